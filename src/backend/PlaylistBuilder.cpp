#include "backend/PlaylistBuilder.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <system_error>
#include <vector>

namespace rfidaudio::backend {

PlaylistBuildResult PlaylistBuilder::build(const std::filesystem::path& location) {
    namespace fs = std::filesystem;
    PlaylistBuildResult result;

    std::error_code ec;
    auto status = fs::status(location, ec);
    if (ec || !fs::exists(status)) {
        result.error = model::ErrorKind::AssetMissing;
        result.error_message = "Asset " + location.string() + " does not exist";
        return result;
    }

    if (!fs::is_directory(status)) {
        result.playlist = model::Playlist({location});
        return result;
    }

    auto listing = util::DirectoryScanner::list_directory(location);
    if (!listing.ok) {
        result.error = model::ErrorKind::AssetUnreadable;
        result.error_message = listing.error_message;
        return result;
    }

    std::vector<fs::path> items(listing.audio_files.begin(), listing.audio_files.end());
    result.playlist = model::Playlist(std::move(items));

    util::Logger::debug("PlaylistBuilder: " + location.string() + " -> " +
                        std::to_string(result.playlist->size()) + " items");
    return result;
}

}  // namespace rfidaudio::backend
