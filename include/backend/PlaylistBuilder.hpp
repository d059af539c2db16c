#pragma once

#include "model/Errors.hpp"
#include "model/Playlist.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace rfidaudio::backend {

struct PlaylistBuildResult {
    std::optional<model::Playlist> playlist;
    model::ErrorKind error = model::ErrorKind::None;
    std::string error_message;

    bool ok() const { return playlist.has_value(); }
};

class PlaylistBuilder {
public:
    // A file gives a one-item playlist, a directory gives its playable
    // entries (one level, sorted). The list is complete before return.
    static PlaylistBuildResult build(const std::filesystem::path& location);
};

}  // namespace rfidaudio::backend
