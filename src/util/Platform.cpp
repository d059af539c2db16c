#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace rfidaudio::util {

std::filesystem::path Platform::get_config_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "rfid-audio";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/rfid-audio");
    return ".config/rfid-audio";
}

std::filesystem::path Platform::get_working_directory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        Logger::warn("Platform: Cannot read current directory (" + ec.message() + "), using \".\"");
        return ".";
    }
    return cwd;
}

bool Platform::is_audio_extension(const char* filename) {
    const char* ext = std::strrchr(filename, '.');
    if (!ext) return false;

    std::string lower(ext);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::string extensions[] = {
        ".mp3", ".flac", ".ogg", ".wav"
    };

    for (const auto& e : extensions) {
        if (lower == e) return true;
    }
    return false;
}

std::string Platform::get_audio_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace rfidaudio::util
