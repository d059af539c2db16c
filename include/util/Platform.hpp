#pragma once

#include <filesystem>
#include <string>

namespace rfidaudio::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_working_directory();

    static bool is_audio_extension(const char* filename);
    static std::string get_audio_format(const std::filesystem::path& path);
};

}  // namespace rfidaudio::util
