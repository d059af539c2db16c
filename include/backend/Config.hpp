#pragma once

#include <filesystem>
#include <string>

namespace rfidaudio::backend {

struct Config {
    // Player settings
    int poll_interval_ms = 500;
    int pause_toggle_absences = 2;

    // Paths; relative mapping entries resolve against asset_directory
    std::filesystem::path asset_directory;
    std::filesystem::path mapping_file;

    // Reader settings
    std::string reader_connstring;

    // Logging
    std::filesystem::path log_file = "/tmp/rfid_audio.log";
    std::string log_level = "info";
    bool log_to_stderr = true;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
};

}  // namespace rfidaudio::backend
