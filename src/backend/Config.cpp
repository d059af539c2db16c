#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace rfidaudio::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Keeps the current value when the text isn't a positive integer
void parse_positive_int(const std::string& key, const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed <= 0) {
            throw std::invalid_argument("not a positive integer");
        }
        out = parsed;
    } catch (const std::exception&) {
        util::Logger::warn("Config: Ignoring invalid value for " + key + ": \"" + value + "\"");
    }
}

}  // namespace

Config ConfigLoader::load_config() {
    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        util::Logger::info("Config: Loading " + config_file.string());
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "player") {
            if (key == "poll_interval_ms") parse_positive_int(key, value, cfg.poll_interval_ms);
            else if (key == "pause_toggle_absences") parse_positive_int(key, value, cfg.pause_toggle_absences);
        }
        else if (current_section == "paths") {
            if (key == "asset_directory") cfg.asset_directory = value;
            else if (key == "mapping_file") cfg.mapping_file = value;
        }
        else if (current_section == "reader") {
            if (key == "connstring") cfg.reader_connstring = value;
        }
        else if (current_section == "log") {
            if (key == "file") cfg.log_file = value;
            else if (key == "level") cfg.log_level = value;
            else if (key == "stderr") cfg.log_to_stderr = (value == "true");
        }
    }

    return cfg;
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

}  // namespace rfidaudio::backend
