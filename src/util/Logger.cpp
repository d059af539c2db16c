#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>
#include <sstream>

namespace rfidaudio::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static Logger::Level log_min_level = Logger::Level::Info;
static bool log_to_stderr = false;

void Logger::init(const std::filesystem::path& file, Level min_level, bool mirror_stderr) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(file, std::ios::app);
    log_min_level = min_level;
    log_to_stderr = mirror_stderr;
}

bool Logger::enabled(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    return level >= log_min_level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_min_level) return;

    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(default_file(), std::ios::app);
    }

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    std::ostringstream stamp;
    stamp << std::put_time(&tm, "[%H:%M:%S] ");
    std::string line = std::format("{}{}{}\n", stamp.str(), level_str, message);

    if (log_file) {
        log_file << line;
        log_file.flush();  // Ensure writes are visible immediately
    }
    if (log_to_stderr) {
        std::cerr << line;
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name, Level fallback) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return fallback;
}

}  // namespace rfidaudio::util
