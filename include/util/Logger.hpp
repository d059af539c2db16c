#pragma once

#include <filesystem>
#include <string>

namespace rfidaudio::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::filesystem::path& file = default_file(),
                     Level min_level = Level::Info,
                     bool mirror_stderr = true);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static Level parse_level(const std::string& name, Level fallback = Level::Info);
    static bool enabled(Level level);
    static std::filesystem::path default_file() { return "/tmp/rfid_audio.log"; }
};

}  // namespace rfidaudio::util
