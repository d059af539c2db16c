#include "audio/PipeWireBackend.hpp"
#include "backend/AssetMap.hpp"
#include "backend/Config.hpp"
#include "control/PlaybackController.hpp"
#include "reader/NfcCardSensor.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace {

struct CliOptions {
    std::filesystem::path directory;
    std::filesystem::path mapping_file;
};

void print_usage(const char* argv0) {
    std::cerr << "rfid-audio - Play audio files based on rfid sensor\n\n"
              << "Usage: " << argv0 << " -m FILE [-d DIRECTORY]\n\n"
              << "  -d DIRECTORY  Directory where audio files are present (default: current directory)\n"
              << "  -m FILE       Mapping file (card id -> file or folder)\n"
              << "  -h            Show this help\n";
}

// Returns false when the process should exit with a usage error
bool parse_args(int argc, char** argv, CliOptions& out) {
    int opt;
    while ((opt = getopt(argc, argv, "d:m:h")) != -1) {
        switch (opt) {
            case 'd': out.directory = optarg; break;
            case 'm': out.mapping_file = optarg; break;
            case 'h': print_usage(argv[0]); std::exit(0);
            default: return false;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

// Global shutdown flag, polled by the playback loop between cycles
std::atomic<bool> g_shutdown{false};
std::atomic<int> g_signal{0};

void signal_handler(int signum) {
    g_signal.store(signum);
    g_shutdown.store(true);
}

void setup_signals() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGHUP, signal_handler);
    std::signal(SIGQUIT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace rfidaudio;

    CliOptions cli;
    if (!parse_args(argc, argv, cli)) {
        print_usage(argv[0]);
        return 2;
    }

    setup_signals();

    try {
        util::Logger::init();

        auto config = backend::ConfigLoader::load_config();
        util::Logger::init(config.log_file,
                           util::Logger::parse_level(config.log_level),
                           config.log_to_stderr);

        // Command line wins over the config file
        if (!cli.directory.empty()) config.asset_directory = cli.directory;
        if (!cli.mapping_file.empty()) config.mapping_file = cli.mapping_file;
        if (config.asset_directory.empty()) config.asset_directory = util::Platform::get_working_directory();

        if (config.mapping_file.empty()) {
            util::Logger::error("No mapping file given (-m FILE or [paths] mapping_file)");
            print_usage(argv[0]);
            return 2;
        }

        reader::NfcCardSensor sensor(reader::NfcConfig{config.reader_connstring});
        sensor.open();

        audio::PipeWireBackend audio;
        audio.init();

        auto mapping = backend::AssetMap::load(config.mapping_file, config.asset_directory);

        control::ControllerOptions options;
        options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
        options.pause_toggle_absences = config.pause_toggle_absences;

        control::PlaybackController controller(sensor, mapping, audio, options);

        util::Logger::info("Rfid player started (assets in " + config.asset_directory.string() + ")");

        controller.run(g_shutdown);

        util::Logger::info(std::string("Signal ") + strsignal(g_signal.load()) + " received. Quitting.");
        return 1;
    } catch (const std::exception& e) {
        util::Logger::error("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
