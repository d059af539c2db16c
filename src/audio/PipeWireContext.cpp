#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <string>

namespace rfidaudio::audio {

PipeWireContext::PipeWireContext() {
}

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // Safe to leave initialized until process exit
}

bool PipeWireContext::init() {
    if (loop_) return true; // Already initialized

    pw_init(nullptr, nullptr);
    util::Logger::debug(std::string("PipeWireContext: Linked with libpipewire ") +
                        pw_get_library_version());

    loop_ = pw_thread_loop_new("rfid-audio", nullptr);
    if (!loop_) {
        util::Logger::error("PipeWireContext: pw_thread_loop_new failed");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        util::Logger::error("PipeWireContext: pw_thread_loop_start failed");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }
    return true;
}

} // namespace rfidaudio::audio
