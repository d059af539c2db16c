#pragma once

struct pw_thread_loop;

namespace rfidaudio::audio {

// Process-wide PipeWire thread loop, shared by every output stream.
class PipeWireContext {
public:
    PipeWireContext();
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }

private:
    struct pw_thread_loop* loop_ = nullptr;
};

} // namespace rfidaudio::audio
