#pragma once

#include "audio/PipeWireContext.hpp"
#include <cstddef>
#include <cstdint>
#include <stop_token>

struct pw_stream;

namespace rfidaudio::audio {

class PipeWireOutput {
public:
    PipeWireOutput();
    ~PipeWireOutput();

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    bool init(PipeWireContext& context, int sample_rate, int channels);

    // drain = wait for queued audio to play out before destroying the stream
    void close(bool drain = false);

    // Write interleaved float frames. Returns frames actually written;
    // 0 on error or when stop was requested while waiting for a buffer.
    size_t write(const float* data, size_t frames, std::stop_token stop_token = {});
    void pause(bool paused);

    bool is_initialized() const { return stream_ != nullptr; }
    bool is_paused() const { return paused_; }

    int get_sample_rate() const { return sample_rate_; }
    int get_channels() const { return channels_; }

private:
    int sample_rate_ = 0;
    int channels_ = 0;
    bool paused_ = false;

    struct pw_stream* stream_ = nullptr;
    PipeWireContext* context_ = nullptr; // Non-owning
};

} // namespace rfidaudio::audio
