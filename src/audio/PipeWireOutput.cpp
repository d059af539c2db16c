#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/utils/result.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>

namespace rfidaudio::audio {

namespace {

const char* state_name(enum pw_stream_state state) {
    return pw_stream_state_as_string(state);
}

}  // namespace

static const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = nullptr,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = nullptr,  // Buffers are dequeued from the decode thread
    .drained = nullptr,
    .command = nullptr,
    .trigger_done = nullptr,
};

PipeWireOutput::PipeWireOutput() {
}

PipeWireOutput::~PipeWireOutput() {
    close();
}

bool PipeWireOutput::init(PipeWireContext& context, int sample_rate, int channels) {
    util::Logger::debug("PipeWireOutput: Initializing (" +
                        std::to_string(sample_rate) + "Hz, " +
                        std::to_string(channels) + "ch)");

    if (stream_) {
        util::Logger::debug("PipeWireOutput: Already initialized, skipping");
        return false;
    }

    context_ = &context;
    sample_rate_ = sample_rate;
    channels_ = channels;

    struct pw_thread_loop* loop = context_->get_loop();
    if (!loop) {
        util::Logger::error("PipeWireOutput: Context loop is null");
        return false;
    }

    // Lock the thread loop for all PipeWire operations
    pw_thread_loop_lock(loop);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop),
        "RFID Audio Kiosk",
        props,
        &stream_events,
        this
    );

    if (!stream_) {
        util::Logger::error("PipeWireOutput: Failed to create stream");
        pw_thread_loop_unlock(loop);
        return false;
    }

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels_);
    info.rate = static_cast<uint32_t>(sample_rate_);

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT |
            PW_STREAM_FLAG_MAP_BUFFERS
        ),
        params, 1
    );

    pw_thread_loop_unlock(loop);

    if (result < 0) {
        util::Logger::error("PipeWireOutput: Stream connect failed (" +
                            std::string(spa_strerror(result)) + ")");
        close();
        return false;
    }

    paused_ = false;
    util::Logger::debug("PipeWireOutput: Initialized successfully");
    return true;
}

void PipeWireOutput::close(bool drain) {
    if (stream_ && context_ && context_->get_loop()) {
        struct pw_thread_loop* loop = context_->get_loop();

        pw_thread_loop_lock(loop);
        pw_stream_flush(stream_, drain);
        pw_stream_destroy(stream_);
        pw_thread_loop_unlock(loop);

        stream_ = nullptr;
        util::Logger::debug(std::string("PipeWireOutput: Closed") + (drain ? " (drained)" : ""));
    } else if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }

    sample_rate_ = 0;
    channels_ = 0;
    paused_ = false;
}

size_t PipeWireOutput::write(const float* data, size_t frames, std::stop_token stop_token) {
    if (!stream_ || !context_ || !context_->get_loop() || !data || frames == 0) {
        return 0;
    }

    struct pw_thread_loop* loop = context_->get_loop();

    // Wait for the stream to reach STREAMING (suspended sinks take time)
    const int max_state_retries = 100;  // Up to 2 seconds
    enum pw_stream_state state = PW_STREAM_STATE_UNCONNECTED;
    for (int i = 0; i < max_state_retries && !stop_token.stop_requested(); ++i) {
        pw_thread_loop_lock(loop);
        state = pw_stream_get_state(stream_, nullptr);
        pw_thread_loop_unlock(loop);

        if (state == PW_STREAM_STATE_STREAMING) {
            break;
        }

        if (state == PW_STREAM_STATE_ERROR) {
            util::Logger::error("PipeWireOutput: Stream in ERROR state");
            return 0;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (stop_token.stop_requested()) {
        return 0;
    }

    if (state != PW_STREAM_STATE_STREAMING) {
        util::Logger::error(std::string("PipeWireOutput: Stream never reached STREAMING (stuck in state=") +
                            state_name(state) + ")");
        return 0;
    }

    struct pw_buffer* pw_buf = nullptr;
    const int max_retries = 50;
    for (int i = 0; i < max_retries && !stop_token.stop_requested(); ++i) {
        pw_thread_loop_lock(loop);
        pw_buf = pw_stream_dequeue_buffer(stream_);
        if (pw_buf) {
            break;  // Keep the loop locked until the buffer is queued
        }
        pw_thread_loop_unlock(loop);

        // Exponential backoff: 2ms, 4ms, 8ms, 16ms, capped at 50ms
        int delay_ms = std::min(2 << std::min(i, 4), 50);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    if (!pw_buf) {
        if (!stop_token.stop_requested()) {
            util::Logger::error("PipeWireOutput: Failed to acquire buffer after " +
                                std::to_string(max_retries) + " retries - sink may be suspended");
        }
        return 0;
    }

    struct spa_buffer* buf = pw_buf->buffer;
    if (!buf->datas[0].data) {
        pw_stream_queue_buffer(stream_, pw_buf);
        pw_thread_loop_unlock(loop);
        return 0;
    }

    size_t bytes_per_frame = channels_ * sizeof(float);
    size_t max_frames = buf->datas[0].maxsize / bytes_per_frame;
    size_t frames_to_write = std::min(frames, max_frames);
    size_t bytes_to_write = frames_to_write * bytes_per_frame;

    // Copy with clamping; NaN/Inf become silence
    float* dst = static_cast<float*>(buf->datas[0].data);
    size_t total_samples = frames_to_write * channels_;
    for (size_t i = 0; i < total_samples; ++i) {
        float val = data[i];
        if (!std::isfinite(val)) {
            val = 0.0f;
        }
        dst[i] = std::clamp(val, -1.0f, 1.0f);
    }

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = bytes_per_frame;
    buf->datas[0].chunk->size = bytes_to_write;

    pw_stream_queue_buffer(stream_, pw_buf);
    pw_thread_loop_unlock(loop);

    return frames_to_write;
}

void PipeWireOutput::pause(bool paused) {
    if (paused_ == paused) {
        return;
    }

    if (!stream_ || !context_ || !context_->get_loop()) return;

    struct pw_thread_loop* loop = context_->get_loop();

    pw_thread_loop_lock(loop);
    pw_stream_set_active(stream_, !paused);
    pw_thread_loop_unlock(loop);

    paused_ = paused;
}

} // namespace rfidaudio::audio
