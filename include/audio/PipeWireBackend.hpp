#pragma once

#include "audio/AudioBackend.hpp"
#include "audio/AudioDecoder.hpp"
#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireOutput.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rfidaudio::audio {

// One decoded file streaming to its own PipeWire stream. Decoding and
// writing run on a worker thread started by play().
class PipeWireSink : public PlaybackHandle {
public:
    PipeWireSink(PipeWireContext& context, std::unique_ptr<AudioDecoder> decoder, std::string name);
    ~PipeWireSink() override;

    bool init();

    void play() override;
    void pause() override;
    void stop() override;
    bool empty() const override { return finished_.load(std::memory_order_acquire); }

private:
    void run(std::stop_token stop_token);

    PipeWireContext& context_;
    std::unique_ptr<AudioDecoder> decoder_;
    std::string name_;
    PipeWireOutput output_;
    std::jthread worker_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> finished_{false};
};

class PipeWireBackend : public AudioBackend {
public:
    PipeWireBackend() = default;

    // Fatal if the PipeWire thread loop cannot be started
    void init();

    OpenResult open(const std::filesystem::path& path) override;

    static std::unique_ptr<AudioDecoder> create_decoder_for(const std::filesystem::path& path);

private:
    PipeWireContext context_;
};

} // namespace rfidaudio::audio
