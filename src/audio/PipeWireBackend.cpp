#include "audio/PipeWireBackend.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/OGGDecoder.hpp"
#include "audio/SndFileDecoder.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <chrono>
#include <stdexcept>

namespace rfidaudio::audio {

namespace {

constexpr int BUFFER_FRAMES = 4096;

}  // namespace

PipeWireSink::PipeWireSink(PipeWireContext& context, std::unique_ptr<AudioDecoder> decoder, std::string name)
    : context_(context), decoder_(std::move(decoder)), name_(std::move(name)) {}

PipeWireSink::~PipeWireSink() {
    stop();
}

bool PipeWireSink::init() {
    return output_.init(context_, decoder_->get_sample_rate(), decoder_->get_channels());
}

void PipeWireSink::play() {
    paused_.store(false, std::memory_order_release);
    if (!worker_.joinable() && !finished_.load(std::memory_order_acquire)) {
        worker_ = std::jthread([this](std::stop_token st) { run(st); });
    }
}

void PipeWireSink::pause() {
    paused_.store(true, std::memory_order_release);
}

void PipeWireSink::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    output_.close();
    if (decoder_) {
        decoder_->close();
    }
    finished_.store(true, std::memory_order_release);
}

void PipeWireSink::run(std::stop_token stop_token) {
    const int channels = decoder_->get_channels();
    std::vector<float> buffer(static_cast<size_t>(BUFFER_FRAMES) * channels, 0.0f);
    bool reached_end = false;

    while (!stop_token.stop_requested()) {
        if (paused_.load(std::memory_order_acquire)) {
            output_.pause(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        output_.pause(false);

        int frames_read = decoder_->read_pcm(buffer.data(), BUFFER_FRAMES);
        if (frames_read <= 0) {
            reached_end = true;
            break;
        }

        // Partial writes: keep feeding until the chunk is gone
        size_t written_total = 0;
        size_t remaining = static_cast<size_t>(frames_read);
        while (remaining > 0 && !stop_token.stop_requested()) {
            size_t written = output_.write(buffer.data() + written_total * channels, remaining, stop_token);
            if (written == 0) {
                break;
            }
            written_total += written;
            remaining -= written;
        }

        if (remaining > 0 && !stop_token.stop_requested()) {
            util::Logger::error("PipeWireSink: Audio output failed for " + name_ + ", giving up on it");
            break;
        }
    }

    if (reached_end && !stop_token.stop_requested()) {
        output_.close(true);
    }
    finished_.store(true, std::memory_order_release);
}

void PipeWireBackend::init() {
    if (!context_.init()) {
        throw std::runtime_error("Audio could not be opened");
    }
    util::Logger::info("PipeWireBackend: Audio output ready");
}

std::unique_ptr<AudioDecoder> PipeWireBackend::create_decoder_for(const std::filesystem::path& path) {
    auto format = util::Platform::get_audio_format(path);
    if (format == "mp3") {
        return std::make_unique<MP3Decoder>();
    }
    if (format == "flac" || format == "wav") {
        return std::make_unique<SndFileDecoder>();
    }
    if (format == "ogg") {
        return std::make_unique<OGGDecoder>();
    }
    return nullptr;
}

OpenResult PipeWireBackend::open(const std::filesystem::path& path) {
    OpenResult result;

    auto decoder = create_decoder_for(path);
    if (!decoder) {
        result.error = model::ErrorKind::AssetUnreadable;
        result.error_message = "unsupported format: " + path.string();
        return result;
    }

    if (!decoder->open(path.string())) {
        result.error = model::ErrorKind::AssetUnreadable;
        result.error_message = "cannot open " + path.string();
        return result;
    }

    auto sink = std::make_unique<PipeWireSink>(context_, std::move(decoder), path.filename().string());
    if (!sink->init()) {
        result.error = model::ErrorKind::PlaybackStartFailure;
        result.error_message = "PipeWire stream could not be created";
        return result;
    }

    result.handle = std::move(sink);
    return result;
}

} // namespace rfidaudio::audio
