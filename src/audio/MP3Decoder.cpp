#include "audio/MP3Decoder.hpp"
#include "util/Logger.hpp"

namespace rfidaudio::audio {

MP3Decoder::MP3Decoder() {
    mpg123_init();
    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        util::Logger::error(std::string("MP3Decoder: mpg123_new failed: ") + mpg123_plain_strerror(err));
    }
}

MP3Decoder::~MP3Decoder() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
    mpg123_exit();
}

bool MP3Decoder::open(const std::string& filepath) {
    util::Logger::debug("MP3Decoder: Opening file: " + filepath);

    if (!handle_) {
        util::Logger::error("MP3Decoder: Handle is null");
        return false;
    }

    if (mpg123_open(handle_, filepath.c_str()) != MPG123_OK) {
        util::Logger::error("MP3Decoder: Failed to open file: " + filepath +
                            " (error: " + std::string(mpg123_strerror(handle_)) + ")");
        return false;
    }

    long rate;
    int channels, encoding;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        util::Logger::error("MP3Decoder: Failed to get format for: " + filepath);
        mpg123_close(handle_);
        return false;
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;

    // Force signed 16-bit output; converted to float in read_pcm
    mpg123_format_none(handle_);
    if (mpg123_format(handle_, rate, channels, MPG123_ENC_SIGNED_16) != MPG123_OK) {
        util::Logger::error("MP3Decoder: Failed to set output format for: " + filepath);
        mpg123_close(handle_);
        return false;
    }

    off_t length = mpg123_length(handle_);
    total_frames_ = (length == MPG123_ERR) ? 0 : static_cast<long>(length);
    position_frames_ = 0;
    opened_ = true;

    util::Logger::debug("MP3Decoder: Opened - " +
                        std::to_string(sample_rate_) + "Hz, " +
                        std::to_string(channels_) + "ch, " +
                        std::to_string(total_frames_) + " frames");
    return true;
}

void MP3Decoder::close() {
    if (handle_ && opened_) {
        mpg123_close(handle_);
    }
    opened_ = false;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int MP3Decoder::read_pcm(float* buffer, int max_frames) {
    if (!opened_ || !buffer || channels_ == 0) return 0;

    size_t samples_wanted = static_cast<size_t>(max_frames) * channels_;
    s16_buffer_.resize(samples_wanted);
    size_t bytes_read = 0;

    int result = mpg123_read(handle_,
                             reinterpret_cast<unsigned char*>(s16_buffer_.data()),
                             samples_wanted * sizeof(short),
                             &bytes_read);

    if (result == MPG123_NEW_FORMAT) {
        util::Logger::debug("MP3Decoder: Format changed mid-stream, retrying read");
        result = mpg123_read(handle_,
                             reinterpret_cast<unsigned char*>(s16_buffer_.data()),
                             samples_wanted * sizeof(short),
                             &bytes_read);
    }

    // Check for errors BEFORE using data
    if (result == MPG123_ERR) {
        util::Logger::error("MP3Decoder: Read error: " + std::string(mpg123_strerror(handle_)));
        return 0;
    }

    if (result == MPG123_DONE && bytes_read == 0) {
        return 0;
    }

    size_t samples_read = bytes_read / sizeof(short);
    for (size_t i = 0; i < samples_read; ++i) {
        buffer[i] = s16_buffer_[i] / 32768.0f;
    }

    int frames_read = static_cast<int>(samples_read / channels_);
    position_frames_ += frames_read;
    return frames_read;
}

} // namespace rfidaudio::audio
