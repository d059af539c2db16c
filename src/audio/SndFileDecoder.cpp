#include "audio/SndFileDecoder.hpp"
#include "util/Logger.hpp"
#include <cstring>

namespace rfidaudio::audio {

SndFileDecoder::SndFileDecoder() {
    std::memset(&info_, 0, sizeof(info_));
}

SndFileDecoder::~SndFileDecoder() {
    close();
}

bool SndFileDecoder::open(const std::string& filepath) {
    util::Logger::debug("SndFileDecoder: Opening file: " + filepath);

    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filepath.c_str(), SFM_READ, &info_);
    if (!file_) {
        util::Logger::error("SndFileDecoder: Failed to open file: " + filepath +
                            " (" + sf_strerror(nullptr) + ")");
        return false;
    }

    sample_rate_ = info_.samplerate;
    channels_ = info_.channels;
    total_frames_ = static_cast<long>(info_.frames);
    position_frames_ = 0;

    util::Logger::debug("SndFileDecoder: Opened - " +
                        std::to_string(sample_rate_) + "Hz, " +
                        std::to_string(channels_) + "ch, " +
                        std::to_string(total_frames_) + " frames");
    return true;
}

void SndFileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int SndFileDecoder::read_pcm(float* buffer, int max_frames) {
    if (!file_ || !buffer) {
        return 0;
    }

    sf_count_t frames_read = sf_readf_float(file_, buffer, max_frames);
    if (frames_read < 0) {
        util::Logger::error(std::string("SndFileDecoder: Read error: ") + sf_strerror(file_));
        return 0;
    }

    position_frames_ += static_cast<long>(frames_read);
    return static_cast<int>(frames_read);
}

} // namespace rfidaudio::audio
