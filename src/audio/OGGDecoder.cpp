#include "audio/OGGDecoder.hpp"
#include "util/Logger.hpp"
#include <cstring>
#include <cstdio>

namespace rfidaudio::audio {

OGGDecoder::OGGDecoder() {
    std::memset(&vf_, 0, sizeof(vf_));
}

OGGDecoder::~OGGDecoder() {
    close();
}

bool OGGDecoder::open(const std::string& filepath) {
    util::Logger::debug("OGGDecoder: Opening file: " + filepath);

    FILE* f = std::fopen(filepath.c_str(), "rb");
    if (!f) {
        util::Logger::error("OGGDecoder: Failed to fopen file: " + filepath);
        return false;
    }

    // On success vorbisfile owns the FILE* and closes it in ov_clear
    int rc = ov_open(f, &vf_, nullptr, 0);
    if (rc < 0) {
        util::Logger::error("OGGDecoder: Failed to open OGG stream: " + filepath +
                            " (code=" + std::to_string(rc) + ")");
        std::fclose(f);
        return false;
    }

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        util::Logger::error("OGGDecoder: Failed to get vorbis info for: " + filepath);
        ov_clear(&vf_);
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    total_frames_ = static_cast<long>(ov_pcm_total(&vf_, -1));
    position_frames_ = 0;
    is_open_ = true;

    util::Logger::debug("OGGDecoder: Opened - " +
                        std::to_string(sample_rate_) + "Hz, " +
                        std::to_string(channels_) + "ch, " +
                        std::to_string(total_frames_) + " frames");
    return true;
}

void OGGDecoder::close() {
    if (is_open_) {
        ov_clear(&vf_);
        is_open_ = false;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int OGGDecoder::read_pcm(float* buffer, int max_frames) {
    if (!is_open_ || !buffer) return 0;

    float** pcm;
    int frames_read = 0;
    int bitstream = 0;

    while (frames_read < max_frames) {
        long ret = ov_read_float(&vf_, &pcm, max_frames - frames_read, &bitstream);
        if (ret == OV_HOLE) continue;  // Recoverable gap in the stream
        if (ret < 0) {
            util::Logger::error("OGGDecoder: Read error (code=" + std::to_string(ret) + ")");
            break;
        }
        if (ret == 0) break;  // EOF

        // Interleave channels
        for (long i = 0; i < ret; i++) {
            for (int ch = 0; ch < channels_; ch++) {
                buffer[(frames_read + i) * channels_ + ch] = pcm[ch][i];
            }
        }

        frames_read += static_cast<int>(ret);
    }

    position_frames_ += frames_read;
    return frames_read;
}

} // namespace rfidaudio::audio
