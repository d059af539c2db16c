#pragma once

#include "model/Errors.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace rfidaudio::audio {

// A single playing asset. Decoding and output happen elsewhere; the owner
// only steers it and polls empty().
class PlaybackHandle {
public:
    virtual ~PlaybackHandle() = default;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;

    // True once the asset produced all its audio, or after stop().
    virtual bool empty() const = 0;
};

struct OpenResult {
    std::unique_ptr<PlaybackHandle> handle;
    model::ErrorKind error = model::ErrorKind::None;
    std::string error_message;

    bool ok() const { return handle != nullptr; }
};

// Owns the output device for the process lifetime and hands out one
// handle per asset.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual OpenResult open(const std::filesystem::path& path) = 0;
};

}  // namespace rfidaudio::audio
