#pragma once

#include "audio/AudioBackend.hpp"
#include "model/Errors.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace rfidaudio::backend {

struct StartResult {
    model::ErrorKind error = model::ErrorKind::None;
    std::string error_message;

    bool ok() const { return error == model::ErrorKind::None; }
};

// Holds at most one live playback handle. Starting a new asset always
// stops and releases the previous one first.
class PlaybackSession {
public:
    explicit PlaybackSession(audio::AudioBackend& backend);
    ~PlaybackSession();

    PlaybackSession(PlaybackSession&& other) noexcept;
    PlaybackSession& operator=(PlaybackSession&& other) noexcept;
    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    StartResult start(const std::filesystem::path& path);
    bool is_finished() const;

    // No-ops without a handle
    void pause();
    void resume();
    void toggle_pause();

    void stop_and_discard();

    bool has_handle() const { return handle_ != nullptr; }
    bool is_paused() const { return paused_; }
    const std::filesystem::path& path() const { return path_; }

private:
    audio::AudioBackend* backend_;  // Non-owning
    std::unique_ptr<audio::PlaybackHandle> handle_;
    std::filesystem::path path_;
    bool paused_ = false;
};

}  // namespace rfidaudio::backend
