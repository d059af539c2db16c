#include "backend/PlaybackSession.hpp"
#include "util/Logger.hpp"

namespace rfidaudio::backend {

PlaybackSession::PlaybackSession(audio::AudioBackend& backend)
    : backend_(&backend) {}

PlaybackSession::~PlaybackSession() {
    stop_and_discard();
}

PlaybackSession::PlaybackSession(PlaybackSession&& other) noexcept
    : backend_(other.backend_),
      handle_(std::move(other.handle_)),
      path_(std::move(other.path_)),
      paused_(other.paused_) {
    other.paused_ = false;
}

PlaybackSession& PlaybackSession::operator=(PlaybackSession&& other) noexcept {
    if (this != &other) {
        stop_and_discard();
        backend_ = other.backend_;
        handle_ = std::move(other.handle_);
        path_ = std::move(other.path_);
        paused_ = other.paused_;
        other.paused_ = false;
    }
    return *this;
}

StartResult PlaybackSession::start(const std::filesystem::path& path) {
    stop_and_discard();

    StartResult result;
    auto opened = backend_->open(path);
    if (!opened.ok()) {
        result.error = opened.error == model::ErrorKind::None
            ? model::ErrorKind::PlaybackStartFailure
            : opened.error;
        result.error_message = opened.error_message;
        return result;
    }

    handle_ = std::move(opened.handle);
    path_ = path;
    paused_ = false;
    handle_->play();
    return result;
}

bool PlaybackSession::is_finished() const {
    return !handle_ || handle_->empty();
}

void PlaybackSession::pause() {
    if (!handle_ || paused_) return;
    handle_->pause();
    paused_ = true;
    util::Logger::info("Paused " + path_.string());
}

void PlaybackSession::resume() {
    if (!handle_ || !paused_) return;
    handle_->play();
    paused_ = false;
    util::Logger::info("Resumed " + path_.string());
}

void PlaybackSession::toggle_pause() {
    if (paused_) {
        resume();
    } else {
        pause();
    }
}

void PlaybackSession::stop_and_discard() {
    if (!handle_) return;
    handle_->stop();
    handle_.reset();
    paused_ = false;
}

}  // namespace rfidaudio::backend
