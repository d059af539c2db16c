#include "control/PlaybackController.hpp"
#include "backend/PlaylistBuilder.hpp"
#include "util/Logger.hpp"
#include <exception>
#include <string>
#include <thread>

namespace rfidaudio::control {

PlaybackController::PlaybackController(reader::CardSensor& sensor,
                                       const backend::AssetResolver& resolver,
                                       audio::AudioBackend& audio,
                                       ControllerOptions options)
    : sensor_(sensor), resolver_(resolver), audio_(audio), options_(options) {}

void PlaybackController::run(const std::atomic<bool>& shutdown) {
    util::Logger::info("PlaybackController: Polling every " +
                       std::to_string(options_.poll_interval.count()) + "ms");

    while (!shutdown.load()) {
        step();
        std::this_thread::sleep_for(options_.poll_interval);
    }

    if (state_.session) {
        state_.session->stop_and_discard();
        state_.session.reset();
    }
}

void PlaybackController::step() {
    auto card = poll_sensor();

    if (card) {
        int previous_absences = state_.consecutive_absences;
        state_.consecutive_absences = 0;

        if (state_.currently_identified != card) {
            on_new_card(*card);
        } else if (!state_.playlist.done()) {
            on_same_card(previous_absences);
        } else if (previous_absences >= options_.pause_toggle_absences) {
            // Put back on a finished (or failed) playlist: start it over
            on_new_card(*card);
        }
        // Held on a finished playlist: nothing left to do for it
    } else {
        // currently_identified is kept so a short dropout still reads as the same card
        state_.consecutive_absences++;
    }

    advance_if_finished();
    start_if_idle();
}

std::optional<model::CardId> PlaybackController::poll_sensor() {
    try {
        return sensor_.poll();
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("PlaybackController: SensorFailure: ") + e.what());
        return std::nullopt;
    }
}

void PlaybackController::on_same_card(int previous_absences) {
    // A single missed cycle is reader jitter; a longer gap is the lift-and-replace gesture
    if (previous_absences < options_.pause_toggle_absences) {
        return;
    }
    if (state_.session) {
        state_.session->toggle_pause();
    }
}

void PlaybackController::on_new_card(const model::CardId& id) {
    auto location = resolver_.resolve(id);
    if (!location) {
        util::Logger::error("Card with id " + id.hex + " is not mapped (" +
                            std::string(model::to_string(model::ErrorKind::CardUnmapped)) + ")");
        return;
    }

    util::Logger::info("Card " + id.hex + " recognized -> " + location->string());

    if (state_.session) {
        state_.session->stop_and_discard();
        state_.session.reset();
    }

    // From here on the card owns the slot, even if its asset cannot be played
    state_.currently_identified = id;
    state_.playlist = model::Playlist{};

    auto built = backend::PlaylistBuilder::build(*location);
    if (!built.ok()) {
        util::Logger::error(std::string(model::to_string(built.error)) + ": " + built.error_message);
        return;
    }

    if (built.playlist->empty()) {
        util::Logger::warn("No playable files in " + location->string());
    }

    state_.playlist = std::move(*built.playlist);
}

void PlaybackController::advance_if_finished() {
    if (!state_.session || !state_.session->is_finished()) {
        return;
    }

    if (util::Logger::enabled(util::Logger::Level::Debug)) {
        util::Logger::debug("Finished " + state_.session->path().string());
    }
    state_.session->stop_and_discard();
    state_.session.reset();
    state_.playlist.advance();

    if (state_.playlist.done()) {
        util::Logger::info("Playlist finished (" + std::to_string(state_.playlist.size()) + " items)");
    }
}

void PlaybackController::start_if_idle() {
    if (state_.session || state_.playlist.done()) {
        return;
    }

    const auto& item = state_.playlist.current();
    backend::PlaybackSession session(audio_);
    auto started = session.start(item);
    if (!started.ok()) {
        // Cursor stays put, so the same item is tried again next cycle
        util::Logger::error("Error playing " + item.string() + ": " +
                            std::string(model::to_string(started.error)) + ": " + started.error_message);
        return;
    }

    util::Logger::info("Playing " + item.string() + " (" +
                       std::to_string(state_.playlist.cursor() + 1) + "/" +
                       std::to_string(state_.playlist.size()) + ")");
    state_.session = std::move(session);
}

}  // namespace rfidaudio::control
