#pragma once

#include "audio/AudioBackend.hpp"
#include "backend/AssetMap.hpp"
#include "backend/PlaybackSession.hpp"
#include "model/CardId.hpp"
#include "model/Playlist.hpp"
#include "reader/CardSensor.hpp"
#include <atomic>
#include <chrono>
#include <optional>

namespace rfidaudio::control {

struct ControllerOptions {
    std::chrono::milliseconds poll_interval{500};
    // Absent cycles before a returning card counts as a pause/resume gesture
    int pause_toggle_absences = 2;
};

// Carried from one cycle to the next; owned by the controller only.
struct ControllerState {
    std::optional<model::CardId> currently_identified;
    model::Playlist playlist;
    std::optional<backend::PlaybackSession> session;
    int consecutive_absences = 0;
};

/**
 * Turns card present/absent observations into playback decisions.
 *
 * Each step() polls the sensor once and then:
 *   - same card, playlist still running: debounce, maybe toggle pause
 *   - same card put back on an exhausted playlist: rebuild it
 *   - same card held on an exhausted playlist: nothing
 *   - new card: resolve, rebuild playlist
 *   - no card: count the absence
 * and finally advances past a finished item and starts the next one.
 * Per-cycle failures are logged and never leave step().
 */
class PlaybackController {
public:
    PlaybackController(reader::CardSensor& sensor,
                       const backend::AssetResolver& resolver,
                       audio::AudioBackend& audio,
                       ControllerOptions options = {});

    void step();
    // step() every poll_interval until shutdown is set
    void run(const std::atomic<bool>& shutdown);

    const ControllerState& state() const { return state_; }
    const ControllerOptions& options() const { return options_; }

private:
    std::optional<model::CardId> poll_sensor();
    void on_same_card(int previous_absences);
    void on_new_card(const model::CardId& id);
    void advance_if_finished();
    void start_if_idle();

    reader::CardSensor& sensor_;
    const backend::AssetResolver& resolver_;
    audio::AudioBackend& audio_;
    ControllerOptions options_;
    ControllerState state_;
};

}  // namespace rfidaudio::control
