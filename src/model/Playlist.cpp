#include "model/Playlist.hpp"
#include <algorithm>
#include <stdexcept>

namespace rfidaudio::model {

Playlist::Playlist(std::vector<std::filesystem::path> items)
    : items_(std::move(items)) {
    // Directory listings come back in on-disk order; sort for reproducible playback
    std::sort(items_.begin(), items_.end());
}

const std::filesystem::path& Playlist::current() const {
    if (done()) {
        throw std::out_of_range("Playlist: current() called on exhausted playlist");
    }
    return items_[cursor_];
}

void Playlist::advance() {
    if (cursor_ < items_.size()) {
        cursor_++;
    }
}

}  // namespace rfidaudio::model
