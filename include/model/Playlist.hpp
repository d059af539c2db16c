#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

namespace rfidaudio::model {

// Ordered items built from one resolved location, plus a play cursor.
// Items are sorted on construction and never change afterwards; a new card
// replaces the whole playlist. cursor() == size() means exhausted.
class Playlist {
public:
    Playlist() = default;
    explicit Playlist(std::vector<std::filesystem::path> items);

    bool done() const { return cursor_ >= items_.size(); }
    const std::filesystem::path& current() const;
    void advance();

    size_t cursor() const { return cursor_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<std::filesystem::path>& items() const { return items_; }

private:
    std::vector<std::filesystem::path> items_;
    size_t cursor_ = 0;
};

}  // namespace rfidaudio::model
