#pragma once

#include "audio/AudioBackend.hpp"
#include "backend/AssetMap.hpp"
#include "model/CardId.hpp"
#include "reader/CardSensor.hpp"
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace rfidaudio::test {

inline model::CardId card(const std::string& hex) { return model::CardId{hex}; }

// Replays a scripted sequence of reads; an exhausted script reads as no card.
class ScriptedSensor : public reader::CardSensor {
public:
    void push(std::optional<model::CardId> read) { script_.push_back(std::move(read)); }
    void push_card(const std::string& hex, int cycles = 1) {
        for (int i = 0; i < cycles; ++i) push(card(hex));
    }
    void push_absent(int cycles = 1) {
        for (int i = 0; i < cycles; ++i) push(std::nullopt);
    }

    std::optional<model::CardId> poll() override {
        if (script_.empty()) return std::nullopt;
        auto next = script_.front();
        script_.pop_front();
        return next;
    }

private:
    std::deque<std::optional<model::CardId>> script_;
};

class ThrowingSensor : public reader::CardSensor {
public:
    std::optional<model::CardId> poll() override {
        throw std::runtime_error("bus error");
    }
};

// What happened to one handle the fake backend gave out
struct FakeHandleState {
    std::filesystem::path path;
    bool playing = false;
    bool paused = false;
    bool stopped = false;
    bool finished = false;
    int pause_calls = 0;
    int play_calls = 0;
};

class FakeHandle : public audio::PlaybackHandle {
public:
    explicit FakeHandle(std::shared_ptr<FakeHandleState> state, int* live)
        : state_(std::move(state)), live_(live) { ++*live_; }
    ~FakeHandle() override { --*live_; }

    void play() override { state_->playing = true; state_->paused = false; state_->play_calls++; }
    void pause() override { state_->paused = true; state_->pause_calls++; }
    void stop() override { state_->stopped = true; state_->playing = false; }
    bool empty() const override { return state_->finished || state_->stopped; }

private:
    std::shared_ptr<FakeHandleState> state_;
    int* live_;
};

class FakeAudioBackend : public audio::AudioBackend {
public:
    audio::OpenResult open(const std::filesystem::path& path) override {
        audio::OpenResult result;
        open_attempts++;
        if (unreadable.count(path.filename().string())) {
            result.error = model::ErrorKind::AssetUnreadable;
            result.error_message = "cannot open " + path.string();
            return result;
        }
        if (refuse_start) {
            result.error = model::ErrorKind::PlaybackStartFailure;
            result.error_message = "device busy";
            return result;
        }
        auto state = std::make_shared<FakeHandleState>();
        state->path = path;
        handles.push_back(state);
        max_live = std::max(max_live, live + 1);
        result.handle = std::make_unique<FakeHandle>(state, &live);
        return result;
    }

    std::shared_ptr<FakeHandleState> last() const {
        return handles.empty() ? nullptr : handles.back();
    }

    std::vector<std::shared_ptr<FakeHandleState>> handles;
    std::set<std::string> unreadable;  // file names that fail to open
    bool refuse_start = false;
    int open_attempts = 0;
    int live = 0;
    int max_live = 0;
};

class MapResolver : public backend::AssetResolver {
public:
    void add(const std::string& hex, std::filesystem::path path) { map_[hex] = std::move(path); }

    std::optional<std::filesystem::path> resolve(const model::CardId& id) const override {
        auto it = map_.find(id.hex);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, std::filesystem::path> map_;
};

// Scratch directory under /tmp, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("rfid_audio_test_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::filesystem::path touch(const std::string& rel, const std::string& content = "x") const {
        auto file = path_ / rel;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file) << content;
        return file;
    }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace rfidaudio::test
