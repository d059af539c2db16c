#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "backend/AssetMap.hpp"
#include "control/PlaybackController.hpp"

using namespace rfidaudio;
using namespace rfidaudio::test;

// Mapping file on disk, real folders, scripted reader and fake output
namespace {

struct Kiosk {
    explicit Kiosk(const std::string& name) : dir(name) {
        dir.touch("assets/stories/03-end.mp3");
        dir.touch("assets/stories/01-start.mp3");
        dir.touch("assets/stories/02-middle.ogg");
        dir.touch("assets/stories/cover.jpg");
        dir.touch("assets/bell.wav");
        mapping_file = dir.touch("cards.map",
            "# kiosk cards\n"
            "04a1b2c3 stories\n"
            "04d4e5f6   bell.wav\n"
            "\n"
            "04ffffff gone.mp3\n");
        mapping = backend::AssetMap::load(mapping_file, dir.path() / "assets");
    }

    control::PlaybackController controller() {
        control::ControllerOptions options;
        options.poll_interval = std::chrono::milliseconds(0);
        return control::PlaybackController(sensor, mapping, audio, options);
    }

    std::vector<std::string> played() const {
        std::vector<std::string> names;
        for (const auto& h : audio.handles) names.push_back(h->path.filename().string());
        return names;
    }

    TempDir dir;
    std::filesystem::path mapping_file;
    backend::AssetMap mapping;
    ScriptedSensor sensor;
    FakeAudioBackend audio;
};

void finish_current(FakeAudioBackend& audio) {
    if (auto h = audio.last()) h->finished = true;
}

}  // namespace

TEST_CASE(test_pipeline_folder_plays_in_order) {
    Kiosk kiosk("pipeline_order");
    kiosk.sensor.push_card("04a1b2c3");
    auto controller = kiosk.controller();

    controller.step();
    for (int i = 0; i < 3; ++i) {
        finish_current(kiosk.audio);
        controller.step();
    }

    auto played = kiosk.played();
    ASSERT_EQ(played.size(), 3u);
    ASSERT_EQ(played[0], std::string("01-start.mp3"));
    ASSERT_EQ(played[1], std::string("02-middle.ogg"));
    ASSERT_EQ(played[2], std::string("03-end.mp3"));
    ASSERT_TRUE(controller.state().playlist.done());
    ASSERT_EQ(kiosk.audio.max_live, 1);
}

TEST_CASE(test_pipeline_swap_cards_mid_playlist) {
    Kiosk kiosk("pipeline_swap");
    kiosk.sensor.push_card("04a1b2c3", 2);
    kiosk.sensor.push_absent(1);
    kiosk.sensor.push_card("04D4E5F6");  // upper case from a different reader
    auto controller = kiosk.controller();

    controller.step();
    controller.step();
    finish_current(kiosk.audio);
    controller.step();  // second story item starts
    controller.step();  // bell card replaces the playlist

    auto played = kiosk.played();
    ASSERT_EQ(played.size(), 3u);
    ASSERT_EQ(played[1], std::string("02-middle.ogg"));
    ASSERT_EQ(played[2], std::string("bell.wav"));
    ASSERT_TRUE(kiosk.audio.handles[1]->stopped);
    ASSERT_EQ(controller.state().playlist.size(), 1u);
}

TEST_CASE(test_pipeline_mapped_but_missing_file) {
    Kiosk kiosk("pipeline_missing");
    kiosk.sensor.push_card("04ffffff", 3);
    auto controller = kiosk.controller();
    for (int i = 0; i < 3; ++i) controller.step();

    ASSERT_TRUE(kiosk.audio.handles.empty());
    ASSERT_TRUE(controller.state().currently_identified == card("04ffffff"));
    ASSERT_TRUE(controller.state().playlist.done());
}

TEST_CASE(test_pipeline_pause_gesture_then_other_card) {
    Kiosk kiosk("pipeline_pause");
    kiosk.sensor.push_card("04d4e5f6");
    kiosk.sensor.push_absent(3);
    kiosk.sensor.push_card("04d4e5f6");
    kiosk.sensor.push_card("04a1b2c3");
    auto controller = kiosk.controller();
    for (int i = 0; i < 5; ++i) controller.step();
    ASSERT_TRUE(kiosk.audio.handles[0]->paused);

    controller.step();
    ASSERT_TRUE(kiosk.audio.handles[0]->stopped);
    ASSERT_EQ(kiosk.audio.last()->path.filename(), std::filesystem::path("01-start.mp3"));
    ASSERT_FALSE(controller.state().session->is_paused());
}

int main() {
    return rfidaudio::test::TestRunner::instance().run_all("PIPELINE TESTS");
}
