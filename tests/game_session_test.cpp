#include "app/game_session.h"
#include "core/errors.h"
#include "core/game_core.h"
#include "persistence/preference_store.h"
#include "fakes.h"
#include <gtest/gtest.h>

using namespace paddleball;
using namespace paddleball::testing_support;

namespace {

class GameSessionTest : public ::testing::Test {
protected:
    Collaborators io() { return Collaborators{surface, overlay, audio, prefs}; }

    void pump(double step = 16.0) {
        now += step;
        session.pump(now);
    }

    CountingSurface surface;
    RecordingOverlay overlay;
    RecordingAudio audio;
    MemoryPreferenceStore prefs;
    GameSession session{Settings{}, io(), 800, 600};
    double now = 0.0;
};

} // namespace

TEST_F(GameSessionTest, StartsReadyWithEntities) {
    EXPECT_EQ(session.generation(), 1u);
    EXPECT_TRUE(session.core().created());
    EXPECT_EQ(session.core().state().current(), Phase::Ready);
    pump();
    EXPECT_EQ(overlay.button, "Start");
}

TEST_F(GameSessionTest, ScoreLeadsToAFreshSession) {
    session.core().press_start();
    pump();
    GameCore &core = session.core();
    core.key_down(Key::Player2Down);
    core.key_up(Key::Player2Down);
    Ball &b = core.ball();
    b.body.set_x(-21);
    b.body.set_y(50);
    b.launched = true;
    b.direction_x = -1;
    pump();
    EXPECT_EQ(session.core().player1().score, 1);
    EXPECT_EQ(session.generation(), 1u);

    pump(1000);
    EXPECT_EQ(session.generation(), 2u);
    EXPECT_EQ(session.core().player1().score, 0);
    EXPECT_EQ(session.core().state().current(), Phase::Ready);
    EXPECT_FALSE(session.core().input().second_player_active());
}

TEST_F(GameSessionTest, RestartAfterWin) {
    session.core().press_start();
    pump();
    session.core().player1().score = 5;
    pump();
    EXPECT_EQ(session.core().state().current(), Phase::WinPlayer1);

    session.core().key_up(Key::Relaunch);
    pump();
    EXPECT_EQ(session.generation(), 2u);
    EXPECT_EQ(session.core().state().current(), Phase::Ready);
}

TEST_F(GameSessionTest, ReconfigureValidatesAndRebuilds) {
    Settings s;
    s.win_score = 0;
    s.name = "Other";
    session.reconfigure(s);
    EXPECT_EQ(session.generation(), 2u);
    EXPECT_EQ(session.settings().win_score, 1);
    EXPECT_EQ(session.core().state().win_score(), 1);
    EXPECT_EQ(session.core().settings().name, "Other");
}

TEST_F(GameSessionTest, ResizeRebuildsAtTheNewSize) {
    session.resize(1000, 1000);
    EXPECT_EQ(session.generation(), 2u);
    EXPECT_DOUBLE_EQ(session.core().screen().scale, 3.0);
    EXPECT_DOUBLE_EQ(session.core().player1().body.height, 150.0);
}

TEST_F(GameSessionTest, FailedResizeKeepsTheRunningGame) {
    session.core().press_start();
    pump();
    session.core().player1().score = 3;

    EXPECT_THROW(session.resize(0, 600), ConfigError);
    EXPECT_EQ(session.generation(), 1u);
    const GameCore &core = session.core();
    EXPECT_TRUE(core.created());
    EXPECT_EQ(core.state().current(), Phase::Play);
    EXPECT_EQ(core.player1().score, 3);
    EXPECT_DOUBLE_EQ(core.screen().bounds.right, 800.0);

    const auto frames = surface.frames;
    pump();
    EXPECT_EQ(surface.frames, frames + 1);

    // the old size is still the one a later reset uses
    session.reset();
    EXPECT_EQ(session.generation(), 2u);
    EXPECT_DOUBLE_EQ(session.core().screen().bounds.right, 800.0);
}

TEST_F(GameSessionTest, MuteSurvivesReset) {
    session.core().toggle_mute();
    session.reset();
    EXPECT_EQ(session.generation(), 2u);
    EXPECT_TRUE(session.core().state().muted());
}
