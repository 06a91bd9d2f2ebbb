/**
 * @file game_core.h
 * @brief Core game loop for PaddleBall
 *
 * This file contains the platform-independent simulation: one tick per
 * scheduled frame, paddle and ball movement, collision, scoring and the
 * phase machine. Drawing, sound and persistence go through the
 * collaborator interfaces.
 */

#pragma once

#include "core/ball.h"
#include "core/collaborators.h"
#include "core/computer_opponent.h"
#include "core/entity.h"
#include "core/frame_timer.h"
#include "core/input_router.h"
#include "core/paddle.h"
#include "core/scheduler.h"
#include "core/settings.h"
#include "core/state_machine.h"

#include <cstdint>
#include <string>

namespace paddleball {

/**
 * @brief Playfield geometry shared by all entities
 */
struct Screen {
    Bounds bounds;
    double center_x = 0.0;
    double center_y = 0.0;
    double scale = 0.0;     ///< Surface scale, see surface_scale()
};

/// Side the ball is relaunched from.
enum class LaunchSide {
    Left,   ///< From player 2, travelling right
    Right   ///< From player 1, travelling left
};

/**
 * @brief One game session's simulation
 *
 * Lifecycle: construct, load(), then assets_ready() once the host has
 * its resources. From then on the host calls advance_timers() and
 * dispatch_frame() every display refresh and feeds input in between.
 *
 * Player 1 owns the right paddle and player 2 the left one. Player 2 is
 * the computer until a human presses one of its keys.
 *
 * A GameCore is never reused across sessions. When reset_requested()
 * becomes true the owner discards it and builds a new one.
 */
class GameCore {
public:
    static constexpr double kComputerRelaunchDelayMs = 3000.0;
    static constexpr double kResetDelayMs = 1000.0;
    static constexpr double kPlayer1HitSpeedup = 1.0;   ///< Added to ball speed per player 1 hit
    static constexpr double kPlayer2HitSpeedup = 10.0;  ///< Added to ball speed per player 2 hit

    /**
     * @brief Build a session on a surface of the given size
     *
     * Reads the stored mute preference. The phase starts at loading.
     */
    GameCore(const Settings& settings, Collaborators collaborators, double width, double height);

    GameCore(const GameCore&) = delete;
    GameCore& operator=(const GameCore&) = delete;

    /**
     * @brief Lay out the screen and apply settings
     * @throws ConfigError if the surface has no area
     */
    void load();

    /**
     * @brief Asset pipeline finished: create entities, enter ready
     *
     * Requests the first frame. Calling it again has no effect.
     */
    void assets_ready();

    /// Fire deferred actions due at @p now_ms.
    void advance_timers(double now_ms);

    /// Run the pending frame, if any. @return true if a tick ran
    bool dispatch_frame(double now_ms);

    /// @name Input
    /// @{
    void key_down(Key k);
    void key_up(Key k);
    void pointer_moved(double y);
    void touch_moved(double y);
    void click();               ///< Click/tap on the playfield
    void press_start();         ///< Start button activation
    void toggle_pause();
    void toggle_mute();
    /// @}

    /**
     * @brief Put a stopped ball back in play from one side
     *
     * Ignored while the ball is launched. Resets ball speed, aligns the
     * ball with the launching paddle and launches it away from it.
     */
    void relaunch_ball(LaunchSide side);

    bool reset_requested() const { return reset_flag; }

    /// Preference key holding the mute flag.
    std::string mute_key() const;

    const StateMachine& state() const { return game_state; }
    const Screen& screen() const { return scr; }
    const FrameTiming& timing() const { return frame_timer.timing(); }
    const InputRouter& input() const { return router; }
    const Settings& settings() const { return config; }
    const FrameScheduler& scheduler() const { return frames; }
    TimerQueue& timers() { return deferred; }
    bool created() const { return has_entities; }

    Paddle& player1() { return p1; }
    Paddle& player2() { return p2; }
    Ball& ball() { return b; }
    const Paddle& player1() const { return p1; }
    const Paddle& player2() const { return p2; }
    const Ball& ball() const { return b; }

private:
    void create();
    void play(double now_ms);
    void update_player1(double scale);
    void update_player2(double scale);
    void update_ball(double scale);
    void draw_paddle(const Paddle& p);
    void request_frame(bool resumed = false);
    void cancel_frame();
    void playback(SoundCue cue);
    void schedule_reset();
    void request_reset();
    bool stopped_on_right() const;
    std::string score_text(const Paddle& p) const;

    Settings config;
    Collaborators io;
    double surface_w;
    double surface_h;
    Screen scr;

    StateMachine game_state;
    InputRouter router;
    ComputerOpponent opponent;
    FrameTimer frame_timer;
    FrameScheduler frames;
    TimerQueue deferred;

    Paddle p1;
    Paddle p2;
    Ball b;

    bool has_entities = false;
    bool music_started = false;
    bool reset_flag = false;
    TimerToken reset_timer;         ///< Pending post-score reset, if any
    std::uint64_t frame_handle = 0;
};

} // namespace paddleball
