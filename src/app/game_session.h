/**
 * @file game_session.h
 * @brief Session lifecycle around GameCore
 *
 * GameSession owns the current GameCore and replaces it whenever a full
 * reset is needed: after a score, after a win, on resize, and when the
 * settings bundle is swapped.
 */

#pragma once

#include <memory>
#include "core/collaborators.h"
#include "core/settings.h"

namespace paddleball {

class GameCore;

/**
 * @brief Owns one game at a time and rebuilds it on reset
 *
 * Hosts call pump() once per display refresh and route input through
 * core(). The reference returned by core() is invalidated by any call
 * that may reset (pump, reconfigure, resize, reset).
 */
class GameSession {
public:
    /**
     * @brief Start the first session immediately
     *
     * The settings are validated before use; the collaborators must
     * outlive the session.
     */
    GameSession(const Settings& settings, Collaborators collaborators, double width, double height);
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Fire due timers, run the pending frame, apply any reset
     * @param now_ms Host timestamp in milliseconds
     */
    void pump(double now_ms);

    /// Swap in a new settings bundle and start a fresh session.
    void reconfigure(const Settings& settings);

    /// Surface changed size; start a fresh session at the new size.
    void resize(double width, double height);

    /// Discard the current game and start over at loading.
    void reset();

    GameCore& core();
    const GameCore& core() const;
    const Settings& settings() const { return config; }

    /// Number of sessions started so far (1 after construction).
    unsigned int generation() const { return sessions; }

private:
    void rebuild(const Settings& settings, double w, double h);

    Settings config;
    Collaborators io;
    double width;
    double height;
    std::unique_ptr<GameCore> game;
    unsigned int sessions = 0;
};

} // namespace paddleball
