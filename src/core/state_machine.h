/**
 * @file state_machine.h
 * @brief Game phase progression plus pause/mute flags
 */

#pragma once

namespace paddleball {

enum class Phase {
    Loading = 0,
    Ready,
    Play,
    WinPlayer1,
    WinPlayer2
};

const char* phase_name(Phase p);

/**
 * @brief Fixed-transition phase machine
 *
 * loading -> ready -> play -> win-player1 | win-player2. Win phases are
 * terminal; only a new session starts over at loading. Every phase write
 * records the outgoing phase as previous(), so callers can tell whether
 * a phase was entered since the last settle().
 *
 * paused and muted are independent of the phase and never change it.
 */
class StateMachine {
public:
    explicit StateMachine(int win_score = 5) : win(win_score) {}

    Phase current() const { return cur; }
    Phase previous() const { return prev; }
    bool paused() const { return is_paused; }
    bool muted() const { return is_muted; }
    int win_score() const { return win; }
    bool is_win() const { return cur == Phase::WinPlayer1 || cur == Phase::WinPlayer2; }

    /// True when the phase is @p to and the last write came from @p from.
    bool entered(Phase from, Phase to) const { return cur == to && prev == from; }

    void set_win_score(int score) { win = score; }

    /// loading -> ready. Returns false from any other phase.
    bool mark_ready();

    /// ready -> play. Returns false from any other phase.
    bool start();

    /**
     * @brief play -> win-* once a score equals the win score
     *
     * Player 1 is checked first and wins a simultaneous tie.
     * @return true if a win phase was entered
     */
    bool check_winner(int player1_score, int player2_score);

    /// Rewrite the current phase, so previous() == current().
    void settle() { write(cur); }

    /**
     * @brief Flip the pause flag, only while playing
     * @return false (and no change) outside the play phase
     */
    bool toggle_pause();

    void set_muted(bool m) { is_muted = m; }

private:
    void write(Phase next);

    Phase cur = Phase::Loading;
    Phase prev = Phase::Loading;
    bool is_paused = false;
    bool is_muted = false;
    int win;
};

} // namespace paddleball
