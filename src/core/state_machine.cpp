#include "core/state_machine.h"
#include "core/debug_log.h"

namespace paddleball {

const char* phase_name(Phase p) {
    switch (p) {
    case Phase::Loading: return "loading";
    case Phase::Ready: return "ready";
    case Phase::Play: return "play";
    case Phase::WinPlayer1: return "win-player1";
    case Phase::WinPlayer2: return "win-player2";
    }
    return "unknown";
}

void StateMachine::write(Phase next) {
    if (next != cur) {
        PADDLEBALL_DBG << "phase " << phase_name(cur) << " -> " << phase_name(next) << "\n";
    }
    prev = cur;
    cur = next;
}

bool StateMachine::mark_ready() {
    if (cur != Phase::Loading) return false;
    write(Phase::Ready);
    return true;
}

bool StateMachine::start() {
    if (cur != Phase::Ready) return false;
    write(Phase::Play);
    return true;
}

bool StateMachine::check_winner(int player1_score, int player2_score) {
    if (cur != Phase::Play) return false;
    if (player1_score == win) { write(Phase::WinPlayer1); return true; }
    if (player2_score == win) { write(Phase::WinPlayer2); return true; }
    return false;
}

bool StateMachine::toggle_pause() {
    if (cur != Phase::Play) return false;
    is_paused = !is_paused;
    return true;
}

} // namespace paddleball
