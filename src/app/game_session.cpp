#include "app/game_session.h"
#include "core/debug_log.h"
#include "core/game_core.h"
#include <utility>

namespace paddleball {

GameSession::GameSession(const Settings& settings, Collaborators collaborators, double w, double h)
    : config(settings), io(collaborators), width(w), height(h) {
    validate_settings(config);
    rebuild(config, width, height);
}

GameSession::~GameSession() = default;

void GameSession::rebuild(const Settings& settings, double w, double h) {
    // the running core stays in place until its replacement is ready
    auto next = std::make_unique<GameCore>(settings, io, w, h);
    next->load();
    // no asset pipeline here: resources are ready as soon as loading ends
    next->assets_ready();

    config = settings;
    width = w;
    height = h;
    // dropping the old core also drops its pending frame and timers
    game = std::move(next);
    ++sessions;
    PADDLEBALL_DBG << "session " << sessions << " started\n";
}

void GameSession::pump(double now_ms) {
    if (game->reset_requested()) reset();
    game->advance_timers(now_ms);
    game->dispatch_frame(now_ms);
    if (game->reset_requested()) reset();
}

void GameSession::reconfigure(const Settings& settings) {
    Settings candidate = settings;
    validate_settings(candidate);
    rebuild(candidate, width, height);
}

void GameSession::resize(double w, double h) {
    rebuild(config, w, h);
}

void GameSession::reset() { rebuild(config, width, height); }

GameCore& GameSession::core() { return *game; }

const GameCore& GameSession::core() const { return *game; }

} // namespace paddleball
