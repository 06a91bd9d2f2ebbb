/**
 * @file game_core.cpp
 * @brief Implementation of the PaddleBall game loop
 *
 * One tick per scheduled frame: timing, phase handling, paddles, ball
 * bounce, paddle hits, scoring, then the ball itself. Deferred actions
 * (delayed relaunch, post-score reset) run on the TimerQueue.
 */

#include "core/game_core.h"
#include "core/debug_log.h"
#include "core/errors.h"
#include <iostream>

namespace paddleball {

GameCore::GameCore(const Settings& settings, Collaborators collaborators, double width, double height)
    : config(settings), io(collaborators), surface_w(width), surface_h(height),
      game_state(settings.win_score), opponent(settings.difficulty) {
    game_state.set_muted(io.prefs.get_bool(mute_key(), false));
}

std::string GameCore::mute_key() const {
    return preference_prefix(config.name) + "muted";
}

void GameCore::load() {
    Bounds sb{0.0, surface_w, surface_h, 0.0};
    if (!sb.valid()) {
        throw ConfigError("surface must have a positive width and height");
    }
    scr.bounds = sb;
    scr.center_x = surface_w / 2.0;
    scr.center_y = surface_h / 2.0;
    scr.scale = surface_scale(surface_w, surface_h);
    frame_timer = FrameTimer(scr.scale);

    game_state.set_win_score(config.win_score);
    io.overlay.set_styles(config);
}

void GameCore::assets_ready() {
    if (has_entities) return;
    create();
}

void GameCore::create() {
    const double scale = scr.scale;
    const double pw = config.paddle_width * scale;
    const double ph = config.paddle_height * scale;
    const double py = scr.center_y - ph / 2.0;

    p1.owner = PlayerId::Player1;
    p1.color = config.right_paddle_color;
    p1.body = Body(scr.bounds.right - pw, py, pw, ph, config.paddle_speed, scr.bounds);

    p2.owner = PlayerId::Player2;
    p2.color = config.left_paddle_color;
    p2.body = Body(0.0, py, pw, ph, config.paddle_speed, scr.bounds);

    // ball may travel one ball width past either side so it can score
    const double bs = config.ball_size * scale;
    Bounds ball_bounds{0.0, scr.bounds.right + bs, scr.bounds.bottom, scr.bounds.left - bs};
    b = Ball{};
    b.body = Body(scr.bounds.right + bs, p1.body.y, bs, bs, config.ball_speed, ball_bounds);
    b.direction_y = config.ball_direction_y;

    has_entities = true;
    game_state.mark_ready();
    request_frame();
}

void GameCore::advance_timers(double now_ms) {
    deferred.advance_to(now_ms);
}

bool GameCore::dispatch_frame(double now_ms) {
    return frames.dispatch(now_ms);
}

void GameCore::request_frame(bool resumed) {
    if (resumed) frame_timer.mark_resumed();
    frame_handle = frames.request([this](double t){ play(t); });
}

void GameCore::cancel_frame() {
    frames.cancel(frame_handle);
    frame_handle = 0;
}

void GameCore::play(double now_ms) {
    const FrameTiming &ft = frame_timer.tick(now_ms);
    const double scale = ft.scale;

    io.surface.clear(config.background_color);
    io.surface.draw_image(ImageId::Background, 0.0, 0.0, scr.bounds.right, scr.bounds.bottom);

    io.overlay.set_score1(score_text(p1));
    io.overlay.set_score2(score_text(p2));

    if (game_state.entered(Phase::Loading, Phase::Ready)) {
        io.overlay.hide_loading();
        io.overlay.set_banner(config.name);
        io.overlay.set_button(config.start_text);
        io.overlay.show_stats();
        io.overlay.set_mute(game_state.muted());
        io.overlay.set_pause(game_state.paused());
        io.overlay.set_instructions(config.instructions_desktop, config.instructions_mobile);
        game_state.settle();
    }

    if (game_state.current() == Phase::Play) {
        if (game_state.entered(Phase::Ready, Phase::Play)) {
            io.overlay.hide_banner();
            io.overlay.hide_button();
            io.overlay.hide_instructions();
            game_state.settle();
        }

        // the rest of this tick still runs after a win is detected
        game_state.check_winner(p1.score, p2.score);

        if (!game_state.muted() && !music_started) {
            io.audio.start_music();
            music_started = true;
        }

        update_player1(scale);
        draw_paddle(p1);
        update_player2(scale);
        draw_paddle(p2);
        update_ball(scale);
        io.surface.draw_image(ImageId::Ball, b.body.x, b.body.y, b.body.width, b.body.height);
    }

    if (game_state.current() == Phase::WinPlayer1) io.overlay.set_banner(config.player1_win_text);
    if (game_state.current() == Phase::WinPlayer2) io.overlay.set_banner(config.player2_win_text);

    io.surface.present();
    request_frame();
}

void GameCore::update_player1(double scale) {
    if (router.active_source() == InputSource::Keyboard) {
        p1.body.move(0, router.player1_axis(), scale);
    } else {
        // analog sources steer at a fixed scale of 1
        p1.body.move(0, router.analog_axis(p1.body.center_y), 1.0);
    }
}

void GameCore::update_player2(double scale) {
    if (opponent.engaged(b, router.second_player_active())) {
        p2.body.move(0, opponent.command(b, p2.body), scale);
    }
    if (router.second_player_active()) {
        p2.body.move(0, router.player2_axis(), scale);
    }
}

void GameCore::update_ball(double scale) {
    const Bounds &bb = *b.body.bounds;

    // clamping lands exactly on the edge, so equality is the contact test
    bool on_edge_y = b.body.y == scr.bounds.top || b.body.y == scr.bounds.bottom - b.body.height;
    if (on_edge_y) b.direction_y = -b.direction_y;

    Paddle* hit = b.collisions_with({&p1, &p2});
    if (hit && hit->owner == PlayerId::Player1) {
        playback(SoundCue::Bounce);
        b.direction_x = -1;
        b.body.speed += kPlayer1HitSpeedup;
    }
    if (hit && hit->owner == PlayerId::Player2) {
        playback(SoundCue::Bounce);
        b.direction_x = 1;
        b.body.speed += kPlayer2HitSpeedup;
        b.stop();
        schedule_reset();
    }

    // out on the left: point for player 1 (right paddle)
    if (b.launched && b.body.x <= bb.left) {
        playback(SoundCue::Score);
        p1.score += 1;
        PADDLEBALL_DBG << player_name(p1.owner) << " scores: " << p1.score << "\n";
        b.body.speed = config.ball_speed;
        if (router.second_player_active()) {
            b.stop();
        } else {
            b.body.set_y(p2.body.y);
            b.launch(deferred, kComputerRelaunchDelayMs, 1, p2.body.width);
        }
        schedule_reset();
    }

    // out on the right: point for player 2 (left paddle); no auto relaunch here
    if (b.launched && b.body.x + b.body.width >= bb.right) {
        playback(SoundCue::Score);
        p2.score += 1;
        PADDLEBALL_DBG << player_name(p2.owner) << " scores: " << p2.score << "\n";
        b.body.speed = config.ball_speed;
        b.stop();
    }

    b.move(scale);
}

void GameCore::draw_paddle(const Paddle& p) {
    io.surface.fill_rect(p.body.x, p.body.y, p.body.width, p.body.height, p.color);
}

void GameCore::playback(SoundCue cue) {
    if (game_state.muted()) return;
    io.audio.play(cue);
}

void GameCore::schedule_reset() {
    if (reset_timer.valid()) return;
    reset_timer = deferred.schedule(kResetDelayMs, [this]() {
        reset_timer = TimerToken{};
        request_reset();
    });
}

void GameCore::request_reset() {
    PADDLEBALL_DBG << "session reset requested\n";
    reset_flag = true;
}

bool GameCore::stopped_on_right() const {
    return !b.launched && b.body.x > scr.center_x;
}

std::string GameCore::score_text(const Paddle& p) const {
    return std::to_string(p.score) + "/" + std::to_string(game_state.win_score());
}

void GameCore::relaunch_ball(LaunchSide side) {
    if (!has_entities || b.launched) return;

    b.body.speed = config.ball_speed;
    if (side == LaunchSide::Right) {
        b.body.set_y(p1.body.y);
        b.launch(-1, p1.body.width);
    } else {
        b.body.set_y(p2.body.y);
        b.launch(1, p2.body.width);
    }
}

void GameCore::key_down(Key k) {
    router.key_down(k);
    if (!has_entities) return;

    switch (k) {
    case Key::Player2Relaunch:
        if (game_state.current() == Phase::Play && !stopped_on_right()) {
            relaunch_ball(LaunchSide::Left);
        }
        break;
    case Key::Pause: toggle_pause(); break;
    case Key::Mute: toggle_mute(); break;
    case Key::Start: press_start(); break;
    default: break;
    }
}

void GameCore::key_up(Key k) {
    router.key_up(k);
    if (!has_entities || k != Key::Relaunch) return;

    if (game_state.current() == Phase::Play && stopped_on_right()) {
        relaunch_ball(LaunchSide::Right);
    }
    if (game_state.is_win()) request_reset();
}

void GameCore::pointer_moved(double y) { router.pointer_moved(y); }

void GameCore::touch_moved(double y) { router.touch_moved(y); }

void GameCore::click() {
    if (game_state.current() == Phase::Loading) return;
    if (game_state.current() == Phase::Play && stopped_on_right()) {
        relaunch_ball(LaunchSide::Right);
    }
    if (game_state.is_win()) request_reset();
}

void GameCore::press_start() {
    if (game_state.current() == Phase::Loading) return;
    game_state.start();
}

void GameCore::toggle_pause() {
    if (!game_state.toggle_pause()) return;
    io.overlay.set_pause(game_state.paused());

    if (game_state.paused()) {
        // deferred actions keep running; only the frame chain stops
        cancel_frame();
        io.audio.suspend();
        io.overlay.set_banner("Paused");
    } else {
        request_frame(true);
        if (!game_state.muted()) io.audio.resume();
        io.overlay.hide_banner();
    }
}

void GameCore::toggle_mute() {
    if (game_state.current() == Phase::Loading) return;

    bool muted = !game_state.muted();
    if (!io.prefs.set_bool(mute_key(), muted)) {
        std::cerr << "warning: could not persist mute preference\n";
    }
    game_state.set_muted(muted);
    io.overlay.set_mute(muted);

    if (muted) {
        io.audio.suspend();
    } else if (!game_state.paused()) {
        io.audio.resume();
    }
}

} // namespace paddleball
