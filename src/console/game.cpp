/**
 * @file console/game.cpp
 * @brief Terminal host: raw key bytes in, character frames out
 *
 * Terminals report presses but not releases, so direction keys are held
 * for a short window after each byte and released when it expires.
 */

#include "console/game.h"
#include "app/game_session.h"
#include "core/game_core.h"
#include "core/frame_timer.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

namespace paddleball {

namespace {
constexpr double kKeyHoldMs = 120.0;
}

TerminalSurface::TerminalSurface(int cols, int rows)
    : width(cols), height(rows), grid(rows, std::string(cols, ' ')) {}

void TerminalSurface::clear(unsigned int) {
    for (auto &row : grid) std::fill(row.begin(), row.end(), ' ');
}

void TerminalSurface::fill(double x, double y, double w, double h, char ch) {
    int x0 = (int)std::floor(x), y0 = (int)std::floor(y);
    int x1 = std::max(x0 + 1, (int)std::ceil(x + w));
    int y1 = std::max(y0 + 1, (int)std::ceil(y + h));
    x0 = std::clamp(x0, 0, width); x1 = std::clamp(x1, 0, width);
    y0 = std::clamp(y0, 0, height); y1 = std::clamp(y1, 0, height);
    for (int r = y0; r < y1; ++r)
        for (int c = x0; c < x1; ++c) grid[r][c] = ch;
}

void TerminalSurface::draw_image(ImageId image, double x, double y, double w, double h) {
    if (image == ImageId::Background) {
        int mid = width / 2;
        for (int r = 0; r < height; r += 2) grid[r][mid] = ':';
        return;
    }
    fill(x, y, w, h, 'O');
}

void TerminalSurface::fill_rect(double x, double y, double w, double h, unsigned int) {
    fill(x, y, w, h, '|');
}

std::vector<std::string> TerminalOverlay::lines() const {
    std::vector<std::string> out;
    if (loading) { out.push_back("Loading..."); return out; }
    std::string status = stats ? ("P2 " + score2 + "   P1 " + score1) : std::string();
    status += muted ? "   [muted]" : "";
    status += paused ? "   [paused]" : "";
    out.push_back(status);
    out.push_back(banner.empty() ? std::string() : ("== " + banner + " =="));
    out.push_back(button.empty() ? std::string() : ("[Enter] " + button));
    out.push_back(instructions);
    return out;
}

Game::Game(int w, int h, Platform &platform, const Settings &settings, PreferenceStore &prefs)
: width(w), height(h), platform(platform), settings(settings), prefs(prefs), surface(w, h) {}

void Game::press(GameSession &session, Key k, double now_ms) {
    auto it = std::find_if(held.begin(), held.end(), [&](const HeldKey &hk){ return hk.key == k; });
    if (it != held.end()) { it->release_at = now_ms + kKeyHoldMs; return; }
    session.core().key_down(k);
    held.push_back({k, now_ms + kKeyHoldMs});
}

void Game::release_expired(GameSession &session, double now_ms) {
    for (auto it = held.begin(); it != held.end();) {
        if (it->release_at <= now_ms) { session.core().key_up(it->key); it = held.erase(it); }
        else ++it;
    }
}

void Game::process_input(GameSession &session, double now_ms) {
    auto tap = [&](Key k){ session.core().key_down(k); session.core().key_up(k); };
    while (platform.kbhit()) {
        int c = platform.getch();
        if (c < 0) break;
        if (c == 'q' || c == 'Q') { running = false; }
        if (c == 'w' || c == 'W') { press(session, Key::Player2Up, now_ms); }
        if (c == 's' || c == 'S') { press(session, Key::Player2Down, now_ms); }
        if (c == 'e' || c == 'E') { tap(Key::Player2Relaunch); }
        if (c == ' ') { tap(Key::Relaunch); }
        if (c == 'p' || c == 'P') { tap(Key::Pause); }
        if (c == 'm' || c == 'M') { tap(Key::Mute); }
        if (c == '\r' || c == '\n') { tap(Key::Start); }
        if (c == 0x1B) { // ESC seq
            if (!platform.kbhit()) continue;
            int b1 = platform.getch();
            if (b1 == '[') {
                if (!platform.kbhit()) continue;
                int b2 = platform.getch();
                if (b2 == 'A') { press(session, Key::Player1Up, now_ms); }
                if (b2 == 'B') { press(session, Key::Player1Down, now_ms); }
            }
        }
        if (c == 0 || c == 0xE0) { // Windows arrow prefix
            if (!platform.kbhit()) continue;
            int code = platform.getch();
            if (code == 72) { press(session, Key::Player1Up, now_ms); }
            if (code == 80) { press(session, Key::Player1Down, now_ms); }
        }
    }
    release_expired(session, now_ms);
}

void Game::render() {
    std::string out;
    out.reserve((width + 1) * (height + 6) + 128);
    out += "\x1b[H"; // cursor home
    for (const auto &row : surface.rows()) { out += row; out += '\n'; }
    for (const auto &line : overlay.lines()) {
        std::string l = line.substr(0, (size_t)width);
        l.resize((size_t)width, ' ');
        out += l; out += '\n';
    }
    out += "Arrows: move  Space: launch  W/S: player 2  E: P2 launch  P: pause  M: mute  Q: quit";
    if (audio.take_ring()) out += '\a';
    std::cout << out << std::flush;
}

int Game::run() {
    using clock = std::chrono::steady_clock;
    const double target_dt = 1.0/60.0;
    Collaborators io{surface, overlay, audio, prefs};
    GameSession session(settings, io, width, height);

    platform.clear_screen();
    platform.set_cursor_visible(false);
    auto last = clock::now();
    while (running) {
        auto now = clock::now();
        std::chrono::duration<double> elapsed = now - last;
        if (elapsed.count() < target_dt) {
            std::this_thread::sleep_for(std::chrono::duration<double>(target_dt - elapsed.count()));
            continue;
        }
        last = now;
        double now_ms = monotonic_ms();
        unsigned int generation = session.generation();
        process_input(session, now_ms);
        session.pump(now_ms);
        // keys held across a reset belong to the old session
        if (session.generation() != generation) held.clear();
        render();
    }
    platform.set_cursor_visible(true);
    return 0;
}

} // namespace paddleball
