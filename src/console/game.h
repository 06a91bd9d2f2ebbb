/**
 * @file console/game.h
 * @brief Terminal host for PaddleBall
 */
#pragma once

#include "platform/platform.h"
#include "core/collaborators.h"
#include "core/input_router.h"
#include "core/settings.h"
#include <string>
#include <vector>

namespace paddleball {

class GameSession;

/**
 * @brief Character-cell drawing surface; one cell per surface unit
 */
class TerminalSurface : public Surface {
public:
    TerminalSurface(int cols, int rows);
    void clear(unsigned int color) override;
    void draw_image(ImageId image, double x, double y, double w, double h) override;
    void fill_rect(double x, double y, double w, double h, unsigned int color) override;
    const std::vector<std::string>& rows() const { return grid; }
private:
    void fill(double x, double y, double w, double h, char ch);
    int width;
    int height;
    std::vector<std::string> grid;
};

/**
 * @brief Overlay state printed underneath the playfield
 */
class TerminalOverlay : public Overlay {
public:
    void set_styles(const Settings&) override {}
    void hide_loading() override { loading = false; }
    void set_banner(const std::string& text) override { banner = text; }
    void hide_banner() override { banner.clear(); }
    void set_button(const std::string& text) override { button = text; }
    void hide_button() override { button.clear(); }
    void set_instructions(const std::string& desktop, const std::string&) override { instructions = desktop; }
    void hide_instructions() override { instructions.clear(); }
    void show_stats() override { stats = true; }
    void set_score1(const std::string& text) override { score1 = text; }
    void set_score2(const std::string& text) override { score2 = text; }
    void set_mute(bool m) override { muted = m; }
    void set_pause(bool p) override { paused = p; }

    std::vector<std::string> lines() const;

private:
    bool loading = true;
    bool stats = false;
    bool muted = false;
    bool paused = false;
    std::string banner, button, instructions, score1, score2;
};

/**
 * @brief Terminal bell for score cues; everything else is silent
 */
class BellAudio : public AudioSink {
public:
    void play(SoundCue cue) override { if (cue == SoundCue::Score && !suspended) ring = true; }
    void start_music() override {}
    void suspend() override { suspended = true; }
    void resume() override { suspended = false; }
    /// True once per pending ring.
    bool take_ring() { bool r = ring; ring = false; return r; }
private:
    bool ring = false;
    bool suspended = false;
};

class Game {
public:
    Game(int w, int h, Platform &platform, const Settings &settings, PreferenceStore &prefs);
    int run();
private:
    void process_input(GameSession &session, double now_ms);
    void press(GameSession &session, Key k, double now_ms);
    void release_expired(GameSession &session, double now_ms);
    void render();

    struct HeldKey { Key key; double release_at; };

    int width, height;
    Platform &platform;
    Settings settings;
    PreferenceStore &prefs;
    TerminalSurface surface;
    TerminalOverlay overlay;
    BellAudio audio;
    std::vector<HeldKey> held;
    bool running = true;
};

} // namespace paddleball
