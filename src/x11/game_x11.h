#pragma once

#include <memory>
#include <string>
#include <X11/Xlib.h>
#include "core/collaborators.h"
#include "core/settings.h"

namespace paddleball {

class GameSession;

// Draws into an off-screen pixmap and copies it to the window on present()
class X11Surface : public Surface {
public:
    X11Surface(Display* display, Window window, int width, int height, unsigned int ball_color);
    ~X11Surface() override;

    void resize(int width, int height);

    void clear(unsigned int color) override;
    void draw_image(ImageId image, double x, double y, double w, double h) override;
    void fill_rect(double x, double y, double w, double h, unsigned int color) override;

    // Copy the back buffer to the window
    void flip();

    // Text drawn by the overlay goes onto the same back buffer
    void draw_text(int x, int y, const std::string& text, unsigned int color);
    void draw_text_centered(int y, const std::string& text, unsigned int color);
    int width() const { return m_width; }
    int height() const { return m_height; }

private:
    void set_color(unsigned int rgb);

    Display* m_display;
    Window m_window;
    GC m_gc = nullptr;
    Pixmap m_backBuffer = 0;
    XFontStruct* m_font = nullptr;
    int m_width;
    int m_height;
    unsigned int m_ballColor;
};

// Keeps the overlay strings and paints them after each frame
class X11Overlay : public Overlay {
public:
    void set_styles(const Settings& settings) override;
    void hide_loading() override { m_loading = false; }
    void set_banner(const std::string& text) override { m_banner = text; }
    void hide_banner() override { m_banner.clear(); }
    void set_button(const std::string& text) override { m_button = text; }
    void hide_button() override { m_button.clear(); }
    void set_instructions(const std::string& desktop, const std::string&) override { m_instructions = desktop; }
    void hide_instructions() override { m_instructions.clear(); }
    void show_stats() override { m_stats = true; }
    void set_score1(const std::string& text) override { m_score1 = text; }
    void set_score2(const std::string& text) override { m_score2 = text; }
    void set_mute(bool muted) override { m_muted = muted; }
    void set_pause(bool paused) override { m_paused = paused; }

    void paint(X11Surface& surface) const;
    bool button_visible() const { return !m_button.empty(); }

private:
    unsigned int m_textColor = 0xffffff;
    unsigned int m_primaryColor = 0x3070ff;
    bool m_loading = true;
    bool m_stats = false;
    bool m_muted = false;
    bool m_paused = false;
    std::string m_banner, m_button, m_instructions, m_score1, m_score2;
};

// X11 window host driving a GameSession at the display refresh cadence
class PaddleBallX11 {
public:
    PaddleBallX11(const Settings& settings, PreferenceStore& prefs);
    ~PaddleBallX11();

    int run();

private:
    bool initializeWindow();
    void shutdown();
    void gameLoop();
    void handleEvent(XEvent& event);
    void handleKey(XKeyEvent& key, bool pressed);

    Settings m_settings;
    PreferenceStore& m_prefs;

    // X11 state
    Display* m_display = nullptr;
    Window m_window = 0;
    Atom m_wmDeleteMessage = 0;
    int m_windowWidth = 800;
    int m_windowHeight = 600;
    bool m_running = true;

    std::unique_ptr<X11Surface> m_surface;
    X11Overlay m_overlay;
    NullAudio m_audio;
    std::unique_ptr<GameSession> m_session;
};

} // namespace paddleball

// C-style entry point used by main_x11.cpp
int run_paddleball_x11(const paddleball::Settings& settings, paddleball::PreferenceStore& prefs);
