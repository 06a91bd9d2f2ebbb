#include "x11/game_x11.h"
#include "app/game_session.h"
#include "core/frame_timer.h"
#include "core/game_core.h"
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

namespace paddleball {

X11Surface::X11Surface(Display* display, Window window, int width, int height, unsigned int ball_color)
    : m_display(display), m_window(window), m_width(width), m_height(height), m_ballColor(ball_color) {
    m_gc = XCreateGC(m_display, m_window, 0, nullptr);
    m_font = XLoadQueryFont(m_display, "fixed");
    if (m_font) XSetFont(m_display, m_gc, m_font->fid);
    resize(width, height);
}

X11Surface::~X11Surface() {
    if (m_backBuffer) XFreePixmap(m_display, m_backBuffer);
    if (m_font) XFreeFont(m_display, m_font);
    if (m_gc) XFreeGC(m_display, m_gc);
}

void X11Surface::resize(int width, int height) {
    if (m_backBuffer) XFreePixmap(m_display, m_backBuffer);
    m_width = width;
    m_height = height;
    int screen = DefaultScreen(m_display);
    m_backBuffer = XCreatePixmap(m_display, m_window, m_width, m_height, DefaultDepth(m_display, screen));
}

void X11Surface::set_color(unsigned int rgb) {
    // TrueColor visuals take 0xRRGGBB directly as the pixel value
    XSetForeground(m_display, m_gc, rgb);
}

void X11Surface::clear(unsigned int color) {
    set_color(color);
    XFillRectangle(m_display, m_backBuffer, m_gc, 0, 0, m_width, m_height);
}

void X11Surface::draw_image(ImageId image, double x, double y, double w, double h) {
    if (image == ImageId::Background) {
        // center net
        set_color(0x404060);
        int mid = m_width / 2;
        for (int yy = 0; yy < m_height; yy += 24) {
            XFillRectangle(m_display, m_backBuffer, m_gc, mid - 2, yy, 4, 12);
        }
        return;
    }
    set_color(m_ballColor);
    XFillArc(m_display, m_backBuffer, m_gc, (int)std::lround(x), (int)std::lround(y),
             (unsigned)std::max(1L, std::lround(w)), (unsigned)std::max(1L, std::lround(h)), 0, 360 * 64);
}

void X11Surface::fill_rect(double x, double y, double w, double h, unsigned int color) {
    set_color(color);
    XFillRectangle(m_display, m_backBuffer, m_gc, (int)std::lround(x), (int)std::lround(y),
                   (unsigned)std::max(1L, std::lround(w)), (unsigned)std::max(1L, std::lround(h)));
}

void X11Surface::draw_text(int x, int y, const std::string& text, unsigned int color) {
    if (text.empty()) return;
    set_color(color);
    XDrawString(m_display, m_backBuffer, m_gc, x, y, text.c_str(), (int)text.size());
}

void X11Surface::draw_text_centered(int y, const std::string& text, unsigned int color) {
    int w = m_font ? XTextWidth(m_font, text.c_str(), (int)text.size()) : (int)text.size() * 6;
    draw_text((m_width - w) / 2, y, text, color);
}

void X11Surface::flip() {
    XCopyArea(m_display, m_backBuffer, m_window, m_gc, 0, 0, m_width, m_height, 0, 0);
    XFlush(m_display);
}

void X11Overlay::set_styles(const Settings& settings) {
    m_textColor = settings.text_color;
    m_primaryColor = settings.primary_color;
}

void X11Overlay::paint(X11Surface& surface) const {
    if (m_loading) {
        surface.draw_text_centered(surface.height() / 2, "Loading...", m_textColor);
        return;
    }
    if (m_stats) {
        surface.draw_text(20, 20, m_score2, m_textColor);
        surface.draw_text(surface.width() - 60, 20, m_score1, m_textColor);
    }
    std::string glyphs = std::string(m_muted ? "[muted]" : "[sound]") + (m_paused ? " [paused]" : "");
    surface.draw_text_centered(20, glyphs, m_textColor);
    surface.draw_text_centered(surface.height() / 2 - 40, m_banner, m_textColor);
    if (!m_button.empty()) {
        surface.draw_text_centered(surface.height() / 2, "[ " + m_button + " ]", m_primaryColor);
    }
    surface.draw_text_centered(surface.height() / 2 + 40, m_instructions, m_textColor);
}

PaddleBallX11::PaddleBallX11(const Settings& settings, PreferenceStore& prefs)
    : m_settings(settings), m_prefs(prefs) {
}

PaddleBallX11::~PaddleBallX11() {
    shutdown();
}

int PaddleBallX11::run() {
    if (!initializeWindow()) {
        std::cerr << "Failed to initialize X11 window" << std::endl;
        return -1;
    }

    m_surface = std::make_unique<X11Surface>(m_display, m_window, m_windowWidth, m_windowHeight, m_settings.ball_color);
    Collaborators io{*m_surface, m_overlay, m_audio, m_prefs};
    m_session = std::make_unique<GameSession>(m_settings, io, m_windowWidth, m_windowHeight);

    gameLoop();

    return 0;
}

bool PaddleBallX11::initializeWindow() {
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        std::cerr << "Cannot open X11 display" << std::endl;
        return false;
    }

    int screen = DefaultScreen(m_display);
    Window root = RootWindow(m_display, screen);

    m_window = XCreateSimpleWindow(
        m_display,
        root,
        0, 0,
        m_windowWidth, m_windowHeight,
        1,
        BlackPixel(m_display, screen),
        BlackPixel(m_display, screen)
    );

    if (!m_window) {
        std::cerr << "Failed to create X11 window" << std::endl;
        return false;
    }

    XStoreName(m_display, m_window, m_settings.name.c_str());

    // Handle window close events
    m_wmDeleteMessage = XInternAtom(m_display, "WM_DELETE_WINDOW", False);
    XSetWMProtocols(m_display, m_window, &m_wmDeleteMessage, 1);

    // Releases only arrive when the key really goes up
    Bool supported = False;
    XkbSetDetectableAutoRepeat(m_display, True, &supported);
    if (!supported) {
        std::cerr << "warning: detectable auto-repeat unavailable, held keys may stutter" << std::endl;
    }

    XSelectInput(m_display, m_window,
                 ExposureMask | KeyPressMask | KeyReleaseMask |
                 ButtonPressMask | ButtonReleaseMask | PointerMotionMask |
                 StructureNotifyMask);

    XMapWindow(m_display, m_window);
    XFlush(m_display);

    return true;
}

void PaddleBallX11::shutdown() {
    m_session.reset();
    m_surface.reset();

    if (m_display) {
        if (m_window) {
            XDestroyWindow(m_display, m_window);
            m_window = 0;
        }
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}

void PaddleBallX11::gameLoop() {
    while (m_running) {
        while (XPending(m_display)) {
            XEvent event;
            XNextEvent(m_display, &event);
            handleEvent(event);
        }

        if (!m_running) break;

        m_session->pump(monotonic_ms());
        // overlay text goes on top of whatever the last frame drew, paused or not
        m_overlay.paint(*m_surface);
        m_surface->flip();

        // ~60 FPS
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }
}

void PaddleBallX11::handleEvent(XEvent& event) {
    switch (event.type) {
    case ClientMessage:
        if ((Atom)event.xclient.data.l[0] == m_wmDeleteMessage) {
            m_running = false;
        }
        break;

    case ConfigureNotify:
        if (event.xconfigure.width != m_windowWidth || event.xconfigure.height != m_windowHeight) {
            m_windowWidth = event.xconfigure.width;
            m_windowHeight = event.xconfigure.height;
            m_surface->resize(m_windowWidth, m_windowHeight);
            m_session->resize(m_windowWidth, m_windowHeight);
        }
        break;

    case KeyPress:
        handleKey(event.xkey, true);
        break;

    case KeyRelease:
        handleKey(event.xkey, false);
        break;

    case ButtonPress:
        if (event.xbutton.button == Button1) {
            GameCore& core = m_session->core();
            if (core.state().current() == Phase::Ready && m_overlay.button_visible()) core.press_start();
            else core.click();
        }
        break;

    case MotionNotify:
        m_session->core().pointer_moved(event.xmotion.y);
        break;
    }
}

void PaddleBallX11::handleKey(XKeyEvent& key, bool pressed) {
    KeySym sym = XLookupKeysym(&key, 0);
    if (pressed && (sym == XK_q || sym == XK_Escape)) {
        m_running = false;
        return;
    }

    Key k;
    switch (sym) {
    case XK_Up: k = Key::Player1Up; break;
    case XK_Down: k = Key::Player1Down; break;
    case XK_w: k = Key::Player2Up; break;
    case XK_s: k = Key::Player2Down; break;
    case XK_space: k = Key::Relaunch; break;
    case XK_Shift_L: k = Key::Player2Relaunch; break;
    case XK_p: k = Key::Pause; break;
    case XK_m: k = Key::Mute; break;
    case XK_Return: k = Key::Start; break;
    default: return;
    }

    GameCore& core = m_session->core();
    if (pressed) core.key_down(k);
    else core.key_up(k);
}

} // namespace paddleball

int run_paddleball_x11(const paddleball::Settings& settings, paddleball::PreferenceStore& prefs) {
    paddleball::PaddleBallX11 game(settings, prefs);
    return game.run();
}
