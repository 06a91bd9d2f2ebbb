/** platform/platform_posix.cpp - raw-mode POSIX terminal */
#include "platform/platform.h"
#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <iostream>

namespace paddleball {

class PosixPlatform : public Platform {
public:
    PosixPlatform() {
        enable_ansi();
        have_orig = tcgetattr(STDIN_FILENO, &orig) == 0;
        if (have_orig) {
            struct termios term = orig;
            term.c_lflag &= ~(ICANON | ECHO);
            term.c_cc[VMIN] = 0;
            term.c_cc[VTIME] = 0;
            tcsetattr(STDIN_FILENO, TCSANOW, &term);
        }
    }
    ~PosixPlatform() override {
        if (have_orig) tcsetattr(STDIN_FILENO, TCSANOW, &orig);
        set_cursor_visible(true);
    }
    bool kbhit() override { int bytes = 0; ioctl(STDIN_FILENO, FIONREAD, &bytes); return bytes > 0; }
    int getch() override { unsigned char c = 0; if (read(STDIN_FILENO, &c, 1) <= 0) return -1; return (int)c; }
    void clear_screen() override { std::cout << "\x1b[2J\x1b[H"; }
    void set_cursor_visible(bool v) override { std::cout << (v ? "\x1b[?25h" : "\x1b[?25l") << std::flush; }
    void enable_ansi() override {}
    bool terminal_size(int &cols, int &rows) override {
        struct winsize ws{};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0) return false;
        cols = ws.ws_col; rows = ws.ws_row;
        return true;
    }
private:
    struct termios orig{};
    bool have_orig = false;
};

std::unique_ptr<Platform> createPlatform() { return std::make_unique<PosixPlatform>(); }

} // namespace paddleball
#endif
