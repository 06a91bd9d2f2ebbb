/**
 * @file platform/platform.h
 * @brief Terminal abstraction used by the console host
 *
 * Hides raw-mode keyboard reads and ANSI output differences between
 * POSIX terminals and the Windows console.
 */
#pragma once
#include <memory>

namespace paddleball {

struct Platform {
    virtual ~Platform() = default;

    /// Non-blocking: true if a byte is waiting to be read.
    virtual bool kbhit() = 0;

    /// Read one byte of keyboard input, or -1 on failure.
    virtual int getch() = 0;

    virtual void clear_screen() = 0;
    virtual void set_cursor_visible(bool visible) = 0;
    virtual void enable_ansi() = 0;

    /**
     * @brief Current terminal size in character cells
     * @return false if the size could not be queried (outputs untouched)
     */
    virtual bool terminal_size(int &cols, int &rows) = 0;
};

std::unique_ptr<Platform> createPlatform();

} // namespace paddleball
