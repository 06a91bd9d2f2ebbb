/**
 * @file frame_timer.h
 * @brief Frame timing and movement scale
 *
 * FrameTimer turns frame timestamps into a per-frame movement scale so
 * that perceived speed stays roughly independent of the refresh rate.
 */

#pragma once

#include <cstdint>

namespace paddleball {

/**
 * @brief Timing of the most recent frame
 */
struct FrameTiming {
    std::uint64_t sequence = 0;   ///< Frames ticked so far
    double last_timestamp = 0.0;  ///< Timestamp of the last tick (ms)
    double delta_ms = 0.0;        ///< Time since the previous tick (ms)
    double scale = 0.0;           ///< surface_scale * delta_ms * 0.01
};

/**
 * @brief Surface scale used to size entities: ((w + h) / 2) * 0.003
 */
double surface_scale(double width, double height);

class FrameTimer {
public:
    explicit FrameTimer(double surface_scale = 1.0) : surface(surface_scale) {}

    /**
     * @brief Record a frame at @p now_ms and recompute the scale
     *
     * The first tick, and the first tick after mark_resumed(), report a
     * zero delta so nothing jumps.
     */
    const FrameTiming& tick(double now_ms);

    /// The next tick starts from a zero delta.
    void mark_resumed() { resumed = true; }

    const FrameTiming& timing() const { return current; }
    double surface_scale() const { return surface; }

private:
    FrameTiming current;
    double surface;
    bool resumed = true;
};

/**
 * @brief Milliseconds on the steady clock, for hosts pacing the loop
 */
double monotonic_ms();

} // namespace paddleball
