/**
 * @file entity.h
 * @brief Positioned, bounded, movable game objects
 *
 * Body is the movement capability shared by paddles and the ball. Each
 * kind composes a Body and adds its own state instead of inheriting.
 */

#pragma once

#include <optional>

namespace paddleball {

/**
 * @brief Axis-aligned rectangle limiting where an entity may go
 *
 * Coordinates follow the surface: (0,0) is top-left and Y grows downward.
 */
struct Bounds {
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    double left = 0.0;

    bool valid() const { return right > left && bottom > top; }
};

/**
 * @brief Throw ConfigError unless right > left and bottom > top
 */
void require_valid(const Bounds& b);

/**
 * @brief Side an entity is heading toward
 *
 * Negative horizontal motion reports Right and positive reports Left,
 * matching the behaviour gameplay code was tuned against.
 */
enum class Facing {
    Left,
    Right
};

/**
 * @brief Shared movement state for every entity
 *
 * Position is the top-left corner. The center, previous position and
 * velocity are derived and refreshed whenever set_x/set_y run.
 */
struct Body {
    double x = 0.0;
    double y = 0.0;
    double prev_x = 0.0;        ///< Position before the last set_x
    double prev_y = 0.0;        ///< Position before the last set_y
    double center_x = 0.0;
    double center_y = 0.0;
    double velocity_x = 0.0;    ///< x - prev_x after the last set_x
    double velocity_y = 0.0;    ///< y - prev_y after the last set_y
    double width = 0.0;
    double height = 0.0;
    double speed = 1.0;
    Facing direction = Facing::Right;
    std::optional<Bounds> bounds;   ///< Unset bodies refuse to move

    Body() = default;
    Body(double x, double y, double width, double height, double speed, const Bounds& bounds);

    void set_x(double nx);
    void set_y(double ny);

    /**
     * @brief Replace the movement bounds
     * @throws ConfigError if the rectangle is degenerate
     */
    void set_bounds(const Bounds& b);

    /**
     * @brief Move along each axis and clamp into bounds
     *
     * A zero axis keeps that coordinate; otherwise the candidate is
     * position + axis * speed * scale. Candidates outside
     * [left, right - width] / [top, bottom - height] snap to the
     * nearest edge. Velocity and previous position are refreshed on
     * both axes every call.
     *
     * @param axis_x Horizontal command, usually -1, 0 or 1
     * @param axis_y Vertical command (analog sources pass fractions)
     * @param scale Per-frame multiplier from the frame clock
     * @throws ConfigError if the body has no bounds
     */
    void move(double axis_x, double axis_y, double scale);
};

} // namespace paddleball
