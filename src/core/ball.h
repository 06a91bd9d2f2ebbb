/**
 * @file ball.h
 * @brief Ball launch protocol and paddle collision queries
 */

#pragma once

#include "core/entity.h"
#include "core/paddle.h"
#include <vector>

namespace paddleball {

class TimerQueue;

/**
 * @brief The ball: a Body plus a launched/stopped protocol
 *
 * A stopped ball ignores move(). launch() and stop() are the only ways
 * between the two states. Nothing forces direction_x to 0 while
 * stopped except stop() itself.
 */
struct Ball {
    Body body;
    int direction_x = -1;   ///< -1, 0 or 1
    int direction_y = 0;    ///< -1, 0 or 1
    bool launched = false;

    /**
     * @brief Launch immediately
     *
     * Stops the ball, then shifts x by (edge_offset + width) * direction
     * and starts moving horizontally in that direction. Launching an
     * already launched ball simply launches it again.
     *
     * @param direction_x Signed unit direction; 0 is rejected
     * @param edge_offset Width of the paddle being launched from
     * @return false (with a warning) if direction_x is 0
     */
    bool launch(int direction_x, double edge_offset);

    /**
     * @brief Launch after @p delay_ms on @p timers
     *
     * The ball stops now. The shift is computed now and applied to
     * whatever x the ball has when the timer fires. A non-positive
     * delay launches immediately.
     */
    bool launch(TimerQueue& timers, double delay_ms, int direction_x, double edge_offset);

    void stop();

    /// No-op while stopped; otherwise Body::move with the current directions.
    void move(double scale);

    /**
     * @brief Lenient proximity test against another body
     *
     * True when the ball's center_y lies strictly inside the other
     * body's vertical span and the horizontal center distance is
     * below half the summed widths.
     */
    bool collides_with(const Body& other) const;

    /**
     * @brief First paddle (in list order) the ball collides with, or nullptr
     */
    Paddle* collisions_with(const std::vector<Paddle*>& paddles) const;
};

} // namespace paddleball
