/**
 * @file computer_opponent.h
 * @brief Proportional tracker driving the left paddle in single-player games
 */

#pragma once

namespace paddleball {

struct Ball;
struct Body;

/**
 * @brief Coarse, beatable opponent
 *
 * Commands axis = (ball.y / 2 - paddle.y) / (ball.x * 2), clamped to
 * +/- difficulty / 2. Only engages while no second human has joined and
 * the ball is launched toward the left paddle.
 */
class ComputerOpponent {
public:
    explicit ComputerOpponent(double difficulty = 4.0)
        : difficulty(difficulty < 0 ? 0.0 : difficulty) {}

    bool engaged(const Ball& ball, bool second_player_active) const;
    double command(const Ball& ball, const Body& paddle) const;
    double speed_limit() const { return difficulty / 2.0; }

private:
    double difficulty;
};

} // namespace paddleball
