#include "core/computer_opponent.h"
#include "core/ball.h"
#include <algorithm>
#include <cmath>

namespace paddleball {

bool ComputerOpponent::engaged(const Ball& ball, bool second_player_active) const {
    return !second_player_active && ball.launched && ball.direction_x < 0;
}

double ComputerOpponent::command(const Ball& ball, const Body& paddle) const {
    double offset = ball.body.y / 2.0 - paddle.y;
    double axis = offset / (ball.body.x * 2.0);
    // 0/0 when the ball sits on x=0 level with the target
    if (std::isnan(axis)) return 0.0;
    double limit = speed_limit();
    return std::clamp(axis, -limit, limit);
}

} // namespace paddleball
