/**
 * @file paddle.h
 * @brief Player paddles
 */

#pragma once

#include "core/entity.h"

namespace paddleball {

/**
 * @brief Paddle owner
 *
 * Player1 plays the right side, Player2 (human or computer) the left.
 */
enum class PlayerId {
    Player1 = 0,
    Player2
};

const char* player_name(PlayerId id);

struct Paddle {
    Body body;
    PlayerId owner = PlayerId::Player1;
    int score = 0;              ///< Only ever incremented by scoring rules
    unsigned int color = 0xffffff;
};

} // namespace paddleball
