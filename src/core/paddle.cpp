#include "core/paddle.h"

namespace paddleball {

const char* player_name(PlayerId id) {
    return id == PlayerId::Player1 ? "player1" : "player2";
}

} // namespace paddleball
