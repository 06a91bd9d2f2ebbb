#include "core/settings.h"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <sstream>

namespace paddleball {

void validate_settings(Settings& s) {
    auto at_least = [](int &v, int lo){ if (v < lo) v = lo; };
    at_least(s.paddle_width, 1);
    at_least(s.paddle_height, 1);
    at_least(s.paddle_speed, 1);
    at_least(s.ball_speed, 1);
    at_least(s.ball_size, 1);
    at_least(s.win_score, 1);
    at_least(s.difficulty, 0);
    s.ball_direction_y = std::clamp(s.ball_direction_y, -1, 1);
    auto rgb = [](unsigned int &c){ c &= 0xffffffu; };
    rgb(s.background_color); rgb(s.text_color); rgb(s.primary_color);
    rgb(s.left_paddle_color); rgb(s.right_paddle_color); rgb(s.ball_color);
}

std::string preference_prefix(const std::string& name) {
    std::uint32_t h = 0;
    for (unsigned char c : name) h = h * 31u + c;
    std::int64_t v = static_cast<std::int32_t>(h);
    std::ostringstream os;
    os << std::hex << std::llabs(v);
    return os.str();
}

} // namespace paddleball
