/**
 * @file settings.h
 * @brief Read-only settings bundle consumed by a game session
 *
 * Sizes are in surface-scale units and are multiplied by the surface
 * scale when entities are created. Colors are 0xRRGGBB.
 */

#pragma once

#include <string>

namespace paddleball {

struct Settings {
    // Text
    std::string name = "PaddleBall";                ///< Banner text; also keys stored preferences
    std::string start_text = "Start";
    std::string player1_win_text = "Player 1 Wins!";
    std::string player2_win_text = "Player 2 Wins!";
    std::string instructions_desktop = "Arrow keys or mouse to move, Space to launch";
    std::string instructions_mobile = "Drag to move, tap to launch";
    std::string font_family = "monospace";

    // Palette
    unsigned int background_color = 0x101020;
    unsigned int text_color = 0xffffff;
    unsigned int primary_color = 0x3070ff;
    unsigned int left_paddle_color = 0xff5050;      ///< Player 2
    unsigned int right_paddle_color = 0x50a0ff;     ///< Player 1
    unsigned int ball_color = 0xffffff;

    // Gameplay
    int paddle_width = 8;
    int paddle_height = 50;
    int paddle_speed = 50;
    int ball_speed = 10;
    int ball_size = 10;
    int win_score = 5;
    int difficulty = 4;          ///< Computer speed limit is difficulty / 2
    int ball_direction_y = 0;    ///< Initial vertical direction of the ball; 0 plays flat
};

/**
 * @brief Clamp every numeric field into a usable range
 *
 * This is the configuration boundary: the simulation never checks these
 * values again.
 */
void validate_settings(Settings& s);

/**
 * @brief Short identifier derived from the game name
 *
 * 32-bit string hash (h = h * 31 + c, wrapped), absolute value, in base
 * 16. Prefixes stored preference keys so games sharing a store do not
 * collide.
 */
std::string preference_prefix(const std::string& name);

} // namespace paddleball
