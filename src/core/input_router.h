/**
 * @file input_router.h
 * @brief Normalized input intents for both paddles
 *
 * Hosts translate their raw events (terminal bytes, X11 key symbols,
 * pointer motion) into the calls below. The router keeps the latest
 * intent per source and remembers which source spoke last.
 */

#pragma once

namespace paddleball {

/**
 * @brief Logical keys understood by the game
 */
enum class Key {
    Player1Up,
    Player1Down,
    Player2Up,
    Player2Down,
    Relaunch,           ///< Player 1 relaunch (acts on release)
    Player2Relaunch,    ///< Player 2 relaunch (acts on press)
    Pause,
    Mute,
    Start
};

enum class InputSource {
    Keyboard,
    Pointer,
    Touch
};

/**
 * @brief Up/down pair for one paddle
 */
struct DirectionalPad {
    bool up = false;
    bool down = false;

    /// Down counts +1, up counts -1; both or neither give 0.
    int axis() const { return (down ? 1 : 0) + (up ? -1 : 0); }
};

class InputRouter {
public:
    /**
     * @brief Record a key press
     *
     * Any key event makes the keyboard the active source. The first
     * Player2Up/Player2Down press activates the second player for the
     * rest of the session.
     */
    void key_down(Key k);

    /// Record a key release; also selects the keyboard source.
    void key_up(Key k);

    /// Pointer moved to @p y in surface coordinates.
    void pointer_moved(double y);

    /// Touch moved to @p y in surface coordinates.
    void touch_moved(double y);

    InputSource active_source() const { return source; }
    bool second_player_active() const { return second_player; }

    int player1_axis() const { return pad1.axis(); }
    int player2_axis() const { return pad2.axis(); }

    /**
     * @brief Analog command for the pointer/touch source
     *
     * (sourceY - paddle_center_y) / 100, uncapped. Meant to be applied
     * with scale 1 rather than the frame scale.
     */
    double analog_axis(double paddle_center_y) const;

    double pointer_y() const { return pointer; }
    double touch_y() const { return touch; }
    const DirectionalPad& player1_pad() const { return pad1; }
    const DirectionalPad& player2_pad() const { return pad2; }

private:
    void set_key(Key k, bool pressed);

    DirectionalPad pad1;
    DirectionalPad pad2;
    double pointer = 0.0;
    double touch = 0.0;
    InputSource source = InputSource::Keyboard;
    bool second_player = false;
};

} // namespace paddleball
