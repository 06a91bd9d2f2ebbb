#include "core/input_router.h"
#include "core/debug_log.h"

namespace paddleball {

void InputRouter::set_key(Key k, bool pressed) {
    switch (k) {
    case Key::Player1Up: pad1.up = pressed; break;
    case Key::Player1Down: pad1.down = pressed; break;
    case Key::Player2Up: pad2.up = pressed; break;
    case Key::Player2Down: pad2.down = pressed; break;
    default: break;
    }
}

void InputRouter::key_down(Key k) {
    source = InputSource::Keyboard;
    set_key(k, true);
    if (!second_player && (k == Key::Player2Up || k == Key::Player2Down)) {
        second_player = true;
        PADDLEBALL_DBG << "second player joined\n";
    }
}

void InputRouter::key_up(Key k) {
    source = InputSource::Keyboard;
    set_key(k, false);
}

void InputRouter::pointer_moved(double y) {
    source = InputSource::Pointer;
    pointer = y;
}

void InputRouter::touch_moved(double y) {
    source = InputSource::Touch;
    touch = y;
}

double InputRouter::analog_axis(double paddle_center_y) const {
    double y = source == InputSource::Touch ? touch : pointer;
    return (y - paddle_center_y) / 100.0;
}

} // namespace paddleball
