/**
 * @file entity.cpp
 * @brief Movement and clamping for Body
 */

#include "core/entity.h"
#include "core/errors.h"

namespace paddleball {

void require_valid(const Bounds& b) {
    if (!b.valid()) {
        throw ConfigError("entity bounds must satisfy right > left and bottom > top");
    }
}

Body::Body(double x_, double y_, double w, double h, double spd, const Bounds& b)
    : x(x_), y(y_), prev_x(x_), prev_y(y_),
      center_x(x_ + w / 2.0), center_y(y_ + h / 2.0),
      width(w), height(h), speed(spd) {
    set_bounds(b);
}

void Body::set_x(double nx) {
    prev_x = x;
    x = nx;
    center_x = x + width / 2.0;
    velocity_x = x - prev_x;
}

void Body::set_y(double ny) {
    prev_y = y;
    y = ny;
    center_y = y + height / 2.0;
    velocity_y = y - prev_y;
}

void Body::set_bounds(const Bounds& b) {
    require_valid(b);
    bounds = b;
}

void Body::move(double axis_x, double axis_y, double scale) {
    if (!bounds) {
        throw ConfigError("move() called on an entity without bounds");
    }
    const Bounds& b = *bounds;

    double nx = axis_x == 0 ? x : x + axis_x * speed * scale;
    double ny = axis_y == 0 ? y : y + axis_y * speed * scale;

    // NaN fails both range checks and snaps to the far edge
    if (nx >= b.left && nx <= b.right - width) set_x(nx);
    else set_x(nx < b.left ? b.left : b.right - width);

    if (ny >= b.top && ny <= b.bottom - height) set_y(ny);
    else set_y(ny < b.top ? b.top : b.bottom - height);

    if (axis_x < 0) direction = Facing::Right;
    if (axis_x > 0) direction = Facing::Left;
}

} // namespace paddleball
