#include "core/ball.h"
#include "core/debug_log.h"
#include "core/scheduler.h"
#include <cmath>
#include <iostream>

namespace paddleball {

namespace {

int unit(int d) { return d < 0 ? -1 : 1; }

} // namespace

bool Ball::launch(int dx, double edge_offset) {
    if (dx == 0) {
        std::cerr << "warning: ball launch ignored, horizontal direction is 0\n";
        return false;
    }
    dx = unit(dx);
    double shift = (edge_offset + body.width) * dx;
    stop();
    launched = true;
    body.set_x(body.x + shift);
    direction_x = dx;
    PADDLEBALL_DBG << "ball launched dx=" << dx << " x=" << body.x << "\n";
    return true;
}

bool Ball::launch(TimerQueue& timers, double delay_ms, int dx, double edge_offset) {
    if (delay_ms <= 0) return launch(dx, edge_offset);
    if (dx == 0) {
        std::cerr << "warning: delayed ball launch ignored, horizontal direction is 0\n";
        return false;
    }
    dx = unit(dx);
    double shift = (edge_offset + body.width) * dx;
    stop();
    timers.schedule(delay_ms, [this, dx, shift]() {
        launched = true;
        body.set_x(body.x + shift);
        direction_x = dx;
        PADDLEBALL_DBG << "ball launched (deferred) dx=" << dx << " x=" << body.x << "\n";
    });
    return true;
}

void Ball::stop() {
    launched = false;
    direction_x = 0;
}

void Ball::move(double scale) {
    if (!launched) return;
    body.move(direction_x, direction_y, scale);
}

bool Ball::collides_with(const Body& other) const {
    double distance_x = std::abs(other.center_x - body.center_x);
    bool on_y = body.center_y > other.y && body.center_y < other.y + other.height;
    return on_y && distance_x < (other.width + body.width) / 2.0;
}

Paddle* Ball::collisions_with(const std::vector<Paddle*>& paddles) const {
    for (Paddle* p : paddles) {
        if (p && collides_with(p->body)) return p;
    }
    return nullptr;
}

} // namespace paddleball
