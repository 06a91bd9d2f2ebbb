#include "core/frame_timer.h"
#include <chrono>

namespace paddleball {

double surface_scale(double width, double height) {
    return ((width + height) / 2.0) * 0.003;
}

const FrameTiming& FrameTimer::tick(double now_ms) {
    current.delta_ms = resumed ? 0.0 : now_ms - current.last_timestamp;
    resumed = false;
    current.last_timestamp = now_ms;
    current.scale = surface * current.delta_ms * 0.01;
    ++current.sequence;
    return current;
}

double monotonic_ms() {
    using clock = std::chrono::steady_clock;
    std::chrono::duration<double, std::milli> d = clock::now().time_since_epoch();
    return d.count();
}

} // namespace paddleball
