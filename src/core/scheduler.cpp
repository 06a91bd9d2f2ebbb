#include "core/scheduler.h"
#include <algorithm>
#include <utility>

namespace paddleball {

std::uint64_t FrameScheduler::request(Callback next) {
    callback = std::move(next);
    handle = next_handle++;
    return handle;
}

void FrameScheduler::cancel(std::uint64_t h) {
    if (h != 0 && h == handle) {
        callback = nullptr;
        handle = 0;
    }
}

bool FrameScheduler::dispatch(double now_ms) {
    if (!callback) return false;
    Callback cb = std::move(callback);
    callback = nullptr;
    handle = 0;
    cb(now_ms);
    return true;
}

TimerToken TimerQueue::schedule(double delay_ms, Action action) {
    if (delay_ms < 0) delay_ms = 0;
    TimerToken tok{next_id++};
    timers.push_back({tok.id, now_ms + delay_ms, std::move(action)});
    return tok;
}

bool TimerQueue::cancel(TimerToken token) {
    auto it = std::find_if(timers.begin(), timers.end(),
                           [&](const Timer &t){ return t.id == token.id; });
    if (it == timers.end()) return false;
    timers.erase(it);
    return true;
}

void TimerQueue::cancel_all() { timers.clear(); }

int TimerQueue::advance_to(double now) {
    if (now > now_ms) now_ms = now;

    // ids handed out from here on belong to timers scheduled while firing
    const std::uint64_t horizon = next_id;
    int fired = 0;
    for (;;) {
        auto due = timers.end();
        for (auto it = timers.begin(); it != timers.end(); ++it) {
            if (it->id >= horizon || it->fire_at > now_ms) continue;
            if (due == timers.end() || it->fire_at < due->fire_at) due = it;
        }
        if (due == timers.end()) break;
        Action action = std::move(due->action);
        timers.erase(due);
        action();
        ++fired;
    }
    return fired;
}

} // namespace paddleball
