/**
 * @file scheduler.h
 * @brief Cooperative frame scheduling and deferred actions
 *
 * Everything here runs on the caller's thread. The host pumps both
 * objects once per display refresh: timers first, then the frame.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace paddleball {

/**
 * @brief Single-slot "next frame" request, modelled on a display refresh callback
 *
 * At most one frame is pending. A new request replaces the previous one,
 * and cancel() only drops the request whose handle it is given.
 */
class FrameScheduler {
public:
    using Callback = std::function<void(double timestamp_ms)>;

    /**
     * @brief Request that @p next runs on the next dispatch
     * @return Handle identifying this request (never 0)
     */
    std::uint64_t request(Callback next);

    /**
     * @brief Drop the pending request if @p handle still names it
     */
    void cancel(std::uint64_t handle);

    /**
     * @brief Run the pending callback, if any
     *
     * The slot is cleared before the callback runs so the callback may
     * request the following frame.
     *
     * @return true if a callback ran
     */
    bool dispatch(double now_ms);

    bool pending() const { return static_cast<bool>(callback); }
    std::uint64_t pending_handle() const { return handle; }

private:
    Callback callback;
    std::uint64_t handle = 0;
    std::uint64_t next_handle = 1;
};

/**
 * @brief Token returned by TimerQueue::schedule, used to cancel
 */
struct TimerToken {
    std::uint64_t id = 0;
    bool valid() const { return id != 0; }
};

/**
 * @brief Deferred actions with explicit fire times
 *
 * Due timers fire in fire-time order (ties keep scheduling order).
 * Timers scheduled from inside a firing callback are never run in the
 * same advance_to() call, so callbacks are not reentered.
 */
class TimerQueue {
public:
    using Action = std::function<void()>;

    TimerToken schedule(double delay_ms, Action action);
    bool cancel(TimerToken token);
    void cancel_all();

    /**
     * @brief Move the clock to @p now_ms and fire everything due
     * @return Number of actions fired
     */
    int advance_to(double now_ms);

    double now() const { return now_ms; }
    std::size_t size() const { return timers.size(); }
    bool empty() const { return timers.empty(); }

private:
    struct Timer {
        std::uint64_t id;
        double fire_at;
        Action action;
    };

    std::vector<Timer> timers;
    double now_ms = 0.0;
    std::uint64_t next_id = 1;
};

} // namespace paddleball
