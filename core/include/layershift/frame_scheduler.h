#pragma once

/**
 * @file frame_scheduler.h
 * @brief Host-driven frame and timer callbacks
 *
 * The desktop host pumps the scheduler once per swap, which makes it the
 * display refresh signal. Time only advances through pump(), so tests can
 * drive frames and timeouts deterministically.
 */

#include <cstdint>
#include <functional>
#include <map>

namespace layershift {

class FrameScheduler {
public:
    using Id = uint64_t;
    using FrameCallback = std::function<void(double nowMs)>;
    using TimerCallback = std::function<void()>;

    /// @brief Run cb on the next pump; callbacks requested during a pump wait for the following one
    Id requestFrame(FrameCallback cb);
    void cancelFrame(Id id);

    /// @brief Run cb on the first pump at or after now() + delayMs
    Id setTimeout(double delayMs, TimerCallback cb);
    void clearTimeout(Id id);

    /**
     * @brief Advance time and run due callbacks
     *
     * Frame callbacks run first in request order, then due timers in
     * deadline order. A callback cancelled by an earlier one in the same
     * pump does not run.
     */
    void pump(double nowMs);

    /// @brief Time of the last pump
    double now() const { return m_now; }

    size_t pendingFrames() const { return m_frames.size(); }
    size_t pendingTimers() const { return m_timers.size(); }

private:
    struct Timer {
        double dueMs = 0.0;
        TimerCallback cb;
    };

    Id m_nextId = 1;
    double m_now = 0.0;
    std::map<Id, FrameCallback> m_frames;
    std::map<Id, Timer> m_timers;
};

} // namespace layershift
