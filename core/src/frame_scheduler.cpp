// Layershift - Frame scheduler

#include <layershift/frame_scheduler.h>
#include <algorithm>
#include <vector>

namespace layershift {

FrameScheduler::Id FrameScheduler::requestFrame(FrameCallback cb) {
    const Id id = m_nextId++;
    m_frames.emplace(id, std::move(cb));
    return id;
}

void FrameScheduler::cancelFrame(Id id) {
    m_frames.erase(id);
}

FrameScheduler::Id FrameScheduler::setTimeout(double delayMs, TimerCallback cb) {
    const Id id = m_nextId++;
    m_timers.emplace(id, Timer{m_now + std::max(delayMs, 0.0), std::move(cb)});
    return id;
}

void FrameScheduler::clearTimeout(Id id) {
    m_timers.erase(id);
}

void FrameScheduler::pump(double nowMs) {
    m_now = std::max(m_now, nowMs);

    // Snapshot first so callbacks registered now wait for the next pump
    std::vector<Id> frameIds;
    frameIds.reserve(m_frames.size());
    for (const auto& entry : m_frames) frameIds.push_back(entry.first);

    for (Id id : frameIds) {
        auto it = m_frames.find(id);
        if (it == m_frames.end()) continue;
        FrameCallback cb = std::move(it->second);
        m_frames.erase(it);
        cb(m_now);
    }

    std::vector<std::pair<double, Id>> due;
    for (const auto& entry : m_timers) {
        if (entry.second.dueMs <= m_now) due.emplace_back(entry.second.dueMs, entry.first);
    }
    std::sort(due.begin(), due.end());

    for (const auto& d : due) {
        auto it = m_timers.find(d.second);
        if (it == m_timers.end()) continue;
        TimerCallback cb = std::move(it->second.cb);
        m_timers.erase(it);
        cb();
    }
}

} // namespace layershift
