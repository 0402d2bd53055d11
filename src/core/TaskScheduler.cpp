/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TaskScheduler.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace Ragfall {

void TaskScheduler::scheduleAfter(float seconds, Task task) {
    enqueue(std::max(0.0f, seconds), std::move(task), OwnerToken{}, false);
}

void TaskScheduler::scheduleAfter(float seconds, Task task, OwnerToken owner) {
    enqueue(std::max(0.0f, seconds), std::move(task), std::move(owner), true);
}

void TaskScheduler::scheduleNextTick(Task task) {
    enqueue(0.0, std::move(task), OwnerToken{}, false);
}

void TaskScheduler::scheduleNextTick(Task task, OwnerToken owner) {
    enqueue(0.0, std::move(task), std::move(owner), true);
}

void TaskScheduler::enqueue(double delay, Task task, OwnerToken owner, bool bound) {
    if (!task) {
        SCHEDULER_WARN("Ignoring empty task");
        return;
    }

    PendingTask pending;
    pending.dueTime = m_now + delay;
    pending.sequence = m_nextSequence++;
    pending.earliestTick = m_tick + 1;
    pending.task = std::move(task);
    pending.owner = std::move(owner);
    pending.bound = bound;
    m_pending.push_back(std::move(pending));
}

size_t TaskScheduler::update(float deltaTime) {
    if (m_updating) {
        SCHEDULER_ERROR("Re-entrant update() ignored");
        return 0;
    }

    m_updating = true;
    struct UpdatingReset {
        bool& flag;
        ~UpdatingReset() { flag = false; }
    } updatingReset{m_updating};

    ++m_tick;
    m_now += std::max(0.0f, deltaTime);

    // Pull out everything due this tick so tasks may schedule freely while running
    std::vector<PendingTask> due;
    auto firstNotDue = std::stable_partition(
        m_pending.begin(), m_pending.end(), [this](const PendingTask& t) {
            return !(t.earliestTick <= m_tick && t.dueTime <= m_now);
        });
    due.assign(std::make_move_iterator(firstNotDue),
               std::make_move_iterator(m_pending.end()));
    m_pending.erase(firstNotDue, m_pending.end());

    std::sort(due.begin(), due.end(), [](const PendingTask& a, const PendingTask& b) {
        if (a.dueTime != b.dueTime) {
            return a.dueTime < b.dueTime;
        }
        return a.sequence < b.sequence;
    });

    size_t ran = 0;
    for (auto& pending : due) {
        if (pending.bound && pending.owner.expired()) {
            SCHEDULER_DEBUG(std::format("Dropping task {}: owner is gone", pending.sequence));
            continue;
        }

        try {
            pending.task();
            ++ran;
        } catch (const std::exception& e) {
            SCHEDULER_ERROR(std::format("Task {} threw: {}", pending.sequence, e.what()));
        } catch (...) {
            SCHEDULER_ERROR(std::format("Task {} threw an unknown exception", pending.sequence));
        }
    }

    return ran;
}

void TaskScheduler::clear() {
    if (!m_pending.empty()) {
        SCHEDULER_DEBUG(std::format("Clearing {} pending tasks", m_pending.size()));
    }
    m_pending.clear();
}

} // namespace Ragfall
