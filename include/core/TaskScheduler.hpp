/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TASK_SCHEDULER_HPP
#define TASK_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace Ragfall {

/**
 * @brief Cooperative single-threaded scheduler over a virtual clock.
 *
 * Work is resumed either after a delay in seconds or on the next tick, and
 * only ever from inside update(). The clock advances by the deltaTime passed
 * to update(), so tests drive it directly without a frame loop.
 *
 * Ordering:
 * - Due tasks run in due-time order, ties in scheduling order.
 * - A task scheduled while update() is running waits for the next update(),
 *   even when its delay is zero.
 *
 * Cancellation: a task may be bound to an owner token. When the owner is
 * gone by the time the task falls due, the task is dropped without running.
 * There is no other way to cancel a task.
 */
class TaskScheduler {
public:
    using Task = std::function<void()>;
    using OwnerToken = std::weak_ptr<const void>;

    TaskScheduler() = default;
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /**
     * @brief Runs task once at least `seconds` of virtual time have passed
     * @param seconds Delay; negative values are treated as zero
     * @param task Work to run
     * @param owner Optional lifetime token, task is dropped once it expires
     */
    void scheduleAfter(float seconds, Task task);
    void scheduleAfter(float seconds, Task task, OwnerToken owner);

    /**
     * @brief Runs task during the next update()
     */
    void scheduleNextTick(Task task);
    void scheduleNextTick(Task task, OwnerToken owner);

    /**
     * @brief Advances the clock and runs every task that has fallen due
     * @param deltaTime Seconds elapsed since the previous update
     * @return Number of tasks that ran
     */
    size_t update(float deltaTime);

    double now() const { return m_now; }
    uint64_t tickCount() const { return m_tick; }
    size_t pendingCount() const { return m_pending.size(); }
    bool isUpdating() const { return m_updating; }

    /**
     * @brief Drops every pending task without running it
     */
    void clear();

private:
    struct PendingTask {
        double dueTime{0.0};
        uint64_t sequence{0};
        uint64_t earliestTick{0};
        Task task;
        OwnerToken owner;
        bool bound{false};
    };

    void enqueue(double delay, Task task, OwnerToken owner, bool bound);

    std::vector<PendingTask> m_pending;
    double m_now{0.0};
    uint64_t m_tick{0};
    uint64_t m_nextSequence{0};
    bool m_updating{false};
};

} // namespace Ragfall

#endif // TASK_SCHEDULER_HPP
