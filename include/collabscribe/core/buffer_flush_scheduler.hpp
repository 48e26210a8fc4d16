#pragma once

#include "collabscribe/core/task_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace collabscribe {
namespace core {

/**
 * Periodic flush timer. Each period it injects one LOW priority flush tick into
 * the session task queue; a tick is never enqueued while another one is still
 * pending, so a stalled loop does not accumulate ticks. The flush action itself
 * always runs on the session loop.
 *
 * Must be owned by a std::shared_ptr: queued ticks hold only a weak reference.
 */
class BufferFlushScheduler : public std::enable_shared_from_this<BufferFlushScheduler> {
public:
    using FlushAction = std::function<void()>;

    BufferFlushScheduler(std::shared_ptr<TaskQueue> taskQueue,
                         std::chrono::milliseconds interval,
                         FlushAction action);
    ~BufferFlushScheduler();

    BufferFlushScheduler(const BufferFlushScheduler&) = delete;
    BufferFlushScheduler& operator=(const BufferFlushScheduler&) = delete;

    /**
     * Enable ticks and, if withTimer is set, start the timer thread
     */
    void start(bool withTimer = true);

    /**
     * Stop the timer thread. Ticks still queued become no-ops.
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * Enqueue a flush tick unless one is already pending.
     * @return true if a new tick was enqueued
     */
    bool requestTick();

    /**
     * Body of a flush tick, executed on the session loop
     */
    void flushOnce();

    bool isTickPending() const { return tickPending_; }
    size_t getFlushCount() const { return flushCount_; }
    size_t getCoalescedTicks() const { return coalescedTicks_; }
    std::chrono::milliseconds getInterval() const { return interval_; }

private:
    void timerLoop();

    std::shared_ptr<TaskQueue> taskQueue_;
    const std::chrono::milliseconds interval_;
    FlushAction action_;

    std::atomic<bool> running_;
    std::atomic<bool> tickPending_;
    std::atomic<size_t> flushCount_;
    std::atomic<size_t> coalescedTicks_;

    std::thread timerThread_;
    std::mutex timerMutex_;
    std::condition_variable timerCondition_;
};

} // namespace core
} // namespace collabscribe
