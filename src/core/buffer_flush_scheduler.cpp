#include "collabscribe/core/buffer_flush_scheduler.hpp"
#include "collabscribe/utils/logging.hpp"

namespace collabscribe {
namespace core {

BufferFlushScheduler::BufferFlushScheduler(std::shared_ptr<TaskQueue> taskQueue,
                                           std::chrono::milliseconds interval,
                                           FlushAction action)
    : taskQueue_(std::move(taskQueue))
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000))
    , action_(std::move(action))
    , running_(false)
    , tickPending_(false)
    , flushCount_(0)
    , coalescedTicks_(0) {
}

BufferFlushScheduler::~BufferFlushScheduler() {
    stop();
}

void BufferFlushScheduler::start(bool withTimer) {
    if (running_) {
        return;
    }
    running_ = true;

    if (withTimer) {
        timerThread_ = std::thread(&BufferFlushScheduler::timerLoop, this);
        utils::Logger::debug("Flush timer started with " + std::to_string(interval_.count()) + " ms period");
    }
}

void BufferFlushScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        running_ = false;
    }
    timerCondition_.notify_all();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }
}

bool BufferFlushScheduler::requestTick() {
    if (!running_ || !taskQueue_) {
        return false;
    }

    bool expected = false;
    if (!tickPending_.compare_exchange_strong(expected, true)) {
        coalescedTicks_++;
        return false;
    }

    std::weak_ptr<BufferFlushScheduler> weak = weak_from_this();
    bool queued = taskQueue_->enqueue([weak]() {
        if (auto self = weak.lock()) {
            self->flushOnce();
        }
    }, TaskPriority::LOW);

    if (!queued) {
        tickPending_ = false;
    }
    return queued;
}

void BufferFlushScheduler::flushOnce() {
    // Clear first so the timer may queue the next tick while this one runs
    tickPending_ = false;

    if (!running_ || !action_) {
        return;
    }

    action_();
    flushCount_++;
}

void BufferFlushScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(timerMutex_);

    while (running_) {
        timerCondition_.wait_for(lock, interval_, [this] { return !running_; });
        if (!running_) {
            break;
        }

        lock.unlock();
        requestTick();
        lock.lock();
    }
}

} // namespace core
} // namespace collabscribe
