#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>
#include <atomic>
#include <memory>
#include <future>
#include <cstdint>
#include <type_traits>

namespace collabscribe {
namespace core {

/**
 * Priority levels for session commands. Commands of equal priority run in
 * submission order.
 */
enum class TaskPriority {
    LOW = 0,      // timer-driven housekeeping (flush ticks)
    NORMAL = 1,   // recognition events, control operations, queries
    HIGH = 2
};

/**
 * Base task interface
 */
class Task {
public:
    explicit Task(TaskPriority priority = TaskPriority::NORMAL)
        : priority_(priority), sequence_(0) {}

    virtual ~Task() = default;
    virtual void execute() = 0;

    TaskPriority getPriority() const { return priority_; }
    uint64_t getSequence() const { return sequence_; }

private:
    friend class TaskQueue;

    TaskPriority priority_;
    uint64_t sequence_;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    FunctionTask(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL)
        : Task(priority), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Task comparator for priority queue (higher priority first, then FIFO)
 */
struct TaskComparator {
    bool operator()(const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) const {
        if (a->getPriority() != b->getPriority()) {
            return static_cast<int>(a->getPriority()) < static_cast<int>(b->getPriority());
        }
        return a->getSequence() > b->getSequence();
    }
};

/**
 * Thread-safe command queue with priority support
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    // Non-copyable, non-movable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task to the queue. Returns false once the queue is shutting down.
     */
    bool enqueue(std::shared_ptr<Task> task);

    bool enqueue(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * Add a task with future support for result retrieval. If the queue has
     * been shut down the returned future holds a std::future_error.
     */
    template<typename F, typename... Args>
    auto enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    /**
     * Get the next task (blocks if empty).
     * Returns nullptr once the queue is shutting down and drained.
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Try to get the next task without blocking
     */
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Stop accepting tasks and wake up all waiting threads. Already queued
     * tasks are still handed out by dequeue().
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> queue_;
    std::atomic<bool> shutdown_;
    uint64_t nextSequence_;
};

/**
 * Executes the tasks of one TaskQueue on a single worker thread, giving the
 * owner a serialization point for all of its state mutations.
 */
class SerialExecutor {
public:
    SerialExecutor();
    ~SerialExecutor();

    // Non-copyable, non-movable
    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;
    SerialExecutor(SerialExecutor&&) = delete;
    SerialExecutor& operator=(SerialExecutor&&) = delete;

    /**
     * Start the worker thread on the given task queue
     */
    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down, run what is already queued and join the worker
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * True when called from the worker thread
     */
    bool isWorkerThread() const;

    size_t getExecutedCount() const { return executed_; }
    size_t getFailedCount() const { return failed_; }

private:
    void workerLoop();

    std::thread worker_;
    std::thread::id workerId_;
    mutable std::mutex idMutex_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> executed_;
    std::atomic<size_t> failed_;
};

// Template implementation
template<typename F, typename... Args>
auto TaskQueue::enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {

    using return_type = typename std::result_of<F(Args...)>::type;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task_ptr->get_future();

    auto wrapper_task = std::make_shared<FunctionTask>(
        [task_ptr]() { (*task_ptr)(); },
        priority
    );

    // A rejected wrapper drops the last packaged_task reference, which
    // stores broken_promise in the future.
    enqueue(wrapper_task);

    return result;
}

} // namespace core
} // namespace collabscribe
