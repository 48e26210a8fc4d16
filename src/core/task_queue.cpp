#include "collabscribe/core/task_queue.hpp"
#include "collabscribe/utils/error_handler.hpp"
#include "collabscribe/utils/logging.hpp"

namespace collabscribe {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false), nextSequence_(0) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(std::shared_ptr<Task> task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        task->sequence_ = nextSequence_++;
        queue_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool TaskQueue::enqueue(std::function<void()> func, TaskPriority priority) {
    auto task = std::make_shared<FunctionTask>(std::move(func), priority);
    return enqueue(task);
}

std::shared_ptr<Task> TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);

    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.top();
    queue_.pop();
    return task;
}

std::shared_ptr<Task> TaskQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.top();
    queue_.pop();
    return task;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

void TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> empty_queue;
    queue_.swap(empty_queue);
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

// SerialExecutor implementation

SerialExecutor::SerialExecutor()
    : running_(false), executed_(0), failed_(0) {
}

SerialExecutor::~SerialExecutor() {
    stop();
}

void SerialExecutor::start(std::shared_ptr<TaskQueue> task_queue) {
    if (running_ || !task_queue) {
        return;
    }

    task_queue_ = std::move(task_queue);
    running_ = true;

    std::lock_guard<std::mutex> lock(idMutex_);
    worker_ = std::thread(&SerialExecutor::workerLoop, this);
    workerId_ = worker_.get_id();
}

void SerialExecutor::stop() {
    if (!running_) {
        return;
    }

    if (task_queue_) {
        task_queue_->shutdown();
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    running_ = false;
    {
        std::lock_guard<std::mutex> lock(idMutex_);
        workerId_ = std::thread::id();
    }
    task_queue_.reset();
}

bool SerialExecutor::isWorkerThread() const {
    std::lock_guard<std::mutex> lock(idMutex_);
    return workerId_ == std::this_thread::get_id();
}

void SerialExecutor::workerLoop() {
    while (true) {
        auto task = task_queue_->dequeue();

        if (!task) {
            // Queue shut down and drained
            break;
        }

        try {
            task->execute();
            executed_++;
        } catch (const std::exception& e) {
            failed_++;
            utils::Logger::error("Session task failed: " + std::string(e.what()));
            utils::ErrorHandler::getInstance().reportError(e, "SerialExecutor");
        }
    }
}

} // namespace core
} // namespace collabscribe
