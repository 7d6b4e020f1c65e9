#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace overlapseg {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false) {
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
            return false; // Don't accept new tasks when shutting down
        }
        queue_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool TaskQueue::enqueue(std::function<void()> func, const std::string& name) {
    return enqueue(std::make_shared<FunctionTask>(std::move(func), name));
}

std::shared_ptr<Task> TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait until there's a task or we're shutting down
    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.front();
    queue_.pop_front();
    return task;
}

std::shared_ptr<Task> TaskQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.front();
    queue_.pop_front();
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
    queue_.clear();
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

// ThreadPool implementation

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(num_threads), running_(false), active_threads_(0), failed_tasks_(0) {
    if (num_threads_ == 0) {
        num_threads_ = 1; // Ensure at least one thread
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> task_queue) {
    if (running_ || !task_queue) {
        return;
    }

    task_queue_ = task_queue;
    running_ = true;

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

void ThreadPool::stop() {
    if (!running_) {
        return;
    }

    // Workers drain what is already queued, then see the shutdown
    if (task_queue_) {
        task_queue_->shutdown();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    running_ = false;
    workers_.clear();
    task_queue_.reset();
}

size_t ThreadPool::getActiveThreads() const {
    return active_threads_;
}

void ThreadPool::workerLoop() {
    while (true) {
        auto task = task_queue_->dequeue();

        if (!task) {
            // Task queue is shut down and empty
            break;
        }

        active_threads_++;
        try {
            task->execute();
        } catch (const std::exception& e) {
            failed_tasks_++;
            utils::Logger::error("Task " + task->getName() + " failed: " + e.what());
        }
        active_threads_--;
    }
}

} // namespace core
} // namespace overlapseg
