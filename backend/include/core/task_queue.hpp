#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace overlapseg {
namespace core {

/**
 * Base task interface
 */
class Task {
public:
    explicit Task(std::string name = "") : name_(std::move(name)) {}
    virtual ~Task() = default;
    virtual void execute() = 0;

    const std::string& getName() const { return name_; }

private:
    std::string name_;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    explicit FunctionTask(std::function<void()> func, std::string name = "")
        : Task(std::move(name)), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Thread-safe FIFO task queue
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
     * Add a task to the queue. Ignored once the queue is shutting down.
     * @return true if the task was accepted
     */
    bool enqueue(std::shared_ptr<Task> task);

    /**
     * Add a function-based task to the queue
     */
    bool enqueue(std::function<void()> func, const std::string& name = "");

    /**
     * Add a task whose result (or exception) is delivered through a future
     */
    template<typename F, typename... Args>
    auto enqueueWithFuture(const std::string& name, F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    /**
     * Get the next task from the queue (blocks if empty)
     * Returns nullptr once the queue is shut down and drained
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Try to get the next task without blocking
     * Returns nullptr if queue is empty
     */
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;

    /**
     * Clear all pending tasks
     */
    void clear();

    /**
     * Shutdown the queue (wake up all waiting threads)
     */
    void shutdown();

    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::shared_ptr<Task>> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Thread pool for executing tasks from TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Start the thread pool with the given task queue
     */
    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Stop the thread pool, finish queued tasks and join all threads
     */
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const;

    /**
     * Number of tasks that ended with an exception
     */
    size_t getFailedTasks() const { return failed_tasks_; }

    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
    std::atomic<size_t> failed_tasks_;
};

// Template implementation
template<typename F, typename... Args>
auto TaskQueue::enqueueWithFuture(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {

    using return_type = typename std::result_of<F(Args...)>::type;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task_ptr->get_future();

    auto wrapper_task = std::make_shared<FunctionTask>(
        [task_ptr]() { (*task_ptr)(); },
        name
    );

    if (!enqueue(wrapper_task)) {
        throw std::runtime_error("Task queue is shut down, cannot run " + name);
    }

    return result;
}

} // namespace core
} // namespace overlapseg
