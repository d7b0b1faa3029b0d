#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace otafetch {

namespace detail {
struct TaskState;
} // namespace detail

// Read side of a task's cancellation flag, handed to the running task.
class CancelToken {
public:
    CancelToken() = default;

    bool IsCancelled() const;

    // Sleeps up to `timeout`. Returns false as soon as the task is cancelled.
    bool WaitFor(std::chrono::milliseconds timeout) const;

private:
    friend class WorkerPool;
    explicit CancelToken(std::shared_ptr<detail::TaskState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::TaskState> state_;
};

// Owner side of a submitted task. Copies share the same task.
class TaskHandle {
public:
    TaskHandle() = default;

    bool Valid() const { return state_ != nullptr; }
    void Cancel();
    bool IsCancelled() const;
    bool Done() const;
    bool WaitDone(std::chrono::milliseconds timeout) const;

private:
    friend class WorkerPool;
    explicit TaskHandle(std::shared_ptr<detail::TaskState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::TaskState> state_;
};

class WorkerPool {
public:
    using Task = std::function<void(const CancelToken&)>;

    static constexpr std::size_t kDefaultThreads = 4;

    explicit WorkerPool(std::size_t threads = kDefaultThreads);
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    ~WorkerPool();

    // Queues a task. After Shutdown() the returned handle is already cancelled.
    TaskHandle Submit(std::string name, Task task);

    // Cancels queued and running tasks, then joins every worker.
    void Shutdown();

    std::size_t ThreadCount() const { return threads_.size(); }

private:
    struct Job {
        std::string name;
        Task task;
        std::shared_ptr<detail::TaskState> state;
    };

    void WorkerLoop();
    static void RunJob(Job& job);

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::vector<std::shared_ptr<detail::TaskState>> running_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

// Runs posted closures one at a time, in posting order, on the pool.
class Strand {
public:
    explicit Strand(WorkerPool& pool) : pool_(pool) {}
    Strand(const Strand&) = delete;
    Strand& operator=(const Strand&) = delete;

    void Post(std::function<void()> fn);

    // True when nothing is queued or running.
    bool Idle() const;
    bool WaitIdle(std::chrono::milliseconds timeout) const;

private:
    void Drain();

    WorkerPool& pool_;
    mutable std::mutex mu_;
    mutable std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    bool draining_ = false;
};

} // namespace otafetch
