#include "util/worker_pool.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace otafetch {

namespace detail {

struct TaskState {
    std::mutex mu;
    std::condition_variable cv;
    bool cancelled = false;
    bool done = false;

    void Cancel() {
        {
            std::lock_guard<std::mutex> lk(mu);
            cancelled = true;
        }
        cv.notify_all();
    }

    void MarkDone() {
        {
            std::lock_guard<std::mutex> lk(mu);
            done = true;
        }
        cv.notify_all();
    }
};

} // namespace detail

bool CancelToken::IsCancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->cancelled;
}

bool CancelToken::WaitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return true;
    }
    std::unique_lock<std::mutex> lk(state_->mu);
    return !state_->cv.wait_for(lk, timeout, [this] { return state_->cancelled; });
}

void TaskHandle::Cancel() {
    if (state_) state_->Cancel();
}

bool TaskHandle::IsCancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->cancelled;
}

bool TaskHandle::Done() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->done;
}

bool TaskHandle::WaitDone(std::chrono::milliseconds timeout) const {
    if (!state_) return true;
    std::unique_lock<std::mutex> lk(state_->mu);
    return state_->cv.wait_for(lk, timeout, [this] { return state_->done; });
}

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this, i] {
            SetThreadTag("worker-" + std::to_string(i));
            WorkerLoop();
        });
    }
}

WorkerPool::~WorkerPool() { Shutdown(); }

TaskHandle WorkerPool::Submit(std::string name, Task task) {
    auto state = std::make_shared<detail::TaskState>();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!stopping_) {
            queue_.push_back(Job{std::move(name), std::move(task), state});
            cv_.notify_one();
            return TaskHandle(state);
        }
    }
    LogWarn("WorkerPool: rejecting task '%s' after shutdown", name.c_str());
    state->Cancel();
    state->MarkDone();
    return TaskHandle(state);
}

void WorkerPool::Shutdown() {
    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
        dropped.swap(queue_);
        for (auto& st : running_) st->Cancel();
    }
    cv_.notify_all();

    for (auto& job : dropped) {
        job.state->Cancel();
        job.state->MarkDone();
    }

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::WorkerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
            running_.push_back(job.state);
        }

        RunJob(job);

        {
            std::lock_guard<std::mutex> lk(mu_);
            running_.erase(std::remove(running_.begin(), running_.end(), job.state), running_.end());
        }
        job.state->MarkDone();
    }
}

void WorkerPool::RunJob(Job& job) {
    const CancelToken token(job.state);
    if (token.IsCancelled()) {
        LogDebug("WorkerPool: skipping cancelled task '%s'", job.name.c_str());
        return;
    }
    try {
        job.task(token);
    } catch (const std::exception& e) {
        LogError("WorkerPool: task '%s' failed: %s", job.name.c_str(), e.what());
    }
}

void Strand::Post(std::function<void()> fn) {
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.push_back(std::move(fn));
        if (!draining_) {
            draining_ = true;
            schedule = true;
        }
    }
    if (!schedule) return;

    auto handle = pool_.Submit("strand", [this](const CancelToken&) { Drain(); });
    if (handle.IsCancelled() && handle.Done()) {
        // Pool is shut down; nothing will ever drain the queue.
        std::lock_guard<std::mutex> lk(mu_);
        queue_.clear();
        draining_ = false;
        idle_cv_.notify_all();
    }
}

bool Strand::Idle() const {
    std::lock_guard<std::mutex> lk(mu_);
    return !draining_ && queue_.empty();
}

bool Strand::WaitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    return idle_cv_.wait_for(lk, timeout, [this] { return !draining_ && queue_.empty(); });
}

void Strand::Drain() {
    while (true) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (queue_.empty()) {
                draining_ = false;
                idle_cv_.notify_all();
                return;
            }
            fn = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            fn();
        } catch (const std::exception& e) {
            LogError("Strand: command failed: %s", e.what());
        }
    }
}

} // namespace otafetch
