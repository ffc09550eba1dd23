#include "mcpsrv/worker_pool.hpp"
#include "mcpsrv/log.hpp"

namespace mcpsrv {

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    stop(StopMode::Drain);
}

void WorkerPool::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] {
                return !tasks_.empty() || !running_;
            });
            if (!running_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            log_error("worker", std::string("Task failed: ") + e.what());
        }
    }
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

std::size_t WorkerPool::stop(StopMode mode) {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        if (mode == StopMode::Cancel) {
            dropped = tasks_.size();
            std::queue<std::function<void()>>().swap(tasks_);
        }
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    if (dropped > 0) {
        log_debug("worker", "Dropped " + std::to_string(dropped) + " queued tasks");
    }
    return dropped;
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace mcpsrv
