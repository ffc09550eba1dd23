#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mcpsrv {

/// Fixed-size pool of threads draining a FIFO task queue.
class WorkerPool {
public:
    enum class StopMode {
        Drain,   ///< run everything already queued, then stop
        Cancel,  ///< drop queued tasks; running ones finish
    };

    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false once the pool is stopping.
    bool submit(std::function<void()> task);

    /// Stop accepting work and join all threads. Idempotent.
    /// Returns the number of tasks dropped.
    std::size_t stop(StopMode mode = StopMode::Drain);

    [[nodiscard]] std::size_t size() const { return threads_.size(); }
    [[nodiscard]] std::size_t pending() const;

private:
    void run();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{true};
};

} // namespace mcpsrv
