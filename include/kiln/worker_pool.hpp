#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace kiln {

/**
 * @brief Thread-safe MPMC queue with graceful shutdown
 *
 * pop() blocks until an item is available or shutdown() is called; items
 * already queued at shutdown are still handed out.
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// @return false once shutdown has been signaled
    bool push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        queue_.push(std::move(item));
        cv_.notify_one();
        return true;
    }

    /// @return nullopt when shut down and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

/**
 * @brief Fixed-size pool of worker threads draining a WorkQueue
 *
 * The destructor finishes queued tasks and joins every worker.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t size() const { return threads_.size(); }

    /// Queue a callable; the future carries its result or exception
    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        if (!queue_.push([task] { (*task)(); })) {
            // Pool is shutting down: run inline so the future is still satisfied
            (*task)();
        }
        return future;
    }

private:
    void run();

    WorkQueue<std::function<void()>> queue_;
    std::vector<std::thread> threads_;
};

} // namespace kiln
