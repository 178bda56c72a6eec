#pragma once
// Fixed set of threads draining a FIFO of tasks. Results and exceptions
// travel back through std::future.
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>
#include "../errors.hpp"

namespace cachex {

class WorkerPool {
public:
    explicit WorkerPool(size_t workers);
    // Runs every queued task, then joins
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        // std::function needs a copyable target
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (stopping_) throw CacheError("worker pool is shutting down");
            queue_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    [[nodiscard]] size_t size() const { return threads_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace cachex
