#include "worker_pool.hpp"
#include "../utils/logger.hpp"

namespace cachex {

WorkerPool::WorkerPool(size_t workers) {
    if (workers == 0) throw ConfigError("worker pool needs at least one thread");
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; i++) {
        threads_.emplace_back([this] { worker_loop(); });
    }
    LOG_DBG("[async] Started %zu workers", workers);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    LOG_DBG("[async] Workers stopped");
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace cachex
