#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <gtest/gtest.h>

namespace cachex {

TEST(WorkerPoolTest, ReturnsResults) {
    WorkerPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
    auto a = pool.submit([] { return 20; });
    auto b = pool.submit([] { return std::string("done"); });
    EXPECT_EQ(a.get(), 20);
    EXPECT_EQ(b.get(), "done");
}

TEST(WorkerPoolTest, PropagatesExceptions) {
    WorkerPool pool(1);
    auto f = pool.submit([]() -> int { throw PreconditionError("k", "boom"); });
    EXPECT_THROW(f.get(), PreconditionError);
    // The worker survives a failed task
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, VoidTasks) {
    WorkerPool pool(3);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; i++) futures.push_back(pool.submit([&counter] { counter++; }));
    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerPoolTest, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 20; i++) {
            (void)pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                counter++;
            });
        }
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(WorkerPoolTest, MoveOnlyCaptures) {
    WorkerPool pool(1);
    auto p = std::make_unique<int>(7);
    auto f = pool.submit([p = std::move(p)] { return *p * 6; });
    EXPECT_EQ(f.get(), 42);
}

TEST(WorkerPoolTest, ZeroWorkersRejected) {
    EXPECT_THROW(WorkerPool(0), ConfigError);
}

} // namespace cachex
