/**
 * @file test_worker_pool_adapter.cpp
 * @brief Unit tests for the worker pool adapters
 */

#include <gtest/gtest.h>

#include <cymo/adapters/worker_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

namespace cymo::adapters::test {

class AsyncWorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(AsyncWorkerPoolTest, WorkerCountDefaultsToHardware) {
    async_worker_pool pool;
    EXPECT_GT(pool.worker_count(), 0u);
    EXPECT_TRUE(pool.is_running());
}

TEST_F(AsyncWorkerPoolTest, ExplicitWorkerCount) {
    async_worker_pool pool(3);
    EXPECT_EQ(pool.worker_count(), 3u);
}

TEST_F(AsyncWorkerPoolTest, RunsEveryUnit) {
    async_worker_pool pool(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(pool.submit([&counter]() { counter.fetch_add(1); }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(counter.load(), 16);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST_F(AsyncWorkerPoolTest, ExceptionIsRethrownFromFuture) {
    async_worker_pool pool(1);

    auto future = pool.submit([]() { throw std::runtime_error("unit failed"); });

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST_F(AsyncWorkerPoolTest, UnitsRunConcurrently) {
    async_worker_pool pool(2);
    std::promise<void> first_started;
    auto started = first_started.get_future();

    auto waiter = pool.submit([&started]() { started.wait(); });
    auto signaller = pool.submit([&first_started]() { first_started.set_value(); });

    ASSERT_EQ(waiter.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    signaller.get();
    waiter.get();
}

// =============================================================================
// Factory Tests
// =============================================================================

class WorkerPoolFactoryTest : public ::testing::Test {};

TEST_F(WorkerPoolFactoryTest, CreatesRunningPool) {
    auto pool = worker_pool_factory::create(2);

    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 2u);

    std::atomic<bool> ran{false};
    pool->submit([&ran]() { ran = true; }).get();
    EXPECT_TRUE(ran.load());
}

TEST_F(WorkerPoolFactoryTest, ReportsBackend) {
#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_TRUE(worker_pool_factory::has_thread_system());
#else
    EXPECT_FALSE(worker_pool_factory::has_thread_system());
#endif
}

}  // namespace cymo::adapters::test
