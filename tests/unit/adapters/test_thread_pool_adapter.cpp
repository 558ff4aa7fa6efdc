/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the transfer thread pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::adapters::test {

using namespace std::chrono_literals;

class AsyncTransferPoolTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = std::make_shared<async_transfer_pool>(4); }

    void TearDown() override {
        if (pool_) {
            pool_->shutdown();
        }
    }

    std::shared_ptr<async_transfer_pool> pool_;
};

TEST_F(AsyncTransferPoolTest, WorkerCount) {
    EXPECT_EQ(pool_->worker_count(), 4u);
    EXPECT_TRUE(pool_->is_running());

    async_transfer_pool automatic;
    EXPECT_GE(automatic.worker_count(), 1u);
}

TEST_F(AsyncTransferPoolTest, SubmitRunsTask) {
    std::atomic<int> value{0};

    auto future = pool_->submit([&value] { value = 42; });
    future.get();

    EXPECT_EQ(value.load(), 42);
}

TEST_F(AsyncTransferPoolTest, SubmitManyTasks) {
    constexpr int task_count = 100;
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < task_count; ++i) {
        futures.push_back(pool_->submit([&counter] { ++counter; }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter.load(), task_count);
    EXPECT_EQ(pool_->pending_tasks(), 0u);
}

TEST_F(AsyncTransferPoolTest, TasksRunConcurrently) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool_->submit([&] {
            int now = ++running;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {
            }
            std::this_thread::sleep_for(50ms);
            --running;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_GT(peak.load(), 1);
}

TEST_F(AsyncTransferPoolTest, ExceptionReachesFuture) {
    auto future = pool_->submit([] { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the exception
    std::atomic<bool> ran{false};
    pool_->submit([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());
}

TEST_F(AsyncTransferPoolTest, DelayedTaskWaits) {
    auto start = std::chrono::steady_clock::now();

    auto future = pool_->submit_delayed([] {}, 100ms);
    future.get();

    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 100ms);
}

TEST_F(AsyncTransferPoolTest, DelayedTasksDoNotOccupyWorkers) {
    auto single = std::make_shared<async_transfer_pool>(1);

    auto delayed = single->submit_delayed([] {}, 300ms);

    auto start = std::chrono::steady_clock::now();
    single->submit([] {}).get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 200ms);
    delayed.get();
    single->shutdown();
}

TEST_F(AsyncTransferPoolTest, DelayedTasksRunInDueOrder) {
    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int id) {
        return [&, id] {
            std::lock_guard lock(mutex);
            order.push_back(id);
        };
    };

    auto late = pool_->submit_delayed(record(2), 150ms);
    auto early = pool_->submit_delayed(record(1), 30ms);
    early.get();
    late.get();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
}

TEST_F(AsyncTransferPoolTest, ZeroDelayRunsImmediately) {
    std::atomic<bool> ran{false};
    pool_->submit_delayed([&ran] { ran = true; }, 0ms).get();
    EXPECT_TRUE(ran.load());
}

TEST_F(AsyncTransferPoolTest, ShutdownDropsPendingTimers) {
    std::atomic<bool> ran{false};
    auto future = pool_->submit_delayed([&ran] { ran = true; }, 10s);

    pool_->shutdown();

    EXPECT_FALSE(pool_->is_running());
    EXPECT_THROW(future.get(), std::future_error);
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(pool_->pending_tasks(), 0u);
}

TEST_F(AsyncTransferPoolTest, SubmitAfterShutdownIsRejected) {
    pool_->shutdown();

    std::atomic<bool> ran{false};
    auto future = pool_->submit([&ran] { ran = true; });

    EXPECT_THROW(future.get(), std::future_error);
    EXPECT_FALSE(ran.load());
}

TEST_F(AsyncTransferPoolTest, DestroyFromOwnTask) {
    auto pool = std::make_shared<async_transfer_pool>(2);
    std::promise<void> released;
    auto done = released.get_future();

    auto* raw = pool.get();
    (void)raw->submit([pool = std::move(pool), &released]() mutable {
        pool.reset();
        released.set_value();
    });

    EXPECT_EQ(done.wait_for(2s), std::future_status::ready);
}

// =============================================================================
// Factory
// =============================================================================

class TransferPoolFactoryTest : public ::testing::Test {};

TEST_F(TransferPoolFactoryTest, CreatesRunningPool) {
    auto pool = transfer_pool_factory::create(3, "factory_test_pool");
    ASSERT_NE(pool, nullptr);

    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 3u);

    std::atomic<int> value{0};
    pool->submit([&value] { value = 7; }).get();
    EXPECT_EQ(value.load(), 7);
}

TEST_F(TransferPoolFactoryTest, DelayedTaskRuns) {
    auto pool = transfer_pool_factory::create(2);

    std::atomic<bool> ran{false};
    pool->submit_delayed([&ran] { ran = true; }, 20ms).get();
    EXPECT_TRUE(ran.load());
}

}  // namespace kcenon::chunked_upload::adapters::test
