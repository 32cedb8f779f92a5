#include "facewatch/database/thread_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace facewatch;

TEST(ThreadPool, SubmitReturnsFuture) {
    ThreadPool pool(2);
    auto f = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(f.get(), 5);
}

TEST(ThreadPool, WaitAllDrainsQueue) {
    ThreadPool pool(3);
    std::atomic<int> done{0};

    for (int i = 0; i < 100; ++i) {
        pool.submit_low_priority([&done]() {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
            done++;
        });
    }
    pool.wait_all();

    EXPECT_EQ(done.load(), 100);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(ThreadPool, HighPriorityRunsFirst) {
    ThreadPool pool(1);
    std::mutex mutex;
    std::vector<int> order;

    // Keep the single worker busy while the queue fills
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    pool.submit_high_priority([opened]() { opened.wait(); });

    for (int i = 0; i < 3; ++i) {
        pool.submit_low_priority([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    pool.submit_high_priority([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(100);
    });

    gate.set_value();
    pool.wait_all();

    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], 100);
    EXPECT_EQ(order[1], 0);
    EXPECT_EQ(order[2], 1);
    EXPECT_EQ(order[3], 2);
}

TEST(ThreadPool, TaskExceptionDoesNotKillWorker) {
    ThreadPool pool(1);
    pool.submit_high_priority([]() { throw std::runtime_error("boom"); });

    auto f = pool.submit([]() { return 42; });
    EXPECT_EQ(f.get(), 42);
}

TEST(ThreadPool, SubmitAfterStopThrows) {
    ThreadPool pool(1);
    pool.stop();
    EXPECT_THROW(pool.submit_low_priority([]() {}), std::runtime_error);
}
