#include <tinta/platform/thread_pool.h>

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <stdexcept>
#include <vector>

using namespace tinta::platform;

// ---------------------------------------------------------------------------
// 1. Submit returns the task's value
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, SubmitReturnsValue) {
    ThreadPool pool(2);
    auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

// ---------------------------------------------------------------------------
// 2. run_all executes every job before returning
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, RunAllExecutesEveryJob) {
    ThreadPool pool(3);
    std::vector<int> slots(16, 0);
    std::vector<std::function<void()>> jobs;
    for (size_t i = 0; i < slots.size(); ++i) {
        jobs.push_back([&slots, i]() { slots[i] = static_cast<int>(i) + 1; });
    }
    pool.run_all(std::move(jobs));

    for (size_t i = 0; i < slots.size(); ++i) EXPECT_EQ(slots[i], static_cast<int>(i) + 1);
}

// ---------------------------------------------------------------------------
// 3. Nested run_all from a worker does not deadlock
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, NestedRunAllCompletes) {
    ThreadPool pool(1);
    std::atomic<int> count{0};
    std::vector<std::function<void()>> outer;
    for (int i = 0; i < 3; ++i) {
        outer.push_back([&pool, &count]() {
            std::vector<std::function<void()>> inner;
            for (int k = 0; k < 3; ++k) inner.push_back([&count]() { ++count; });
            pool.run_all(std::move(inner));
        });
    }
    pool.run_all(std::move(outer));
    EXPECT_EQ(count.load(), 9);
}

// ---------------------------------------------------------------------------
// 4. run_all rethrows a job's exception after all jobs finished
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, RunAllRethrows) {
    ThreadPool pool(2);
    std::atomic<int> finished{0};
    std::vector<std::function<void()>> jobs;
    jobs.push_back([&finished]() { ++finished; });
    jobs.push_back([]() { throw std::runtime_error("job failed"); });
    jobs.push_back([&finished]() { ++finished; });

    EXPECT_THROW(pool.run_all(std::move(jobs)), std::runtime_error);
    EXPECT_EQ(finished.load(), 2);
}

// ---------------------------------------------------------------------------
// 5. Submitting after shutdown throws
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(2);
    EXPECT_TRUE(pool.is_running());
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    EXPECT_THROW(pool.post([]() {}), std::runtime_error);
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}

// ---------------------------------------------------------------------------
// 6. Zero threads still yields a usable pool
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, ZeroThreadsFallsBackToOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}
