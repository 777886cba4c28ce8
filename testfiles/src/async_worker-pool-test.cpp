// SPDX-License-Identifier: GPL-2.0-or-later
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <gtest/gtest.h>
#include "async/progress.h"
#include "async/worker-pool.h"
using namespace Svgfx::Async;

TEST(WorkerPoolTest, Size)
{
    WorkerPool pool(3);
    EXPECT_EQ(pool.size(), 3);

    WorkerPool automatic;
    EXPECT_EQ(automatic.size(), WorkerPool::default_numthreads());
    EXPECT_GT(automatic.size(), 0);
}

TEST(WorkerPoolTest, JoinRunsQueuedTasks)
{
    std::atomic<int> count{0};
    WorkerPool pool(2);
    for (int i = 0; i < 100; i++) {
        pool.post([&] { count++; });
    }
    pool.join();
    EXPECT_EQ(count, 100);

    // Idempotent.
    pool.join();
}

TEST(WorkerPoolTest, PostAfterJoinThrows)
{
    WorkerPool pool(1);
    pool.join();
    EXPECT_THROW(pool.post([] {}), std::logic_error);
}

TEST(WorkerPoolTest, SubmitReturnsValueOrException)
{
    WorkerPool pool(2);

    auto value = pool.submit([] { return 42; });
    EXPECT_EQ(value.get(), 42);

    auto error = pool.submit([] () -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(error.get(), std::runtime_error);
}

// Two tasks that each wait for the other can only finish if they run at the same time.
TEST(WorkerPoolTest, TasksRunConcurrently)
{
    WorkerPool pool(2);

    std::mutex mutex;
    std::condition_variable cond;
    int arrived = 0;

    auto rendezvous = [&] {
        auto lock = std::unique_lock(mutex);
        arrived++;
        cond.notify_all();
        return cond.wait_for(lock, std::chrono::seconds(5), [&] { return arrived == 2; });
    };

    auto a = pool.submit(rendezvous);
    auto b = pool.submit(rendezvous);

    EXPECT_TRUE(a.get());
    EXPECT_TRUE(b.get());
}

TEST(ProgressTest, DeadlineProgress)
{
    using clock = std::chrono::steady_clock;
    CancellationToken token;

    DeadlineProgress<double> open(token, clock::now() + std::chrono::hours(1));
    EXPECT_TRUE(open.keepgoing());
    EXPECT_TRUE(open.report(0.5));
    EXPECT_NO_THROW(open.throw_if_cancelled());

    DeadlineProgress<double> expired(token, clock::now() - std::chrono::milliseconds(1));
    EXPECT_FALSE(expired.keepgoing());
    EXPECT_THROW(expired.throw_if_cancelled(), TimeoutException);

    token.cancel();
    EXPECT_FALSE(open.keepgoing());
    try {
        open.report_or_throw(0.7);
        FAIL() << "expected cancellation";
    } catch (TimeoutException const &) {
        FAIL() << "cancellation reported as timeout";
    } catch (CancelledException const &) {
    }
}

TEST(ProgressTest, SubProgressForwardsCancellation)
{
    CancellationToken token;
    DeadlineProgress<double> root(token, std::chrono::steady_clock::now() + std::chrono::hours(1));
    SubProgress<double> sub(root, 0.5, 0.5);

    EXPECT_TRUE(sub.report(0.5));
    token.cancel();
    EXPECT_FALSE(sub.keepgoing());
    EXPECT_THROW(sub.throw_if_cancelled(), CancelledException);
}
