// SPDX-License-Identifier: GPL-2.0-or-later
/** \file
 * Bounded pool of worker threads for filter primitive execution.
 */
#ifndef SVGFX_ASYNC_WORKER_POOL_H
#define SVGFX_ASYNC_WORKER_POOL_H

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace Svgfx {
namespace Async {

/**
 * A fixed number of threads executing posted tasks in FIFO order.
 *
 * Tasks still queued when join() is called are run to completion before join() returns.
 * Posting after join() throws std::logic_error.
 */
class WorkerPool final
{
public:
    /// Create a pool of \a numthreads threads, or a platform-dependent number if it is zero.
    explicit WorkerPool(int numthreads = 0);
    ~WorkerPool();

    WorkerPool(WorkerPool const &) = delete;
    WorkerPool &operator=(WorkerPool const &) = delete;

    int size() const { return numthreads; }

    /// Queue a task with no result.
    void post(std::function<void()> task);

    /// Queue a task, returning a future for its result or exception.
    template <typename F>
    auto submit(F &&f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto future = task->get_future();
        post([task] { (*task)(); });
        return future;
    }

    /// Wait for all queued tasks, then stop the threads.
    void join();

    /// The thread count used for a requested count of zero.
    static int default_numthreads();

private:
    int numthreads;
    std::mutex mutables;
    std::unique_ptr<boost::asio::thread_pool> pool;
};

} // namespace Async
} // namespace Svgfx

#endif // SVGFX_ASYNC_WORKER_POOL_H
