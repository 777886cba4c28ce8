// SPDX-License-Identifier: GPL-2.0-or-later
#include "worker-pool.h"

#include <stdexcept>
#include <thread>

namespace Svgfx {
namespace Async {

WorkerPool::WorkerPool(int numthreads_)
    : numthreads(numthreads_ > 0 ? numthreads_ : default_numthreads())
{
    pool = std::make_unique<boost::asio::thread_pool>(numthreads);
}

WorkerPool::~WorkerPool()
{
    join();
}

int WorkerPool::default_numthreads()
{
    if (int n = std::thread::hardware_concurrency(); n > 0) {
        return n;
    } else {
        // If not reported, use a sensible fallback.
        return 4;
    }
}

void WorkerPool::post(std::function<void()> task)
{
    auto g = std::lock_guard(mutables);
    if (!pool) {
        throw std::logic_error("WorkerPool: post() after join()");
    }
    boost::asio::post(*pool, std::move(task));
}

void WorkerPool::join()
{
    std::unique_ptr<boost::asio::thread_pool> stopping;
    {
        auto g = std::lock_guard(mutables);
        if (!pool) return;
        stopping.swap(pool);
    }
    stopping->join();
}

} // namespace Async
} // namespace Svgfx
