// SPDX-License-Identifier: GPL-2.0-or-later
/** \file Channel
 * Thread-safe communication channel between worker tasks and the thread that waits for them.
 */
#ifndef SVGFX_ASYNC_CHANNEL_H
#define SVGFX_ASYNC_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace Svgfx {
namespace Async {
namespace Channel {
namespace detail {

template <typename T>
class Shared final
{
public:
    Shared() = default;
    Shared(Shared const &) = delete;
    Shared &operator=(Shared const &) = delete;

    operator bool() const
    {
        auto g = std::lock_guard(mutables);
        return is_open;
    }

    bool send(T &&value)
    {
        {
            auto g = std::lock_guard(mutables);
            if (!is_open) return false;
            queue.push_back(std::move(value));
        }
        cond.notify_one();
        return true;
    }

    template <typename Clock, typename Duration>
    std::optional<T> receive_until(std::chrono::time_point<Clock, Duration> const &deadline)
    {
        auto lock = std::unique_lock(mutables);
        if (!cond.wait_until(lock, deadline, [this] { return !queue.empty() || !is_open; })) {
            return {};
        }
        if (queue.empty()) {
            return {};
        }
        auto value = std::move(queue.front());
        queue.pop_front();
        return value;
    }

    void close()
    {
        {
            auto g = std::lock_guard(mutables);
            is_open = false;
            queue.clear();
        }
        cond.notify_all();
    }

private:
    mutable std::mutex mutables;
    std::condition_variable cond;
    std::deque<T> queue;
    bool is_open = true;
};

struct Create;

} // namespace detail

/**
 * The sending end. Unlike Dest, a Source may be copied, so that every task in a batch can hold one.
 */
template <typename T>
class Source final
{
public:
    Source() = default;

    /**
     * Check whether the channel is still open.
     */
    explicit operator bool() const { return shared && shared->operator bool(); }

    /**
     * Attempt to deliver a value to the Dest end.
     *
     * \return Whether the channel was still open. If not, the value is dropped.
     */
    bool send(T value) const { return shared && shared->send(std::move(value)); }

    /**
     * Release this end. The channel stays open for other copies.
     */
    void close() { shared.reset(); }

private:
    std::shared_ptr<detail::Shared<T>> shared;
    explicit Source(std::shared_ptr<detail::Shared<T>> shared_) : shared(std::move(shared_)) {}
    friend struct detail::Create;
};

template <typename T>
class Dest final
{
public:
    Dest() = default;
    Dest(Dest const &) = delete;
    Dest &operator=(Dest const &) = delete;
    Dest(Dest &&) = default;
    Dest &operator=(Dest &&) = default;
    ~Dest() { close(); }

    /**
     * Close the channel. Pending values are discarded, and further sends fail.
     */
    void close() { if (shared) { shared->close(); shared.reset(); } }

    /**
     * Wait for the next value until the deadline passes.
     *
     * \return The value, or nothing on timeout or if the channel was closed.
     */
    template <typename Clock, typename Duration>
    std::optional<T> receive_until(std::chrono::time_point<Clock, Duration> const &deadline)
    {
        if (!shared) return {};
        return shared->receive_until(deadline);
    }

    /**
     * Check whether \a close() has already been called, or if the channel was never opened.
     */
    explicit operator bool() const { return (bool)shared; }

private:
    std::shared_ptr<detail::Shared<T>> shared;
    explicit Dest(std::shared_ptr<detail::Shared<T>> shared_) : shared(std::move(shared_)) {}
    friend struct detail::Create;
};

namespace detail {

struct Create
{
    Create() = delete;

    template <typename T>
    static auto create()
    {
        auto shared = std::make_shared<detail::Shared<T>>();
        auto src = Source<T>(shared);
        auto dst = Dest<T>(std::move(shared));
        return std::make_pair(std::move(src), std::move(dst));
    }
};

} // namespace detail

/**
 * Create a linked Source - Destination pair forming a thread-safe communication channel.
 *
 * Sources deliver values that the Dest collects in order of arrival. Destructing the Dest closes the
 * channel; Sources then see their sends fail.
 */
template <typename T>
std::pair<Source<T>, Dest<T>> create()
{
    return detail::Create::create<T>();
}

} // namespace Channel
} // namespace Async
} // namespace Svgfx

#endif // SVGFX_ASYNC_CHANNEL_H
