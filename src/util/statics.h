// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Process-wide objects with explicit initialisation and destruction.
 */
#ifndef SVGFX_UTIL_STATICS_H
#define SVGFX_UTIL_STATICS_H

#include <optional>
#include <stdexcept>
#include <utility>

namespace Svgfx {
namespace Util {

class StaticBase;

/**
 * Process-wide services (the filter registry and the result cache) must be
 * created once at start-up and torn down before the end of main(), because
 * background threads (the worker pool and the cache sweeper) use them.
 *
 * Instead of the function-local static idiom
 *
 *     X &get()
 *     {
 *         static X x;
 *         return x;
 *     }
 *
 * write
 *
 *     X &get()
 *     {
 *         static Static<X> x;
 *         return x.get();
 *     }
 *
 * and initialise with x.emplace(args...).
 *
 * Differences from the function-local idiom:
 *     - The object is only constructed by an explicit emplace(), with arguments.
 *     - get() throws std::logic_error before emplace() or after destruction.
 *     - Destruction happens in StaticsBin::get().destroy(), in reverse order of
 *       construction, and the object may be re-created afterwards. This is what
 *       allows isolated tests.
 *     - Construction is not thread-safe; it must happen on the main thread.
 */

/**
 * Maintains the list of statics that need to be destroyed,
 * destroys them, and complains if it's not asked to do so in time.
 */
class StaticsBin
{
public:
    static StaticsBin &get();
    void destroy();
    ~StaticsBin();

private:
    StaticBase *head = nullptr;

    template <typename T>
    friend class Static;
};

/// Base class for statics, allowing type-erased destruction.
class StaticBase
{
protected:
    StaticBase *next = nullptr;
    ~StaticBase() = default;
    virtual void destroy() = 0;
    friend class StaticsBin;
};

/// Wrapper for a static of type T.
template <typename T>
class Static final : public StaticBase
{
public:
    template <typename... Args>
    T &emplace(Args &&... args)
    {
        if (opt) {
            throw std::logic_error("static object already initialised");
        }
        opt.emplace(std::forward<Args>(args)...);
        auto &bin = StaticsBin::get();
        next = bin.head;
        bin.head = this;
        return *opt;
    }

    T &get()
    {
        if (!opt) {
            throw std::logic_error("static object used before initialisation or after shutdown");
        }
        return *opt;
    }

    bool has_value() const { return opt.has_value(); }

private:
    std::optional<T> opt;
    void destroy() override { opt.reset(); }
};

} // namespace Util
} // namespace Svgfx

#endif // SVGFX_UTIL_STATICS_H
