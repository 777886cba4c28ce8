// SPDX-License-Identifier: GPL-2.0-or-later
/** \file Progress
 * Interface for reporting progress and checking cancellation.
 */
#ifndef SVGFX_ASYNC_PROGRESS_H
#define SVGFX_ASYNC_PROGRESS_H

#include <atomic>
#include <chrono>

namespace Svgfx {
namespace Async {

class CancelledException {};

/// Thrown in place of CancelledException when a deadline rather than a caller stopped the work.
class TimeoutException : public CancelledException {};

/**
 * An interface for tasks to report progress and check for cancellation.
 * Not supported:
 *  - Error reporting - use exceptions!
 *  - Thread-safety - overrides should provide this if needed.
 */
template <typename... T>
class Progress
{
public:
    /// Report a progress value, returning false if cancelled.
    bool report(T const &... progress) { return _report(progress...); }

    /// Report a progress value, throwing CancelledException if cancelled.
    void report_or_throw(T const &... progress) { if (!_report(progress...)) _throw(); }

    /// Return whether not cancelled.
    bool keepgoing() const { return _keepgoing(); }

    /// Throw CancelledException if cancelled.
    void throw_if_cancelled() const { if (!_keepgoing()) _throw(); }

    /// Convenience function - same as keepgoing().
    operator bool() const { return _keepgoing(); }

protected:
    ~Progress() = default;
    virtual bool _keepgoing() const = 0;
    virtual bool _report(T const &... progress) = 0;
    virtual void _throw() const { throw CancelledException(); }
};

/**
 * A Progress object representing a sub-task of another Progress.
 */
template <typename T, typename... S>
class SubProgress final
    : public Progress<T, S...>
{
public:
    /// Construct a progress object for a sub-task.
    SubProgress(Progress<T, S...> &parent, T from, T amount)
    {
        if (auto p = dynamic_cast<SubProgress*>(&parent)) {
            _root = p->_root;
            _from = p->_from + p->_amount * from;
            _amount = p->_amount * amount;
        } else {
            _root = &parent;
            _from = from;
            _amount = amount;
        }
    }

private:
    Progress<T, S...> *_root;
    T _from, _amount;

    bool _keepgoing() const override { return _root->keepgoing(); }
    bool _report(T const &progress, S const &... aux) override { return _root->report(_from + _amount * progress, aux...); }
    void _throw() const override { _root->throw_if_cancelled(); throw CancelledException(); }
};

/**
 * A dummy Progress object that never reports cancellation.
 */
template <typename... T>
class ProgressAlways final
    : public Progress<T...>
{
private:
    bool _keepgoing() const override { return true; }
    bool _report(T const &...) override { return true; }
};

/**
 * A shareable cancellation flag. Many tasks may observe one token; any thread may cancel it.
 */
class CancellationToken final
{
public:
    void cancel() noexcept { _cancelled.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return _cancelled.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> _cancelled{false};
};

/**
 * A Progress object that stops when either a CancellationToken fires or a deadline passes.
 *
 * Passing the deadline is reported with TimeoutException, cancellation with CancelledException.
 */
template <typename... T>
class DeadlineProgress final
    : public Progress<T...>
{
public:
    using clock = std::chrono::steady_clock;

    DeadlineProgress(CancellationToken const &token, clock::time_point deadline)
        : _token(&token), _deadline(deadline) {}

    bool expired() const { return clock::now() >= _deadline; }
    clock::time_point deadline() const { return _deadline; }

private:
    CancellationToken const *_token;
    clock::time_point _deadline;

    bool _keepgoing() const override { return !_token->cancelled() && !expired(); }
    bool _report(T const &...) override { return _keepgoing(); }

    void _throw() const override
    {
        if (!_token->cancelled() && expired()) {
            throw TimeoutException();
        }
        throw CancelledException();
    }
};

} // namespace Async
} // namespace Svgfx

#endif // SVGFX_ASYNC_PROGRESS_H
