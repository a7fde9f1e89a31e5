/**
 * @file lock.cppm
 * @brief Continuation-passing mutex with cooperative cancellation points
 *
 * Usage Example:
 *   import coopmod.sync.lock;
 *
 *   async_lock lock(ctx);
 *
 *   // Skipped with errc::interrupted when another caller is queued
 *   auto checkpoint = lock.cancels<void>([&](completion<void> next) {
 *       long_step(next);
 *   });
 *
 *   lock.run<int>([&](completion<int> release) {
 *       checkpoint([release](result<void> r) {
 *           if (!r) { release(fail(r.error())); return; }
 *           release(42);
 *       });
 *   }, [](result<int> r) {
 *       // called once, after the critical section released the lock
 *   });
 */
module;

#include <coopmod/config.hpp>

export module coopmod.sync.lock;

import std;
import coopmod.core.error;
import coopmod.core.log;
import coopmod.io.io_context;
import coopmod.sync.completion;

namespace coopmod {

// =============================================================================
// async_lock — FIFO lock for interleaved continuations
// =============================================================================

/// Serializes critical sections on one io_context.
/// - run(): acquire now if free, else queue (FIFO); release hands the lock to
///   the oldest waiter on the next loop tick, so stack depth stays bounded
/// - cancels() / should_yield(): cooperative cancellation points that give up
///   when another caller is waiting and the lock is cancellable
///
/// Not thread-safe. Must outlive every run() it has accepted.
export class async_lock {
public:
    explicit async_lock(io_context& ctx, bool cancellable = true) noexcept
        : ctx_(&ctx), cancellable_(cancellable) {}

    ~async_lock() = default;

    async_lock(const async_lock&) = delete;
    auto operator=(const async_lock&) -> async_lock& = delete;

    /// Run critical_section(release) under the lock; done receives what
    /// release was called with. If critical_section throws before releasing,
    /// the lock is released, done gets the failure and the exception is rethrown.
    template <typename T>
    void run(async_fn<T> critical_section, completion<T> done) {
        std::function<void()> acquired =
            [this, cs = std::move(critical_section), done = std::move(done)]() {
                acquire<T>(cs, done);
            };

        // Queue behind existing waiters even while a hand-off is in flight
        if (locked_ || handoff_ || start_ < end_) {
            waiters_.emplace(end_++, std::move(acquired));
            return;
        }
        acquired();
    }

    /// Checkpoint query: true when a cancellation point should give up now
    [[nodiscard]] auto should_yield() const noexcept -> bool {
        return cancellable_ && start_ < end_;
    }

    /// Wrap thunk into a cancellation point. The wrapper completes with
    /// errc::interrupted, without running thunk, when should_yield() holds.
    template <typename T>
    [[nodiscard]] auto cancels(async_fn<T> thunk) -> async_fn<T> {
        return [this, thunk = std::move(thunk)](completion<T> next) {
            if (cancellable_) {
                if (!locked_)
                    logger::warn("async_lock: cancellation point reached outside a critical section");
                if (start_ < end_) {
                    logger::debug("async_lock: interrupted, {} waiter(s) queued", waiter_count());
                    if (next)
                        next(fail(errc::interrupted));
                    return;
                }
            }
            thunk(std::move(next));
        };
    }

    [[nodiscard]] auto cancellable() const noexcept -> bool { return cancellable_; }
    void set_cancellable(bool on) noexcept { cancellable_ = on; }

    [[nodiscard]] auto locked() const noexcept -> bool { return locked_; }

    [[nodiscard]] auto waiter_count() const noexcept -> std::size_t {
        return static_cast<std::size_t>(end_ - start_);
    }

private:
    template <typename T>
    void acquire(const async_fn<T>& critical_section, const completion<T>& done) {
        locked_ = true;
        auto released = std::make_shared<bool>(false);

        completion<T> release = [this, released, done](result<T> r) {
            if (*released) {
                logger::warn("async_lock: release invoked more than once, ignored");
                return;
            }
            *released = true;
            unlock();
            if (done)
                done(std::move(r));
        };

        try {
            critical_section(release);
        } catch (...) {
            if (!*released) {
                *released = true;
                auto ec = error_from_exception(std::current_exception(),
                                               errc::critical_section_failed);
                logger::error("async_lock: critical section threw before release: {}",
                              ec.message());
                unlock();
                if (done)
                    done(fail(ec));
            }
            throw;
        }
    }

    /// Drop the lock and schedule the oldest waiter for the next tick
    void unlock() {
        locked_ = false;
        if (start_ == end_)
            return;

        auto it = waiters_.find(start_++);
        auto next = std::move(it->second);
        waiters_.erase(it);

        handoff_ = true;
        ctx_->post([this, next = std::move(next)]() {
            handoff_ = false;
            next();
        });
    }

    io_context* ctx_;
    bool cancellable_;
    bool locked_ = false;
    bool handoff_ = false;   // a waiter was dequeued and is about to acquire

    // waiters_[start_ .. end_) in arrival order
    std::unordered_map<std::uint64_t, std::function<void()>> waiters_;
    std::uint64_t start_ = 0;
    std::uint64_t end_ = 0;
};

} // namespace coopmod
