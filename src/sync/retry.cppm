/**
 * @file retry.cppm
 * @brief Bounded retry for continuation-passing operations, aware of
 *        cooperative cancellation
 *
 * Usage example:
 *   import coopmod.sync.retry;
 *
 *   // Up to 3 attempts; an errc::interrupted attempt stops the loop and is
 *   // reported to the completion as-is
 *   retry<int>(ctx, 3, [&](completion<int> next) {
 *       lock.run<int>(critical_section, next);
 *   }, [](result<int> r) { ... });
 *
 *   // Fixed 100ms between attempts, hook runs after every failed attempt
 *   retry_with_delay<void>(ctx, 5, 100ms, task, done,
 *       [](std::function<void()> resume) { reconnect(resume); });
 *
 *   // Backoff through the underlying primitive
 *   basic_retry<int>(ctx, {
 *       .max_attempts = 5,
 *       .initial_delay = 10ms,
 *       .multiplier = 2.0,
 *   }, task, done);
 */
module;

#include <coopmod/config.hpp>

export module coopmod.sync.retry;

import std;
import coopmod.core.error;
import coopmod.core.log;
import coopmod.io.io_context;
import coopmod.sync.completion;

namespace coopmod {

// =============================================================================
// retry_options — Retry configuration
// =============================================================================

export struct retry_options {
    std::uint32_t max_attempts = 5;        ///< Max attempts (including first try); 0 acts as 1
    std::chrono::steady_clock::duration
        initial_delay = std::chrono::milliseconds(0);  ///< Delay after first failure
    std::chrono::steady_clock::duration
        max_delay = std::chrono::seconds(5);           ///< Max delay cap
    double multiplier = 1.0;               ///< Backoff multiplier
    bool   jitter     = false;             ///< Add random ±25% jitter to delay
};

namespace detail {

template <typename T>
struct retry_state {
    io_context* ctx;
    retry_options opts;
    async_fn<T> task;
    completion<T> done;
    std::uint32_t attempt = 0;
    std::chrono::steady_clock::duration delay{};
};

inline auto next_delay(const retry_options& opts,
                       std::chrono::steady_clock::duration& delay)
    -> std::chrono::steady_clock::duration
{
    static thread_local std::mt19937 rng{std::random_device{}()};

    auto actual = delay;
    if (opts.jitter && delay.count() > 0) {
        auto base_us = std::chrono::duration_cast<std::chrono::microseconds>(delay).count();
        std::uniform_int_distribution<long long> dist(
            static_cast<long long>(base_us * 0.75),
            static_cast<long long>(base_us * 1.25));
        actual = std::chrono::microseconds(dist(rng));
    }

    auto next_us = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::microseconds>(delay).count()
        * opts.multiplier);
    delay = std::chrono::microseconds(next_us);
    if (delay > opts.max_delay)
        delay = opts.max_delay;
    return actual;
}

template <typename T>
void start_attempt(std::shared_ptr<retry_state<T>> st);

template <typename T>
void on_attempt(std::shared_ptr<retry_state<T>> st, result<T> r) {
    if (r) {
        st->done(std::move(r));
        return;
    }

    auto max = std::max<std::uint32_t>(st->opts.max_attempts, 1);
    if (st->attempt >= max) {
        logger::warn("retry: giving up after {} attempt(s): {}",
                     st->attempt, r.error().message());
        st->done(std::move(r));
        return;
    }
    logger::debug("retry: attempt {}/{} failed: {}",
                  st->attempt, max, r.error().message());

    // Later attempts never run on the failing attempt's stack
    auto wait = next_delay(st->opts, st->delay);
    if (wait.count() <= 0)
        st->ctx->post([st] { start_attempt(st); });
    else
        st->ctx->schedule_after(wait, [st] { start_attempt(st); });
}

template <typename T>
void start_attempt(std::shared_ptr<retry_state<T>> st) {
    ++st->attempt;
    st->task(make_once<result<T>>([st](result<T> r) {
        on_attempt(st, std::move(r));
    }, "retry attempt completion"));
}

// void results travel as std::monostate through the interrupt-aware layer
template <typename T>
using lift_t = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

template <typename T>
auto lift(result<T>&& r) -> std::optional<lift_t<T>> {
    if constexpr (std::is_void_v<T>)
        return std::monostate{};
    else
        return std::move(*r);
}

template <typename T>
auto lower(std::optional<lift_t<T>>&& v) -> result<T> {
    if constexpr (std::is_void_v<T>)
        return {};
    else
        return std::move(*v);
}

} // namespace detail

// =============================================================================
// basic_retry — attempt loop with give-up-after-N semantics
// =============================================================================

/// Invoke task until it succeeds or opts.max_attempts attempts failed.
/// done receives the first success or the last error. The first attempt
/// starts synchronously; later ones run on the next tick or after the delay.
export template <typename T>
void basic_retry(io_context& ctx, retry_options opts,
                 async_fn<T> task, completion<T> done)
{
    if (!task) {
        if (done)
            done(fail(errc::invalid_argument));
        return;
    }
    auto st = std::make_shared<detail::retry_state<T>>(detail::retry_state<T>{
        .ctx = &ctx,
        .opts = opts,
        .task = std::move(task),
        .done = done ? std::move(done) : completion<T>([](result<T>) {}),
        .delay = opts.initial_delay,
    });
    detail::start_attempt(std::move(st));
}

// =============================================================================
// retry — basic_retry that lets interruption through
// =============================================================================

/// Like basic_retry, but an attempt failing with errc::interrupted is not a
/// retryable failure: the loop is told it succeeded (so it stops), and the
/// interruption replaces the outcome handed to done.
export template <typename T>
void retry(io_context& ctx, retry_options opts,
           async_fn<T> task, completion<T> done)
{
    using lifted = std::optional<detail::lift_t<T>>;

    if (!task) {
        if (done)
            done(fail(errc::invalid_argument));
        return;
    }

    // Single slot per retry() call; attempts are sequential so it never overlaps
    auto captured = std::make_shared<std::optional<std::error_code>>();

    async_fn<lifted> guarded = [captured, task = std::move(task)](completion<lifted> next) {
        task([captured, next](result<T> r) {
            if (!r && is_interrupted(r.error())) {
                if (captured->has_value())
                    logger::warn("retry: interruption captured twice in one call");
                *captured = r.error();
                next(lifted{});
                return;
            }
            if (!r) {
                next(fail(r.error()));
                return;
            }
            next(detail::lift<T>(std::move(r)));
        });
    };

    basic_retry<lifted>(ctx, opts, std::move(guarded),
        [captured, done = std::move(done)](result<lifted> r) {
            if (!done)
                return;
            if (captured->has_value()) {
                auto ec = **captured;
                captured->reset();
                done(fail(ec));
                return;
            }
            if (!r) {
                done(fail(r.error()));
                return;
            }
            done(detail::lower<T>(std::move(*r)));
        });
}

/// retry with a plain attempt count
export template <typename T>
void retry(io_context& ctx, std::uint32_t times,
           async_fn<T> task, completion<T> done)
{
    retry<T>(ctx, retry_options{.max_attempts = times}, std::move(task), std::move(done));
}

// =============================================================================
// retry_with_delay — fixed delay + asynchronous failure hook
// =============================================================================

/// Failure hook: receives a continuation to call once it is done
export using failure_hook = std::function<void(std::function<void()>)>;

/// Retry task up to `times` attempts. After a failed attempt on_failure runs
/// first, then the next attempt starts `delay` later. Success is reported
/// immediately; the last failed attempt is reported without waiting, and an
/// interruption skips both the hook and the delay.
export template <typename T>
void retry_with_delay(io_context& ctx, std::uint32_t times,
                      std::chrono::steady_clock::duration delay,
                      async_fn<T> task, completion<T> done,
                      failure_hook on_failure = {})
{
    if (!task) {
        if (done)
            done(fail(errc::invalid_argument));
        return;
    }
    if (!on_failure)
        on_failure = [](std::function<void()> resume) { resume(); };

    auto attempts = std::make_shared<std::uint32_t>(0);
    auto bound = std::max<std::uint32_t>(times, 1);
    io_context* loop = &ctx;

    async_fn<T> delayed = [loop, bound, delay, task = std::move(task),
                           on_failure = std::move(on_failure), attempts](completion<T> next) {
        auto attempt = ++*attempts;
        task([loop, bound, delay, on_failure, attempt, next](result<T> r) {
            if (r || is_interrupted(r.error())) {
                next(std::move(r));
                return;
            }
            on_failure(make_once<>(std::function<void()>(
                [loop, bound, delay, attempt, next, r]() {
                    if (attempt >= bound) {
                        next(r);
                        return;
                    }
                    loop->schedule_after(delay, [next, r] { next(r); });
                }), "retry_with_delay failure hook"));
        });
    };

    retry<T>(ctx, bound, std::move(delayed), std::move(done));
}

} // namespace coopmod
