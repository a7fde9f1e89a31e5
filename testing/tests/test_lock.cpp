/// coopmod unit tests — async_lock serialization, FIFO hand-off, throw path,
/// cancellation points

#include "test_framework.hpp"

import std;
import coopmod.core.error;
import coopmod.io.io_context;
import coopmod.sync.completion;
import coopmod.sync.lock;

using namespace coopmod;

// Stop the loop after a while so a lost completion fails instead of hanging
static void run_with_watchdog(io_context& ctx) {
    ctx.schedule_after(std::chrono::seconds(5), [&ctx] { ctx.stop(); });
    ctx.run();
}

// =============================================================================
// Basic acquire / release
// =============================================================================

TEST(lock_runs_immediately_when_free) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    int completions = 0;
    int value = 0;
    lock.run<int>([&](completion<int> release) {
        ASSERT_TRUE(lock.locked());
        release(42);
    }, [&](result<int> r) {
        ++completions;
        ASSERT_TRUE(r.has_value());
        value = *r;
    });

    ASSERT_EQ(completions, 1);
    ASSERT_EQ(value, 42);
    ASSERT_FALSE(lock.locked());
}

TEST(lock_completion_receives_failure) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    std::error_code got;
    lock.run<void>([](completion<void> release) {
        release(fail(errc::operation_failed));
    }, [&](result<void> r) {
        ASSERT_FALSE(r.has_value());
        got = r.error();
    });

    ASSERT_EQ(got, make_error_code(errc::operation_failed));
    ASSERT_FALSE(lock.locked());
}

TEST(lock_queues_while_held) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    completion<void> held;
    bool second_started = false;

    lock.run<void>([&](completion<void> release) { held = release; }, {});
    lock.run<void>([&](completion<void> release) {
        second_started = true;
        release({});
    }, {});

    ASSERT_TRUE(lock.locked());
    ASSERT_EQ(lock.waiter_count(), static_cast<std::size_t>(1));
    ASSERT_FALSE(second_started);

    held({});
    // Hand-off happens on the next tick, never inside release()
    ASSERT_FALSE(second_started);
    ASSERT_EQ(lock.waiter_count(), static_cast<std::size_t>(0));

    ctx->poll();
    ASSERT_TRUE(second_started);
    ASSERT_FALSE(lock.locked());
}

TEST(lock_never_overlaps_and_serves_fifo) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    int active = 0;
    int max_active = 0;
    std::vector<int> order;
    constexpr int N = 5;

    for (int i = 0; i < N; ++i) {
        lock.run<int>([&, i](completion<int> release) {
            ++active;
            max_active = std::max(max_active, active);
            order.push_back(i);
            // Finish asynchronously so later callers really have to wait
            ctx->schedule_after(std::chrono::milliseconds(2), [&active, release, i] {
                --active;
                release(i);
            });
        }, [&, i](result<int> r) {
            ASSERT_TRUE(r.has_value());
            ASSERT_EQ(*r, i);
            if (i == N - 1)
                ctx->stop();
        });
    }

    run_with_watchdog(*ctx);

    ASSERT_EQ(max_active, 1);
    ASSERT_EQ(order.size(), static_cast<std::size_t>(N));
    for (int i = 0; i < N; ++i)
        ASSERT_EQ(order[i], i);
}

TEST(lock_run_during_handoff_queues_behind) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    completion<void> held;
    std::vector<char> order;

    lock.run<void>([&](completion<void> release) { held = release; }, {});
    lock.run<void>([&](completion<void> release) {
        order.push_back('b');
        release({});
    }, {});

    held({});
    ASSERT_FALSE(lock.locked());

    // Lock is free but 'b' is about to take it: 'c' must wait its turn
    lock.run<void>([&](completion<void> release) {
        order.push_back('c');
        release({});
    }, {});
    ASSERT_TRUE(order.empty());

    ctx->poll();
    ctx->poll();
    ASSERT_EQ(order.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(order[0], 'b');
    ASSERT_EQ(order[1], 'c');
}

TEST(lock_double_release_ignored) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    int completions = 0;
    completion<int> saved;
    lock.run<int>([&](completion<int> release) {
        saved = release;
        release(1);
    }, [&](result<int>) { ++completions; });

    saved(2);
    ASSERT_EQ(completions, 1);
    ASSERT_FALSE(lock.locked());
}

// =============================================================================
// Synchronous throw
// =============================================================================

TEST(lock_throw_releases_and_rethrows) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    std::optional<result<void>> outcome;
    bool caught = false;
    try {
        lock.run<void>([](completion<void>) {
            throw std::runtime_error("boom");
        }, [&](result<void> r) { outcome = r; });
    } catch (const std::runtime_error&) {
        caught = true;
    }

    ASSERT_TRUE(caught);
    ASSERT_FALSE(lock.locked());
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    ASSERT_EQ(outcome->error(), make_error_code(errc::critical_section_failed));
}

TEST(lock_throw_keeps_system_error_code) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    std::error_code got;
    auto expected = std::make_error_code(std::errc::permission_denied);
    ASSERT_THROWS_AS(lock.run<void>([&](completion<void>) {
        throw std::system_error(expected);
    }, [&](result<void> r) { got = r.error(); }), std::system_error);

    ASSERT_EQ(got, expected);
}

TEST(lock_throw_still_wakes_next_waiter) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    completion<void> held;
    bool thrower_completed = false;
    bool third_ran = false;

    lock.run<void>([&](completion<void> release) { held = release; }, {});
    lock.run<void>([](completion<void>) {
        throw std::runtime_error("waiter failed");
    }, [&](result<void> r) {
        ASSERT_FALSE(r.has_value());
        thrower_completed = true;
    });
    lock.run<void>([&](completion<void> release) {
        third_ran = true;
        release({});
    }, {});

    held({});

    // The throwing waiter runs from the loop: the exception surfaces there
    ASSERT_THROWS_AS(ctx->poll(), std::runtime_error);
    ASSERT_TRUE(thrower_completed);
    ASSERT_FALSE(lock.locked());
    ASSERT_FALSE(third_ran);

    ctx->poll();
    ASSERT_TRUE(third_ran);
}

// =============================================================================
// Cancellation points
// =============================================================================

TEST(lock_cancels_interrupts_when_waiters_queued) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    bool body_ran = false;
    auto checkpoint = lock.cancels<int>([&](completion<int> next) {
        body_ran = true;
        next(1);
    });

    completion<void> held;
    lock.run<void>([&](completion<void> release) { held = release; }, {});
    lock.run<void>([](completion<void> release) { release({}); }, {});

    ASSERT_TRUE(lock.should_yield());

    std::optional<result<int>> got;
    checkpoint([&](result<int> r) { got = r; });

    ASSERT_FALSE(body_ran);
    ASSERT_TRUE(got.has_value());
    ASSERT_FALSE(got->has_value());
    ASSERT_TRUE(is_interrupted(got->error()));

    held({});
    ctx->poll();
}

TEST(lock_cancels_runs_body_without_waiters) {
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    auto checkpoint = lock.cancels<int>([](completion<int> next) { next(7); });

    std::optional<result<int>> got;
    lock.run<void>([&](completion<void> release) {
        ASSERT_FALSE(lock.should_yield());
        checkpoint([&, release](result<int> r) {
            got = r;
            release({});
        });
    }, {});

    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got->has_value());
    ASSERT_EQ(**got, 7);
}

TEST(lock_cancels_noop_when_not_cancellable) {
    auto ctx = make_io_context();
    async_lock lock(*ctx, false);
    ASSERT_FALSE(lock.cancellable());

    bool body_ran = false;
    auto checkpoint = lock.cancels<void>([&](completion<void> next) {
        body_ran = true;
        next({});
    });

    completion<void> held;
    lock.run<void>([&](completion<void> release) { held = release; }, {});
    lock.run<void>([](completion<void> release) { release({}); }, {});

    ASSERT_FALSE(lock.should_yield());
    std::optional<result<void>> got;
    checkpoint([&](result<void> r) { got = r; });
    ASSERT_TRUE(body_ran);
    ASSERT_TRUE(got.has_value() && got->has_value());

    // Runtime switch
    lock.set_cancellable(true);
    ASSERT_TRUE(lock.should_yield());

    held({});
    ctx->poll();
}

TEST(lock_interrupted_section_yields_to_waiter) {
    // A long critical section keeps looping through a cancellation point
    // until someone queues up, then gives the lock away
    auto ctx = make_io_context();
    async_lock lock(*ctx);

    int steps = 0;
    bool waiter_ran = false;
    std::error_code first_outcome;

    std::function<void(completion<void>)> loop;
    auto checkpoint = lock.cancels<void>([&](completion<void> next) {
        ++steps;
        ctx->post([next] { next({}); });
    });
    loop = [&](completion<void> release) {
        checkpoint([&, release](result<void> r) {
            if (!r) {
                release(r);
                return;
            }
            if (steps == 3) {
                lock.run<void>([&](completion<void> rel) {
                    waiter_ran = true;
                    rel({});
                }, [&](result<void>) { ctx->stop(); });
            }
            loop(release);
        });
    };

    lock.run<void>(loop, [&](result<void> r) {
        ASSERT_FALSE(r.has_value());
        first_outcome = r.error();
    });

    run_with_watchdog(*ctx);

    ASSERT_EQ(steps, 3);
    ASSERT_TRUE(is_interrupted(first_outcome));
    ASSERT_TRUE(waiter_ran);
}

RUN_TESTS()
