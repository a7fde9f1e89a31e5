/// coopmod unit tests — async_deque storage, drain notification, consumer loop

#include "test_framework.hpp"

import std;
import coopmod.io.io_context;
import coopmod.sync.deque;

using namespace coopmod;

// =============================================================================
// Passive deque
// =============================================================================

TEST(deque_push_back_pop_front_is_fifo) {
    auto ctx = make_io_context();
    async_deque<int> dq(*ctx);

    dq.push_back(1);
    dq.push_back(2);
    dq.push_back(3);
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(3));

    ASSERT_EQ(dq.pop_front(), 1);
    ASSERT_EQ(dq.pop_front(), 2);
    ASSERT_EQ(dq.pop_front(), 3);
    ASSERT_TRUE(dq.empty());
}

TEST(deque_push_front_pop_front_is_lifo) {
    auto ctx = make_io_context();
    async_deque<std::string> dq(*ctx);

    dq.push_front("a");
    dq.push_front("b");
    ASSERT_EQ(dq.pop_front(), std::string("b"));
    ASSERT_EQ(dq.pop_front(), std::string("a"));
}

TEST(deque_mixed_ends) {
    auto ctx = make_io_context();
    async_deque<int> dq(*ctx);

    dq.push_back(2);
    dq.push_front(1);
    dq.push_back(3);
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(3));
    ASSERT_EQ(dq.pop_back(), 3);
    ASSERT_EQ(dq.pop_front(), 1);
    ASSERT_EQ(dq.pop_back(), 2);
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(0));
}

TEST(deque_pop_empty_throws) {
    auto ctx = make_io_context();
    async_deque<int> dq(*ctx);

    ASSERT_THROWS_AS(dq.pop_front(), std::out_of_range);
    ASSERT_THROWS_AS(dq.pop_back(), std::out_of_range);

    // Still usable afterwards
    dq.push_back(7);
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(1));
    ASSERT_EQ(dq.pop_back(), 7);
}

TEST(deque_without_consumer_is_passive) {
    auto ctx = make_io_context();
    async_deque<int> dq(*ctx);
    dq.push_back(1);
    ctx->poll();
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(1));
}

// =============================================================================
// when_drain
// =============================================================================

TEST(deque_when_drain_runs_immediately_when_empty) {
    auto ctx = make_io_context();
    async_deque<int> dq(*ctx);
    bool ran = false;
    dq.when_drain([&] { ran = true; });
    ASSERT_TRUE(ran);
}

TEST(deque_when_drain_fires_once_on_emptying) {
    auto ctx = make_io_context();
    async_deque<int> dq(*ctx);
    int fired = 0;

    dq.push_back(1);
    dq.push_back(2);
    dq.when_drain([&] { ++fired; });

    dq.pop_front();
    ASSERT_EQ(fired, 0);
    dq.pop_front();
    ASSERT_EQ(fired, 1);

    // Not re-registered
    dq.push_back(3);
    dq.pop_back();
    ASSERT_EQ(fired, 1);
}

// =============================================================================
// Consumer loop
// =============================================================================

TEST(deque_initial_elements_start_on_next_tick) {
    auto ctx = make_io_context();
    std::vector<std::string> seen;

    async_deque<std::string> dq(*ctx, {"a", "b", "c"},
        [&](std::string v, std::function<void()> done) {
            seen.push_back(std::move(v));
            done();
        });

    ASSERT_TRUE(seen.empty());
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(3));

    // One element per tick: done() never recurses into the next delivery
    ctx->poll();
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(1));
    ctx->poll();
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(2));
    ctx->poll();
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(3));

    ASSERT_EQ(seen[0], std::string("a"));
    ASSERT_EQ(seen[1], std::string("b"));
    ASSERT_EQ(seen[2], std::string("c"));
    ASSERT_TRUE(dq.empty());
}

TEST(deque_one_element_in_flight) {
    auto ctx = make_io_context();
    int active = 0;
    int max_active = 0;
    std::vector<int> seen;
    constexpr int N = 4;

    async_deque<int> dq(*ctx, [&](int v, std::function<void()> done) {
        ++active;
        max_active = std::max(max_active, active);
        seen.push_back(v);
        ctx->schedule_after(std::chrono::milliseconds(2), [&, done] {
            --active;
            done();
            if (seen.size() == N && active == 0)
                ctx->stop();
        });
    });

    for (int i = 0; i < N; ++i)
        dq.push_back(i);

    // Delivery on push to an idle consumer is immediate
    ASSERT_TRUE(dq.busy());
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(N - 1));

    ctx->schedule_after(std::chrono::seconds(5), [&] { ctx->stop(); });
    ctx->run();

    ASSERT_EQ(max_active, 1);
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(N));
    for (int i = 0; i < N; ++i)
        ASSERT_EQ(seen[i], i);
    ASSERT_FALSE(dq.busy());
}

TEST(deque_push_front_while_busy_jumps_queue) {
    auto ctx = make_io_context();
    std::vector<int> seen;
    std::function<void()> pending;

    async_deque<int> dq(*ctx, [&](int v, std::function<void()> done) {
        seen.push_back(v);
        pending = done;
    });

    dq.push_back(1);       // delivered now, held
    dq.push_back(2);
    dq.push_front(0);      // ahead of 2

    pending();
    ctx->poll();
    pending();
    ctx->poll();

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(3));
    ASSERT_EQ(seen[0], 1);
    ASSERT_EQ(seen[1], 0);
    ASSERT_EQ(seen[2], 2);
}

TEST(deque_consumer_done_is_one_shot) {
    auto ctx = make_io_context();
    std::vector<int> seen;

    async_deque<int> dq(*ctx, [&](int v, std::function<void()> done) {
        seen.push_back(v);
        done();
        done();
    });

    dq.push_back(1);
    dq.push_back(2);
    dq.push_back(3);
    ctx->poll();
    ctx->poll();
    ctx->poll();

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(3));
    ASSERT_TRUE(dq.empty());
}

TEST(deque_idle_consumer_resumes_on_push) {
    auto ctx = make_io_context();
    std::vector<int> seen;

    async_deque<int> dq(*ctx, [&](int v, std::function<void()> done) {
        seen.push_back(v);
        done();
    });

    dq.push_back(1);
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(1));
    ctx->poll();

    dq.push_back(2);
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(seen[1], 2);
}

TEST(deque_when_drain_after_consumer_takes_last) {
    auto ctx = make_io_context();
    bool drained = false;

    async_deque<int> dq(*ctx, {1, 2}, [](int, std::function<void()> done) {
        done();
    });
    dq.when_drain([&] { drained = true; });

    ctx->poll();
    ASSERT_FALSE(drained);
    ctx->poll();
    ASSERT_TRUE(drained);
}

TEST(deque_consumer_throw_keeps_draining) {
    auto ctx = make_io_context();
    std::vector<int> seen;
    bool drained = false;

    async_deque<int> dq(*ctx, {1, 2, 3}, [&](int v, std::function<void()> done) {
        seen.push_back(v);
        if (v == 1)
            throw std::runtime_error("consumer failed");
        done();
    });
    dq.when_drain([&] { drained = true; });

    // The throw surfaces from the loop; the element is dropped
    ASSERT_THROWS_AS(ctx->poll(), std::runtime_error);
    ASSERT_FALSE(dq.busy());

    dq.push_back(4);
    for (int i = 0; i < 5; ++i)
        ctx->poll();

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(4));
    ASSERT_EQ(seen[1], 2);
    ASSERT_EQ(seen[3], 4);
    ASSERT_TRUE(dq.empty());
    ASSERT_TRUE(drained);
}

TEST(deque_done_after_throw_is_ignored) {
    auto ctx = make_io_context();
    std::vector<int> seen;
    std::function<void()> first_done;

    async_deque<int> dq(*ctx, {1, 2, 3}, [&](int v, std::function<void()> done) {
        seen.push_back(v);
        if (v == 1) {
            first_done = done;
            throw std::runtime_error("consumer failed");
        }
        // 2 stays in flight
    });

    ASSERT_THROWS_AS(ctx->poll(), std::runtime_error);
    ctx->poll();
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(2));
    ASSERT_TRUE(dq.busy());

    // Must not release the element delivered after the throw
    first_done();
    ctx->poll();
    ASSERT_TRUE(dq.busy());
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(dq.size(), static_cast<std::size_t>(1));
}

RUN_TESTS()
