/// coopmod example — Async Lock Demo
/// 演示 async_lock 串行化临界区，以及 cancels() 检查点让出锁

import std;
import coopmod.core;
import coopmod.io;
import coopmod.sync;

using namespace coopmod;

struct shared_state {
    explicit shared_state(io_context& ctx) : lock(ctx) {}
    async_lock lock;
    int counter = 0;
};

// One increment per critical section, finished on a later tick
void increment(io_context& ctx, shared_state& state, int id, int times) {
    for (int i = 0; i < times; ++i) {
        state.lock.run<int>([&ctx, &state, id](completion<int> release) {
            int prev = state.counter;
            ctx.schedule_after(std::chrono::milliseconds(1), [&state, release, id, prev] {
                state.counter = prev + 1;
                std::println("  [task-{}] {} -> {}", id, prev, state.counter);
                release(state.counter);
            });
        }, {});
    }
}

// A long job that checks in between steps and gives the lock away as soon
// as somebody queues behind it
void long_job(io_context& ctx, shared_state& state) {
    auto step = state.lock.cancels<void>([&ctx](completion<void> next) {
        ctx.schedule_after(std::chrono::milliseconds(2), [next] { next({}); });
    });
    auto loop = std::make_shared<std::function<void(completion<void>)>>();
    *loop = [step, loop, &state](completion<void> release) {
        step([loop, release](result<void> r) {
            if (!r) {
                release(r);
                return;
            }
            (*loop)(release);
        });
    };

    state.lock.run<void>([loop](completion<void> release) { (*loop)(release); },
        [&ctx, loop](result<void> r) {
            std::println("  [long-job] stopped: {}",
                         r ? std::string("finished") : r.error().message());
            // Break the self-reference once the loop body has unwound
            ctx.post([loop] { *loop = nullptr; });
        });
}

auto main() -> int {
    std::println("=== coopmod: Async Lock Demo ===");
    auto ctx = make_io_context();
    shared_state state(*ctx);

    constexpr int N = 3;   // 任务数
    constexpr int M = 3;   // 每个任务递增次数

    std::println("\n-- serialized increments --");
    for (int id = 0; id < N; ++id)
        increment(*ctx, state, id, M);

    state.lock.run<void>([&](completion<void> release) {
        std::println("  Final counter = {} (expected {})", state.counter, N * M);
        release({});

        std::println("\n-- cooperative cancellation --");
        long_job(*ctx, state);
        ctx->schedule_after(std::chrono::milliseconds(10), [&] {
            state.lock.run<void>([&](completion<void> rel) {
                std::println("  [latecomer] got the lock");
                rel({});
                ctx->stop();
            }, {});
        });
    }, {});

    ctx->run();
    std::println("Done.");
    return 0;
}
