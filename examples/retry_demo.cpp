/// coopmod example — Retry Demo
/// 演示 retry_with_delay 与中断感知的 retry

import std;
import coopmod.core;
import coopmod.io;
import coopmod.sync;

using namespace coopmod;

auto main() -> int {
    logger::init("retry_demo", logger::level::debug);
    std::println("=== coopmod: Retry Demo ===");
    auto ctx = make_io_context();
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    // Flaky task: fails twice, then succeeds
    int calls = 0;
    retry_with_delay<int>(*ctx, 4, std::chrono::milliseconds(100),
        [&](completion<int> next) {
            ++calls;
            std::println("  [{:>4}ms] attempt {}", elapsed_ms(), calls);
            if (calls < 3)
                next(fail(errc::operation_failed));
            else
                next(calls * 10);
        },
        [&](result<int> r) {
            if (r)
                std::println("  [{:>4}ms] result = {}", elapsed_ms(), *r);
            else
                std::println("  [{:>4}ms] gave up: {}", elapsed_ms(), r.error().message());

            // An interrupted task is never retried
            retry<void>(*ctx, 5, [&](completion<void> next) {
                std::println("  [{:>4}ms] interrupted attempt", elapsed_ms());
                next(fail(errc::interrupted));
            }, [&](result<void> r2) {
                std::println("  [{:>4}ms] interrupted: {}", elapsed_ms(),
                             is_interrupted(r2.error()));
                ctx->stop();
            });
        },
        [](std::function<void()> resume) {
            std::println("         failure hook: cleaning up");
            resume();
        });

    ctx->run();
    std::println("Done.");
    return 0;
}
