/// coopmod example — Async Deque Demo
/// 演示 async_deque 的单消费者模型：一次只处理一个元素

import std;
import coopmod.core;
import coopmod.io;
import coopmod.sync;

using namespace coopmod;

auto main() -> int {
    std::println("=== coopmod: Async Deque Demo ===");
    auto ctx = make_io_context();
    int sum = 0;

    // Consumer: each element takes a few milliseconds to "process"
    async_deque<int> jobs(*ctx, {1, 2}, [&](int v, std::function<void()> done) {
        std::println("  [consumer] recv {}", v);
        ctx->schedule_after(std::chrono::milliseconds(3), [&sum, v, done] {
            sum += v;
            done();
        });
    });

    // Producer: pushes while the consumer is busy
    for (int i = 3; i <= 5; ++i) {
        ctx->schedule_after(std::chrono::milliseconds(i), [&jobs, i] {
            std::println("  [producer] send {}", i);
            jobs.push_back(i);
        });
    }
    // Urgent work goes to the front
    ctx->schedule_after(std::chrono::milliseconds(4), [&jobs] {
        std::println("  [producer] send 100 (front)");
        jobs.push_front(100);
    });

    ctx->schedule_after(std::chrono::milliseconds(10), [&] {
        jobs.when_drain([&] {
            // Last element handed out: wait for the consumer to finish it
            ctx->schedule_after(std::chrono::milliseconds(10), [&] {
                std::println("  [consumer] done, sum = {}", sum);
                ctx->stop();
            });
        });
    });

    ctx->run();
    std::println("Done.");
    return 0;
}
