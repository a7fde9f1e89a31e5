#include <coopmod/version.hpp>
#include <coopmod/config.hpp>

import std;
import coopmod.core;
import coopmod.io;
import coopmod.sync;

// =============================================================================
// Demo: lock + retry + join + deque on one event loop (smoke test)
// =============================================================================

using namespace coopmod;

auto main() -> int {
    logger::init_from_env("coopmod");
    std::println("coopmod v{}", COOPMOD_VERSION_STRING);

    auto ctx = make_io_context();
    async_lock lock(*ctx);

    // 1. two critical sections, the second waits for the first
    std::println("\n=== async_lock ===");
    for (int id = 0; id < 2; ++id) {
        lock.run<int>([&, id](completion<int> release) {
            std::println("  section {} entered", id);
            ctx->schedule_after(std::chrono::milliseconds(5), [release, id] {
                release(id);
            });
        }, [](result<int> r) {
            std::println("  section {} released", *r);
        });
    }

    // 2. a task that fails twice before succeeding
    std::println("\n=== retry ===");
    auto attempts = std::make_shared<int>(0);
    retry<std::string>(*ctx, 3, [attempts](completion<std::string> next) {
        if (++*attempts < 3) {
            next(fail(errc::operation_failed));
            return;
        }
        next(std::format("ok after {} attempts", *attempts));
    }, [](result<std::string> r) {
        std::println("  retry: {}", r ? *r : r.error().message());
    });

    // 3. join three tasks, one of them failing
    std::vector<async_fn<int>> tasks = {
        [](completion<int> next) { next(1); },
        [](completion<int> next) { next(fail(errc::operation_failed)); },
        [](completion<int> next) { next(3); },
    };
    parallel_locked<int>(std::move(tasks), [](join_result<int> r) {
        std::println("\n=== parallel_locked ===");
        std::println("  {} value(s), {} failure(s)",
                     std::ranges::count_if(r.values, [](auto& v) { return v.has_value(); }),
                     r.error ? r.error->errors.size() : 0);
    });

    // 4. queue drained by a single consumer, then stop the loop
    std::println("\n=== async_deque ===");
    async_deque<std::string> queue(*ctx, {"a", "b", "c"},
        [](std::string item, std::function<void()> done) {
            std::println("  consumed {}", item);
            done();
        });
    queue.when_drain([&] {
        ctx->schedule_after(std::chrono::milliseconds(50), [&] { ctx->stop(); });
    });

    ctx->run();
    std::println("\nAll OK. See examples/ for full demos.");
    return 0;
}
