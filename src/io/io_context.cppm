module;

#include <coopmod/config.hpp>

export module coopmod.io.io_context;

import std;

namespace coopmod {

// =============================================================================
// post_node — lock-free MPSC queue node
// =============================================================================

/// Node of the post queue; owns the callback until it has been dispatched
export struct post_node {
    std::atomic<post_node*> next{nullptr};
    std::function<void()> callback;
};

// =============================================================================
// io_context — event loop interface
// =============================================================================

/// Single-threaded execution context driving continuations.
/// - post(fn): run fn on the next loop tick, never synchronously
/// - schedule_after(d, fn): run fn once after d elapses
/// Callbacks posted while a tick is being dispatched run on the following tick.
export class io_context {
public:
    using duration = std::chrono::steady_clock::duration;

    virtual ~io_context() {
        auto* chain = post_head_.exchange(nullptr, std::memory_order_acquire);
        while (chain) {
            auto* next = chain->next.load(std::memory_order_relaxed);
            delete chain;
            chain = next;
        }
        for (auto* node : ready_)
            delete node;
    }

    io_context(const io_context&) = delete;
    io_context(io_context&&) = delete;
    auto operator=(const io_context&) -> io_context& = delete;
    auto operator=(io_context&&) -> io_context& = delete;

    /// Run the event loop until stop()
    virtual void run() = 0;

    /// Wait for and process one batch of ready events
    /// @return number of callbacks dispatched
    virtual auto run_one() -> std::size_t = 0;

    /// Process ready events without blocking
    /// @return number of callbacks dispatched
    virtual auto poll() -> std::size_t = 0;

    /// Stop the event loop
    virtual void stop() = 0;

    [[nodiscard]] virtual auto stopped() const noexcept -> bool = 0;

    /// Allow run() again after stop()
    virtual void restart() = 0;

    /// Run fn once after `after` has elapsed (zero or negative: as soon as possible,
    /// but never synchronously)
    virtual void schedule_after(duration after, std::function<void()> fn) = 0;

    /// Queue fn for the next loop tick (thread-safe, lock-free)
    void post(std::function<void()> fn) {
        auto* node = new post_node{};
        node->callback = std::move(fn);
        push_node(node);
        wake();
    }

    /// Number of timers not yet fired
    [[nodiscard]] virtual auto pending_timers() const noexcept -> std::size_t = 0;

protected:
    io_context() = default;

    /// Platform hook: wake a blocked loop
    virtual void wake() = 0;

    /// Dispatch everything posted before this call. Callbacks posted meanwhile
    /// stay queued for the next tick. If a callback throws, the rest of the
    /// batch is kept and dispatched by the next call.
    auto drain_post_queue() -> std::size_t {
        auto* chain = post_head_.exchange(nullptr, std::memory_order_acquire);

        // push order is LIFO: reverse into the ready list for FIFO dispatch
        std::deque<post_node*> batch;
        while (chain) {
            batch.push_front(chain);
            chain = chain->next.load(std::memory_order_relaxed);
        }
        ready_.insert(ready_.end(), batch.begin(), batch.end());

        std::size_t count = 0;
        while (!ready_.empty()) {
            std::unique_ptr<post_node> node(ready_.front());
            ready_.pop_front();
            ++count;
            if (node->callback)
                node->callback();
        }
        return count;
    }

    /// True if callbacks are waiting for dispatch
    [[nodiscard]] auto has_posted() const noexcept -> bool {
        return !ready_.empty()
            || post_head_.load(std::memory_order_acquire) != nullptr;
    }

private:
    /// MPSC push: atomic exchange + store next
    void push_node(post_node* node) {
        node->next.store(nullptr, std::memory_order_relaxed);
        auto* prev = post_head_.exchange(node, std::memory_order_acq_rel);
        if (prev)
            node->next.store(prev, std::memory_order_relaxed);
    }

    std::atomic<post_node*> post_head_{nullptr};
    std::deque<post_node*> ready_;  // consumer side only
};

/// Create the platform default io_context
export [[nodiscard]] auto make_io_context()
    -> std::unique_ptr<io_context>;

} // namespace coopmod
