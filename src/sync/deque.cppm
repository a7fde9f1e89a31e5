/**
 * @file deque.cppm
 * @brief Double-ended queue with an optional single-consumer loop
 *
 * Usage Example:
 *   import coopmod.sync.deque;
 *
 *   async_deque<job> jobs(ctx, {first, second}, [&](job j, std::function<void()> done) {
 *       process(j, done);    // next job is delivered on a later tick, after done()
 *   });
 *   jobs.push_back(third);
 *   jobs.when_drain([] { logger::info("idle"); });
 */
module;

#include <coopmod/config.hpp>

export module coopmod.sync.deque;

import std;
import coopmod.core.log;
import coopmod.io.io_context;
import coopmod.sync.completion;

namespace coopmod {

// =============================================================================
// async_deque<T>
// =============================================================================
//
// Storage: elements keyed by position in [begin_, end_), begin_ moves down on
// push_front, end_ moves up on push_back. O(1) at both ends, nothing shifts.
//
// Transitions:
//  • empty → non-empty (push): wakes the consumer loop
//  • non-empty → empty (pop):  fires every pending when_drain() continuation once
//
// Consumer loop: one element in flight at a time. When the consumer calls
// done(), the next element is delivered on the next loop tick, never on the
// consumer's stack.
//
// Not thread-safe. Must outlive the consumer loop and drain continuations.

export template <typename T>
class async_deque {
public:
    using consumer_fn = std::function<void(T, std::function<void()>)>;

    /// Passive deque: no consumer loop
    explicit async_deque(io_context& ctx)
        : ctx_(&ctx) {}

    async_deque(io_context& ctx, consumer_fn consumer)
        : async_deque(ctx, std::vector<T>{}, std::move(consumer)) {}

    /// Initial elements are pushed back in order; consumption starts on the
    /// next loop tick
    async_deque(io_context& ctx, std::vector<T> initial, consumer_fn consumer)
        : ctx_(&ctx), consumer_(std::move(consumer))
    {
        for (auto& v : initial)
            store_back(std::move(v));
        if (consumer_ && size() > 0) {
            scheduled_ = true;
            ctx_->post([this] { step(); });
        }
    }

    ~async_deque() = default;

    async_deque(const async_deque&) = delete;
    auto operator=(const async_deque&) -> async_deque& = delete;

    void push_back(T value) {
        store_back(std::move(value));
        if (size() == 1)
            on_unempty();
    }

    void push_front(T value) {
        entries_.emplace(--begin_, std::move(value));
        if (size() == 1)
            on_unempty();
    }

    /// @throws std::out_of_range on an empty deque
    auto pop_back() -> T {
        if (begin_ == end_)
            throw std::out_of_range("pop_back from empty async_deque");
        auto it = entries_.find(--end_);
        T value = std::move(it->second);
        entries_.erase(it);
        if (begin_ == end_)
            on_empty();
        return value;
    }

    /// @throws std::out_of_range on an empty deque
    auto pop_front() -> T {
        if (begin_ == end_)
            throw std::out_of_range("pop_front from empty async_deque");
        auto it = entries_.find(begin_++);
        T value = std::move(it->second);
        entries_.erase(it);
        if (begin_ == end_)
            on_empty();
        return value;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return static_cast<std::size_t>(end_ - begin_);
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return begin_ == end_; }

    /// fn runs now if empty, otherwise once, the next time the deque empties
    void when_drain(std::function<void()> fn) {
        if (empty()) {
            fn();
            return;
        }
        drain_waiters_.push_back(std::move(fn));
    }

    /// True while the consumer holds an element
    [[nodiscard]] auto busy() const noexcept -> bool { return in_flight_; }

private:
    void store_back(T value) {
        entries_.emplace(end_++, std::move(value));
    }

    void on_unempty() {
        if (!consumer_ || in_flight_ || scheduled_)
            return;
        step();
    }

    void on_empty() {
        auto waiters = std::exchange(drain_waiters_, {});
        for (auto& fn : waiters)
            fn();
    }

    /// Deliver the front element to the consumer
    void step() {
        scheduled_ = false;
        if (in_flight_ || empty())
            return;
        in_flight_ = true;
        auto value = pop_front();
        // Cleared when the consumer throws: a late done() must not release
        // the element that is in flight by then
        auto live = std::make_shared<bool>(true);
        auto done = make_once<>(std::function<void()>([this, live] {
            if (!*live)
                return;
            *live = false;
            finish_step();
        }), "async_deque consumer done");

        try {
            consumer_(std::move(value), std::move(done));
        } catch (...) {
            logger::error("async_deque: consumer threw, element dropped");
            if (*live) {
                *live = false;
                finish_step();
            }
            throw;
        }
    }

    /// Element handled: schedule the next delivery if anything is left
    void finish_step() {
        in_flight_ = false;
        if (!empty() && !scheduled_) {
            scheduled_ = true;
            ctx_->post([this] { step(); });
        }
    }

    io_context* ctx_;
    consumer_fn consumer_;
    std::unordered_map<std::int64_t, T> entries_;
    std::int64_t begin_ = 0;
    std::int64_t end_ = 0;
    std::vector<std::function<void()>> drain_waiters_;
    bool in_flight_ = false;
    bool scheduled_ = false;   // a step() is already posted
};

} // namespace coopmod
