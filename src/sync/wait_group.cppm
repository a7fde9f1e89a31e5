/**
 * @file wait_group.cppm
 * @brief Wait Group — run a continuation once a group of operations completed
 *        (similar to Go sync.WaitGroup)
 *
 * Usage Example:
 *   import coopmod.sync.wait_group;
 *
 *   wait_group wg;
 *   wg.add(3);
 *   for (int i = 0; i < 3; ++i)
 *       start_worker(i, [&] { wg.done(); });
 *
 *   wg.wait([] { logger::info("all workers finished"); });
 */
module;

#include <coopmod/config.hpp>

export module coopmod.sync.wait_group;

import std;

namespace coopmod {

// =============================================================================
// wait_group
// =============================================================================

/// - add(n): increase the pending count
/// - done(): decrease it; reaching zero runs every wait() continuation once,
///   in registration order
/// - wait(fn): runs fn synchronously if the count is already zero
export class wait_group {
public:
    wait_group() noexcept = default;
    ~wait_group() = default;

    wait_group(const wait_group&) = delete;
    auto operator=(const wait_group&) -> wait_group& = delete;

    void add(int n = 1) {
        if (n < 0 || count_ > std::numeric_limits<int>::max() - n)
            throw std::invalid_argument("wait_group::add: invalid count");
        count_ += n;
    }

    void done() {
        if (count_ <= 0)
            throw std::logic_error("wait_group::done: count would go negative");
        if (--count_ > 0)
            return;

        // Steal the list first: a continuation may add() and wait() again
        auto waiters = std::exchange(waiters_, {});
        for (auto& fn : waiters)
            fn();
    }

    void wait(std::function<void()> fn) {
        if (count_ == 0) {
            fn();
            return;
        }
        waiters_.push_back(std::move(fn));
    }

    /// Remaining count
    [[nodiscard]] auto count() const noexcept -> int { return count_; }

private:
    int count_ = 0;
    std::vector<std::function<void()>> waiters_;
};

} // namespace coopmod
