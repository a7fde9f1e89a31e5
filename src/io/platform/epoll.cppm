module;

#include <coopmod/config.hpp>

#ifdef COOPMOD_HAS_EPOLL

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <ctime>

export module coopmod.io.platform.epoll;

import std;
import coopmod.io.io_context;

namespace coopmod {

// =============================================================================
// epoll Context
// =============================================================================

/// Linux epoll event loop
/// - eventfd wakes the loop when callbacks are posted or stop() is called
/// - every schedule_after() arms its own timerfd, closed once it fires
export class epoll_context : public io_context {
public:
    explicit epoll_context(std::size_t max_events = 128)
        : events_(max_events)
    {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0)
            throw std::system_error(
                errno, std::generic_category(), "epoll_create1 failed");

        event_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (event_fd_ < 0) {
            ::close(epoll_fd_);
            throw std::system_error(
                errno, std::generic_category(), "eventfd failed");
        }

        ::epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = event_fd_;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, event_fd_, &ev) < 0) {
            ::close(event_fd_);
            ::close(epoll_fd_);
            throw std::system_error(
                errno, std::generic_category(), "epoll_ctl(eventfd) failed");
        }
    }

    ~epoll_context() override {
        for (auto& [fd, fn] : timers_)
            ::close(fd);
        if (event_fd_ >= 0) ::close(event_fd_);
        if (epoll_fd_ >= 0) ::close(epoll_fd_);
    }

    void run() override {
        while (!stopped_.load(std::memory_order_relaxed)) {
            run_one_impl(-1);
        }
    }

    auto run_one() -> std::size_t override {
        return run_one_impl(-1);
    }

    auto poll() -> std::size_t override {
        return run_one_impl(0);
    }

    void stop() override {
        stopped_.store(true, std::memory_order_relaxed);
        wake();
    }

    [[nodiscard]] auto stopped() const noexcept -> bool override {
        return stopped_.load(std::memory_order_relaxed);
    }

    void restart() override {
        stopped_.store(false, std::memory_order_relaxed);
    }

    void schedule_after(duration after, std::function<void()> fn) override {
        int tfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (tfd < 0)
            throw std::system_error(
                errno, std::generic_category(), "timerfd_create failed");

        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(after).count();
        if (ns <= 0)
            ns = 1;  // a zero it_value would disarm the timer
        ::itimerspec its{};
        its.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
        its.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);

        if (::timerfd_settime(tfd, 0, &its, nullptr) < 0) {
            int err = errno;
            ::close(tfd);
            throw std::system_error(err, std::generic_category(), "timerfd_settime failed");
        }

        ::epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = tfd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, tfd, &ev) < 0) {
            int err = errno;
            ::close(tfd);
            throw std::system_error(err, std::generic_category(), "epoll_ctl(timerfd) failed");
        }
        timers_.emplace(tfd, std::move(fn));
    }

    [[nodiscard]] auto pending_timers() const noexcept -> std::size_t override {
        return timers_.size();
    }

protected:
    void wake() override {
        std::uint64_t val = 1;
        // EAGAIN means the counter is already non-zero: the loop wakes anyway
        (void)::write(event_fd_, &val, sizeof(val));
    }

private:
    auto run_one_impl(int timeout_ms) -> std::size_t {
        // Leftovers from a throwing callback must not wait for a new event
        if (has_posted())
            timeout_ms = 0;

        int n = ::epoll_wait(epoll_fd_, events_.data(),
                             static_cast<int>(events_.size()), timeout_ms);
        if (n < 0 && errno != EINTR)
            throw std::system_error(errno, std::generic_category(), "epoll_wait failed");

        std::size_t handled = 0;
        for (int i = 0; i < n; ++i) {
            int fd = events_[i].data.fd;
            if (fd == event_fd_) {
                std::uint64_t val = 0;
                (void)::read(event_fd_, &val, sizeof(val));
                continue;
            }
            handled += fire_timer(fd);
        }
        handled += drain_post_queue();
        return handled;
    }

    auto fire_timer(int tfd) -> std::size_t {
        auto it = timers_.find(tfd);
        if (it == timers_.end())
            return 0;
        auto fn = std::move(it->second);
        timers_.erase(it);

        std::uint64_t expirations = 0;
        (void)::read(tfd, &expirations, sizeof(expirations));
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, tfd, nullptr);
        ::close(tfd);

        if (fn)
            fn();
        return 1;
    }

    int epoll_fd_ = -1;
    int event_fd_ = -1;
    std::vector<::epoll_event> events_;
    std::unordered_map<int, std::function<void()>> timers_;
    std::atomic<bool> stopped_{false};
};

} // namespace coopmod

#endif // COOPMOD_HAS_EPOLL
