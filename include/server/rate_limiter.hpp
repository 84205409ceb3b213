#pragma once

#include "config/config_types.hpp"
#include "server/irate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sqlgate {

/**
 * @brief Per-client fixed-window rate limiter
 *
 * Window opens on a client's first request and lasts `window`. Once
 * `max_requests` have been admitted, further requests are denied and
 * blocked_until is pinned to the window end.
 *
 * Thread-safety: the client map is behind a shared_mutex (read-mostly),
 * each client's counters behind its own mutex. Requests from different
 * clients never contend on the same counter lock.
 */
class FixedWindowRateLimiter : public IRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit FixedWindowRateLimiter(const RateLimitConfig& config);
    ~FixedWindowRateLimiter() override;

    FixedWindowRateLimiter(const FixedWindowRateLimiter&) = delete;
    FixedWindowRateLimiter& operator=(const FixedWindowRateLimiter&) = delete;

    [[nodiscard]] RateLimitResult check(const std::string& client_id) override;

    /// Same as check(), evaluated at a caller-supplied instant (tests)
    [[nodiscard]] RateLimitResult check_at(const std::string& client_id, Clock::time_point now);

    [[nodiscard]] ClientRateStatus client_status(const std::string& client_id) const override;

    void reset_all() override;

    /**
     * @brief Evict clients not seen for longer than idle_after
     *
     * Only buckets whose window has already ended are evicted, so dropping
     * one never hands its client a second quota inside the same window.
     *
     * @return Number of evicted clients
     */
    size_t cleanup_idle(std::chrono::seconds idle_after);

    struct Stats {
        uint64_t total_checks;
        uint64_t total_denied;
        uint64_t clients_evicted;
        size_t client_count;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct ClientState {
        std::mutex mutex;
        Clock::time_point window_start{};
        uint32_t count = 0;
        std::optional<Clock::time_point> blocked_until;
        Clock::time_point last_seen{};
        bool evicted = false;   // removed from clients_; callers holding it must look up again
    };

    std::shared_ptr<ClientState> get_client(const std::string& client_id);

    static std::chrono::system_clock::time_point to_wall(Clock::time_point tp);

    void cleanup_loop();

    RateLimitConfig config_;

    std::unordered_map<std::string, std::shared_ptr<ClientState>> clients_;
    mutable std::shared_mutex clients_mutex_;

    std::atomic<uint64_t> total_checks_{0};
    std::atomic<uint64_t> total_denied_{0};
    std::atomic<uint64_t> clients_evicted_{0};

    std::thread cleanup_thread_;
    std::atomic<bool> cleanup_running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
};

} // namespace sqlgate
