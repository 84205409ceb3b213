#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlgate {

struct RateLimitResult {
    bool allowed = false;
    uint32_t count = 0;                       // requests admitted in the current window
    uint32_t limit = 0;
    std::chrono::milliseconds retry_after{0};
    std::optional<std::chrono::system_clock::time_point> blocked_until;
};

/**
 * @brief Read-only view of one client's window
 */
struct ClientRateStatus {
    bool known = false;
    uint32_t count = 0;
    uint32_t limit = 0;
    std::chrono::milliseconds window_remaining{0};
    std::optional<std::chrono::system_clock::time_point> blocked_until;
};

/**
 * @brief Abstract per-client rate limiter interface
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    [[nodiscard]] virtual RateLimitResult check(const std::string& client_id) = 0;

    /// Admit or deny one request; the bool form of check()
    [[nodiscard]] bool try_acquire(const std::string& client_id) {
        return check(client_id).allowed;
    }

    [[nodiscard]] virtual ClientRateStatus client_status(const std::string& client_id) const = 0;

    virtual void reset_all() = 0;
};

} // namespace sqlgate
