#include "server/rate_limiter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

FixedWindowRateLimiter::FixedWindowRateLimiter(const RateLimitConfig& config)
    : config_(config) {

    // Start cleanup thread if idle eviction is configured
    if (config_.enabled && config_.idle_eviction.count() > 0) {
        cleanup_running_.store(true, std::memory_order_release);
        cleanup_thread_ = std::thread([this]() { cleanup_loop(); });
    }
}

FixedWindowRateLimiter::~FixedWindowRateLimiter() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        cleanup_running_.store(false, std::memory_order_release);
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

std::chrono::system_clock::time_point FixedWindowRateLimiter::to_wall(Clock::time_point tp) {
    const auto delta = tp - Clock::now();
    return std::chrono::system_clock::now() +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
}

RateLimitResult FixedWindowRateLimiter::check(const std::string& client_id) {
    return check_at(client_id, Clock::now());
}

RateLimitResult FixedWindowRateLimiter::check_at(const std::string& client_id,
                                                 Clock::time_point now) {
    total_checks_.fetch_add(1, std::memory_order_relaxed);

    RateLimitResult result;
    result.limit = config_.max_requests;

    if (!config_.enabled) {
        result.allowed = true;
        return result;
    }

    // A bucket evicted between lookup and lock is dead; look it up again
    std::shared_ptr<ClientState> state = get_client(client_id);
    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->evicted) {
        lock.unlock();
        state = get_client(client_id);
        lock = std::unique_lock<std::mutex>(state->mutex);
    }
    state->last_seen = now;

    // Window expired (or first request): start a fresh one
    if (state->count == 0 || now - state->window_start >= config_.window) {
        state->window_start = now;
        state->count = 0;
        state->blocked_until.reset();
    }

    if (state->blocked_until && now < *state->blocked_until) {
        result.allowed = false;
    } else if (state->count >= config_.max_requests) {
        state->blocked_until = state->window_start + config_.window;
        result.allowed = false;
    } else {
        ++state->count;
        result.allowed = true;
    }

    result.count = state->count;
    if (!result.allowed) {
        total_denied_.fetch_add(1, std::memory_order_relaxed);
        result.retry_after = std::chrono::ceil<std::chrono::milliseconds>(
            *state->blocked_until - now);
        result.blocked_until = to_wall(*state->blocked_until);
        utils::log::warn(std::format(
            "Rate limit exceeded for client '{}': {}/{} in window, retry after {}ms",
            client_id, state->count, config_.max_requests, result.retry_after.count()));
    }
    return result;
}

ClientRateStatus FixedWindowRateLimiter::client_status(const std::string& client_id) const {
    ClientRateStatus status;
    status.limit = config_.max_requests;

    std::shared_ptr<ClientState> state;
    {
        std::shared_lock<std::shared_mutex> lock(clients_mutex_);
        const auto it = clients_.find(client_id);
        if (it == clients_.end()) {
            return status;
        }
        state = it->second;
    }

    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(state->mutex);
    status.known = true;

    const auto window_end = state->window_start + config_.window;
    if (now >= window_end) {
        return status;   // window already over: next request starts fresh
    }
    status.count = state->count;
    status.window_remaining = std::chrono::ceil<std::chrono::milliseconds>(window_end - now);
    if (state->blocked_until && now < *state->blocked_until) {
        status.blocked_until = to_wall(*state->blocked_until);
    }
    return status;
}

void FixedWindowRateLimiter::reset_all() {
    std::unique_lock<std::shared_mutex> lock(clients_mutex_);
    clients_.clear();
}

size_t FixedWindowRateLimiter::cleanup_idle(std::chrono::seconds idle_after) {
    const auto now = Clock::now();
    size_t evicted = 0;

    std::unique_lock<std::shared_mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end(); ) {
        bool idle = false;
        {
            auto& state = *it->second;
            std::lock_guard<std::mutex> client_lock(state.mutex);
            // An open window keeps its count, however long the client has been quiet
            idle = now - state.last_seen > idle_after &&
                   now - state.window_start >= config_.window;
            state.evicted = idle;
        }
        if (idle) {
            it = clients_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        clients_evicted_.fetch_add(evicted, std::memory_order_relaxed);
    }
    return evicted;
}

FixedWindowRateLimiter::Stats FixedWindowRateLimiter::get_stats() const {
    size_t count = 0;
    {
        std::shared_lock<std::shared_mutex> lock(clients_mutex_);
        count = clients_.size();
    }
    return Stats{
        .total_checks = total_checks_.load(std::memory_order_relaxed),
        .total_denied = total_denied_.load(std::memory_order_relaxed),
        .clients_evicted = clients_evicted_.load(std::memory_order_relaxed),
        .client_count = count,
    };
}

std::shared_ptr<FixedWindowRateLimiter::ClientState>
FixedWindowRateLimiter::get_client(const std::string& client_id) {
    // Fast path: shared lock for read
    {
        std::shared_lock<std::shared_mutex> lock(clients_mutex_);
        const auto it = clients_.find(client_id);
        if (it != clients_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock for write
    std::unique_lock<std::shared_mutex> lock(clients_mutex_);

    // Double-check: another thread may have created it
    auto [it, inserted] = clients_.try_emplace(client_id, nullptr);
    if (inserted) {
        it->second = std::make_shared<ClientState>();
    }
    return it->second;
}

void FixedWindowRateLimiter::cleanup_loop() {
    // Sweep a few times per eviction period
    const auto interval = std::max(std::chrono::seconds(1), config_.idle_eviction / 4);

    while (cleanup_running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(cleanup_mutex_);
            cleanup_cv_.wait_for(lock, interval,
                [this]() { return !cleanup_running_.load(std::memory_order_acquire); });
        }

        if (!cleanup_running_.load(std::memory_order_acquire)) break;

        const auto evicted = cleanup_idle(config_.idle_eviction);
        if (evicted > 0) {
            utils::log::debug(std::format("Rate limiter evicted {} idle clients", evicted));
        }
    }
}

} // namespace sqlgate
