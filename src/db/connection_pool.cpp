#include "db/connection_pool.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

ConnectionPool::ConnectionPool(const DatabaseConfig& config,
                               std::shared_ptr<IConnectionFactory> factory)
    : config_(config),
      factory_(std::move(factory)),
      slots_(config.max_connections) {

    // Lowest index handed out first
    empty_.reserve(slots_.size());
    for (size_t i = slots_.size(); i > 0; --i) {
        empty_.push_back(i - 1);
    }
    idle_.reserve(slots_.size());

    // Pre-warm pool with min_connections
    const auto opened = ensure_minimum();
    if (opened < config_.min_connections) {
        utils::log::warn(std::format(
            "ConnectionPool pre-warm opened {} of {} connections", opened, config_.min_connections));
    }

    maintenance_thread_ = std::thread([this]() { maintenance_loop(); });

    utils::log::info(std::format("ConnectionPool initialized: {} connections (min={}, max={})",
        opened, config_.min_connections, config_.max_connections));
}

ConnectionPool::~ConnectionPool() {
    shutdown();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

// ============================================================================
// Checkout / checkin
// ============================================================================

Result<PooledConnection> ConnectionPool::checkout(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (shutdown_) {
            return Result<PooledConnection>::error(ErrorCategory::EXECUTION,
                "connection pool is shut down");
        }

        if (!idle_.empty()) {
            const size_t index = idle_.back();
            idle_.pop_back();
            Slot& slot = slots_[index];

            // Idle past the threshold: the server may have dropped it silently
            if (idle_expired(slot, std::chrono::steady_clock::now())) {
                auto stale = std::move(slot.conn);
                slot.state = SlotState::CREATING;
                ++in_use_;
                peak_in_use_ = std::max(peak_in_use_, in_use_);
                lock.unlock();
                stale->close();
                stale.reset();
                closed_.fetch_add(1, std::memory_order_relaxed);
                idle_reaped_.fetch_add(1, std::memory_order_relaxed);
                lock.lock();
                return fill_and_lease(index, lock);
            }

            slot.state = SlotState::IN_USE;
            ++in_use_;
            peak_in_use_ = std::max(peak_in_use_, in_use_);

            // Only probe sessions that sat long enough to have gone stale
            if (std::chrono::steady_clock::now() - slot.last_used_at <= config_.health_check_after) {
                return Result<PooledConnection>::ok(lease_locked(index));
            }
            return probe_and_lease(index, lock);
        }

        if (!empty_.empty()) {
            const size_t index = empty_.back();
            empty_.pop_back();
            slots_[index].state = SlotState::CREATING;
            ++in_use_;
            peak_in_use_ = std::max(peak_in_use_, in_use_);
            return fill_and_lease(index, lock);
        }

        if (available_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && empty_.empty()) {
            checkout_timeouts_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format(
                "Connection pool exhausted: {} in use, waited {}ms", in_use_, timeout.count()));
            return Result<PooledConnection>::error(ErrorCategory::POOL_EXHAUSTED,
                std::format("no connection available within {}ms", timeout.count()));
        }
    }
}

Result<PooledConnection> ConnectionPool::fill_and_lease(size_t index,
                                                        std::unique_lock<std::mutex>& lock) {
    lock.unlock();
    auto conn = create_connection();
    lock.lock();

    Slot& slot = slots_[index];

    if (!conn || shutdown_) {
        if (conn) {
            conn->close();
            closed_.fetch_add(1, std::memory_order_relaxed);
        }
        slot.state = SlotState::EMPTY;
        ++slot.generation;
        empty_.push_back(index);
        --in_use_;
        available_cv_.notify_one();
        return Result<PooledConnection>::error(ErrorCategory::EXECUTION,
            shutdown_ ? "connection pool is shut down" : "database unavailable");
    }

    const auto now = std::chrono::steady_clock::now();
    slot.conn = std::move(conn);
    slot.created_at = now;
    slot.last_used_at = now;
    ++slot.generation;
    slot.state = SlotState::IN_USE;
    return Result<PooledConnection>::ok(lease_locked(index));
}

Result<PooledConnection> ConnectionPool::probe_and_lease(size_t index,
                                                         std::unique_lock<std::mutex>& lock) {
    // The slot is IN_USE, so nothing else touches its connection while unlocked
    IDbConnection* conn = slots_[index].conn.get();
    lock.unlock();
    const bool healthy = conn->is_healthy(config_.health_check_query);
    lock.lock();

    if (healthy) {
        return Result<PooledConnection>::ok(lease_locked(index));
    }

    health_check_failures_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Idle connection in slot {} failed its health check; replacing it",
        index));
    auto dead = std::move(slots_[index].conn);
    slots_[index].state = SlotState::CREATING;
    lock.unlock();
    dead->close();
    dead.reset();
    closed_.fetch_add(1, std::memory_order_relaxed);
    lock.lock();
    return fill_and_lease(index, lock);
}

PooledConnection ConnectionPool::lease_locked(size_t index) {
    Slot& slot = slots_[index];
    return PooledConnection(this, index, slot.generation, slot.conn.get());
}

void ConnectionPool::checkin(PooledConnection& lease, bool healthy) {
    if (!lease.is_valid() || lease.pool_ != this) {
        return;
    }

    const size_t index = lease.slot();
    const uint64_t generation = lease.generation();
    lease.detach();

    std::unique_ptr<IDbConnection> doomed;
    bool refill = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= slots_.size()) {
            return;
        }
        Slot& slot = slots_[index];
        if (slot.state != SlotState::IN_USE || slot.generation != generation) {
            return;   // stale lease
        }
        --in_use_;

        const bool keep = healthy && !shutdown_ && slot.conn && slot.conn->is_connected();
        if (keep) {
            slot.state = SlotState::IDLE;
            slot.last_used_at = std::chrono::steady_clock::now();
            idle_.push_back(index);
        } else {
            doomed = std::move(slot.conn);
            slot.state = SlotState::EMPTY;
            ++slot.generation;
            empty_.push_back(index);
            refill = !shutdown_ && total_locked() < config_.min_connections;
            if (refill) refill_requested_ = true;
        }
    }
    available_cv_.notify_one();

    if (doomed) {
        doomed->close();
        closed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Discarded connection in slot {}", index));
    }
    if (refill) {
        maintenance_cv_.notify_one();
    }
}

// ============================================================================
// Maintenance
// ============================================================================

bool ConnectionPool::idle_expired(const Slot& slot,
                                  std::chrono::steady_clock::time_point now) const {
    return config_.idle_timeout.count() > 0 && now - slot.last_used_at > config_.idle_timeout;
}

size_t ConnectionPool::reap_idle() {
    std::vector<std::unique_ptr<IDbConnection>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto it = idle_.begin(); it != idle_.end(); ) {
            Slot& slot = slots_[*it];
            if (idle_expired(slot, now)) {
                doomed.emplace_back(std::move(slot.conn));
                slot.state = SlotState::EMPTY;
                ++slot.generation;
                empty_.push_back(*it);
                it = idle_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& conn : doomed) {
        conn->close();
    }
    if (!doomed.empty()) {
        closed_.fetch_add(doomed.size(), std::memory_order_relaxed);
        idle_reaped_.fetch_add(doomed.size(), std::memory_order_relaxed);
        utils::log::debug(std::format("Reaped {} idle connections", doomed.size()));
        available_cv_.notify_all();
    }
    return doomed.size();
}

size_t ConnectionPool::ensure_minimum() {
    size_t opened = 0;
    while (true) {
        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ || total_locked() >= config_.min_connections || empty_.empty()) {
                break;
            }
            index = empty_.back();
            empty_.pop_back();
            slots_[index].state = SlotState::CREATING;
        }

        auto conn = create_connection();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            Slot& slot = slots_[index];
            if (!conn || shutdown_) {
                slot.state = SlotState::EMPTY;
                empty_.push_back(index);
                if (conn) {
                    conn->close();
                    closed_.fetch_add(1, std::memory_order_relaxed);
                }
                break;
            }
            const auto now = std::chrono::steady_clock::now();
            slot.conn = std::move(conn);
            slot.created_at = now;
            slot.last_used_at = now;
            ++slot.generation;
            slot.state = SlotState::IDLE;
            idle_.push_back(index);
        }
        available_cv_.notify_one();
        ++opened;
    }
    return opened;
}

void ConnectionPool::maintenance_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        maintenance_cv_.wait_for(lock, config_.maintenance_interval,
            [this]() { return shutdown_ || refill_requested_; });
        if (shutdown_) break;
        refill_requested_ = false;

        lock.unlock();
        reap_idle();
        ensure_minimum();
        lock.lock();
    }
}

void ConnectionPool::shutdown() {
    std::vector<std::unique_ptr<IDbConnection>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        for (const size_t index : idle_) {
            Slot& slot = slots_[index];
            doomed.emplace_back(std::move(slot.conn));
            slot.state = SlotState::EMPTY;
            ++slot.generation;
            empty_.push_back(index);
        }
        idle_.clear();
    }
    available_cv_.notify_all();
    maintenance_cv_.notify_all();

    for (auto& conn : doomed) {
        conn->close();
    }
    closed_.fetch_add(doomed.size(), std::memory_order_relaxed);

    utils::log::info(std::format("ConnectionPool shut down ({} idle connections closed)",
        doomed.size()));
}

ConnectionPool::Stats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.idle = idle_.size();
    s.in_use = in_use_;
    s.total = total_locked();
    s.peak_in_use = peak_in_use_;
    s.created = created_.load(std::memory_order_relaxed);
    s.closed = closed_.load(std::memory_order_relaxed);
    s.create_failures = create_failures_.load(std::memory_order_relaxed);
    s.checkout_timeouts = checkout_timeouts_.load(std::memory_order_relaxed);
    s.idle_reaped = idle_reaped_.load(std::memory_order_relaxed);
    s.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    return s;
}

std::unique_ptr<IDbConnection> ConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        create_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error("ConnectionPool failed to open a database connection");
        return nullptr;
    }

    const auto timeout_ms = static_cast<uint32_t>(config_.query_timeout.count());
    if (!conn->set_query_timeout(timeout_ms)) {
        create_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Failed to set statement_timeout={}ms on new connection",
            timeout_ms));
        conn->close();
        return nullptr;
    }

    created_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

} // namespace sqlgate
