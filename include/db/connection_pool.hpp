#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqlgate {

/**
 * @brief Bounded connection pool over an arena of slots
 *
 * Design:
 * - Arena: one Slot per max_connections, allocated once. Membership is
 *   tracked by index free-lists (idle LIFO, empty stack), so the number
 *   of issued connections can never exceed the arena size.
 * - Checkout waits on a condition variable up to the caller's timeout,
 *   then fails with POOL_EXHAUSTED.
 * - Connections are created outside the lock; a slot being filled is
 *   CREATING and counts toward capacity.
 * - An idle session unused for longer than health_check_after runs
 *   health_check_query before it is leased and is replaced if that fails.
 * - Unhealthy checkin closes the session and frees the slot; the
 *   maintenance thread refills to min_connections and reaps sessions
 *   idle longer than idle_timeout.
 *
 * Thread-safety: one mutex guards the arena and free-lists.
 */
class ConnectionPool {
public:
    struct Stats {
        size_t idle = 0;
        size_t in_use = 0;
        size_t total = 0;                 // slots holding or creating a connection
        size_t peak_in_use = 0;
        uint64_t created = 0;
        uint64_t closed = 0;
        uint64_t create_failures = 0;
        uint64_t checkout_timeouts = 0;
        uint64_t idle_reaped = 0;
        uint64_t health_check_failures = 0;
    };

    /**
     * @brief Construct and pre-warm to min_connections
     * @param config Pool sizing, timeouts and connection target
     * @param factory Connection factory (creates IDbConnection instances)
     */
    ConnectionPool(const DatabaseConfig& config, std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Check out a connection, waiting at most `timeout`
     * @return Lease, POOL_EXHAUSTED on timeout, EXECUTION if a new
     *         connection could not be opened or the pool is shut down
     */
    [[nodiscard]] Result<PooledConnection> checkout(std::chrono::milliseconds timeout);

    [[nodiscard]] Result<PooledConnection> checkout() {
        return checkout(config_.checkout_timeout);
    }

    /**
     * @brief Return a leased connection
     * @param healthy true: back to IDLE; false: close, free slot, schedule refill
     */
    void checkin(PooledConnection& lease, bool healthy);

    /**
     * @brief Close sessions idle longer than idle_timeout
     * @return Number of connections closed
     */
    size_t reap_idle();

    /**
     * @brief Open connections until min_connections are held
     * @return Number of connections opened
     */
    size_t ensure_minimum();

    /**
     * @brief Stop maintenance and close idle connections
     *
     * Leases still out are closed on checkin. Further checkouts fail.
     */
    void shutdown();

    [[nodiscard]] Stats stats() const;

    [[nodiscard]] const DatabaseConfig& config() const { return config_; }

private:
    enum class SlotState { EMPTY, CREATING, IDLE, IN_USE };

    struct Slot {
        std::unique_ptr<IDbConnection> conn;
        SlotState state = SlotState::EMPTY;
        std::chrono::steady_clock::time_point created_at{};
        std::chrono::steady_clock::time_point last_used_at{};
        uint64_t generation = 0;
    };

    std::unique_ptr<IDbConnection> create_connection();

    /// Fill a CREATING slot reserved by checkout; lock is held on entry and exit
    Result<PooledConnection> fill_and_lease(size_t index, std::unique_lock<std::mutex>& lock);

    /// Health-check an idle slot already marked IN_USE; lock is held on entry and exit
    Result<PooledConnection> probe_and_lease(size_t index, std::unique_lock<std::mutex>& lock);

    PooledConnection lease_locked(size_t index);
    size_t total_locked() const { return slots_.size() - empty_.size(); }
    bool idle_expired(const Slot& slot, std::chrono::steady_clock::time_point now) const;

    void maintenance_loop();

    DatabaseConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::vector<Slot> slots_;
    std::vector<size_t> idle_;    // LIFO: most recently used on top
    std::vector<size_t> empty_;

    mutable std::mutex mutex_;
    std::condition_variable available_cv_;
    std::condition_variable maintenance_cv_;
    bool shutdown_ = false;
    bool refill_requested_ = false;

    size_t in_use_ = 0;
    size_t peak_in_use_ = 0;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> closed_{0};
    std::atomic<uint64_t> create_failures_{0};
    std::atomic<uint64_t> checkout_timeouts_{0};
    std::atomic<uint64_t> idle_reaped_{0};
    std::atomic<uint64_t> health_check_failures_{0};

    std::thread maintenance_thread_;
};

} // namespace sqlgate
