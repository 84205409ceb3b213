#pragma once

#include "db/idb_connection.hpp"
#include <cstddef>
#include <cstdint>

namespace sqlgate {

class ConnectionPool;

/**
 * @brief RAII checkout lease for one pool slot
 *
 * Refers to its slot by index and generation, never by owning pointer:
 * the pool keeps ownership of the connection. Move-only.
 *
 * A lease destroyed without release() is checked in unhealthy, since the
 * caller gave up on it without saying whether the session is still good.
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool, size_t slot, uint64_t generation, IDbConnection* conn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_; }
    IDbConnection* operator->() const { return conn_; }

    bool is_valid() const { return conn_ != nullptr; }

    size_t slot() const { return slot_; }
    uint64_t generation() const { return generation_; }

    /**
     * @brief Check the connection back in
     * @param healthy false discards the session and frees the slot
     */
    void release(bool healthy);

private:
    friend class ConnectionPool;

    void detach() noexcept;

    ConnectionPool* pool_ = nullptr;
    size_t slot_ = 0;
    uint64_t generation_ = 0;
    IDbConnection* conn_ = nullptr;
};

} // namespace sqlgate
