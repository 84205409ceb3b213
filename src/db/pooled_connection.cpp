#include "db/pooled_connection.hpp"
#include "db/connection_pool.hpp"

namespace sqlgate {

PooledConnection::PooledConnection(ConnectionPool* pool, size_t slot, uint64_t generation,
                                   IDbConnection* conn)
    : pool_(pool), slot_(slot), generation_(generation), conn_(conn) {}

PooledConnection::~PooledConnection() {
    if (pool_ && conn_) {
        pool_->checkin(*this, false);
    }
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), slot_(other.slot_), generation_(other.generation_), conn_(other.conn_) {
    other.detach();
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Give back the current slot before taking the new one
        if (pool_ && conn_) {
            pool_->checkin(*this, false);
        }
        pool_ = other.pool_;
        slot_ = other.slot_;
        generation_ = other.generation_;
        conn_ = other.conn_;
        other.detach();
    }
    return *this;
}

void PooledConnection::release(bool healthy) {
    if (pool_ && conn_) {
        pool_->checkin(*this, healthy);
    }
}

void PooledConnection::detach() noexcept {
    pool_ = nullptr;
    conn_ = nullptr;
}

} // namespace sqlgate
