#pragma once

#include "audit/audit_sink.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqlgate::testing {

/// Answers one execute() call
using QueryHandler = std::function<DbResultSet(const std::string& sql, size_t max_rows)>;

/// Successful result with `total` single-column rows, capped at max_rows the way a LIMIT would be
inline DbResultSet numbered_rows(size_t total, size_t max_rows) {
    DbResultSet rs;
    rs.success = true;
    rs.column_names = {"n"};
    const size_t n = std::min(total, max_rows);
    rs.rows.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        rs.rows.push_back({std::to_string(i + 1)});
    }
    return rs;
}

inline DbResultSet db_error(std::string sqlstate, std::string message, bool broken = false) {
    DbResultSet rs;
    rs.success = false;
    rs.sqlstate = std::move(sqlstate);
    rs.error_message = std::move(message);
    rs.connection_broken = broken;
    return rs;
}

inline DbResultSet db_timeout() {
    DbResultSet rs = db_error("57014", "canceling statement due to statement timeout");
    rs.timed_out = true;
    return rs;
}

class FakeConnectionFactory;

/**
 * @brief In-memory IDbConnection; every call is reported to its factory
 */
class FakeConnection : public IDbConnection {
public:
    FakeConnection(FakeConnectionFactory* factory, int id) : factory_(factory), id_(id) {}
    ~FakeConnection() override { close(); }

    [[nodiscard]] DbResultSet execute(const std::string& sql, size_t max_rows) override;

    [[nodiscard]] bool is_healthy(const std::string& query) override;

    [[nodiscard]] bool is_connected() const override { return connected_; }

    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_ms_ = timeout_ms;
        return true;
    }

    void close() override;

    /// Simulate the server dropping the session
    void drop() { connected_ = false; }

    [[nodiscard]] int id() const { return id_; }
    [[nodiscard]] uint32_t query_timeout_ms() const { return timeout_ms_; }

private:
    FakeConnectionFactory* factory_;
    int id_;
    std::atomic<bool> connected_{true};
    std::atomic<bool> closed_{false};
    uint32_t timeout_ms_ = 0;
};

/**
 * @brief Connection factory with scripted behaviour and call accounting
 *
 * The default handler returns `table_rows` numbered rows capped at
 * max_rows. Must outlive every connection it creates.
 */
class FakeConnectionFactory : public IConnectionFactory {
public:
    [[nodiscard]] std::unique_ptr<IDbConnection> create(const std::string& connection_string) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_conninfo_ = connection_string;
        }
        if (fail_creates_.load()) {
            create_failures_.fetch_add(1);
            return nullptr;
        }
        const int id = created_.fetch_add(1) + 1;
        live_.fetch_add(1);
        return std::make_unique<FakeConnection>(this, id);
    }

    void set_handler(QueryHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void set_table_rows(size_t rows) { table_rows_.store(rows); }
    void set_fail_creates(bool fail) { fail_creates_.store(fail); }

    /// execute() sleeps this long before answering
    void set_latency(std::chrono::milliseconds latency) {
        latency_ms_.store(latency.count());
    }

    [[nodiscard]] int created() const { return created_.load(); }
    [[nodiscard]] int closed() const { return closed_.load(); }
    [[nodiscard]] int live() const { return live_.load(); }
    [[nodiscard]] int create_failures() const { return create_failures_.load(); }
    [[nodiscard]] int executions() const { return executions_.load(); }
    [[nodiscard]] int max_concurrent() const { return max_concurrent_.load(); }
    [[nodiscard]] int health_checks() const { return health_checks_.load(); }

    [[nodiscard]] std::string last_health_query() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_health_query_;
    }

    [[nodiscard]] std::vector<std::string> executed_sql() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return executed_sql_;
    }

    [[nodiscard]] std::string last_conninfo() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_conninfo_;
    }

private:
    friend class FakeConnection;

    DbResultSet run(const std::string& sql, size_t max_rows) {
        executions_.fetch_add(1);
        const int now = concurrent_.fetch_add(1) + 1;
        int seen = max_concurrent_.load();
        while (now > seen && !max_concurrent_.compare_exchange_weak(seen, now)) {}

        QueryHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            executed_sql_.push_back(sql);
            handler = handler_;
        }
        if (const auto ms = latency_ms_.load(); ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        DbResultSet rs = handler ? handler(sql, max_rows)
                                 : numbered_rows(table_rows_.load(), max_rows);
        concurrent_.fetch_sub(1);
        return rs;
    }

    void on_health_check(const std::string& query) {
        health_checks_.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        last_health_query_ = query;
    }

    void on_close() {
        closed_.fetch_add(1);
        live_.fetch_sub(1);
    }

    mutable std::mutex mutex_;
    QueryHandler handler_;
    std::vector<std::string> executed_sql_;
    std::string last_conninfo_;
    std::string last_health_query_;

    std::atomic<size_t> table_rows_{3};
    std::atomic<bool> fail_creates_{false};
    std::atomic<long long> latency_ms_{0};

    std::atomic<int> created_{0};
    std::atomic<int> closed_{0};
    std::atomic<int> live_{0};
    std::atomic<int> create_failures_{0};
    std::atomic<int> executions_{0};
    std::atomic<int> concurrent_{0};
    std::atomic<int> max_concurrent_{0};
    std::atomic<int> health_checks_{0};
};

inline DbResultSet FakeConnection::execute(const std::string& sql, size_t max_rows) {
    if (!connected_) {
        return db_error("08003", "connection does not exist", true);
    }
    auto rs = factory_->run(sql, max_rows);
    if (rs.connection_broken) {
        connected_ = false;
    }
    return rs;
}

inline bool FakeConnection::is_healthy(const std::string& query) {
    factory_->on_health_check(query);
    return connected_;
}

inline void FakeConnection::close() {
    connected_ = false;
    if (!closed_.exchange(true)) {
        factory_->on_close();
    }
}

/**
 * @brief Audit sink that keeps lines in a store shared with the test
 */
class MemoryAuditSink : public IAuditSink {
public:
    struct Store {
        std::mutex mutex;
        std::vector<std::string> lines;
        int flushes = 0;
        bool shut_down = false;
        bool fail_writes = false;

        std::vector<std::string> snapshot() {
            std::lock_guard<std::mutex> lock(mutex);
            return lines;
        }
    };

    explicit MemoryAuditSink(std::shared_ptr<Store> store) : store_(std::move(store)) {}

    [[nodiscard]] bool write(std::string_view json_lines) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (store_->fail_writes) return false;
        size_t pos = 0;
        while (pos < json_lines.size()) {
            auto nl = json_lines.find('\n', pos);
            if (nl == std::string_view::npos) nl = json_lines.size();
            if (nl > pos) store_->lines.emplace_back(json_lines.substr(pos, nl - pos));
            pos = nl + 1;
        }
        return true;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        ++store_->flushes;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->shut_down = true;
    }

    [[nodiscard]] std::string name() const override { return "memory"; }

private:
    std::shared_ptr<Store> store_;
};

} // namespace sqlgate::testing
