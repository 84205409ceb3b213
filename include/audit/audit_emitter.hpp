#pragma once

#include "audit/ring_buffer.hpp"
#include "audit/audit_sink.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqlgate {

/**
 * @brief Asynchronous audit pipeline
 *
 * Decouples audit recording from I/O using an MPSC ring buffer and a
 * dedicated background writer thread.
 *
 * Request threads call record(), which only enqueues. The writer
 * drains in batches, numbers each record, chains a SHA-256 hash
 * over each record, appends one JSON line per record to every sink and
 * flushes (fsync) after each batch.
 *
 * A full ring makes record() wait for the writer instead of dropping.
 * A sink that rejects a write keeps its unwritten lines in a backlog
 * that is retried, in order, on every writer cycle; no record counts as
 * written until every sink has taken it.
 *
 *   [Thread 1] --record()--> [Ring Buffer] --drain()--> [Writer Thread] --> [FileSink]
 *   [Thread N] --record()-->                                            --> [...]
 */
class AuditEmitter {
public:
    /**
     * @brief Construct with a FileSink on config.output_file
     *
     * Continues the hash chain from the last record already in the file.
     * @throws std::runtime_error if the audit file cannot be opened
     */
    explicit AuditEmitter(const AuditConfig& config);

    /**
     * @brief Construct with caller-supplied sinks
     */
    AuditEmitter(const AuditConfig& config, std::vector<std::unique_ptr<IAuditSink>> sinks);

    ~AuditEmitter();

    // Non-copyable, non-movable (owns thread and ring buffer)
    AuditEmitter(const AuditEmitter&) = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;
    AuditEmitter(AuditEmitter&&) = delete;
    AuditEmitter& operator=(AuditEmitter&&) = delete;

    /**
     * @brief Enqueue an audit event
     *
     * Assigns audit_id if empty. The writer assigns sequence numbers in
     * file order.
     * @return false only after shutdown()
     */
    [[nodiscard]] bool record(AuditEvent event);

    /**
     * @brief Block until every record accepted so far has been attempted
     * @return true if all of them are written and flushed on every sink,
     *         false if some sink still holds them for retry (or shutdown
     *         left them unwritten)
     */
    [[nodiscard]] bool flush();

    /// Graceful shutdown: drain, flush and close all sinks
    void shutdown();

    struct Stats {
        uint64_t total_recorded;     ///< Records accepted by record()
        uint64_t total_written;      ///< Records written to every sink
        uint64_t backpressure_waits; ///< record() calls that waited for ring space
        uint64_t flush_count;        ///< Number of batch flushes performed
        uint64_t sink_write_failures;///< Failed sink write attempts
        uint64_t pending_records;    ///< Records a failing sink has not taken yet
        size_t active_sinks;         ///< Number of active sinks
    };

    [[nodiscard]] Stats get_stats() const;

    /// Serialized form of one record (no trailing newline)
    [[nodiscard]] static std::string to_json(const AuditEvent& event);

    [[nodiscard]] static std::string compute_record_hash(const AuditEvent& event,
                                                         const std::string& prev_hash);

    struct ChainVerification {
        bool valid = true;
        size_t records_checked = 0;
        size_t first_bad_line = 0;   // 1-based, 0 when valid
        std::string error;
    };

    /**
     * @brief Recompute the hash chain over persisted JSON lines
     *
     * record_hash is SHA-256 over the record's exact serialized bytes
     * without the two integrity fields, followed by '|' and previous_hash,
     * so any edited byte breaks it. Blank lines are skipped. A record whose previous_hash does not match
     * the preceding record_hash, or whose record_hash does not match its
     * contents, fails verification.
     */
    [[nodiscard]] static ChainVerification verify_chain(const std::vector<std::string>& lines);

private:
    void writer_thread_func();
    void start();
    void resume_chain(const std::string& last_line);
    void write_batch(std::vector<AuditEvent>& batch);

    bool write_pending();
    uint64_t max_pending() const;
    void flush_sinks();
    void shutdown_sinks();

    // -- Constants --
    static constexpr size_t kMaxBatchSize = 512;

    // -- Sinks --
    std::vector<std::unique_ptr<IAuditSink>> sinks_;

    // Serialized lines a sink has not accepted yet (writer thread only)
    struct Backlog {
        std::string data;
        uint64_t records = 0;
        bool failing = false;
    };
    std::vector<Backlog> backlogs_;   // parallel to sinks_

    // -- Ring buffer --
    MPSCRingBuffer<AuditEvent, 1024> ring_buffer_;

    // -- Background writer thread --
    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    // -- Wakeup / flush synchronization --
    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;      // wakes the writer
    std::condition_variable written_cv_;    // wakes flush() callers
    bool flush_requested_ = false;
    bool writer_done_ = false;
    uint64_t attempted_ = 0;                // ring positions handed to the sinks
    uint64_t persisted_ = 0;                // ring positions written and flushed everywhere
    std::atomic<int> producers_in_flight_{0};

    // -- Config --
    std::chrono::milliseconds batch_flush_interval_{100};
    bool integrity_enabled_{true};

    // -- Stats --
    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
    std::atomic<uint64_t> pending_records_{0};

    // -- Sequence and hash chain (writer thread only, no sync needed) --
    uint64_t next_sequence_ = 0;
    std::string previous_hash_;
};

} // namespace sqlgate
