#pragma once

#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief Abstract interface for audit output destinations
 *
 * Each sink receives serialized JSON lines from the AuditEmitter's
 * writer thread. Implementations are single-threaded (only called from
 * the writer thread), so no internal locking is needed.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Append one or more complete newline-terminated records. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_lines) = 0;

    /// Make everything written so far durable.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/sqlgate/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace sqlgate
