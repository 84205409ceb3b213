#pragma once

#include "audit/audit_sink.hpp"
#include <cstddef>
#include <string>

namespace sqlgate {

/**
 * @brief Append-only JSONL audit file
 *
 * Opened with O_APPEND; committed records are never rewritten. A write
 * that fails part-way is cut back to where it started, so the caller can
 * retry the same lines. If the previous process died mid-line (or the
 * cut-back itself fails) the torn tail is closed off with a newline
 * before the next record so earlier records stay parseable.
 * flush() fsyncs when fsync_on_flush is set.
 *
 * Called exclusively from the AuditEmitter writer thread; no locking needed.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "audit.jsonl";
        bool fsync_on_flush = true;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool write(std::string_view json_lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /**
     * @brief Last complete line of an existing audit file
     * @return Empty string if the file is missing or empty
     */
    [[nodiscard]] static std::string read_last_line(const std::string& path);

private:
    bool write_all(std::string_view data);

    Config config_;
    int fd_ = -1;
    bool needs_newline_ = false;
    size_t bytes_written_ = 0;   // by this instance, logged on close
};

} // namespace sqlgate
