#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace sqlgate {

namespace {

// Lowercase hex SHA-256 of input
std::string sha256_hex(std::string_view input) {
    // SHA-256 via OpenSSL EVP
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    // Convert to hex string
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

// Hash input: the record serialized without its integrity fields, then |previous_hash
std::string chain_hash(std::string_view body, std::string_view prev_hash) {
    std::string input;
    input.reserve(body.size() + 1 + prev_hash.size());
    input += body;
    input += '|';
    input += prev_hash;
    return sha256_hex(input);
}

constexpr std::string_view kRecordHashKey = ",\"record_hash\":\"";

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditEmitter::AuditEmitter(const AuditConfig& config)
    : batch_flush_interval_(config.batch_flush_interval),
      integrity_enabled_(config.integrity_enabled) {

    FileSink::Config file_cfg;
    file_cfg.output_file = config.output_file;
    file_cfg.fsync_on_flush = config.fsync_on_flush;

    if (integrity_enabled_) {
        resume_chain(FileSink::read_last_line(config.output_file));
    }
    sinks_.push_back(std::make_unique<FileSink>(file_cfg));

    start();
}

AuditEmitter::AuditEmitter(const AuditConfig& config,
                           std::vector<std::unique_ptr<IAuditSink>> sinks)
    : sinks_(std::move(sinks)),
      batch_flush_interval_(config.batch_flush_interval),
      integrity_enabled_(config.integrity_enabled) {
    start();
}

void AuditEmitter::start() {
    backlogs_.resize(sinks_.size());
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditEmitter::writer_thread_func, this);

    for (const auto& sink : sinks_) {
        utils::log::info(std::format("Audit sink active: {}", sink->name()));
    }
}

void AuditEmitter::resume_chain(const std::string& last_line) {
    if (last_line.empty()) {
        return;
    }
    try {
        const auto j = nlohmann::json::parse(last_line);
        previous_hash_ = j.value("record_hash", std::string{});
        next_sequence_ = j.value("sequence_num", uint64_t{0}) + 1;
        utils::log::info(std::format("Audit chain resumes after sequence {}", next_sequence_ - 1));
    } catch (const nlohmann::json::exception& e) {
        utils::log::warn(std::format(
            "Audit file tail is not a valid record ({}); starting a new chain", e.what()));
    }
}

AuditEmitter::~AuditEmitter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

bool AuditEmitter::record(AuditEvent event) {
    producers_in_flight_.fetch_add(1, std::memory_order_acq_rel);
    if (!running_.load(std::memory_order_acquire)) {
        producers_in_flight_.fetch_sub(1, std::memory_order_acq_rel);
        utils::log::error(std::format("Audit event for client '{}' after shutdown", event.client_id));
        return false;
    }

    if (event.audit_id.empty()) {
        event.audit_id = utils::generate_uuid();
    }
    ring_buffer_.push(std::move(event));
    total_recorded_.fetch_add(1, std::memory_order_relaxed);
    producers_in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    return true;
}

bool AuditEmitter::flush() {
    // Every position reserved before this point must be written
    const uint64_t target = ring_buffer_.reserved();

    std::unique_lock<std::mutex> lock(flush_mutex_);
    if (!writer_done_) {
        flush_requested_ = true;
        flush_cv_.notify_one();
        written_cv_.wait(lock, [&] { return attempted_ >= target || writer_done_; });
    }
    return persisted_ >= target;
}

void AuditEmitter::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    // Let producers that passed the running_ check finish their push
    while (producers_in_flight_.load(std::memory_order_acquire) > 0) {
        std::this_thread::yield();
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        flush_requested_ = true;
    }
    flush_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

AuditEmitter::Stats AuditEmitter::get_stats() const {
    return Stats{
        .total_recorded = total_recorded_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .backpressure_waits = ring_buffer_.backpressure_waits(),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .pending_records = pending_records_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Sink Helpers
// ============================================================================

bool AuditEmitter::write_pending() {
    bool wrote = false;
    for (size_t i = 0; i < sinks_.size(); ++i) {
        auto& sink = sinks_[i];
        auto& backlog = backlogs_[i];
        if (backlog.data.empty()) {
            continue;
        }

        if (sink->write(backlog.data)) {
            if (backlog.failing) {
                utils::log::info(std::format("Audit sink {} recovered, {} records written",
                    sink->name(), backlog.records));
                backlog.failing = false;
            }
            backlog.data.clear();
            backlog.records = 0;
            wrote = true;
            continue;
        }

        sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
        if (!backlog.failing) {
            utils::log::error(std::format("Audit sink {} rejected a batch; holding records for retry",
                sink->name()));
            backlog.failing = true;
        }
    }
    return wrote;
}

uint64_t AuditEmitter::max_pending() const {
    uint64_t pending = 0;
    for (const auto& backlog : backlogs_) {
        pending = std::max(pending, backlog.records);
    }
    return pending;
}

void AuditEmitter::flush_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void AuditEmitter::shutdown_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void AuditEmitter::write_batch(std::vector<AuditEvent>& batch) {
    std::string output;
    output.reserve(batch.size() * 512);

    for (auto& event : batch) {
        event.sequence_num = next_sequence_++;
        if (integrity_enabled_) {
            event.previous_hash = previous_hash_;
            event.record_hash = compute_record_hash(event, previous_hash_);
            previous_hash_ = event.record_hash;
        }
        output += to_json(event);
        output += '\n';
    }

    // Each sink gets the same bytes, in order, however many retries it needs
    for (auto& backlog : backlogs_) {
        backlog.data += output;
        backlog.records += batch.size();
    }
}

void AuditEmitter::writer_thread_func() {
    std::vector<AuditEvent> batch;
    batch.reserve(kMaxBatchSize);

    while (true) {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            flush_cv_.wait_for(lock, batch_flush_interval_, [this] {
                return flush_requested_ || !running_.load(std::memory_order_acquire);
            });
            flush_requested_ = false;
            stopping = !running_.load(std::memory_order_acquire);
        }

        uint64_t drained_total = 0;
        while (true) {
            batch.clear();
            const size_t drained = ring_buffer_.drain(batch, kMaxBatchSize);
            if (drained == 0) {
                break;
            }
            write_batch(batch);
            drained_total += drained;
        }

        if (write_pending()) {
            flush_sinks();
            flush_count_.fetch_add(1, std::memory_order_relaxed);
        }

        const uint64_t pending = max_pending();
        {
            std::lock_guard<std::mutex> lock(flush_mutex_);
            attempted_ += drained_total;
            persisted_ = attempted_ - pending;
            total_written_.store(persisted_, std::memory_order_relaxed);
            pending_records_.store(pending, std::memory_order_relaxed);
            if (stopping) {
                writer_done_ = true;
            }
        }
        written_cv_.notify_all();

        if (stopping) {
            if (pending > 0) {
                utils::log::error(std::format(
                    "Audit shutdown with {} records not written to every sink", pending));
            }
            shutdown_sinks();
            return;
        }
    }
}

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

void append_event_tracking(std::string& out, const AuditEvent& e) {
    out += std::format("\"audit_id\":\"{}\",\"sequence_num\":{},",
                       utils::escape_json(e.audit_id), e.sequence_num);
    out += std::format("\"timestamp\":\"{}\",\"received_at\":\"{}\",",
                       utils::format_timestamp(e.timestamp),
                       utils::format_timestamp(e.received_at));
}

void append_request(std::string& out, const AuditEvent& e) {
    out += std::format("\"client_id\":\"{}\",\"operation\":\"{}\",\"subject\":\"{}\",",
                       utils::escape_json(e.client_id),
                       operation_to_string(e.operation),
                       utils::escape_json(e.subject));
    if (!e.requested_limit.empty()) {
        out += std::format("\"limit\":\"{}\",", utils::escape_json(e.requested_limit));
    }
}

void append_decision(std::string& out, const AuditEvent& e) {
    out += std::format("\"reason\":\"{}\",\"outcome\":\"{}\",\"final_state\":\"{}\",",
                       reason_code_to_string(e.reason),
                       outcome_code(e.outcome, e.reason),
                       request_state_to_string(e.final_state));
}

void append_execution(std::string& out, const AuditEvent& e) {
    out += std::format("\"row_count\":{},\"truncated\":{},\"duration_us\":{},",
                       e.row_count, utils::booltostr(e.truncated), e.duration.count());
    if (!e.error_message.empty()) {
        out += std::format("\"error\":\"{}\",", utils::escape_json(e.error_message));
    }
}

void append_integrity(std::string& out, const AuditEvent& e) {
    if (!e.record_hash.empty()) {
        out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                           e.record_hash, e.previous_hash);
    } else {
        if (!out.empty() && out.back() == ',') out.pop_back();
    }
}

} // anonymous namespace

std::string AuditEmitter::to_json(const AuditEvent& event) {
    std::string result;
    result += '{';
    append_event_tracking(result, event);
    append_request(result, event);
    append_decision(result, event);
    append_execution(result, event);
    append_integrity(result, event);
    result += '}';
    return result;
}

std::string AuditEmitter::compute_record_hash(const AuditEvent& event,
                                              const std::string& prev_hash) {
    AuditEvent body = event;
    body.record_hash.clear();
    body.previous_hash.clear();
    return chain_hash(to_json(body), prev_hash);
}

AuditEmitter::ChainVerification AuditEmitter::verify_chain(const std::vector<std::string>& lines) {
    ChainVerification result;
    std::string expected_prev;
    bool first = true;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string line = utils::trim(lines[i]);
        if (line.empty()) {
            continue;
        }

        auto fail = [&](std::string why) {
            result.valid = false;
            result.first_bad_line = i + 1;
            result.error = std::move(why);
            return result;
        };

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            return fail(std::format("not valid JSON: {}", e.what()));
        }

        std::string record_hash;
        std::string previous_hash;
        try {
            record_hash = j.at("record_hash").get<std::string>();
            previous_hash = j.at("previous_hash").get<std::string>();
        } catch (const nlohmann::json::exception& e) {
            return fail(std::format("missing or mistyped field: {}", e.what()));
        }

        // The first line may continue a chain whose head was archived
        if (!first && previous_hash != expected_prev) {
            return fail("previous_hash does not match preceding record");
        }

        // The hash covers the exact bytes before the integrity fields, which
        // must close the record
        const size_t split = line.rfind(kRecordHashKey);
        const std::string tail = std::format(",\"record_hash\":\"{}\",\"previous_hash\":\"{}\"}}",
                                             record_hash, previous_hash);
        if (split == std::string::npos || line.compare(split, std::string::npos, tail) != 0) {
            return fail("integrity fields are not the last fields of the record");
        }

        std::string body = line.substr(0, split);
        body += '}';
        if (chain_hash(body, previous_hash) != record_hash) {
            return fail("record_hash does not match record contents");
        }

        expected_prev = std::move(record_hash);
        first = false;
        ++result.records_checked;
    }
    return result;
}

} // namespace sqlgate
