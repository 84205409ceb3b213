#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Per-request state machine
 *
 *   RECEIVED -> CLASSIFYING -> (REJECTED | RATE_LIMITED | EXECUTING)
 *            -> (SUCCEEDED | FAILED | TIMED_OUT) -> AUDITED -> DONE
 *
 * RECEIVED -> REJECTED is also legal: an invalid row limit is refused
 * before classification. advance() throws std::logic_error on any other
 * edge, so a skipped or repeated state is a programming error rather
 * than a silent gap in the audit trail.
 *
 * Owned by one request thread; not thread-safe.
 */
class RequestLifecycle {
public:
    explicit RequestLifecycle(Request request);

    /// Move to `next`, recording it in the path
    void advance(RequestState next);

    [[nodiscard]] static bool is_legal(RequestState from, RequestState to);

    /// REJECTED, RATE_LIMITED, SUCCEEDED, FAILED or TIMED_OUT
    [[nodiscard]] static bool is_outcome_state(RequestState state);

    [[nodiscard]] RequestState state() const { return path_.back(); }
    [[nodiscard]] const std::vector<RequestState>& path() const { return path_; }

    /// Outcome state reached before AUDITED, or the current state if none yet
    [[nodiscard]] RequestState outcome_state() const;

    /// "RECEIVED>CLASSIFYING>EXECUTING>..."
    [[nodiscard]] std::string path_string() const;

    [[nodiscard]] const Request& request() const { return request_; }
    [[nodiscard]] std::chrono::microseconds elapsed() const { return timer_.elapsed_us(); }

private:
    const Request request_;
    std::vector<RequestState> path_;
    utils::Timer timer_;
};

} // namespace sqlgate
