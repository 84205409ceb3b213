#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string_view>

namespace sqlgate {

/**
 * @brief Statement shape ceilings for already-classified reads
 *
 * Pure function of configuration and input: passes the statement through
 * unchanged or rejects it with TOO_COMPLEX. Never rewrites.
 */
class ComplexityGuard {
public:
    struct Measurements {
        size_t length = 0;
        size_t joins = 0;
        size_t nesting_depth = 0;     // parenthesised SELECT/WITH levels
        size_t union_branches = 1;    // 1 + UNION/INTERSECT/EXCEPT count
    };

    ComplexityGuard() : ComplexityGuard(ComplexityConfig{}) {}
    explicit ComplexityGuard(const ComplexityConfig& config) : config_(config) {}

    [[nodiscard]] ValidationVerdict check(std::string_view normalized_text) const;

    /// Measure without judging. Returns false if the text does not tokenize.
    [[nodiscard]] static bool measure(std::string_view text, Measurements& out);

    [[nodiscard]] const ComplexityConfig& config() const { return config_; }

private:
    ComplexityConfig config_;
};

} // namespace sqlgate
