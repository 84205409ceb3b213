#include "core/request_lifecycle.hpp"

#include <format>
#include <stdexcept>

namespace sqlgate {

RequestLifecycle::RequestLifecycle(Request request)
    : request_(std::move(request)) {
    path_.reserve(6);
    path_.push_back(RequestState::RECEIVED);
}

bool RequestLifecycle::is_outcome_state(RequestState state) {
    switch (state) {
        case RequestState::REJECTED:
        case RequestState::RATE_LIMITED:
        case RequestState::SUCCEEDED:
        case RequestState::FAILED:
        case RequestState::TIMED_OUT:
            return true;
        default:
            return false;
    }
}

bool RequestLifecycle::is_legal(RequestState from, RequestState to) {
    switch (from) {
        case RequestState::RECEIVED:
            return to == RequestState::CLASSIFYING || to == RequestState::REJECTED;
        case RequestState::CLASSIFYING:
            return to == RequestState::REJECTED ||
                   to == RequestState::RATE_LIMITED ||
                   to == RequestState::EXECUTING;
        case RequestState::EXECUTING:
            return to == RequestState::SUCCEEDED ||
                   to == RequestState::FAILED ||
                   to == RequestState::TIMED_OUT;
        case RequestState::AUDITED:
            return to == RequestState::DONE;
        case RequestState::DONE:
            return false;
        default:
            return is_outcome_state(from) && to == RequestState::AUDITED;
    }
}

void RequestLifecycle::advance(RequestState next) {
    const RequestState current = state();
    if (!is_legal(current, next)) {
        throw std::logic_error(std::format("illegal request transition {} -> {} (path {})",
            request_state_to_string(current), request_state_to_string(next), path_string()));
    }
    path_.push_back(next);
}

RequestState RequestLifecycle::outcome_state() const {
    for (auto it = path_.rbegin(); it != path_.rend(); ++it) {
        if (is_outcome_state(*it)) {
            return *it;
        }
    }
    return state();
}

std::string RequestLifecycle::path_string() const {
    std::string out;
    for (const auto s : path_) {
        if (!out.empty()) out += '>';
        out += request_state_to_string(s);
    }
    return out;
}

} // namespace sqlgate
