#include <catch2/catch_test_macros.hpp>
#include "core/request_lifecycle.hpp"

#include <stdexcept>

using namespace sqlgate;

namespace {

RequestLifecycle make_lifecycle() {
    Request req;
    req.client_id = "alice";
    req.operation = Operation::QUERY;
    req.raw_text = "SELECT 1";
    req.received_at = std::chrono::system_clock::now();
    return RequestLifecycle(std::move(req));
}

} // namespace

TEST_CASE("RequestLifecycle: happy path", "[lifecycle]") {
    auto lc = make_lifecycle();
    CHECK(lc.state() == RequestState::RECEIVED);
    CHECK(lc.request().client_id == "alice");

    lc.advance(RequestState::CLASSIFYING);
    lc.advance(RequestState::EXECUTING);
    lc.advance(RequestState::SUCCEEDED);
    CHECK(lc.outcome_state() == RequestState::SUCCEEDED);
    lc.advance(RequestState::AUDITED);
    lc.advance(RequestState::DONE);

    CHECK(lc.state() == RequestState::DONE);
    CHECK(lc.outcome_state() == RequestState::SUCCEEDED);
    CHECK(lc.path().size() == 6);
    CHECK(lc.path_string() == "RECEIVED>CLASSIFYING>EXECUTING>SUCCEEDED>AUDITED>DONE");
}

TEST_CASE("RequestLifecycle: every outcome passes through AUDITED", "[lifecycle]") {

    SECTION("Rejected during classification") {
        auto lc = make_lifecycle();
        lc.advance(RequestState::CLASSIFYING);
        lc.advance(RequestState::REJECTED);
        CHECK_THROWS_AS(lc.advance(RequestState::DONE), std::logic_error);
        lc.advance(RequestState::AUDITED);
        lc.advance(RequestState::DONE);
        CHECK(lc.outcome_state() == RequestState::REJECTED);
    }

    SECTION("Invalid limit is rejected before classification") {
        auto lc = make_lifecycle();
        lc.advance(RequestState::REJECTED);
        lc.advance(RequestState::AUDITED);
        CHECK(lc.path_string() == "RECEIVED>REJECTED>AUDITED");
    }

    SECTION("Rate limited") {
        auto lc = make_lifecycle();
        lc.advance(RequestState::CLASSIFYING);
        lc.advance(RequestState::RATE_LIMITED);
        lc.advance(RequestState::AUDITED);
        CHECK(lc.outcome_state() == RequestState::RATE_LIMITED);
    }

    SECTION("Timed out") {
        auto lc = make_lifecycle();
        lc.advance(RequestState::CLASSIFYING);
        lc.advance(RequestState::EXECUTING);
        lc.advance(RequestState::TIMED_OUT);
        lc.advance(RequestState::AUDITED);
        CHECK(lc.outcome_state() == RequestState::TIMED_OUT);
    }
}

TEST_CASE("RequestLifecycle: illegal transitions throw", "[lifecycle]") {
    auto lc = make_lifecycle();

    CHECK_THROWS_AS(lc.advance(RequestState::EXECUTING), std::logic_error);
    CHECK_THROWS_AS(lc.advance(RequestState::AUDITED), std::logic_error);
    CHECK(lc.state() == RequestState::RECEIVED);

    lc.advance(RequestState::CLASSIFYING);
    CHECK_THROWS_AS(lc.advance(RequestState::CLASSIFYING), std::logic_error);
    CHECK_THROWS_AS(lc.advance(RequestState::SUCCEEDED), std::logic_error);

    lc.advance(RequestState::EXECUTING);
    CHECK_THROWS_AS(lc.advance(RequestState::REJECTED), std::logic_error);
    CHECK_THROWS_AS(lc.advance(RequestState::RATE_LIMITED), std::logic_error);

    lc.advance(RequestState::FAILED);
    lc.advance(RequestState::AUDITED);
    lc.advance(RequestState::DONE);
    CHECK_THROWS_AS(lc.advance(RequestState::AUDITED), std::logic_error);
    CHECK(lc.path_string() == "RECEIVED>CLASSIFYING>EXECUTING>FAILED>AUDITED>DONE");
}

TEST_CASE("RequestLifecycle: outcome states", "[lifecycle]") {
    CHECK(RequestLifecycle::is_outcome_state(RequestState::REJECTED));
    CHECK(RequestLifecycle::is_outcome_state(RequestState::RATE_LIMITED));
    CHECK(RequestLifecycle::is_outcome_state(RequestState::SUCCEEDED));
    CHECK(RequestLifecycle::is_outcome_state(RequestState::FAILED));
    CHECK(RequestLifecycle::is_outcome_state(RequestState::TIMED_OUT));
    CHECK_FALSE(RequestLifecycle::is_outcome_state(RequestState::EXECUTING));
    CHECK_FALSE(RequestLifecycle::is_outcome_state(RequestState::AUDITED));

    auto lc = make_lifecycle();
    CHECK(lc.outcome_state() == RequestState::RECEIVED);
}

TEST_CASE("RequestedLimit: validity", "[lifecycle]") {
    CHECK(RequestedLimit::none().is_valid());
    CHECK(RequestedLimit::of(0).is_valid());
    CHECK_FALSE(RequestedLimit::of(-1).is_valid());

    const auto ten = RequestedLimit::of(10);
    CHECK(ten.kind == RequestedLimit::Kind::INTEGER);
    CHECK(ten.value == 10);
    CHECK(ten.raw == "10");

    const auto all = RequestedLimit::invalid("\"all\"");
    CHECK(all.kind == RequestedLimit::Kind::INVALID);
    CHECK(all.raw == "\"all\"");
    CHECK_FALSE(all.is_valid());
}
