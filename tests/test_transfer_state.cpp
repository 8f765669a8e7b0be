#include <catch2/catch_test_macros.hpp>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/orchestrator/transfer_state.hpp"

using namespace warm_transfer;
using S = TransferState;

TEST_CASE("happy path transitions are allowed in order") {
    const std::vector<S> path = {S::Connecting, S::Qualifying, S::HoldRequested, S::DialingRep,
                                 S::Briefing,   S::Merging,    S::Merged,        S::Completed};
    for (size_t i = 1; i < path.size(); ++i) {
        INFO(to_string(path[i - 1]) << " -> " << to_string(path[i]));
        REQUIRE(can_transition(path[i - 1], path[i]));
    }
}

TEST_CASE("states cannot be skipped") {
    REQUIRE_FALSE(can_transition(S::Qualifying, S::Briefing));
    REQUIRE_FALSE(can_transition(S::HoldRequested, S::Merging));
    REQUIRE_FALSE(can_transition(S::DialingRep, S::Merged));
    REQUIRE_FALSE(can_transition(S::Briefing, S::Merged));
    REQUIRE_FALSE(can_transition(S::Merged, S::Qualifying));
}

TEST_CASE("terminal states have no way out") {
    for (auto state : {S::Completed, S::AbortedCustomerLeft, S::AbortedCustomerUnreachable,
                       S::Finished}) {
        REQUIRE(is_terminal(state));
        for (auto to : {S::Qualifying, S::HoldRequested, S::Finished, S::Completed}) {
            REQUIRE_FALSE(can_transition(state, to));
        }
    }
}

TEST_CASE("failed transfers may resume qualifying") {
    REQUIRE_FALSE(is_terminal(S::AbortedNoAnswer));
    REQUIRE_FALSE(is_terminal(S::AbortedBriefingFailed));
    REQUIRE(can_transition(S::AbortedNoAnswer, S::Qualifying));
    REQUIRE(can_transition(S::AbortedBriefingFailed, S::Qualifying));
    REQUIRE_FALSE(can_transition(S::AbortedNoAnswer, S::HoldRequested));
}

TEST_CASE("customer can leave during any transfer step") {
    for (auto state : {S::HoldRequested, S::DialingRep, S::Briefing, S::Merging}) {
        REQUIRE(is_transfer_in_progress(state));
        REQUIRE(can_transition(state, S::AbortedCustomerLeft));
    }
    REQUIRE_FALSE(can_transition(S::Merged, S::AbortedCustomerLeft));
    REQUIRE_FALSE(is_transfer_in_progress(S::Qualifying));
}

TEST_CASE("call request prefers to_uri as the destination") {
    const auto request = parse_call_request(nlohmann::json{
        {"phone_number", "+15550001111"},
        {"to_uri", "sip:priya@example.com"},
        {"name", "Priya"},
        {"metadata", {{"campaign", "q3"}, {"score", 7}}}});
    REQUIRE(request.destination == "sip:priya@example.com");
    REQUIRE(request.phone_number == std::string("+15550001111"));
    REQUIRE(request.name == std::string("Priya"));
    REQUIRE(request.metadata.at("campaign") == "q3");
    REQUIRE(request.metadata.at("score") == "7");
}

TEST_CASE("call request needs a destination") {
    REQUIRE(parse_call_request(nlohmann::json{{"phone_number", "+15550001111"}}).destination ==
            "+15550001111");
    REQUIRE_THROWS_AS(parse_call_request(nlohmann::json{{"name", "Priya"}}), WarmTransferError);
    REQUIRE_THROWS_AS(parse_call_request(nlohmann::json{{"phone_number", ""}}),
                      WarmTransferError);
    REQUIRE_THROWS_AS(parse_call_request(nlohmann::json::array()), WarmTransferError);
}

TEST_CASE("snapshot serializes state and history") {
    TransferSessionSnapshot snapshot;
    snapshot.session_id = "wt-1";
    snapshot.state = S::Merged;
    snapshot.history.push_back({S::Briefing, S::Merging, "representative ready",
                                std::chrono::system_clock::now()});
    snapshot.customer.id = "leg-1";
    snapshot.customer.state = LegState::Merged;
    snapshot.customer.bridged_with = "leg-2";
    snapshot.transfer_reason = TransferReason::Pricing;
    snapshot.transfer_attempts = 1;

    const auto json = snapshot.to_json();
    REQUIRE(json.at("state") == "merged");
    REQUIRE(json.at("history").size() == 1);
    REQUIRE(json.at("history")[0].at("to") == "merging");
    REQUIRE(json.at("customer").at("bridged_with") == "leg-2");
    REQUIRE(json.at("transfer_reason") == "pricing");
    REQUIRE(json.at("representative").is_null());
    REQUIRE(json.at("briefing").is_null());
    REQUIRE_FALSE(json.contains("end_reason"));
}
