#include <catch2/catch_test_macros.hpp>

#include "warm_transfer/agent/transfer_criteria.hpp"

#include <algorithm>
#include <chrono>

using namespace warm_transfer;

namespace {

TransferCriteria default_criteria() {
    return TransferCriteria(ScriptConfig::defaults().transfer_criteria);
}

ConversationState with_signals(const TransferCriteria& criteria, const std::string& text) {
    ConversationState state;
    const auto index = state.append({Speaker::Customer, text, std::chrono::system_clock::now()});
    for (const auto& signal : criteria.match(text, {}, index)) {
        state.add_signal(signal);
    }
    return state;
}

}

TEST_CASE("pricing phrases request a pricing transfer") {
    const auto criteria = default_criteria();
    const auto decision = criteria.evaluate(with_signals(criteria, "How much does it cost?"));
    REQUIRE(decision.requested);
    REQUIRE(decision.reason == TransferReason::Pricing);
    REQUIRE(decision.trigger == "how much");
}

TEST_CASE("asking to talk to pricing is a pricing transfer") {
    const auto criteria = default_criteria();
    const auto state = with_signals(criteria, "I want to talk to pricing");
    REQUIRE(state.signals().size() == 1);
    const auto decision = criteria.evaluate(state);
    REQUIRE(decision.requested);
    REQUIRE(decision.reason == TransferReason::Pricing);
    REQUIRE(decision.trigger == "pricing");
}

TEST_CASE("explicit request outranks every other criterion") {
    const auto criteria = default_criteria();
    const auto state = with_signals(
        criteria, "We're ready to buy, but first I want to talk to a human about the discount.");
    REQUIRE(state.signals().size() == 3);
    REQUIRE(criteria.evaluate(state).reason == TransferReason::ExplicitRequest);
}

TEST_CASE("pricing outranks enterprise terms and negotiation") {
    const auto criteria = default_criteria();
    const auto state =
        with_signals(criteria, "Is there a volume discount on the enterprise contract price?");
    REQUIRE(criteria.evaluate(state).reason == TransferReason::Pricing);
}

TEST_CASE("criteria order in the script does not change priority") {
    std::vector<TransferCriterion> reversed = ScriptConfig::defaults().transfer_criteria;
    std::reverse(reversed.begin(), reversed.end());
    const TransferCriteria criteria(reversed);
    REQUIRE(criteria.criteria().front().reason == TransferReason::ExplicitRequest);
    const auto state = with_signals(criteria, "We need SSO and a quote");
    REQUIRE(criteria.evaluate(state).reason == TransferReason::Pricing);
}

TEST_CASE("small talk requests no transfer") {
    const auto criteria = default_criteria();
    const auto decision = criteria.evaluate(with_signals(criteria, "We mostly use spreadsheets."));
    REQUIRE_FALSE(decision.requested);
}

TEST_CASE("intents from the conversation capability count as signals") {
    const auto criteria = default_criteria();
    const auto signals = criteria.match("", {"Technical Question"}, 4);
    REQUIRE(signals.size() == 1);
    REQUIRE(signals.front().reason == TransferReason::TechnicalQuestion);
    REQUIRE(signals.front().trigger == "intent:Technical Question");
    REQUIRE(signals.front().utterance_index == 4);
    REQUIRE(criteria.match("", {"transfer"}, 0).front().reason ==
            TransferReason::ExplicitRequest);
}

TEST_CASE("consumed signals no longer decide") {
    const auto criteria = default_criteria();
    auto state = with_signals(criteria, "What's the price?");
    REQUIRE(criteria.evaluate(state).requested);
    state.consume_signals();
    REQUIRE_FALSE(criteria.evaluate(state).requested);
}
