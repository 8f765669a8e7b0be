#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "warm_transfer/agent/briefing.hpp"
#include "warm_transfer/agent/conversation_agent.hpp"

#include <chrono>

using namespace warm_transfer;

namespace {

ConversationState pricing_conversation() {
    ConversationState state;
    const auto now = std::chrono::system_clock::now();
    state.append({Speaker::Agent, "Hi, this is Alyssa.", now});
    state.append({Speaker::Customer, "We have twelve analysts.", now});
    state.append({Speaker::Customer, "We're on Tableau today.", now});
    state.append({Speaker::Customer, "What would the pricing look like?", now});
    state.add_topic("pricing, a quote or a demo");
    state.raise_interest(InterestLevel::Medium);
    state.add_competitor({"Tableau", "Desktop-first visualization", "", ""});
    state.set_decision(TransferDecision::request(TransferReason::Pricing, "pricing"));
    return state;
}

}

TEST_CASE("briefing names the customer, the reason and what they need") {
    auto state = pricing_conversation();
    state.set_contact({"Priya Shah", "Northwind", "medium", ""});
    const auto briefing = build_briefing(state, std::string("+15550001111"));

    REQUIRE(briefing.who == "Priya Shah from Northwind");
    REQUIRE(briefing.reason == TransferReason::Pricing);
    const auto text = briefing.text();
    REQUIRE(text.find("Priya Shah from Northwind") != std::string::npos);
    REQUIRE(text.find("Transfer reason: pricing.") != std::string::npos);
    REQUIRE(text.find("pricing, a quote or a demo") != std::string::npos);
    REQUIRE(text.find("Interest level is medium") != std::string::npos);
    REQUIRE(text.find("currently using Tableau; Desktop-first visualization") !=
            std::string::npos);
    REQUIRE(text.find("Let me know when you're ready") != std::string::npos);
}

TEST_CASE("briefing quotes only the latest customer utterances") {
    const auto briefing = build_briefing(pricing_conversation(), std::nullopt);
    const auto text = briefing.text();
    REQUIRE(text.find("What would the pricing look like?") != std::string::npos);
    REQUIRE(text.find("We're on Tableau today.") != std::string::npos);
    REQUIRE(text.find("twelve analysts") == std::string::npos);
    REQUIRE(briefing.who == "a potential customer");
}

TEST_CASE("unknown caller is described by phone number") {
    const auto briefing = build_briefing(pricing_conversation(), std::string("+15550001111"));
    REQUIRE(briefing.who == "a potential customer calling from +15550001111");
}

TEST_CASE("reason tags are spoken without underscores") {
    auto state = pricing_conversation();
    state.set_decision(TransferDecision::request(TransferReason::EnterpriseTerms, "contract"));
    const auto text = build_briefing(state, std::nullopt).text();
    REQUIRE(text.find("Transfer reason: enterprise terms.") != std::string::npos);
}

TEST_CASE("synthesized briefing appends the generated narrative") {
    warm_transfer::testing::FakeCapability capability;
    AgentContext context;
    context.session_id = "wt-test";
    const auto text =
        ConversationAgent::synthesize_briefing(pricing_conversation(), context, capability);
    REQUIRE(text.find("twelve person analytics team") != std::string::npos);
    REQUIRE(text.find("Transfer reason: pricing.") != std::string::npos);
    REQUIRE(capability.summary_count() == 1);
}

TEST_CASE("synthesized briefing survives a failing summary") {
    warm_transfer::testing::FakeCapability capability;
    capability.set_fail_summary(true);
    AgentContext context;
    context.session_id = "wt-test";
    const auto text =
        ConversationAgent::synthesize_briefing(pricing_conversation(), context, capability);
    REQUIRE(text.find("Transfer reason: pricing.") != std::string::npos);
    REQUIRE(text.find("twelve person analytics team") == std::string::npos);
}
