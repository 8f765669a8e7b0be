#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "warm_transfer/agent/conversation_agent.hpp"
#include "warm_transfer/errors.hpp"
#include "warm_transfer/metrics.hpp"

#include <algorithm>

using namespace warm_transfer;

namespace {

const std::string kCustomer = "+15550001111";

struct Harness {
    testing::FakeTelephony telephony;
    testing::FakeSpeech speech;
    testing::FakeCapability capability;
    testing::FakeLookup lookup;
    CallSession leg{telephony, speech, ParticipantRole::Customer, std::chrono::milliseconds(1000)};
    ConversationAgent agent{leg, capability, lookup};
    LegId leg_id;

    Harness() {
        telephony.set_event_handler([this](const TelephonyEvent& event) {
            leg.handle_event(event);
        });
        leg_id = leg.dial(kCustomer, CancellationToken()).id;
    }

    ~Harness() { telephony.set_event_handler(nullptr); }

    void start_qualifier() {
        AgentContext context;
        context.session_id = "wt-agent";
        context.phone_number = kCustomer;
        agent.start(AgentRole::OutboundQualifier, ScriptConfig::defaults(), context);
    }

    void start_presenter() {
        AgentContext context;
        context.session_id = "wt-agent";
        context.briefing = "Hi! I have Priya on the line.";
        context.customer_transcript = "customer: what does it cost?";
        agent.start(AgentRole::BriefingPresenter, ScriptConfig::defaults(), context);
    }

    std::string first_spoken() const {
        const auto lines = speech.spoken(leg_id);
        return lines.empty() ? std::string() : lines.front();
    }
};

}

TEST_CASE("qualifier greets a known contact by name") {
    Harness h;
    h.lookup.add_contact(kCustomer, {"Priya", "Northwind", "medium", "2024-05-02"});
    h.start_qualifier();

    REQUIRE(h.speech.attached(h.leg_id));
    REQUIRE(h.first_spoken().rfind("Hi Priya, this is Alyssa calling from CloudAnalytics AI", 0) ==
            0);
    REQUIRE(h.agent.state().contact()->company == "Northwind");
}

TEST_CASE("qualifier follows up when there is a previous conversation") {
    Harness h;
    h.lookup.add_contact(kCustomer, {"Priya", "Northwind", "", ""});
    h.lookup.add_conversation(kCustomer, "Asked about dashboards in May.");
    h.start_qualifier();

    REQUIRE(h.first_spoken().find("follow up on our previous conversation") != std::string::npos);
    REQUIRE(h.agent.state().previous_conversation() ==
            std::string("Asked about dashboards in May."));
}

TEST_CASE("unknown caller gets the generic greeting") {
    Harness h;
    const auto gaps = Metrics::instance().tool_gap_count("contact_not_found");
    h.start_qualifier();

    REQUIRE(h.first_spoken().rfind("Hi, this is Alyssa", 0) == 0);
    REQUIRE(Metrics::instance().tool_gap_count("contact_not_found") == gaps + 1);
    REQUIRE(h.lookup.contact_calls() == 1);
}

TEST_CASE("lookup failure does not stop the conversation") {
    Harness h;
    h.lookup.make_unavailable(kCustomer);
    h.start_qualifier();
    REQUIRE(h.first_spoken().rfind("Hi, this is Alyssa", 0) == 0);
    REQUIRE_FALSE(h.agent.state().contact());
}

TEST_CASE("ordinary answers are handed to the capability") {
    Harness h;
    h.start_qualifier();
    h.agent.on_utterance("We have about twelve analysts.", Speaker::Customer);

    const auto requests = h.capability.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests.front().role == AgentRole::OutboundQualifier);
    REQUIRE(requests.front().transcript.size() == 2);
    REQUIRE(h.speech.spoken(h.leg_id).back() == "Could you tell me a little about your team?");
    REQUIRE_FALSE(h.agent.decide_transfer().requested);
}

TEST_CASE("transfer phrase requests a transfer without another turn") {
    Harness h;
    h.start_qualifier();
    h.agent.on_utterance("Can you give me a quote?", Speaker::Customer);

    REQUIRE(h.capability.requests().empty());
    const auto decision = h.agent.decide_transfer();
    REQUIRE(decision.requested);
    REQUIRE(decision.reason == TransferReason::Pricing);
    REQUIRE(h.agent.state().interest() == InterestLevel::Medium);

    h.agent.reset_decision();
    REQUIRE_FALSE(h.agent.decide_transfer().requested);
}

TEST_CASE("capability intents can request a transfer") {
    Harness h;
    h.start_qualifier();
    h.capability.push_turn({"Let me get someone for you.", {"transfer"}, false});
    h.agent.on_utterance("Can I get a person on the line", Speaker::Customer);

    const auto decision = h.agent.decide_transfer();
    REQUIRE(decision.reason == TransferReason::ExplicitRequest);
    REQUIRE(decision.trigger == "intent:transfer");
    REQUIRE(h.agent.state().interest() == InterestLevel::High);
}

TEST_CASE("competitor mentions are looked up and fed to later turns") {
    Harness h;
    h.lookup.add_product("Snowflake", {"Snowflake", "Warehouse only", "Scales storage", ""});
    h.start_qualifier();
    h.agent.on_utterance("We keep everything in Snowflake.", Speaker::Customer);

    REQUIRE(h.agent.state().has_competitor("Snowflake"));
    const auto context = h.capability.requests().back().context;
    REQUIRE(std::find(context.begin(), context.end(),
                      "Customer uses Snowflake. Warehouse only; benefits: Scales storage") !=
            context.end());
}

TEST_CASE("capability failure asks the customer to repeat") {
    Harness h;
    h.start_qualifier();
    h.capability.set_fail_turns(true);
    h.agent.on_utterance("We mostly use spreadsheets.", Speaker::Customer);
    REQUIRE(h.speech.spoken(h.leg_id).back() ==
            ScriptConfig::defaults().messages.repeat_request);
}

TEST_CASE("muted agent records but does not answer") {
    Harness h;
    h.start_qualifier();
    h.agent.mute();
    h.agent.on_utterance("Are you still there?", Speaker::Customer);
    REQUIRE(h.capability.requests().empty());
    REQUIRE(h.agent.state().transcript().size() == 2);
}

TEST_CASE("end_call from the capability closes the conversation") {
    Harness h;
    h.start_qualifier();
    h.capability.push_turn({"", {}, true});
    h.agent.on_utterance("Not interested, thanks.", Speaker::Customer);
    REQUIRE(h.agent.end_requested());
    REQUIRE(h.speech.spoken(h.leg_id).back() == ScriptConfig::defaults().messages.closing);
}

TEST_CASE("presenter speaks the briefing first and waits for readiness") {
    Harness h;
    h.start_presenter();
    REQUIRE(h.first_spoken() == "Hi! I have Priya on the line.");

    h.agent.on_utterance("What's their team size?", Speaker::Representative);
    REQUIRE_FALSE(h.agent.ready_acknowledged());
    const auto context = h.capability.requests().back().context;
    REQUIRE(context.back() == "Customer conversation:\ncustomer: what does it cost?");

    h.agent.on_utterance("Okay, go ahead and connect me.", Speaker::Representative);
    REQUIRE(h.agent.ready_acknowledged());
    REQUIRE_FALSE(h.agent.voicemail_detected());
}

TEST_CASE("presenter recognises voicemail") {
    Harness h;
    h.start_presenter();
    h.agent.on_utterance("Please leave a message after the tone.", Speaker::Representative);
    REQUIRE(h.agent.voicemail_detected());
    REQUIRE_FALSE(h.agent.ready_acknowledged());
}

TEST_CASE("presenter accepts a ready intent") {
    Harness h;
    h.start_presenter();
    h.capability.push_turn({"", {"ready"}, false});
    h.agent.on_utterance("Sure thing.", Speaker::Representative);
    REQUIRE(h.agent.ready_acknowledged());
}

TEST_CASE("presenter needs a briefing") {
    Harness h;
    AgentContext context;
    context.session_id = "wt-agent";
    REQUIRE_THROWS_AS(
        h.agent.start(AgentRole::BriefingPresenter, ScriptConfig::defaults(), context),
        WarmTransferError);
}

TEST_CASE("agent cannot open on a dead leg") {
    Harness h;
    h.telephony.remote_hangup(h.leg_id);
    REQUIRE(testing::wait_until([&]() { return h.leg.state() == LegState::Ended; }));
    REQUIRE_THROWS_AS(h.start_qualifier(), LegEndedUnexpectedly);
}

TEST_CASE("qualifier produces a briefing from its own conversation") {
    Harness h;
    h.start_qualifier();
    h.agent.on_utterance("What is the pricing for our team?", Speaker::Customer);
    REQUIRE(h.agent.decide_transfer().requested);

    const auto briefing = h.agent.produce_briefing();
    REQUIRE(briefing.find("Transfer reason: pricing") != std::string::npos);
    REQUIRE(briefing.find("twelve person analytics team") != std::string::npos);
    REQUIRE(h.capability.summary_count() == 1);

    h.capability.set_fail_summary(true);
    const auto fallback = h.agent.produce_briefing();
    REQUIRE(fallback.find("Transfer reason: pricing") != std::string::npos);
    REQUIRE(fallback.find("twelve person analytics team") == std::string::npos);
}

TEST_CASE("speech attach failure surfaces as a telephony error") {
    Harness h;
    h.speech.fail_attach_call(1);
    REQUIRE_THROWS_AS(h.start_qualifier(), TelephonyError);
    REQUIRE_FALSE(h.speech.attached(h.leg_id));

    // The session is not left marked as attached, so a later start retries.
    h.start_qualifier();
    REQUIRE(h.speech.attached(h.leg_id));
}
