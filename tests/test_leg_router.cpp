#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "warm_transfer/orchestrator/leg_router.hpp"
#include "warm_transfer/orchestrator/session_controller.hpp"

using namespace warm_transfer;

namespace {

TelephonyEvent ended(const LegId& leg) {
    return {leg, TelephonyEventType::Ended, std::chrono::system_clock::now(), "completed"};
}

struct Harness {
    testing::FakeTelephony telephony;
    testing::FakeSpeech speech;
    testing::FakeCapability capability;
    testing::FakeLookup lookup;

    std::shared_ptr<SessionController> make_session(const std::string& id) {
        CallRequest request;
        request.destination = "+15550001111";
        SessionConfig config{TransferPolicy{}, ScriptConfig::defaults()};
        return std::make_shared<SessionController>(id, request, config, telephony, speech,
                                                   capability, lookup);
    }
};

}

TEST_CASE("events for unbound legs are held until the leg is bound") {
    Harness h;
    LegRouter router;
    router.route(ended("leg-1"));
    router.route(ended("leg-2"));
    REQUIRE(router.orphan_count() == 2);

    auto session = h.make_session("wt-1");
    router.bind("leg-1", session);
    REQUIRE(router.orphan_count() == 1);
    REQUIRE(router.binding_count() == 1);
}

TEST_CASE("held events are capped") {
    LegRouter router;
    for (size_t i = 0; i < LegRouter::kMaxOrphans + 10; ++i) {
        router.route(ended("leg-" + std::to_string(i)));
    }
    REQUIRE(router.orphan_count() == LegRouter::kMaxOrphans);
}

TEST_CASE("unbinding a session drops every leg it owned") {
    Harness h;
    LegRouter router;
    auto first = h.make_session("wt-1");
    auto second = h.make_session("wt-2");
    router.bind("leg-1", first);
    router.bind("leg-2", first);
    router.bind("leg-3", second);
    REQUIRE(router.binding_count() == 3);

    router.unbind_session("wt-1");
    REQUIRE(router.binding_count() == 1);
}

TEST_CASE("bound events are delivered, not held") {
    Harness h;
    LegRouter router;
    auto session = h.make_session("wt-1");
    router.bind("leg-1", session);
    router.route(ended("leg-1"));
    router.route(TranscriptEvent{"leg-404", "hello"});
    REQUIRE(router.orphan_count() == 0);
}

TEST_CASE("expired sessions are pruned on unbind") {
    Harness h;
    LegRouter router;
    {
        auto session = h.make_session("wt-1");
        router.bind("leg-1", session);
    }
    router.route(ended("leg-1"));
    REQUIRE(router.orphan_count() == 0);
    router.unbind_session("wt-other");
    REQUIRE(router.binding_count() == 0);
}
