#include <catch2/catch_test_macros.hpp>

#include "warm_transfer/metrics.hpp"

using warm_transfer::Metrics;

namespace {

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

}

TEST_CASE("outcome and tool gap counters are labelled") {
    auto& metrics = Metrics::instance();
    const auto before = metrics.outcome_count("metrics_test_outcome");
    metrics.record_outcome("metrics_test_outcome");
    metrics.record_outcome("metrics_test_outcome");
    metrics.increment_tool_gap("metrics_test_gap");

    REQUIRE(metrics.outcome_count("metrics_test_outcome") == before + 2);
    REQUIRE(metrics.tool_gap_count("metrics_test_gap") >= 1);
    REQUIRE(metrics.tool_gap_count("never_recorded_gap") == 0);

    const auto text = metrics.render_prometheus();
    REQUIRE(contains(text, "session_outcomes_total{state=\"metrics_test_outcome\"}"));
    REQUIRE(contains(text, "tool_gaps_total{kind=\"metrics_test_gap\"}"));
}

TEST_CASE("prometheus text declares every counter") {
    const auto text = Metrics::instance().render_prometheus();
    REQUIRE(contains(text, "# TYPE client_requests_total counter\n"));
    REQUIRE(contains(text, "# TYPE calls_placed_total counter\n"));
    REQUIRE(contains(text, "# TYPE transfer_attempts_total counter\n"));
    REQUIRE(contains(text, "# TYPE phase_duration_seconds histogram\n"));
}

TEST_CASE("phase histogram buckets are cumulative") {
    auto& metrics = Metrics::instance();
    metrics.observe_phase("metrics_test_phase", 0.2);
    metrics.observe_phase("metrics_test_phase", 4.0);

    const auto text = metrics.render_prometheus();
    REQUIRE(contains(text,
                     "phase_duration_seconds_bucket{phase=\"metrics_test_phase\",le=\"0.500000\"} 1\n"));
    REQUIRE(contains(text,
                     "phase_duration_seconds_bucket{phase=\"metrics_test_phase\",le=\"5.000000\"} 2\n"));
    REQUIRE(contains(text,
                     "phase_duration_seconds_bucket{phase=\"metrics_test_phase\",le=\"+Inf\"} 2\n"));
    REQUIRE(contains(text, "phase_duration_seconds_count{phase=\"metrics_test_phase\"} 2\n"));
    REQUIRE(contains(text, "phase_duration_seconds_sum{phase=\"metrics_test_phase\"} 4.200000\n"));
}
