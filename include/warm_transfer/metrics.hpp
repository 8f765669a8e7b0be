#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace warm_transfer {

class Metrics {
public:
    static Metrics& instance();

    void increment_request();
    void increment_call_placed();
    void increment_transfer_attempt();
    void increment_tool_gap(const std::string& kind);
    void record_outcome(const std::string& state);
    void observe_phase(const std::string& phase, double seconds);
    void observe_response_time(const std::string& method, double seconds);
    std::string render_prometheus() const;

    // Counters keyed by label; used by tests and the session endpoint.
    uint64_t outcome_count(const std::string& state) const;
    uint64_t tool_gap_count(const std::string& kind) const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(std::unordered_map<std::string, HistogramSeries>& series,
                                   const std::vector<double>& bounds,
                                   const std::string& label);
    void observe(std::unordered_map<std::string, HistogramSeries>& series,
                 const std::vector<double>& bounds,
                 const std::string& label,
                 double seconds);

    mutable std::mutex mutex_;
    uint64_t request_total_ = 0;
    uint64_t calls_placed_ = 0;
    uint64_t transfer_attempts_ = 0;
    std::map<std::string, uint64_t> outcomes_;
    std::map<std::string, uint64_t> tool_gaps_;
    std::unordered_map<std::string, HistogramSeries> phase_histograms_;
    std::unordered_map<std::string, HistogramSeries> response_histograms_;
    std::vector<double> phase_bounds_;
    std::vector<double> response_bounds_;
};

}
