#include "warm_transfer/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace warm_transfer {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    phase_bounds_ = {0.5, 1.0, 2.5, 5.0, 10.0, 20.0, 30.0, 60.0, 120.0, 300.0};
    response_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                        0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
}

void Metrics::increment_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++request_total_;
}

void Metrics::increment_call_placed() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_placed_;
}

void Metrics::increment_transfer_attempt() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++transfer_attempts_;
}

void Metrics::increment_tool_gap(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++tool_gaps_[kind];
}

void Metrics::record_outcome(const std::string& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++outcomes_[state];
}

uint64_t Metrics::outcome_count(const std::string& state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = outcomes_.find(state);
    return it == outcomes_.end() ? 0 : it->second;
}

uint64_t Metrics::tool_gap_count(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tool_gaps_.find(kind);
    return it == tool_gaps_.end() ? 0 : it->second;
}

Metrics::HistogramSeries& Metrics::histogram_for(
    std::unordered_map<std::string, HistogramSeries>& series,
    const std::vector<double>& bounds,
    const std::string& label) {
    auto& item = series[label];
    if (item.buckets.empty()) {
        item.buckets.assign(bounds.size() + 1, 0);
    }
    return item;
}

void Metrics::observe(std::unordered_map<std::string, HistogramSeries>& series,
                      const std::vector<double>& bounds,
                      const std::string& label,
                      double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(series, bounds, label);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (seconds <= bounds[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::observe_phase(const std::string& phase, double seconds) {
    observe(phase_histograms_, phase_bounds_, phase, seconds);
}

void Metrics::observe_response_time(const std::string& method, double seconds) {
    observe(response_histograms_, response_bounds_, method, seconds);
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP client_requests_total Total number of API requests\n";
    out << "# TYPE client_requests_total counter\n";
    out << "client_requests_total " << request_total_ << "\n";

    out << "# HELP calls_placed_total Outbound sessions started\n";
    out << "# TYPE calls_placed_total counter\n";
    out << "calls_placed_total " << calls_placed_ << "\n";

    out << "# HELP transfer_attempts_total Warm transfer attempts\n";
    out << "# TYPE transfer_attempts_total counter\n";
    out << "transfer_attempts_total " << transfer_attempts_ << "\n";

    out << "# HELP session_outcomes_total Sessions by final state\n";
    out << "# TYPE session_outcomes_total counter\n";
    for (const auto& [state, count] : outcomes_) {
        out << "session_outcomes_total{state=\"" << state << "\"} " << count << "\n";
    }

    out << "# HELP tool_gaps_total Lookups that returned nothing or failed\n";
    out << "# TYPE tool_gaps_total counter\n";
    for (const auto& [kind, count] : tool_gaps_) {
        out << "tool_gaps_total{kind=\"" << kind << "\"} " << count << "\n";
    }

    const auto render_histogram = [&out](const char* name,
                                         const char* label,
                                         const std::unordered_map<std::string,
                                                                  HistogramSeries>& series,
                                         const std::vector<double>& bounds) {
        for (const auto& key : sorted_keys(series)) {
            const auto& item = series.at(key);
            for (size_t i = 0; i < bounds.size(); ++i) {
                out << name << "_bucket{" << label << "=\"" << key << "\",le=\"" << bounds[i]
                    << "\"} " << item.buckets[i] << "\n";
            }
            out << name << "_bucket{" << label << "=\"" << key << "\",le=\"+Inf\"} "
                << item.buckets.back() << "\n";
            out << name << "_count{" << label << "=\"" << key << "\"} " << item.count << "\n";
            out << name << "_sum{" << label << "=\"" << key << "\"} " << item.sum << "\n";
        }
    };

    out << "# HELP phase_duration_seconds Duration of transfer phases\n";
    out << "# TYPE phase_duration_seconds histogram\n";
    render_histogram("phase_duration_seconds", "phase", phase_histograms_, phase_bounds_);

    out << "# HELP response_time_seconds Backend response time\n";
    out << "# TYPE response_time_seconds histogram\n";
    render_histogram("response_time_seconds", "method", response_histograms_, response_bounds_);

    return out.str();
}

}
