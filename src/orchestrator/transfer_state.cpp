#include "warm_transfer/orchestrator/transfer_state.hpp"

#include <iomanip>
#include <sstream>

#include "warm_transfer/errors.hpp"

namespace warm_transfer {

namespace {

std::string format_time(std::chrono::system_clock::time_point at) {
    const auto time = std::chrono::system_clock::to_time_t(at);
    std::tm tm_value{};
    gmtime_r(&time, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return stream.str();
}

nlohmann::json leg_json(const CallLeg& leg) {
    nlohmann::json json{{"id", leg.id},
                        {"role", to_string(leg.role)},
                        {"destination", leg.destination},
                        {"state", to_string(leg.state)},
                        {"audio", to_string(leg.audio)}};
    if (leg.bridged_with) {
        json["bridged_with"] = *leg.bridged_with;
    }
    if (!leg.end_detail.empty()) {
        json["end_detail"] = leg.end_detail;
    }
    return json;
}

}

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Connecting:
            return "connecting";
        case TransferState::Qualifying:
            return "qualifying";
        case TransferState::HoldRequested:
            return "hold_requested";
        case TransferState::DialingRep:
            return "dialing_rep";
        case TransferState::Briefing:
            return "briefing";
        case TransferState::Merging:
            return "merging";
        case TransferState::Merged:
            return "merged";
        case TransferState::Completed:
            return "completed";
        case TransferState::AbortedNoAnswer:
            return "aborted_no_answer";
        case TransferState::AbortedCustomerLeft:
            return "aborted_customer_left";
        case TransferState::AbortedBriefingFailed:
            return "aborted_briefing_failed";
        case TransferState::AbortedCustomerUnreachable:
            return "aborted_customer_unreachable";
        case TransferState::Finished:
            return "finished";
    }
    return "unknown";
}

bool is_terminal(TransferState state) {
    switch (state) {
        case TransferState::Completed:
        case TransferState::AbortedCustomerLeft:
        case TransferState::AbortedCustomerUnreachable:
        case TransferState::Finished:
            return true;
        default:
            return false;
    }
}

bool is_transfer_in_progress(TransferState state) {
    switch (state) {
        case TransferState::HoldRequested:
        case TransferState::DialingRep:
        case TransferState::Briefing:
        case TransferState::Merging:
            return true;
        default:
            return false;
    }
}

bool can_transition(TransferState from, TransferState to) {
    using S = TransferState;
    switch (from) {
        case S::Connecting:
            return to == S::Qualifying || to == S::AbortedCustomerUnreachable ||
                   to == S::Finished;
        case S::Qualifying:
            return to == S::HoldRequested || to == S::Finished;
        case S::HoldRequested:
            return to == S::DialingRep || to == S::AbortedNoAnswer ||
                   to == S::AbortedCustomerLeft || to == S::Finished;
        case S::DialingRep:
            return to == S::Briefing || to == S::AbortedNoAnswer ||
                   to == S::AbortedCustomerLeft || to == S::Finished;
        case S::Briefing:
            return to == S::Merging || to == S::AbortedBriefingFailed ||
                   to == S::AbortedCustomerLeft || to == S::Finished;
        case S::Merging:
            return to == S::Merged || to == S::AbortedBriefingFailed ||
                   to == S::AbortedCustomerLeft || to == S::Finished;
        case S::Merged:
            return to == S::Completed;
        case S::AbortedNoAnswer:
        case S::AbortedBriefingFailed:
            // Resuming the customer conversation after a failed attempt.
            return to == S::Qualifying;
        case S::Completed:
        case S::AbortedCustomerLeft:
        case S::AbortedCustomerUnreachable:
        case S::Finished:
            return false;
    }
    return false;
}

CallRequest parse_call_request(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw WarmTransferError("request body must be an object");
    }
    auto text = [&body](const char* key) -> std::optional<std::string> {
        if (!body.contains(key) || !body.at(key).is_string()) {
            return std::nullopt;
        }
        const auto value = body.at(key).get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    };

    CallRequest request;
    request.phone_number = text("phone_number");
    request.name = text("name");
    const auto to_uri = text("to_uri");
    if (to_uri) {
        request.destination = *to_uri;
    } else if (request.phone_number) {
        request.destination = *request.phone_number;
    } else {
        throw WarmTransferError("phone_number or to_uri is required");
    }
    if (body.contains("metadata") && body.at("metadata").is_object()) {
        for (const auto& item : body.at("metadata").items()) {
            request.metadata[item.key()] =
                item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
        }
    }
    return request;
}

nlohmann::json TransferSessionSnapshot::to_json() const {
    nlohmann::json history_json = nlohmann::json::array();
    for (const auto& change : history) {
        history_json.push_back({{"from", to_string(change.from)},
                                {"to", to_string(change.to)},
                                {"reason", change.reason},
                                {"at", format_time(change.at)}});
    }
    nlohmann::json json{{"session_id", session_id},
                        {"state", to_string(state)},
                        {"history", history_json},
                        {"customer", leg_json(customer)},
                        {"transfer_attempts", transfer_attempts},
                        {"finished", finished},
                        {"created_at", format_time(created_at)}};
    json["representative"] = representative ? leg_json(*representative) : nlohmann::json();
    json["briefing"] = briefing ? nlohmann::json(*briefing) : nlohmann::json();
    json["transfer_reason"] =
        transfer_reason ? nlohmann::json(to_string(*transfer_reason)) : nlohmann::json();
    if (!end_reason.empty()) {
        json["end_reason"] = end_reason;
    }
    return json;
}

}
