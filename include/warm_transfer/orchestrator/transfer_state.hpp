#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

enum class TransferState {
    Connecting,
    Qualifying,
    HoldRequested,
    DialingRep,
    Briefing,
    Merging,
    Merged,
    Completed,
    AbortedNoAnswer,
    AbortedCustomerLeft,
    AbortedBriefingFailed,
    AbortedCustomerUnreachable,
    Finished
};

const char* to_string(TransferState state);

// No transition leaves a terminal state.
bool is_terminal(TransferState state);
bool is_transfer_in_progress(TransferState state);
bool can_transition(TransferState from, TransferState to);

struct StateChange {
    TransferState from = TransferState::Connecting;
    TransferState to = TransferState::Connecting;
    std::string reason;
    std::chrono::system_clock::time_point at;
};

// Outbound call request: who to dial and what is known about them.
struct CallRequest {
    std::string destination;
    std::optional<std::string> phone_number;
    std::optional<std::string> name;
    std::map<std::string, std::string> metadata;
};

// Reads `{"phone_number"|"to_uri", "name", "metadata"}`. `to_uri` wins as the
// dial destination when both are given. Throws WarmTransferError when neither
// is present.
CallRequest parse_call_request(const nlohmann::json& body);

struct TransferSessionSnapshot {
    std::string session_id;
    TransferState state = TransferState::Connecting;
    std::vector<StateChange> history;
    CallLeg customer;
    std::optional<CallLeg> representative;
    std::optional<std::string> briefing;
    std::optional<TransferReason> transfer_reason;
    int transfer_attempts = 0;
    bool finished = false;
    std::string end_reason;
    std::chrono::system_clock::time_point created_at;

    nlohmann::json to_json() const;
};

}
