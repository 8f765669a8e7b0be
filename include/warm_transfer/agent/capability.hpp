#pragma once

#include <string>
#include <vector>

#include "warm_transfer/agent/script.hpp"
#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

struct TurnRequest {
    AgentRole role = AgentRole::OutboundQualifier;
    std::string session_id;
    std::vector<Utterance> transcript;
    std::vector<std::string> context;
};

struct TurnResult {
    std::string reply;
    std::vector<std::string> intents;
    bool end_call = false;
};

struct SummaryRequest {
    std::string session_id;
    std::vector<Utterance> transcript;
    TransferReason reason = TransferReason::ExplicitRequest;
    std::vector<std::string> facts;
};

// Generative conversation collaborator: a pure function of the transcript so
// far plus configuration, invoked once per turn.
class ConversationCapability {
public:
    virtual ~ConversationCapability() = default;

    virtual TurnResult next_turn(const TurnRequest& request, const ScriptConfig& script) = 0;
    virtual std::string summarize(const SummaryRequest& request) = 0;
};

}
