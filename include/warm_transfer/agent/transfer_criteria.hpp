#pragma once

#include <string>
#include <vector>

#include "warm_transfer/agent/conversation_state.hpp"
#include "warm_transfer/agent/script.hpp"

namespace warm_transfer {

class TransferCriteria {
public:
    explicit TransferCriteria(std::vector<TransferCriterion> criteria);

    // Every criterion satisfied by one utterance or its detected intents.
    std::vector<TransferSignal> match(const std::string& text,
                                      const std::vector<std::string>& intents,
                                      size_t utterance_index) const;

    // Walks criteria in priority order over the not yet consumed signals; the
    // first criterion with a matching signal decides.
    TransferDecision evaluate(const ConversationState& state) const;

    const std::vector<TransferCriterion>& criteria() const { return criteria_; }

private:
    std::vector<TransferCriterion> criteria_;
};

// Short spoken description of why a transfer was requested.
std::string describe_reason(TransferReason reason);

}
