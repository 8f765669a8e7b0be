#pragma once

#include <optional>
#include <string>
#include <vector>

#include "warm_transfer/agent/conversation_state.hpp"
#include "warm_transfer/agent/script.hpp"

namespace warm_transfer {

// Handoff summary for the representative. The structure (who, why, what is
// needed) is fixed; `narrative` carries the generated wording when available.
struct Briefing {
    std::string who;
    TransferReason reason = TransferReason::ExplicitRequest;
    std::string trigger;
    std::vector<std::string> needs;
    InterestLevel interest = InterestLevel::Unknown;
    std::vector<std::string> competitive_context;
    std::optional<std::string> narrative;

    std::string text() const;
};

Briefing build_briefing(const ConversationState& state,
                        const std::optional<std::string>& phone_number);

}
