#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

struct TransferCriterion {
    TransferReason reason = TransferReason::ExplicitRequest;
    std::vector<std::string> phrases;
};

struct ScriptMessages {
    std::string hold_announcement;
    std::string rep_unavailable;
    std::string apology_closing;
    std::string connecting_rep;
    std::string handoff;
    std::string closing;
    std::string repeat_request;
};

// Customization surface of a conversation: identity, greeting, criteria and
// the fixed lines spoken around transfer transitions.
struct ScriptConfig {
    std::string agent_name;
    std::string company;
    std::string product;
    std::string greeting;
    std::string personalized_greeting;
    std::string follow_up_greeting;
    std::vector<std::string> qualification_criteria;
    std::vector<TransferCriterion> transfer_criteria;
    std::vector<std::string> interest_phrases;
    std::vector<std::string> competitors;
    std::vector<std::string> ready_phrases;
    std::vector<std::string> voicemail_phrases;
    ScriptMessages messages;

    static ScriptConfig defaults();
    static ScriptConfig from_json(const nlohmann::json& json);
    static ScriptConfig load_file(const std::filesystem::path& path);
    nlohmann::json to_json() const;
};

std::string render_template(const std::string& text,
                            const std::map<std::string, std::string>& values);

}
