#include "warm_transfer/backend/conversation.hpp"

#include <utility>

namespace warm_transfer {

nlohmann::json transcript_to_json(const std::vector<Utterance>& transcript) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& utterance : transcript) {
        items.push_back({{"speaker", to_string(utterance.speaker)}, {"text", utterance.text}});
    }
    return items;
}

BackendConversation::BackendConversation(std::shared_ptr<BackendClient> client)
    : client_(std::move(client)) {}

TurnResult BackendConversation::next_turn(const TurnRequest& request,
                                          const ScriptConfig& script) {
    const nlohmann::json body{{"role", to_string(request.role)},
                              {"session_id", request.session_id},
                              {"transcript", transcript_to_json(request.transcript)},
                              {"context", request.context},
                              {"script", script.to_json()}};
    const auto response = client_->post_json("/turn", body);

    TurnResult result;
    result.reply = response.value("reply", "");
    if (response.contains("intents") && response.at("intents").is_array()) {
        result.intents = response.at("intents").get<std::vector<std::string>>();
    }
    result.end_call = response.value("end_call", false);
    return result;
}

std::string BackendConversation::summarize(const SummaryRequest& request) {
    const nlohmann::json body{{"session_id", request.session_id},
                              {"transcript", transcript_to_json(request.transcript)},
                              {"reason", to_string(request.reason)},
                              {"facts", request.facts}};
    const auto response = client_->post_json("/summarize", body);
    return response.value("summary", "");
}

}
