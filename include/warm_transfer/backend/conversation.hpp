#pragma once

#include <memory>

#include "warm_transfer/agent/capability.hpp"
#include "warm_transfer/backend/client.hpp"

namespace warm_transfer {

// Conversation capability served by the backend: `POST /turn` for the next
// agent reply and `POST /summarize` for the briefing narrative.
class BackendConversation : public ConversationCapability {
public:
    explicit BackendConversation(std::shared_ptr<BackendClient> client);

    TurnResult next_turn(const TurnRequest& request, const ScriptConfig& script) override;
    std::string summarize(const SummaryRequest& request) override;

private:
    std::shared_ptr<BackendClient> client_;
};

nlohmann::json transcript_to_json(const std::vector<Utterance>& transcript);

}
