#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "warm_transfer/agent/capability.hpp"
#include "warm_transfer/agent/conversation_state.hpp"
#include "warm_transfer/agent/lookup.hpp"
#include "warm_transfer/agent/script.hpp"
#include "warm_transfer/agent/transfer_criteria.hpp"
#include "warm_transfer/telephony/call_session.hpp"

namespace warm_transfer {

struct AgentContext {
    std::string session_id;
    std::optional<std::string> phone_number;
    std::optional<std::string> caller_name;
    std::map<std::string, std::string> metadata;
    // Briefing presenter only: the text spoken first and the frozen customer
    // conversation it answers questions from.
    std::optional<std::string> briefing;
    std::optional<std::string> customer_transcript;
};

// One AI participant bound to one leg. Not thread-safe: every call comes from
// the owning session's control loop.
class ConversationAgent {
public:
    ConversationAgent(CallSession& session,
                      ConversationCapability& capability,
                      LookupService& lookup);

    ConversationAgent(const ConversationAgent&) = delete;
    ConversationAgent& operator=(const ConversationAgent&) = delete;

    // Attaches speech to the leg and speaks the opening line. Throws
    // LegEndedUnexpectedly when the opening line cannot be spoken.
    void start(AgentRole role, const ScriptConfig& script, AgentContext context);
    void on_utterance(const std::string& text, Speaker speaker);

    TransferDecision decide_transfer();
    std::string produce_briefing() const;

    // Template briefing for a frozen conversation, with a generated narrative
    // when the capability answers.
    static std::string synthesize_briefing(const ConversationState& state,
                                           const AgentContext& context,
                                           ConversationCapability& capability);

    bool say(const std::string& text);
    void mute() { muted_ = true; }
    void unmute() { muted_ = false; }
    bool muted() const { return muted_; }
    void reset_decision();
    void stop();

    bool started() const { return started_; }
    bool ready_acknowledged() const { return ready_; }
    bool voicemail_detected() const { return voicemail_; }
    bool end_requested() const { return end_requested_; }
    AgentRole role() const { return role_; }
    const AgentContext& context() const { return context_; }
    const ConversationState& state() const { return state_; }

private:
    std::string opening_line();
    void enrich_from_contact(const std::string& phone_number);
    void enrich_from_competitors(const std::string& text);
    void handle_customer(size_t index, const std::string& text);
    void handle_representative(const std::string& text);
    std::optional<TurnResult> request_turn();
    std::vector<std::string> turn_context() const;

    CallSession& session_;
    ConversationCapability& capability_;
    LookupService& lookup_;

    AgentRole role_ = AgentRole::OutboundQualifier;
    ScriptConfig script_;
    AgentContext context_;
    std::optional<TransferCriteria> criteria_;
    ConversationState state_;
    std::set<std::string> looked_up_numbers_;
    std::set<std::string> looked_up_products_;
    bool started_ = false;
    bool muted_ = false;
    bool ready_ = false;
    bool voicemail_ = false;
    bool end_requested_ = false;
};

}
