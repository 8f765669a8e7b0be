#include "warm_transfer/agent/conversation_agent.hpp"

#include <algorithm>
#include <chrono>

#include "warm_transfer/agent/briefing.hpp"
#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/metrics.hpp"
#include "warm_transfer/utils/text.hpp"

namespace warm_transfer {

namespace {

bool matches_any(const std::string& text, const std::vector<std::string>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&](const std::string& phrase) {
        return utils::contains_phrase(text, phrase);
    });
}

bool has_intent(const std::vector<std::string>& intents,
                std::initializer_list<const char*> names) {
    for (const auto& intent : intents) {
        const auto normalized = utils::normalize_text(intent);
        for (const auto* name : names) {
            if (normalized == name) {
                return true;
            }
        }
    }
    return false;
}

InterestLevel interest_for(TransferReason reason) {
    switch (reason) {
        case TransferReason::BuyingIntent:
        case TransferReason::ExplicitRequest:
            return InterestLevel::High;
        default:
            return InterestLevel::Medium;
    }
}

std::string describe_product(const ProductRecord& product) {
    std::vector<std::string> parts;
    if (!product.technical_differentiation.empty()) {
        parts.push_back(product.technical_differentiation);
    }
    if (!product.benefits.empty()) {
        parts.push_back("benefits: " + product.benefits);
    }
    if (!product.customer_proof_point.empty()) {
        parts.push_back("proof point: " + product.customer_proof_point);
    }
    return "Customer uses " + product.name + ". " + utils::join(parts, "; ");
}

}

ConversationAgent::ConversationAgent(CallSession& session,
                                     ConversationCapability& capability,
                                     LookupService& lookup)
    : session_(session), capability_(capability), lookup_(lookup) {}

void ConversationAgent::start(AgentRole role, const ScriptConfig& script, AgentContext context) {
    role_ = role;
    script_ = script;
    context_ = std::move(context);
    criteria_.emplace(script_.transfer_criteria);
    started_ = true;
    muted_ = false;
    ready_ = false;
    voicemail_ = false;
    end_requested_ = false;

    session_.attach_speech();
    if (role_ == AgentRole::OutboundQualifier && context_.phone_number) {
        enrich_from_contact(*context_.phone_number);
    }
    const auto line = opening_line();
    info("Agent started", {kv("session_id", context_.session_id),
                           kv("role", to_string(role_)),
                           kv("personalized", state_.contact().has_value())});
    if (!say(line)) {
        throw LegEndedUnexpectedly(std::string("could not speak opening line for ") +
                                   to_string(role_));
    }
}

std::string ConversationAgent::opening_line() {
    if (role_ == AgentRole::BriefingPresenter) {
        if (!context_.briefing || context_.briefing->empty()) {
            throw WarmTransferError("briefing presenter started without a briefing");
        }
        return *context_.briefing;
    }

    std::map<std::string, std::string> values = {
        {"agent", script_.agent_name},
        {"company", script_.company},
        {"product", script_.product},
    };
    std::string name;
    if (const auto& contact = state_.contact(); contact && !contact->name.empty()) {
        name = contact->name;
    } else if (context_.caller_name && !context_.caller_name->empty()) {
        name = *context_.caller_name;
    }
    if (name.empty()) {
        return render_template(script_.greeting, values);
    }
    values["name"] = name;
    if (state_.previous_conversation()) {
        return render_template(script_.follow_up_greeting, values);
    }
    return render_template(script_.personalized_greeting, values);
}

void ConversationAgent::enrich_from_contact(const std::string& phone_number) {
    if (!looked_up_numbers_.insert(phone_number).second) {
        return;
    }
    try {
        const auto contact = lookup_.lookup_contact(phone_number);
        if (!contact) {
            info("Contact not found", {kv("session_id", context_.session_id),
                                       kv_number("phone_number", phone_number)});
            Metrics::instance().increment_tool_gap("contact_not_found");
            return;
        }
        state_.set_contact(*contact);
        info("Contact found", {kv("session_id", context_.session_id),
                               kv("name", contact->name),
                               kv("company", contact->company)});
        if (auto previous = lookup_.lookup_previous_conversation(phone_number)) {
            state_.set_previous_conversation(std::move(*previous));
        }
    } catch (const std::exception& ex) {
        warn("Contact lookup unavailable", {kv("session_id", context_.session_id),
                                            kv_number("phone_number", phone_number),
                                            kv("error", ex.what())});
        Metrics::instance().increment_tool_gap("contact_unavailable");
    }
}

void ConversationAgent::enrich_from_competitors(const std::string& text) {
    for (const auto& name : script_.competitors) {
        if (!utils::contains_phrase(text, name) || !looked_up_products_.insert(name).second) {
            continue;
        }
        state_.add_topic("currently using " + name);
        try {
            auto product = lookup_.lookup_product(name);
            if (!product) {
                info("Product not found", {kv("session_id", context_.session_id),
                                           kv("product", name)});
                Metrics::instance().increment_tool_gap("product_not_found");
                continue;
            }
            if (product->name.empty()) {
                product->name = name;
            }
            state_.add_competitor(std::move(*product));
        } catch (const std::exception& ex) {
            warn("Product lookup unavailable", {kv("session_id", context_.session_id),
                                                kv("product", name),
                                                kv("error", ex.what())});
            Metrics::instance().increment_tool_gap("product_unavailable");
        }
    }
}

void ConversationAgent::on_utterance(const std::string& text, Speaker speaker) {
    if (!started_ || utils::normalize_text(text).empty()) {
        return;
    }
    const auto index = state_.append({speaker, text, std::chrono::system_clock::now()});
    if (muted_) {
        return;
    }
    if (role_ == AgentRole::OutboundQualifier && speaker == Speaker::Customer) {
        handle_customer(index, text);
    } else if (role_ == AgentRole::BriefingPresenter && speaker == Speaker::Representative) {
        handle_representative(text);
    }
}

void ConversationAgent::handle_customer(size_t index, const std::string& text) {
    if (const auto phone = utils::find_phone_number(text)) {
        enrich_from_contact(*phone);
    }
    enrich_from_competitors(text);
    if (matches_any(text, script_.interest_phrases)) {
        state_.raise_interest(InterestLevel::Medium);
    }

    auto signals = criteria_->match(text, {}, index);
    for (const auto& signal : signals) {
        state_.add_topic(describe_reason(signal.reason));
        state_.raise_interest(interest_for(signal.reason));
        state_.add_signal(signal);
    }
    if (!signals.empty()) {
        // The orchestrator speaks the hold announcement next.
        return;
    }

    const auto turn = request_turn();
    if (!turn) {
        say(script_.messages.repeat_request);
        return;
    }
    signals = criteria_->match("", turn->intents, index);
    for (const auto& signal : signals) {
        state_.add_topic(describe_reason(signal.reason));
        state_.raise_interest(interest_for(signal.reason));
        state_.add_signal(signal);
    }
    if (!signals.empty()) {
        return;
    }
    if (!turn->reply.empty()) {
        say(turn->reply);
    }
    if (turn->end_call) {
        if (turn->reply.empty()) {
            say(script_.messages.closing);
        }
        end_requested_ = true;
        info("Agent closed the conversation", {kv("session_id", context_.session_id)});
    }
}

void ConversationAgent::handle_representative(const std::string& text) {
    if (matches_any(text, script_.voicemail_phrases)) {
        voicemail_ = true;
        info("Voicemail detected", {kv("session_id", context_.session_id)});
        return;
    }
    if (matches_any(text, script_.ready_phrases)) {
        ready_ = true;
        info("Representative ready", {kv("session_id", context_.session_id)});
        return;
    }

    const auto turn = request_turn();
    if (!turn) {
        return;
    }
    if (has_intent(turn->intents, {"voicemail", "voicemail detected"})) {
        voicemail_ = true;
        info("Voicemail detected", {kv("session_id", context_.session_id)});
        return;
    }
    if (has_intent(turn->intents, {"ready", "connect to customer"})) {
        ready_ = true;
        info("Representative ready", {kv("session_id", context_.session_id)});
        return;
    }
    if (!turn->reply.empty()) {
        say(turn->reply);
    }
}

std::optional<TurnResult> ConversationAgent::request_turn() {
    TurnRequest request;
    request.role = role_;
    request.session_id = context_.session_id;
    request.transcript = state_.transcript();
    request.context = turn_context();
    const auto started = std::chrono::steady_clock::now();
    try {
        auto result = capability_.next_turn(request, script_);
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
        Metrics::instance().observe_phase("turn", elapsed.count());
        return result;
    } catch (const std::exception& ex) {
        warn("Conversation turn failed", {kv("session_id", context_.session_id),
                                          kv("role", to_string(role_)),
                                          kv("error", ex.what())});
        return std::nullopt;
    }
}

std::vector<std::string> ConversationAgent::turn_context() const {
    std::vector<std::string> facts;
    facts.push_back("You are " + script_.agent_name + " from " + script_.company + ", " +
                    script_.product + ".");
    if (role_ == AgentRole::BriefingPresenter) {
        if (context_.briefing) {
            facts.push_back("Briefing: " + *context_.briefing);
        }
        if (context_.customer_transcript) {
            facts.push_back("Customer conversation:\n" + *context_.customer_transcript);
        }
        return facts;
    }
    if (!script_.qualification_criteria.empty()) {
        facts.push_back("Qualify on: " + utils::join(script_.qualification_criteria, "; ") + ".");
    }
    if (const auto& contact = state_.contact()) {
        auto line = "You are speaking with " + contact->name;
        if (!contact->company.empty()) {
            line += " from " + contact->company;
        }
        facts.push_back(line + ".");
    } else if (context_.caller_name) {
        facts.push_back("You are speaking with " + *context_.caller_name + ".");
    }
    if (const auto& previous = state_.previous_conversation()) {
        facts.push_back("Previous conversation: " + *previous);
    }
    for (const auto& product : state_.competitors()) {
        facts.push_back(describe_product(product));
    }
    for (const auto& [key, value] : context_.metadata) {
        facts.push_back(key + ": " + value);
    }
    return facts;
}

TransferDecision ConversationAgent::decide_transfer() {
    if (state_.decision().requested) {
        return state_.decision();
    }
    if (!criteria_) {
        return TransferDecision::none();
    }
    auto decision = criteria_->evaluate(state_);
    if (decision.requested) {
        state_.set_decision(decision);
        info("Transfer decided", {kv("session_id", context_.session_id),
                                  kv("reason", to_string(decision.reason)),
                                  kv("trigger", decision.trigger)});
    }
    return decision;
}

std::string ConversationAgent::produce_briefing() const {
    return synthesize_briefing(state_, context_, capability_);
}

std::string ConversationAgent::synthesize_briefing(const ConversationState& state,
                                                   const AgentContext& context,
                                                   ConversationCapability& capability) {
    auto briefing = build_briefing(state, context.phone_number);
    SummaryRequest request;
    request.session_id = context.session_id;
    request.transcript = state.transcript();
    request.reason = state.decision().reason;
    request.facts = briefing.needs;
    request.facts.insert(request.facts.end(), briefing.competitive_context.begin(),
                         briefing.competitive_context.end());
    try {
        auto narrative = capability.summarize(request);
        if (!utils::normalize_text(narrative).empty()) {
            briefing.narrative = std::move(narrative);
        }
    } catch (const std::exception& ex) {
        warn("Briefing narrative unavailable, using template",
             {kv("session_id", context.session_id), kv("error", ex.what())});
    }
    return briefing.text();
}

bool ConversationAgent::say(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    if (!session_.say(text)) {
        return false;
    }
    state_.append({Speaker::Agent, text, std::chrono::system_clock::now()});
    return true;
}

void ConversationAgent::reset_decision() {
    state_.consume_signals();
    state_.set_decision(TransferDecision::none());
    muted_ = false;
}

void ConversationAgent::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    session_.detach_speech();
    debug("Agent stopped", {kv("session_id", context_.session_id), kv("role", to_string(role_))});
}

}
