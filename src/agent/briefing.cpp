#include "warm_transfer/agent/briefing.hpp"

#include "warm_transfer/agent/transfer_criteria.hpp"
#include "warm_transfer/utils/text.hpp"

namespace warm_transfer {

namespace {

constexpr size_t kQuotedUtterances = 2;

std::string describe_customer(const ConversationState& state,
                              const std::optional<std::string>& phone_number) {
    if (const auto& contact = state.contact(); contact && !contact->name.empty()) {
        auto who = contact->name;
        if (!contact->company.empty()) {
            who += " from " + contact->company;
        }
        return who;
    }
    if (phone_number && !phone_number->empty()) {
        return "a potential customer calling from " + *phone_number;
    }
    return "a potential customer";
}

std::string reason_tag(TransferReason reason) {
    std::string tag = to_string(reason);
    for (auto& ch : tag) {
        if (ch == '_') {
            ch = ' ';
        }
    }
    return tag;
}

}

Briefing build_briefing(const ConversationState& state,
                        const std::optional<std::string>& phone_number) {
    Briefing briefing;
    briefing.who = describe_customer(state, phone_number);
    briefing.reason = state.decision().reason;
    briefing.trigger = state.decision().trigger;
    briefing.interest = state.interest();

    for (const auto& topic : state.topics()) {
        briefing.needs.push_back(topic);
    }
    const auto customer = state.utterances_by(Speaker::Customer);
    const auto first = customer.size() > kQuotedUtterances ? customer.size() - kQuotedUtterances
                                                           : 0;
    for (size_t i = first; i < customer.size(); ++i) {
        briefing.needs.push_back("they said \"" + customer[i].text + "\"");
    }
    if (const auto& previous = state.previous_conversation()) {
        briefing.needs.push_back("previous conversation: " + *previous);
    }
    for (const auto& product : state.competitors()) {
        auto context = "currently using " + product.name;
        if (!product.technical_differentiation.empty()) {
            context += "; " + product.technical_differentiation;
        }
        briefing.competitive_context.push_back(context);
    }
    return briefing;
}

std::string Briefing::text() const {
    std::string result = "Hi! I have " + who + " on the line. ";
    result += "They're asking about " + describe_reason(reason) +
              ", which is why I'm transferring them to you. ";
    result += "Transfer reason: " + reason_tag(reason) + ". ";
    if (!needs.empty()) {
        result += "What they need: " + utils::join(needs, "; ") + ". ";
    }
    if (interest != InterestLevel::Unknown) {
        result += "Interest level is " + std::string(to_string(interest)) + ". ";
    }
    if (!competitive_context.empty()) {
        result += "Competitive context: " + utils::join(competitive_context, "; ") + ". ";
    }
    if (narrative && !narrative->empty()) {
        result += *narrative + " ";
    }
    result += "Let me know when you're ready and I'll connect you.";
    return result;
}

}
