#include "warm_transfer/agent/transfer_criteria.hpp"

#include <algorithm>

#include "warm_transfer/utils/text.hpp"

namespace warm_transfer {

namespace {

bool intent_matches(const std::string& intent, TransferReason reason) {
    const auto normalized = utils::normalize_text(intent);
    if (normalized == utils::normalize_text(to_string(reason))) {
        return true;
    }
    return reason == TransferReason::ExplicitRequest &&
           (normalized == "transfer" || normalized == "transfer to human");
}

}

TransferCriteria::TransferCriteria(std::vector<TransferCriterion> criteria)
    : criteria_(std::move(criteria)) {
    std::stable_sort(criteria_.begin(), criteria_.end(),
                     [](const TransferCriterion& lhs, const TransferCriterion& rhs) {
                         return static_cast<int>(lhs.reason) < static_cast<int>(rhs.reason);
                     });
}

std::vector<TransferSignal> TransferCriteria::match(const std::string& text,
                                                    const std::vector<std::string>& intents,
                                                    size_t utterance_index) const {
    std::vector<TransferSignal> signals;
    for (const auto& criterion : criteria_) {
        auto phrase = std::find_if(criterion.phrases.begin(), criterion.phrases.end(),
                                   [&text](const std::string& item) {
                                       return utils::contains_phrase(text, item);
                                   });
        if (phrase != criterion.phrases.end()) {
            signals.push_back({criterion.reason, *phrase, utterance_index});
            continue;
        }
        auto intent = std::find_if(intents.begin(), intents.end(),
                                   [&criterion](const std::string& item) {
                                       return intent_matches(item, criterion.reason);
                                   });
        if (intent != intents.end()) {
            signals.push_back({criterion.reason, "intent:" + *intent, utterance_index});
        }
    }
    return signals;
}

TransferDecision TransferCriteria::evaluate(const ConversationState& state) const {
    const auto pending = state.pending_signals();
    for (const auto& criterion : criteria_) {
        for (const auto& signal : pending) {
            if (signal.reason == criterion.reason) {
                return TransferDecision::request(signal.reason, signal.trigger);
            }
        }
    }
    return TransferDecision::none();
}

std::string describe_reason(TransferReason reason) {
    switch (reason) {
        case TransferReason::ExplicitRequest:
            return "speaking with a person on our team";
        case TransferReason::Pricing:
            return "pricing, a quote or a demo";
        case TransferReason::EnterpriseTerms:
            return "enterprise plans and contract terms";
        case TransferReason::TechnicalQuestion:
            return "technical and integration details";
        case TransferReason::BuyingIntent:
            return "moving forward with a purchase";
        case TransferReason::Negotiation:
            return "concerns that need some negotiation";
    }
    return "next steps";
}

}
