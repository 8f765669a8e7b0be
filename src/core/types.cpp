#include "warm_transfer/core/types.hpp"

#include "warm_transfer/utils/text.hpp"

namespace warm_transfer {

const char* to_string(ParticipantRole role) {
    switch (role) {
        case ParticipantRole::Customer:
            return "customer";
        case ParticipantRole::Representative:
            return "representative";
    }
    return "unknown";
}

const char* to_string(LegState state) {
    switch (state) {
        case LegState::Dialing:
            return "dialing";
        case LegState::Connected:
            return "connected";
        case LegState::OnHold:
            return "on_hold";
        case LegState::Merged:
            return "merged";
        case LegState::Ended:
            return "ended";
    }
    return "unknown";
}

const char* to_string(AudioSource source) {
    switch (source) {
        case AudioSource::None:
            return "none";
        case AudioSource::Hold:
            return "hold";
        case AudioSource::Bridge:
            return "bridge";
    }
    return "unknown";
}

const char* to_string(Speaker speaker) {
    switch (speaker) {
        case Speaker::Agent:
            return "agent";
        case Speaker::Customer:
            return "customer";
        case Speaker::Representative:
            return "representative";
    }
    return "unknown";
}

const char* to_string(AgentRole role) {
    switch (role) {
        case AgentRole::OutboundQualifier:
            return "outbound-qualifier";
        case AgentRole::BriefingPresenter:
            return "briefing-presenter";
    }
    return "unknown";
}

const char* to_string(TransferReason reason) {
    switch (reason) {
        case TransferReason::ExplicitRequest:
            return "explicit_request";
        case TransferReason::Pricing:
            return "pricing";
        case TransferReason::EnterpriseTerms:
            return "enterprise_terms";
        case TransferReason::TechnicalQuestion:
            return "technical_question";
        case TransferReason::BuyingIntent:
            return "buying_intent";
        case TransferReason::Negotiation:
            return "negotiation";
    }
    return "unknown";
}

const char* to_string(InterestLevel level) {
    switch (level) {
        case InterestLevel::Unknown:
            return "unknown";
        case InterestLevel::Low:
            return "low";
        case InterestLevel::Medium:
            return "medium";
        case InterestLevel::High:
            return "high";
    }
    return "unknown";
}

std::optional<TransferReason> parse_transfer_reason(const std::string& value) {
    const auto normalized = utils::normalize_text(value);
    for (auto reason : {TransferReason::ExplicitRequest, TransferReason::Pricing,
                        TransferReason::EnterpriseTerms, TransferReason::TechnicalQuestion,
                        TransferReason::BuyingIntent, TransferReason::Negotiation}) {
        if (normalized == utils::normalize_text(to_string(reason))) {
            return reason;
        }
    }
    return std::nullopt;
}

InterestLevel parse_interest_level(const std::string& value) {
    const auto normalized = utils::normalize_text(value);
    if (normalized == "high") return InterestLevel::High;
    if (normalized == "medium") return InterestLevel::Medium;
    if (normalized == "low") return InterestLevel::Low;
    return InterestLevel::Unknown;
}

}
