#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace warm_transfer {

using LegId = std::string;
using Clock = std::chrono::steady_clock;

enum class ParticipantRole {
    Customer,
    Representative
};

enum class LegState {
    Dialing,
    Connected,
    OnHold,
    Merged,
    Ended
};

enum class AudioSource {
    None,
    Hold,
    Bridge
};

enum class Speaker {
    Agent,
    Customer,
    Representative
};

enum class AgentRole {
    OutboundQualifier,
    BriefingPresenter
};

// Declared in priority order: the first satisfied criterion wins.
enum class TransferReason {
    ExplicitRequest,
    Pricing,
    EnterpriseTerms,
    TechnicalQuestion,
    BuyingIntent,
    Negotiation
};

enum class InterestLevel {
    Unknown,
    Low,
    Medium,
    High
};

struct CallLeg {
    LegId id;
    ParticipantRole role = ParticipantRole::Customer;
    std::string destination;
    LegState state = LegState::Dialing;
    AudioSource audio = AudioSource::None;
    std::optional<LegId> bridged_with;
    std::string end_detail;
};

struct Utterance {
    Speaker speaker = Speaker::Customer;
    std::string text;
    std::chrono::system_clock::time_point at;
};

struct TransferDecision {
    bool requested = false;
    TransferReason reason = TransferReason::ExplicitRequest;
    std::string trigger;

    static TransferDecision none() { return {}; }
    static TransferDecision request(TransferReason reason, std::string trigger) {
        TransferDecision decision;
        decision.requested = true;
        decision.reason = reason;
        decision.trigger = std::move(trigger);
        return decision;
    }
};

struct ContactRecord {
    std::string name;
    std::string company;
    std::string interest_level;
    std::string last_contact_date;
};

struct ProductRecord {
    std::string name;
    std::string technical_differentiation;
    std::string benefits;
    std::string customer_proof_point;
};

const char* to_string(ParticipantRole role);
const char* to_string(LegState state);
const char* to_string(AudioSource source);
const char* to_string(Speaker speaker);
const char* to_string(AgentRole role);
const char* to_string(TransferReason reason);
const char* to_string(InterestLevel level);

std::optional<TransferReason> parse_transfer_reason(const std::string& value);
InterestLevel parse_interest_level(const std::string& value);

}
