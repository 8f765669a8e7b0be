#pragma once

#include <optional>
#include <string>
#include <vector>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

struct TransferSignal {
    TransferReason reason = TransferReason::ExplicitRequest;
    std::string trigger;
    size_t utterance_index = 0;
};

// Accumulated dialogue of one agent. Only the owning agent mutates it; the
// orchestrator reads a copy once a decision is set.
class ConversationState {
public:
    size_t append(Utterance utterance);
    const std::vector<Utterance>& transcript() const { return transcript_; }
    std::vector<Utterance> utterances_by(Speaker speaker) const;
    std::string format_transcript() const;

    void add_signal(TransferSignal signal);
    const std::vector<TransferSignal>& signals() const { return signals_; }
    std::vector<TransferSignal> pending_signals() const;
    void consume_signals();

    void add_topic(const std::string& topic);
    const std::vector<std::string>& topics() const { return topics_; }

    void raise_interest(InterestLevel level);
    InterestLevel interest() const { return interest_; }

    void set_contact(ContactRecord contact);
    const std::optional<ContactRecord>& contact() const { return contact_; }
    void set_previous_conversation(std::string summary);
    const std::optional<std::string>& previous_conversation() const {
        return previous_conversation_;
    }
    void add_competitor(ProductRecord product);
    const std::vector<ProductRecord>& competitors() const { return competitors_; }
    bool has_competitor(const std::string& name) const;

    void set_decision(TransferDecision decision);
    const TransferDecision& decision() const { return decision_; }

private:
    std::vector<Utterance> transcript_;
    std::vector<TransferSignal> signals_;
    size_t signal_cursor_ = 0;
    std::vector<std::string> topics_;
    InterestLevel interest_ = InterestLevel::Unknown;
    std::optional<ContactRecord> contact_;
    std::optional<std::string> previous_conversation_;
    std::vector<ProductRecord> competitors_;
    TransferDecision decision_;
};

}
