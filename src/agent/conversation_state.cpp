#include "warm_transfer/agent/conversation_state.hpp"

#include <algorithm>

#include "warm_transfer/utils/text.hpp"

namespace warm_transfer {

size_t ConversationState::append(Utterance utterance) {
    transcript_.push_back(std::move(utterance));
    return transcript_.size() - 1;
}

std::vector<Utterance> ConversationState::utterances_by(Speaker speaker) const {
    std::vector<Utterance> result;
    std::copy_if(transcript_.begin(), transcript_.end(), std::back_inserter(result),
                 [speaker](const Utterance& item) { return item.speaker == speaker; });
    return result;
}

std::string ConversationState::format_transcript() const {
    std::string result;
    for (const auto& item : transcript_) {
        switch (item.speaker) {
            case Speaker::Customer:
                result += "Customer: ";
                break;
            case Speaker::Representative:
                result += "Representative: ";
                break;
            case Speaker::Agent:
                result += "Assistant: ";
                break;
        }
        result += item.text;
        result += '\n';
    }
    return result;
}

void ConversationState::add_signal(TransferSignal signal) {
    signals_.push_back(std::move(signal));
}

std::vector<TransferSignal> ConversationState::pending_signals() const {
    return {signals_.begin() + static_cast<std::ptrdiff_t>(signal_cursor_), signals_.end()};
}

void ConversationState::consume_signals() {
    signal_cursor_ = signals_.size();
}

void ConversationState::add_topic(const std::string& topic) {
    if (topic.empty()) {
        return;
    }
    if (std::find(topics_.begin(), topics_.end(), topic) == topics_.end()) {
        topics_.push_back(topic);
    }
}

void ConversationState::raise_interest(InterestLevel level) {
    if (static_cast<int>(level) > static_cast<int>(interest_)) {
        interest_ = level;
    }
}

void ConversationState::set_contact(ContactRecord contact) {
    raise_interest(parse_interest_level(contact.interest_level));
    contact_ = std::move(contact);
}

void ConversationState::set_previous_conversation(std::string summary) {
    previous_conversation_ = std::move(summary);
}

void ConversationState::add_competitor(ProductRecord product) {
    if (!has_competitor(product.name)) {
        competitors_.push_back(std::move(product));
    }
}

bool ConversationState::has_competitor(const std::string& name) const {
    const auto wanted = utils::normalize_text(name);
    return std::any_of(competitors_.begin(), competitors_.end(),
                       [&wanted](const ProductRecord& item) {
                           return utils::normalize_text(item.name) == wanted;
                       });
}

void ConversationState::set_decision(TransferDecision decision) {
    decision_ = std::move(decision);
}

}
