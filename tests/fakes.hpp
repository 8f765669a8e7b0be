#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "warm_transfer/agent/capability.hpp"
#include "warm_transfer/agent/lookup.hpp"
#include "warm_transfer/backend/client.hpp"
#include "warm_transfer/errors.hpp"
#include "warm_transfer/telephony/provider.hpp"
#include "warm_transfer/telephony/speech.hpp"

namespace warm_transfer::testing {

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

enum class DialOutcome {
    Answer,
    NoAnswer,
    Busy,
    Reject
};

// Provider double. Events are delivered from its own thread, never from
// inside a command, the same contract the SIP provider keeps.
class FakeTelephony : public TelephonyProvider {
public:
    struct Leg {
        std::string destination;
        bool ended = false;
        std::string playing;
        std::optional<LegId> bridged_with;
        int hangups = 0;
    };

    FakeTelephony() : worker_([this]() { deliver_loop(); }) {}

    ~FakeTelephony() override {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
        worker_.join();
    }

    void set_outcome(const std::string& destination, DialOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_[destination] = outcome;
    }

    LegId dial(const std::string& destination) override {
        DialOutcome outcome = DialOutcome::Answer;
        LegId id;
        std::optional<LegId> to_end;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = outcomes_.find(destination);
            if (it != outcomes_.end()) {
                outcome = it->second;
            }
            if (outcome == DialOutcome::Reject) {
                throw TelephonyError("destination rejected: " + destination);
            }
            id = "leg-" + std::to_string(++next_id_);
            legs_[id].destination = destination;
            order_.push_back(id);
            const auto hook = end_on_answer_.find(destination);
            if (outcome == DialOutcome::Answer && hook != end_on_answer_.end()) {
                to_end = hook->second;
            }
        }
        if (to_end) {
            end_leg(*to_end, "completed");
        }
        if (outcome == DialOutcome::Answer) {
            post({id, TelephonyEventType::Connected, std::chrono::system_clock::now(), ""});
        } else if (outcome == DialOutcome::Busy) {
            end_leg(id, "busy");
        }
        return id;
    }

    void hangup(const LegId& leg) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = legs_.find(leg);
            if (it == legs_.end()) {
                return;
            }
            ++it->second.hangups;
        }
        end_leg(leg, "completed");
    }

    void play_audio(const LegId& leg, const std::string& resource) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_playback_) {
            throw TelephonyError("cannot play " + resource);
        }
        legs_[leg].playing = resource;
    }

    void set_fail_playback(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_playback_ = fail;
    }

    void stop_audio(const LegId& leg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        legs_[leg].playing.clear();
    }

    void attach_audio(const LegId& first, const LegId& second) override {
        std::lock_guard<std::mutex> lock(mutex_);
        legs_[first].playing.clear();
        legs_[second].playing.clear();
        legs_[first].bridged_with = second;
        legs_[second].bridged_with = first;
    }

    void detach_audio(const LegId& leg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = legs_[leg];
        if (entry.bridged_with) {
            legs_[*entry.bridged_with].bridged_with.reset();
        }
        entry.bridged_with.reset();
    }

    void set_event_handler(EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    // `other` hangs up just before `destination` answers.
    void end_when_answered(const std::string& destination, const LegId& other) {
        std::lock_guard<std::mutex> lock(mutex_);
        end_on_answer_[destination] = other;
    }

    // The far end hangs up.
    void remote_hangup(const LegId& leg) { end_leg(leg, "completed"); }

    std::optional<LegId> wait_for_leg(const std::string& destination,
                                      size_t nth = 0,
                                      std::chrono::milliseconds timeout =
                                          std::chrono::milliseconds(3000)) const {
        std::optional<LegId> found;
        wait_until([&]() {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t seen = 0;
            for (const auto& id : order_) {
                if (legs_.at(id).destination == destination && seen++ == nth) {
                    found = id;
                    return true;
                }
            }
            return false;
        }, timeout);
        return found;
    }

    Leg leg(const LegId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = legs_.find(id);
        return it == legs_.end() ? Leg{} : it->second;
    }

    size_t dial_count(const std::string& destination) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& id : order_) {
            if (legs_.at(id).destination == destination) {
                ++count;
            }
        }
        return count;
    }

private:
    void end_leg(const LegId& leg, const std::string& detail) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& entry = legs_[leg];
            if (entry.ended) {
                return;
            }
            entry.ended = true;
            entry.playing.clear();
        }
        post({leg, TelephonyEventType::Ended, std::chrono::system_clock::now(), detail});
    }

    void post(TelephonyEvent event) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push_back(std::move(event));
        }
        queue_cv_.notify_one();
    }

    void deliver_loop() {
        while (true) {
            TelephonyEvent event;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                event = std::move(queue_.front());
                queue_.pop_front();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            std::lock_guard<std::mutex> lock(handler_mutex_);
            if (handler_) {
                handler_(event);
            }
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, DialOutcome> outcomes_;
    bool fail_playback_ = false;
    std::map<std::string, LegId> end_on_answer_;
    std::map<LegId, Leg> legs_;
    std::vector<LegId> order_;
    int next_id_ = 0;

    std::mutex handler_mutex_;
    EventHandler handler_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<TelephonyEvent> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

class FakeSpeech : public SpeechGateway {
public:
    void attach(const LegId& leg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attach_calls_;
        if (failing_attach_.count(attach_calls_) != 0) {
            throw BackendError("speech session refused");
        }
        attached_.insert(leg);
    }

    // The nth attach call (1-based, across legs) throws.
    void fail_attach_call(int nth) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_attach_.insert(nth);
    }

    void speak(const LegId& leg, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        spoken_[leg].push_back(text);
    }

    void detach(const LegId& leg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        attached_.erase(leg);
    }

    void set_transcript_handler(TranscriptHandler handler) override {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    // The party on `leg` says `text`.
    void hear(const LegId& leg, const std::string& text) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (handler_) {
            handler_({leg, text});
        }
    }

    std::vector<std::string> spoken(const LegId& leg) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = spoken_.find(leg);
        return it == spoken_.end() ? std::vector<std::string>{} : it->second;
    }

    bool wait_for_spoken(const LegId& leg,
                         const std::string& fragment,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) const {
        return wait_until([&]() {
            for (const auto& line : spoken(leg)) {
                if (line.find(fragment) != std::string::npos) {
                    return true;
                }
            }
            return false;
        }, timeout);
    }

    bool attached(const LegId& leg) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attached_.count(leg) != 0;
    }

private:
    mutable std::mutex mutex_;
    int attach_calls_ = 0;
    std::set<int> failing_attach_;
    std::set<LegId> attached_;
    std::map<LegId, std::vector<std::string>> spoken_;
    std::mutex handler_mutex_;
    TranscriptHandler handler_;
};

class FakeCapability : public ConversationCapability {
public:
    TurnResult next_turn(const TurnRequest& request, const ScriptConfig&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (fail_turns_) {
            throw WarmTransferError("conversation backend down");
        }
        if (!scripted_.empty()) {
            auto result = scripted_.front();
            scripted_.pop_front();
            return result;
        }
        TurnResult result;
        result.reply = "Could you tell me a little about your team?";
        return result;
    }

    std::string summarize(const SummaryRequest& request) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            summaries_.push_back(request);
            delay = summary_delay_;
            if (fail_summary_) {
                throw WarmTransferError("summary unavailable");
            }
        }
        std::this_thread::sleep_for(delay);
        return narrative_;
    }

    void push_turn(TurnResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripted_.push_back(std::move(result));
    }

    void set_fail_turns(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_turns_ = fail;
    }

    void set_fail_summary(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_summary_ = fail;
    }

    void set_summary_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        summary_delay_ = delay;
    }

    size_t summary_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summaries_.size();
    }

    std::vector<TurnRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::string narrative_ = "They run a twelve person analytics team.";

private:
    mutable std::mutex mutex_;
    std::deque<TurnResult> scripted_;
    std::vector<TurnRequest> requests_;
    std::vector<SummaryRequest> summaries_;
    bool fail_turns_ = false;
    bool fail_summary_ = false;
    std::chrono::milliseconds summary_delay_{0};
};

class FakeLookup : public LookupService {
public:
    std::optional<ContactRecord> lookup_contact(const std::string& phone_number) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++contact_calls_;
        if (unavailable_.count(phone_number) != 0) {
            throw ToolUnavailable("contact lookup unavailable");
        }
        const auto it = contacts_.find(phone_number);
        if (it == contacts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> lookup_previous_conversation(
        const std::string& phone_number) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = conversations_.find(phone_number);
        if (it == conversations_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<ProductRecord> lookup_product(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = products_.find(name);
        if (it == products_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void add_contact(const std::string& phone, ContactRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        contacts_[phone] = std::move(record);
    }

    void add_conversation(const std::string& phone, std::string summary) {
        std::lock_guard<std::mutex> lock(mutex_);
        conversations_[phone] = std::move(summary);
    }

    void add_product(const std::string& name, ProductRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        products_[name] = std::move(record);
    }

    void make_unavailable(const std::string& phone) {
        std::lock_guard<std::mutex> lock(mutex_);
        unavailable_.insert(phone);
    }

    int contact_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contact_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ContactRecord> contacts_;
    std::map<std::string, std::string> conversations_;
    std::map<std::string, ProductRecord> products_;
    std::set<std::string> unavailable_;
    int contact_calls_ = 0;
};

}
