#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "warm_transfer/core/cancellation.hpp"
#include "warm_transfer/core/types.hpp"
#include "warm_transfer/telephony/provider.hpp"
#include "warm_transfer/telephony/speech.hpp"

namespace warm_transfer {

// Lifecycle of one telephony leg. Leg state is written by the provider event
// path (handle_event) and by local commands, always under mutex_.
class CallSession {
public:
    using LegCreatedHandler = std::function<void(const LegId&)>;

    CallSession(TelephonyProvider& telephony,
                SpeechGateway& speech,
                ParticipantRole role,
                std::chrono::milliseconds dial_timeout);
    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    void set_on_leg_created(LegCreatedHandler handler);

    // Blocks until the leg connects, fails, times out or `cancel` fires.
    // Throws DialFailure, Timeout or SessionCancelled; the leg is hung up on
    // every failure path.
    CallLeg dial(const std::string& destination, const CancellationToken& cancel);

    void play_audio(const std::string& resource);
    void stop_audio();
    void attach_audio(CallSession& other);
    void detach_audio();

    void attach_speech();
    void detach_speech();
    bool say(const std::string& text);

    void hangup();
    // Hands the leg over to the telephony layer; it is no longer hung up on destruction.
    void release();

    // Applies a provider event; returns false for foreign or redundant events.
    bool handle_event(const TelephonyEvent& event);

    CallLeg leg() const;
    std::optional<LegId> id() const;
    LegState state() const;
    bool is_live() const;
    ParticipantRole role() const { return role_; }

private:
    bool is_live_locked() const;

    TelephonyProvider& telephony_;
    SpeechGateway& speech_;
    const ParticipantRole role_;
    const std::chrono::milliseconds dial_timeout_;
    LegCreatedHandler on_leg_created_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::optional<CallLeg> leg_;
    std::string hold_resource_;
    bool hangup_requested_ = false;
    bool speech_attached_ = false;
    bool released_ = false;
};

}
