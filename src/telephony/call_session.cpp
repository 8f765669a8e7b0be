#include "warm_transfer/telephony/call_session.hpp"

#include <algorithm>
#include <utility>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/utils/text.hpp"

namespace warm_transfer {

const char* to_string(TelephonyEventType type) {
    switch (type) {
        case TelephonyEventType::Connected:
            return "connected";
        case TelephonyEventType::Ended:
            return "ended";
        case TelephonyEventType::Error:
            return "error";
    }
    return "unknown";
}

CallSession::CallSession(TelephonyProvider& telephony,
                         SpeechGateway& speech,
                         ParticipantRole role,
                         std::chrono::milliseconds dial_timeout)
    : telephony_(telephony),
      speech_(speech),
      role_(role),
      dial_timeout_(dial_timeout) {}

CallSession::~CallSession() {
    bool released = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = released_;
    }
    if (released) {
        return;
    }
    try {
        detach_speech();
        hangup();
    } catch (const std::exception& ex) {
        logging::error("Leg cleanup failed", {kv("error", ex.what()),
                                               kv("role", to_string(role_))});
    }
}

void CallSession::set_on_leg_created(LegCreatedHandler handler) {
    on_leg_created_ = std::move(handler);
}

CallLeg CallSession::dial(const std::string& destination, const CancellationToken& cancel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (leg_ && leg_->state != LegState::Ended && !hangup_requested_) {
            throw WarmTransferError("leg already active: " + leg_->id);
        }
    }
    if (cancel.stop_requested()) {
        throw SessionCancelled("dial cancelled before start");
    }

    LegId leg_id;
    try {
        leg_id = telephony_.dial(destination);
    } catch (const TelephonyError& ex) {
        throw DialFailure(ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        CallLeg leg;
        leg.id = leg_id;
        leg.role = role_;
        leg.destination = destination;
        leg.state = LegState::Dialing;
        leg_ = std::move(leg);
        hold_resource_.clear();
        hangup_requested_ = false;
        speech_attached_ = false;
    }
    logging::info("Dialing leg", {kv("leg", leg_id),
                                  kv("role", to_string(role_)),
                                  logging::kv_number("destination", destination)});
    if (on_leg_created_) {
        on_leg_created_(leg_id);
    }

    const auto deadline = Clock::now() + dial_timeout_;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (leg_->state == LegState::Connected) {
            return *leg_;
        }
        if (leg_->state == LegState::Ended) {
            throw DialFailure("leg ended while dialing: " +
                              (leg_->end_detail.empty() ? std::string("no answer")
                                                        : leg_->end_detail));
        }
        if (cancel.stop_requested()) {
            lock.unlock();
            hangup();
            throw SessionCancelled("dial cancelled: " + leg_id);
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            lock.unlock();
            hangup();
            throw Timeout("no answer within " + std::to_string(dial_timeout_.count()) + "ms");
        }
        state_cv_.wait_until(lock, std::min(deadline, now + kCancelPollInterval));
    }
}

void CallSession::play_audio(const std::string& resource) {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || !is_live_locked()) {
            throw LegEndedUnexpectedly("cannot play audio on an ended leg");
        }
        if (leg_->state == LegState::Merged) {
            throw WarmTransferError("merged leg cannot return to hold: " + leg_->id);
        }
        if (leg_->audio == AudioSource::Hold && hold_resource_ == resource) {
            return;
        }
        leg_id = leg_->id;
    }
    telephony_.play_audio(leg_id, resource);
    std::lock_guard<std::mutex> lock(mutex_);
    if (leg_ && leg_->id == leg_id && leg_->state != LegState::Ended) {
        leg_->audio = AudioSource::Hold;
        leg_->state = LegState::OnHold;
        hold_resource_ = resource;
    }
}

void CallSession::stop_audio() {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || leg_->audio != AudioSource::Hold) {
            return;
        }
        leg_id = leg_->id;
    }
    if (is_live()) {
        telephony_.stop_audio(leg_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (leg_ && leg_->audio == AudioSource::Hold) {
        leg_->audio = AudioSource::None;
        hold_resource_.clear();
        if (leg_->state == LegState::OnHold) {
            leg_->state = LegState::Connected;
        }
    }
}

void CallSession::attach_audio(CallSession& other) {
    if (&other == this) {
        throw WarmTransferError("cannot attach a leg to itself");
    }
    std::scoped_lock lock(mutex_, other.mutex_);
    if (!leg_ || !is_live_locked()) {
        throw LegEndedUnexpectedly("cannot attach audio: " + std::string(to_string(role_)) +
                                   " leg is not live");
    }
    if (!other.leg_ || !other.is_live_locked()) {
        throw LegEndedUnexpectedly("cannot attach audio: " +
                                   std::string(to_string(other.role_)) + " leg is not live");
    }
    telephony_.attach_audio(leg_->id, other.leg_->id);
    for (auto* session : {this, &other}) {
        auto& leg = *session->leg_;
        leg.audio = AudioSource::Bridge;
        leg.state = LegState::Merged;
        session->hold_resource_.clear();
    }
    leg_->bridged_with = other.leg_->id;
    other.leg_->bridged_with = leg_->id;
}

void CallSession::detach_audio() {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || leg_->audio == AudioSource::None) {
            return;
        }
        leg_id = leg_->id;
    }
    if (is_live()) {
        telephony_.detach_audio(leg_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (leg_ && leg_->id == leg_id) {
        leg_->audio = AudioSource::None;
        leg_->bridged_with.reset();
        hold_resource_.clear();
        if (leg_->state == LegState::OnHold || leg_->state == LegState::Merged) {
            leg_->state = LegState::Connected;
        }
    }
}

void CallSession::attach_speech() {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || speech_attached_ || !is_live_locked()) {
            return;
        }
        speech_attached_ = true;
        leg_id = leg_->id;
    }
    try {
        speech_.attach(leg_id);
    } catch (const std::exception& ex) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            speech_attached_ = false;
        }
        logging::error("Speech attach failed", {kv("leg", leg_id), kv("error", ex.what())});
        throw TelephonyError("speech unavailable on leg " + leg_id + ": " + ex.what());
    }
}

void CallSession::detach_speech() {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || !speech_attached_) {
            return;
        }
        speech_attached_ = false;
        leg_id = leg_->id;
    }
    speech_.detach(leg_id);
}

bool CallSession::say(const std::string& text) {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || !is_live_locked()) {
            return false;
        }
        leg_id = leg_->id;
    }
    const auto spoken = utils::sanitize_for_speech(text);
    if (spoken.empty()) {
        return false;
    }
    try {
        speech_.speak(leg_id, spoken);
    } catch (const std::exception& ex) {
        logging::error("Speech output failed", {kv("leg", leg_id),
                                                 kv("error", ex.what())});
        return false;
    }
    return true;
}

void CallSession::hangup() {
    LegId leg_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || leg_->state == LegState::Ended || hangup_requested_) {
            return;
        }
        hangup_requested_ = true;
        leg_id = leg_->id;
    }
    logging::info("Hanging up leg", {kv("leg", leg_id), kv("role", to_string(role_))});
    try {
        telephony_.hangup(leg_id);
    } catch (const TelephonyError& ex) {
        logging::warn("Hangup command failed", {kv("leg", leg_id), kv("error", ex.what())});
    }
    state_cv_.notify_all();
}

void CallSession::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
}

bool CallSession::handle_event(const TelephonyEvent& event) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leg_ || leg_->id != event.leg) {
            return false;
        }
        auto& leg = *leg_;
        switch (event.type) {
            case TelephonyEventType::Connected:
                if (leg.state == LegState::Dialing) {
                    leg.state = LegState::Connected;
                    changed = true;
                }
                break;
            case TelephonyEventType::Ended:
                if (leg.state != LegState::Ended) {
                    leg.state = LegState::Ended;
                    leg.audio = AudioSource::None;
                    leg.end_detail = event.detail;
                    hold_resource_.clear();
                    speech_attached_ = false;
                    changed = true;
                }
                break;
            case TelephonyEventType::Error:
                if (leg.state == LegState::Dialing) {
                    leg.state = LegState::Ended;
                    leg.end_detail = event.detail.empty() ? "error" : event.detail;
                    changed = true;
                }
                break;
        }
    }
    if (changed) {
        logging::debug("Leg state changed", {kv("leg", event.leg),
                                             kv("role", to_string(role_)),
                                             kv("event", to_string(event.type)),
                                             kv("state", to_string(state()))});
        state_cv_.notify_all();
    }
    return changed;
}

CallLeg CallSession::leg() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leg_ ? *leg_ : CallLeg{};
}

std::optional<LegId> CallSession::id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!leg_) {
        return std::nullopt;
    }
    return leg_->id;
}

LegState CallSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leg_ ? leg_->state : LegState::Ended;
}

bool CallSession::is_live() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leg_ && is_live_locked();
}

bool CallSession::is_live_locked() const {
    return leg_->state != LegState::Ended && !hangup_requested_;
}

}
