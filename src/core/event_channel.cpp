#include "warm_transfer/core/event_channel.hpp"

namespace warm_transfer {

const char* to_string(SessionEvent::Kind kind) {
    switch (kind) {
        case SessionEvent::Kind::LegConnected:
            return "leg_connected";
        case SessionEvent::Kind::LegEnded:
            return "leg_ended";
        case SessionEvent::Kind::LegError:
            return "leg_error";
        case SessionEvent::Kind::Utterance:
            return "utterance";
        case SessionEvent::Kind::RepDialStarted:
            return "rep_dial_started";
        case SessionEvent::Kind::RepDialSucceeded:
            return "rep_dial_succeeded";
        case SessionEvent::Kind::RepDialFailed:
            return "rep_dial_failed";
        case SessionEvent::Kind::BriefingReady:
            return "briefing_ready";
        case SessionEvent::Kind::Stop:
            return "stop";
    }
    return "unknown";
}

void EventChannel::push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<SessionEvent> EventChannel::pop_until(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this]() { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

}
