#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

struct SessionEvent {
    enum class Kind {
        LegConnected,
        LegEnded,
        LegError,
        Utterance,
        RepDialStarted,
        RepDialSucceeded,
        RepDialFailed,
        BriefingReady,
        Stop
    };

    Kind kind = Kind::Stop;
    LegId leg;
    ParticipantRole role = ParticipantRole::Customer;
    std::string text;
    // Transfer attempt the event belongs to; stale attempts are ignored.
    int attempt = 0;
};

const char* to_string(SessionEvent::Kind kind);

// Multi-producer, single-consumer queue feeding one session control loop.
class EventChannel {
public:
    void push(SessionEvent event);
    std::optional<SessionEvent> pop_until(Clock::time_point deadline);
    void close();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SessionEvent> queue_;
    bool closed_ = false;
};

}
