#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

enum class TelephonyEventType {
    Connected,
    Ended,
    Error
};

const char* to_string(TelephonyEventType type);

struct TelephonyEvent {
    LegId leg;
    TelephonyEventType type = TelephonyEventType::Error;
    std::chrono::system_clock::time_point timestamp;
    std::string detail;
};

// Signaling collaborator. Calls return once the command is issued; `connected`
// and `ended` are only ever reported through the event handler.
class TelephonyProvider {
public:
    using EventHandler = std::function<void(const TelephonyEvent&)>;

    virtual ~TelephonyProvider() = default;

    // Throws TelephonyError when the request is rejected outright.
    virtual LegId dial(const std::string& destination) = 0;
    virtual void hangup(const LegId& leg) = 0;
    // Loops `resource` into the leg; replaces whatever the leg was hearing.
    virtual void play_audio(const LegId& leg, const std::string& resource) = 0;
    virtual void stop_audio(const LegId& leg) = 0;
    // Stops any playback on both legs and bridges them in a single step.
    virtual void attach_audio(const LegId& first, const LegId& second) = 0;
    virtual void detach_audio(const LegId& leg) = 0;
    virtual void set_event_handler(EventHandler handler) = 0;
};

}
