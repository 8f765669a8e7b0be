#pragma once

#include <functional>
#include <string>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

struct TranscriptEvent {
    LegId leg;
    std::string text;
};

// Speech-to-text / text-to-speech attached to one leg at a time.
class SpeechGateway {
public:
    using TranscriptHandler = std::function<void(const TranscriptEvent&)>;

    virtual ~SpeechGateway() = default;

    virtual void attach(const LegId& leg) = 0;
    virtual void speak(const LegId& leg, const std::string& text) = 0;
    virtual void detach(const LegId& leg) = 0;
    virtual void set_transcript_handler(TranscriptHandler handler) = 0;
};

}
