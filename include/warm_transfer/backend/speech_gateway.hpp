#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "warm_transfer/backend/client.hpp"
#include "warm_transfer/backend/ws_client.hpp"
#include "warm_transfer/telephony/audio_stream.hpp"
#include "warm_transfer/telephony/speech.hpp"

namespace warm_transfer {

// Speech sessions hosted by the backend, one per attached leg. The leg's
// audio goes up the session websocket as binary PCM frames and synthesized
// speech comes back the same way. Text is sent with `POST /speech/<id>/say`;
// final transcripts arrive as JSON messages.
class BackendSpeechGateway : public SpeechGateway {
public:
    BackendSpeechGateway(std::shared_ptr<BackendClient> client,
                         LegAudioStream& audio,
                         int sample_rate);
    ~BackendSpeechGateway() override;

    void attach(const LegId& leg) override;
    void speak(const LegId& leg, const std::string& text) override;
    void detach(const LegId& leg) override;
    void set_transcript_handler(TranscriptHandler handler) override;

private:
    struct SpeechSession {
        std::string id;
        std::unique_ptr<BackendWsClient> ws;
    };

    void deliver(const LegId& leg, const nlohmann::json& message);

    void close_session(const LegId& leg, SpeechSession& session);

    std::shared_ptr<BackendClient> client_;
    LegAudioStream& audio_;
    const int sample_rate_;
    std::mutex sessions_mutex_;
    std::unordered_map<LegId, SpeechSession> sessions_;
    std::mutex handler_mutex_;
    TranscriptHandler handler_;
};

}
