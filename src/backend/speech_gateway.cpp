#include "warm_transfer/backend/speech_gateway.hpp"

#include <utility>
#include <vector>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/utils/http.hpp"
#include "warm_transfer/utils/pcm.hpp"

namespace warm_transfer {

BackendSpeechGateway::BackendSpeechGateway(std::shared_ptr<BackendClient> client,
                                           LegAudioStream& audio,
                                           int sample_rate)
    : client_(std::move(client)), audio_(audio), sample_rate_(sample_rate) {}

BackendSpeechGateway::~BackendSpeechGateway() {
    std::vector<LegId> legs;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& item : sessions_) {
            legs.push_back(item.first);
        }
    }
    for (const auto& leg : legs) {
        detach(leg);
    }
}

void BackendSpeechGateway::attach(const LegId& leg) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(leg) != 0) {
            return;
        }
    }
    const auto response = client_->post_json(
        "/speech", {{"leg", leg}, {"sample_rate", sample_rate_}, {"encoding", "pcm_s16le"}});
    SpeechSession session;
    session.id = response.value("session_id", leg);
    session.ws = std::make_unique<BackendWsClient>(client_->base_url());
    session.ws->connect(
        session.id,
        [this, leg](const nlohmann::json& message) { deliver(leg, message); },
        [leg]() { logging::debug("Speech stream closed", {kv("leg", leg)}); },
        [this, leg](const std::string& payload) {
            audio_.write_stream(leg, utils::from_pcm16le(payload));
        });
    auto* ws = session.ws.get();
    try {
        audio_.open_stream(leg, [ws](const std::vector<int16_t>& frame) {
            ws->send_binary(utils::to_pcm16le(frame));
        });
    } catch (const std::exception& ex) {
        logging::error("Speech audio unavailable", {kv("leg", leg),
                                                    kv("speech_session", session.id),
                                                    kv("error", ex.what())});
        close_session(leg, session);
        throw;
    }
    logging::info("Speech attached", {kv("leg", leg),
                                      kv("speech_session", session.id),
                                      kv("sample_rate", sample_rate_)});

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.emplace(leg, std::move(session));
}

void BackendSpeechGateway::speak(const LegId& leg, const std::string& text) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        const auto it = sessions_.find(leg);
        if (it == sessions_.end()) {
            throw WarmTransferError("speech is not attached to leg " + leg);
        }
        session_id = it->second.id;
    }
    client_->post_json("/speech/" + utils::url_encode(session_id) + "/say", {{"text", text}});
}

void BackendSpeechGateway::detach(const LegId& leg) {
    SpeechSession session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        const auto it = sessions_.find(leg);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    audio_.close_stream(leg);
    close_session(leg, session);
    logging::debug("Speech detached", {kv("leg", leg)});
}

void BackendSpeechGateway::close_session(const LegId& leg, SpeechSession& session) {
    session.ws->stop();
    try {
        client_->delete_json("/speech/" + utils::url_encode(session.id));
    } catch (const BackendError& ex) {
        logging::warn("Speech session close failed", {kv("leg", leg),
                                                      kv("speech_session", session.id),
                                                      kv("error", ex.what())});
    }
}

void BackendSpeechGateway::set_transcript_handler(TranscriptHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

void BackendSpeechGateway::deliver(const LegId& leg, const nlohmann::json& message) {
    if (message.value("type", "") != "transcript" || !message.value("final", true)) {
        return;
    }
    const auto text = message.value("text", "");
    if (text.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(handler_mutex_);
    if (handler_) {
        handler_({leg, text});
    }
}

}
