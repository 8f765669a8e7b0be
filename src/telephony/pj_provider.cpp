#include "warm_transfer/telephony/pj_provider.hpp"

#include <pj/os.h>

#include <typeinfo>
#include <utility>
#include <vector>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/telephony/media_port.hpp"

namespace warm_transfer {

void ensure_pj_thread_registered(const char* name) {
    if (pj_thread_is_registered()) {
        return;
    }
    thread_local pj_thread_desc desc;
    pj_thread_t* thread = nullptr;
    pj_thread_register(name ? name : "warm_transfer", desc, &thread);
}

namespace {

std::string end_status(int code) {
    if (code == PJSIP_SC_DECLINE) {
        return "declined";
    } else if (code == PJSIP_SC_BUSY_HERE) {
        return "busy";
    } else if (code == PJSIP_SC_REQUEST_TERMINATED) {
        return "canceled";
    } else if (code == PJSIP_SC_TEMPORARILY_UNAVAILABLE || code == PJSIP_SC_REQUEST_TIMEOUT) {
        return "noanswer";
    } else if (code == PJSIP_SC_NOT_FOUND) {
        return "not_found";
    } else if (code == PJSIP_SC_SERVICE_UNAVAILABLE || code == PJSIP_SC_SERVER_TIMEOUT) {
        return "network_error";
    } else if (code == PJSIP_SC_OK) {
        return "completed";
    }
    return "unknown";
}

bool is_failure_status(const std::string& status) {
    return status == "not_found" || status == "network_error";
}

}

// One outbound leg. Media handles are touched from pjsip callbacks and from
// control threads, so they live under media_mutex_.
class PjLegCall : public pj::Call {
public:
    PjLegCall(PjTelephonyProvider& provider, pj::Account& account, LegId leg)
        : pj::Call(account), provider_(provider), leg_(std::move(leg)) {}

    ~PjLegCall() override {
        std::lock_guard<std::mutex> lock(media_mutex_);
        player_.reset();
        stream_port_.reset();
        media_.reset();
    }

    const LegId& leg() const { return leg_; }

    void onCallState(pj::OnCallStateParam& prm) override {
        (void)prm;
        try {
            const auto info = getInfo();
            logging::debug("Call state changed", {kv("leg", leg_),
                                                  logging::kv_number("uri", info.remoteUri),
                                                  kv("state", static_cast<int>(info.state)),
                                                  kv("state_text", info.stateText)});
            if (info.state == PJSIP_INV_STATE_CONFIRMED) {
                confirmed_ = true;
                open_media();
                provider_.post({leg_, TelephonyEventType::Connected,
                                std::chrono::system_clock::now(), ""});
            } else if (info.state == PJSIP_INV_STATE_DISCONNECTED) {
                close_media();
                const auto status = end_status(static_cast<int>(info.lastStatusCode));
                const bool failed = !confirmed_ && is_failure_status(status);
                provider_.post({leg_,
                                failed ? TelephonyEventType::Error : TelephonyEventType::Ended,
                                std::chrono::system_clock::now(), status});
            }
        } catch (const pj::Error& err) {
            logging::error("Call state handler error", {kv("leg", leg_),
                                                        kv("reason", err.reason),
                                                        kv("status", err.status)});
        } catch (const std::exception& ex) {
            logging::error("Call state handler exception", {kv("leg", leg_),
                                                            kv("error", ex.what())});
        }
    }

    void onCallMediaState(pj::OnCallMediaStateParam& prm) override {
        (void)prm;
        try {
            open_media();
        } catch (const std::exception& ex) {
            logging::error("Call media handler exception", {kv("leg", leg_),
                                                            kv("error", ex.what())});
        }
    }

    void play(const std::string& resource) {
        std::lock_guard<std::mutex> lock(media_mutex_);
        if (!media_) {
            throw TelephonyError("media not ready on leg " + leg_);
        }
        player_.reset();
        auto player = std::make_unique<pj::AudioMediaPlayer>();
        try {
            // Flag 0 loops the file until the player is destroyed.
            player->createPlayer(resource, 0);
            player->startTransmit(*media_);
        } catch (const pj::Error& err) {
            throw TelephonyError("cannot play " + resource + ": " + err.reason);
        }
        player_ = std::move(player);
    }

    void open_stream(LegAudioStream::FrameHandler on_frame, int clock_rate, int frame_time_usec) {
        std::lock_guard<std::mutex> lock(media_mutex_);
        if (!media_) {
            throw TelephonyError("media not ready on leg " + leg_);
        }
        close_stream_locked();

        pj::MediaFormatAudio format;
        format.type = PJMEDIA_TYPE_AUDIO;
        format.clockRate = static_cast<unsigned>(clock_rate);
        format.channelCount = 1;
        format.bitsPerSample = 16;
        format.frameTimeUsec = static_cast<unsigned>(frame_time_usec);

        // Ten seconds of queued speech at most.
        auto port = std::make_unique<LegMediaPort>(std::move(on_frame),
                                                   static_cast<size_t>(clock_rate) * 10);
        try {
            port->createPort("wt/stream/" + leg_, format);
            media_->startTransmit(*port);
            port->startTransmit(*media_);
        } catch (const pj::Error& err) {
            throw TelephonyError("cannot open audio stream on " + leg_ + ": " + err.reason);
        }
        stream_port_ = std::move(port);
    }

    void write_stream(const std::vector<int16_t>& samples) {
        std::lock_guard<std::mutex> lock(media_mutex_);
        if (stream_port_) {
            stream_port_->play(samples);
        }
    }

    void close_stream() {
        std::lock_guard<std::mutex> lock(media_mutex_);
        close_stream_locked();
    }

    void stop_playback() {
        std::lock_guard<std::mutex> lock(media_mutex_);
        stop_player_locked();
    }

    void bridge(PjLegCall& other) {
        std::scoped_lock lock(media_mutex_, other.media_mutex_);
        if (!media_ || !other.media_) {
            throw TelephonyError("media not ready for bridge: " + leg_ + ", " + other.leg_);
        }
        stop_player_locked();
        other.stop_player_locked();
        try {
            media_->startTransmit(*other.media_);
            other.media_->startTransmit(*media_);
        } catch (const pj::Error& err) {
            throw TelephonyError("bridge failed: " + err.reason);
        }
        peer_ = other.leg_;
        other.peer_ = leg_;
    }

    void unbridge(PjLegCall& other) {
        std::scoped_lock lock(media_mutex_, other.media_mutex_);
        try {
            if (media_ && other.media_) {
                media_->stopTransmit(*other.media_);
                other.media_->stopTransmit(*media_);
            }
        } catch (const pj::Error& err) {
            logging::warn("Unbridge failed", {kv("leg", leg_), kv("reason", err.reason)});
        }
        peer_.clear();
        other.peer_.clear();
    }

    std::string peer() const {
        std::lock_guard<std::mutex> lock(media_mutex_);
        return peer_;
    }

    void end() {
        pj::CallOpParam prm(true);
        pj::Call::hangup(prm);
    }

private:
    void open_media() {
        std::lock_guard<std::mutex> lock(media_mutex_);
        if (media_) {
            return;
        }
        try {
            media_ = std::make_unique<pj::AudioMedia>(getAudioMedia(-1));
        } catch (const pj::Error& err) {
            logging::debug("Call media not available", {kv("leg", leg_),
                                                        kv("reason", err.reason)});
        }
    }

    void close_media() {
        std::lock_guard<std::mutex> lock(media_mutex_);
        player_.reset();
        close_stream_locked();
        media_.reset();
    }

    void close_stream_locked() {
        if (!stream_port_) {
            return;
        }
        try {
            if (media_) {
                media_->stopTransmit(*stream_port_);
                stream_port_->stopTransmit(*media_);
            }
        } catch (const pj::Error& err) {
            logging::debug("Audio stream stop failed", {kv("leg", leg_),
                                                        kv("reason", err.reason)});
        }
        stream_port_.reset();
    }

    void stop_player_locked() {
        if (!player_) {
            return;
        }
        try {
            if (media_) {
                player_->stopTransmit(*media_);
            }
        } catch (const pj::Error& err) {
            logging::debug("Player stop failed", {kv("leg", leg_), kv("reason", err.reason)});
        }
        player_.reset();
    }

    PjTelephonyProvider& provider_;
    const LegId leg_;
    bool confirmed_ = false;
    mutable std::mutex media_mutex_;
    std::unique_ptr<pj::AudioMedia> media_;
    std::unique_ptr<pj::AudioMediaPlayer> player_;
    std::unique_ptr<LegMediaPort> stream_port_;
    LegId peer_;
};

void PjAccount::onRegState(pj::OnRegStateParam& prm) {
    try {
        const int status_code = static_cast<int>(prm.code);
        if (status_code / 100 == 5) {
            logging::error("SIP registration server error", {kv("status", status_code),
                                                             kv("reason", prm.reason)});
        } else if (status_code == 408) {
            logging::warn("SIP registration timeout", {kv("status", status_code),
                                                       kv("reason", prm.reason)});
        } else if (status_code == 200) {
            logging::info("SIP registration successful.");
        } else if (status_code != 0) {
            logging::warn("SIP registration failed", {kv("status", status_code),
                                                      kv("reason", prm.reason)});
        }
    } catch (const std::exception& ex) {
        logging::error("Exception in onRegState", {kv("error_type", typeid(ex).name()),
                                                   kv("error", ex.what())});
    }
}

void PjAccount::onIncomingCall(pj::OnIncomingCallParam& iprm) {
    logging::info("Inbound call rejected", {kv("call_id", iprm.callId)});
    try {
        pj::Call call(*this, iprm.callId);
        pj::CallOpParam prm(true);
        prm.statusCode = PJSIP_SC_FORBIDDEN;
        call.hangup(prm);
    } catch (const pj::Error& err) {
        logging::warn("Inbound call reject failed", {kv("call_id", iprm.callId),
                                                     kv("reason", err.reason)});
    }
}

PjTelephonyProvider::PjTelephonyProvider(const Config& config) : config_(config) {}

PjTelephonyProvider::~PjTelephonyProvider() {
    shutdown();
}

void PjTelephonyProvider::init() {
    auto logger = logging::get_logger();
    endpoint_ = std::make_unique<pj::Endpoint>();
    endpoint_->libCreate();

    pj::EpConfig ep_cfg;
    ep_cfg.uaConfig.threadCnt = config_.ua_zero_thread_cnt ? 0 : 1;
    ep_cfg.uaConfig.mainThreadOnly = config_.ua_main_thread_only;
    ep_cfg.uaConfig.maxCalls = static_cast<unsigned>(config_.sip_max_calls);
    ep_cfg.medConfig.threadCnt = 1;
    ep_cfg.medConfig.hasIoqueue = true;
    ep_cfg.medConfig.ecTailLen = static_cast<unsigned>(config_.ec_tail_len);
    ep_cfg.medConfig.sndAutoCloseTime = -1;
    ep_cfg.logConfig.level = static_cast<unsigned>(config_.pjsip_log_level);
    ep_cfg.logConfig.consoleLevel = static_cast<unsigned>(config_.pjsip_console_log_level);
    if (config_.log_filename) {
        ep_cfg.logConfig.filename = *config_.log_filename;
    }
    if (!config_.sip_stun_servers.empty()) {
        pj::StringVector stun_servers;
        for (const auto& stun_server : config_.sip_stun_servers) {
            stun_servers.push_back(stun_server);
        }
        ep_cfg.uaConfig.stunServer = stun_servers;
    }
    endpoint_->libInit(ep_cfg);

    for (const auto& item : config_.codecs_priority) {
        endpoint_->codecSetPriority(item.first, static_cast<pj_uint8_t>(item.second));
    }
    for (const auto& codec : endpoint_->codecEnum2()) {
        logger->info("Supported codec. [codec_id={}, priority={}]", codec.codecId,
                     static_cast<int>(codec.priority));
    }
    if (config_.sip_null_device) {
        endpoint_->audDevManager().setNullDev();
    }
    pj::TransportConfig sip_tp_config;
    sip_tp_config.port = static_cast<unsigned>(config_.sip_port);
    endpoint_->transportCreate(PJSIP_TRANSPORT_UDP, sip_tp_config);
    if (config_.sip_use_tcp) {
        endpoint_->transportCreate(PJSIP_TRANSPORT_TCP, sip_tp_config);
    }
    endpoint_->libStart();

    pj::AccountConfig account_cfg;
    if (config_.sip_caller_id) {
        account_cfg.idUri = "\"" + *config_.sip_caller_id + "\" <sip:" + config_.sip_user +
                            "@" + config_.sip_domain + ">";
    } else {
        account_cfg.idUri = "sip:" + config_.sip_user + "@" + config_.sip_domain;
    }
    account_cfg.regConfig.registrarUri =
        "sip:" + config_.sip_domain + (config_.sip_use_tcp ? ";transport=tcp" : "");
    pj::AuthCredInfo cred("digest", "*", config_.sip_login, 0, config_.sip_password);
    account_cfg.sipConfig.authCreds.push_back(cred);
    if (!config_.sip_proxy_servers.empty()) {
        pj::StringVector proxy_servers;
        for (const auto& proxy_server : config_.sip_proxy_servers) {
            proxy_servers.push_back(proxy_server);
        }
        account_cfg.sipConfig.proxies = proxy_servers;
    }
    account_cfg.natConfig.iceEnabled = config_.sip_use_ice;

    account_ = std::make_unique<PjAccount>();
    account_->create(account_cfg);

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = false;
    }
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
    initialized_ = true;
    logging::info("SIP endpoint started", {kv("domain", config_.sip_domain),
                                           kv("port", config_.sip_port)});
}

void PjTelephonyProvider::shutdown() {
    if (!initialized_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    try {
        if (endpoint_) {
            endpoint_->hangupAllCalls();
        }
    } catch (const pj::Error& err) {
        logging::warn("Hangup all calls failed", {kv("reason", err.reason)});
    }
    {
        std::lock_guard<std::mutex> lock(legs_mutex_);
        legs_.clear();
    }
    account_.reset();
    if (endpoint_) {
        try {
            endpoint_->libDestroy();
        } catch (const pj::Error& err) {
            logging::error("PJSIP shutdown error", {kv("reason", err.reason),
                                                    kv("status", err.status)});
        }
        endpoint_.reset();
    }
    logging::info("SIP endpoint stopped");
}

int PjTelephonyProvider::handle_events() {
    if (!endpoint_) {
        return 0;
    }
    try {
        const auto delay_ms = static_cast<unsigned>(config_.events_delay * 1000.0);
        return endpoint_->libHandleEvents(delay_ms);
    } catch (const pj::Error& err) {
        logging::error("PJSIP handle events error", {kv("reason", err.reason),
                                                     kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error("PJSIP handle events exception", {kv("error", ex.what())});
    }
    return 0;
}

std::string PjTelephonyProvider::to_sip_uri(const std::string& destination) const {
    if (destination.rfind("sip:", 0) == 0 || destination.rfind("sips:", 0) == 0) {
        return destination;
    }
    return "sip:" + destination + "@" + config_.sip_domain +
           (config_.sip_use_tcp ? ";transport=tcp" : "");
}

LegId PjTelephonyProvider::dial(const std::string& destination) {
    if (!initialized_ || !account_) {
        throw TelephonyError("SIP endpoint is not initialized");
    }
    ensure_pj_thread_registered("wt_control");
    const auto uri = to_sip_uri(destination);

    std::lock_guard<std::mutex> lock(legs_mutex_);
    const LegId leg = "leg-" + std::to_string(++next_leg_);
    auto call = std::make_shared<PjLegCall>(*this, *account_, leg);
    try {
        pj::CallOpParam prm(true);
        call->makeCall(uri, prm);
    } catch (const pj::Error& err) {
        throw TelephonyError("dial " + uri + " rejected: " + err.reason);
    }
    legs_.emplace(leg, call);
    logging::info("Outbound leg dialing", {kv("leg", leg), logging::kv_number("uri", uri)});
    return leg;
}

void PjTelephonyProvider::hangup(const LegId& leg) {
    ensure_pj_thread_registered("wt_control");
    std::lock_guard<std::mutex> lock(legs_mutex_);
    const auto it = legs_.find(leg);
    if (it == legs_.end()) {
        return;
    }
    try {
        it->second->end();
    } catch (const pj::Error& err) {
        logging::debug("Hangup ignored", {kv("leg", leg), kv("reason", err.reason)});
    }
}

void PjTelephonyProvider::play_audio(const LegId& leg, const std::string& resource) {
    ensure_pj_thread_registered("wt_control");
    auto call = find_leg(leg);
    if (!call) {
        throw TelephonyError("unknown leg " + leg);
    }
    call->play(resource);
}

void PjTelephonyProvider::stop_audio(const LegId& leg) {
    ensure_pj_thread_registered("wt_control");
    if (auto call = find_leg(leg)) {
        call->stop_playback();
    }
}

void PjTelephonyProvider::attach_audio(const LegId& first, const LegId& second) {
    ensure_pj_thread_registered("wt_control");
    auto a = find_leg(first);
    auto b = find_leg(second);
    if (!a || !b) {
        throw TelephonyError("cannot bridge unknown legs " + first + ", " + second);
    }
    a->bridge(*b);
    logging::info("Legs bridged", {kv("first", first), kv("second", second)});
}

void PjTelephonyProvider::detach_audio(const LegId& leg) {
    ensure_pj_thread_registered("wt_control");
    auto call = find_leg(leg);
    if (!call) {
        return;
    }
    const auto peer = call->peer();
    if (peer.empty()) {
        return;
    }
    if (auto other = find_leg(peer)) {
        call->unbridge(*other);
    }
}

void PjTelephonyProvider::open_stream(const LegId& leg, FrameHandler on_frame) {
    ensure_pj_thread_registered("wt_control");
    auto call = find_leg(leg);
    if (!call) {
        throw TelephonyError("unknown leg " + leg);
    }
    call->open_stream(std::move(on_frame), config_.audio_clock_rate, config_.frame_time_usec);
    logging::debug("Audio stream opened", {kv("leg", leg),
                                           kv("clock_rate", config_.audio_clock_rate)});
}

void PjTelephonyProvider::write_stream(const LegId& leg, const std::vector<int16_t>& samples) {
    if (auto call = find_leg(leg)) {
        call->write_stream(samples);
    }
}

void PjTelephonyProvider::close_stream(const LegId& leg) {
    ensure_pj_thread_registered("wt_control");
    if (auto call = find_leg(leg)) {
        call->close_stream();
        logging::debug("Audio stream closed", {kv("leg", leg)});
    }
}

void PjTelephonyProvider::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

void PjTelephonyProvider::post(TelephonyEvent event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

void PjTelephonyProvider::dispatch_loop() {
    ensure_pj_thread_registered("wt_dispatch");
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
        logging::debug("Telephony event", {kv("leg", event.leg),
                                           kv("type", to_string(event.type)),
                                           kv("detail", event.detail)});
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            if (handler_) {
                handler_(event);
            }
        }
        if (event.type != TelephonyEventType::Connected) {
            forget_leg(event.leg);
        }
    }
}

std::shared_ptr<PjLegCall> PjTelephonyProvider::find_leg(const LegId& leg) const {
    std::lock_guard<std::mutex> lock(legs_mutex_);
    const auto it = legs_.find(leg);
    return it == legs_.end() ? nullptr : it->second;
}

void PjTelephonyProvider::forget_leg(const LegId& leg) {
    auto call = find_leg(leg);
    if (!call) {
        return;
    }
    // A bridged call ends for both parties.
    const auto peer = call->peer();
    if (!peer.empty()) {
        if (auto other = find_leg(peer)) {
            call->unbridge(*other);
        }
        hangup(peer);
    }
    std::lock_guard<std::mutex> lock(legs_mutex_);
    legs_.erase(leg);
}

}
