#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <pjsua2.hpp>

#include "warm_transfer/config.hpp"
#include "warm_transfer/telephony/audio_stream.hpp"
#include "warm_transfer/telephony/provider.hpp"

namespace warm_transfer {

class PjLegCall;

void ensure_pj_thread_registered(const char* name);

class PjAccount : public pj::Account {
public:
    void onRegState(pj::OnRegStateParam& prm) override;
    void onIncomingCall(pj::OnIncomingCallParam& iprm) override;
};

// TelephonyProvider over a pjsua2 endpoint. pjsip callbacks only queue
// events; a dispatcher thread hands them to the registered handler. Each
// leg can also carry a PCM stream for the speech backend.
class PjTelephonyProvider : public TelephonyProvider, public LegAudioStream {
public:
    explicit PjTelephonyProvider(const Config& config);
    ~PjTelephonyProvider() override;

    PjTelephonyProvider(const PjTelephonyProvider&) = delete;
    PjTelephonyProvider& operator=(const PjTelephonyProvider&) = delete;

    void init();
    void shutdown();
    // Polls the pjsip event loop once; returns the number of processed events.
    int handle_events();

    LegId dial(const std::string& destination) override;
    void hangup(const LegId& leg) override;
    void play_audio(const LegId& leg, const std::string& resource) override;
    void stop_audio(const LegId& leg) override;
    void attach_audio(const LegId& first, const LegId& second) override;
    void detach_audio(const LegId& leg) override;
    void set_event_handler(EventHandler handler) override;

    void open_stream(const LegId& leg, FrameHandler on_frame) override;
    void write_stream(const LegId& leg, const std::vector<int16_t>& samples) override;
    void close_stream(const LegId& leg) override;

    std::string to_sip_uri(const std::string& destination) const;

private:
    friend class PjLegCall;

    void post(TelephonyEvent event);
    void dispatch_loop();
    std::shared_ptr<PjLegCall> find_leg(const LegId& leg) const;
    void forget_leg(const LegId& leg);

    const Config& config_;
    std::unique_ptr<pj::Endpoint> endpoint_;
    std::unique_ptr<PjAccount> account_;
    std::atomic<bool> initialized_{false};

    mutable std::mutex legs_mutex_;
    std::unordered_map<LegId, std::shared_ptr<PjLegCall>> legs_;
    unsigned long next_leg_ = 0;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<TelephonyEvent> queue_;
    bool stopping_ = false;
    std::thread dispatcher_;

    std::mutex handler_mutex_;
    EventHandler handler_;
};

}
