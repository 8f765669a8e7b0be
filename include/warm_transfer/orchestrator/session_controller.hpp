#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "warm_transfer/agent/conversation_agent.hpp"
#include "warm_transfer/config.hpp"
#include "warm_transfer/core/cancellation.hpp"
#include "warm_transfer/core/event_channel.hpp"
#include "warm_transfer/orchestrator/transfer_state.hpp"
#include "warm_transfer/telephony/call_session.hpp"

namespace warm_transfer {

// State machine of one outbound call. A single control thread consumes the
// session's event channel; the representative dial and the briefing
// generation run on helper threads that report back through the same channel.
class SessionController {
public:
    using LegBinder = std::function<void(const LegId&)>;

    SessionController(std::string session_id,
                      CallRequest request,
                      SessionConfig config,
                      TelephonyProvider& telephony,
                      SpeechGateway& speech,
                      ConversationCapability& capability,
                      LookupService& lookup);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Called with every leg id the session creates, before the leg can
    // connect, so provider events can be routed back here.
    void set_leg_binder(LegBinder binder);

    void start();
    void stop();
    void join();
    bool wait_finished(std::chrono::milliseconds timeout) const;

    // Event intake; safe from any thread.
    void on_telephony_event(const TelephonyEvent& event);
    void on_transcript(const TranscriptEvent& event);

    TransferSessionSnapshot snapshot() const;
    const std::string& id() const { return session_id_; }
    bool finished() const;

private:
    void run();
    void connect_customer();
    void event_loop();
    void handle_event(const SessionEvent& event);
    void handle_leg_ended(const SessionEvent& event);
    void handle_utterance(const SessionEvent& event);
    void handle_rep_connected(const SessionEvent& event);
    void check_deadlines();
    // Throws BriefingTimeout once the acknowledgement deadline has passed.
    void check_acknowledged(Clock::time_point now) const;
    Clock::time_point next_deadline() const;

    void begin_transfer(const TransferDecision& decision);
    void start_rep_dial(int attempt);
    void start_briefing_generation(int attempt);
    void present_briefing(const std::string& text);
    void merge();
    void customer_left(const std::string& reason);
    void rep_failed(TransferState abort_state, const std::string& reason);
    void begin_closing(TransferState final_state, const std::string& reason);
    void finalize(TransferState final_state, const std::string& reason);

    void transition(TransferState to, const std::string& reason);
    void record_state(TransferState to, const std::string& reason);
    TransferState current_state() const;
    void join_helpers();
    AgentContext qualifier_context() const;

    const std::string session_id_;
    const CallRequest request_;
    const SessionConfig config_;
    ConversationCapability& capability_;
    LookupService& lookup_;

    CallSession customer_;
    CallSession representative_;
    ConversationAgent qualifier_;
    std::unique_ptr<ConversationAgent> presenter_;
    LegBinder leg_binder_;

    EventChannel channel_;
    CancellationToken session_token_;
    CancellationToken transfer_token_;
    std::thread control_thread_;
    std::thread dial_thread_;
    std::vector<std::thread> briefing_threads_;

    // Control-thread state.
    ConversationState frozen_;
    bool finalized_ = false;
    bool presented_ = false;
    std::optional<std::string> pending_briefing_;
    Clock::time_point qualifying_started_;
    Clock::time_point last_customer_activity_;
    Clock::time_point hold_started_;
    Clock::time_point briefing_started_;
    std::optional<Clock::time_point> generation_deadline_;
    std::optional<Clock::time_point> ack_deadline_;
    std::optional<Clock::time_point> closing_deadline_;
    TransferState closing_state_ = TransferState::Finished;
    std::string closing_reason_;

    // Shared with snapshot readers.
    mutable std::mutex mutex_;
    mutable std::condition_variable finished_cv_;
    TransferState state_ = TransferState::Connecting;
    std::vector<StateChange> history_;
    std::optional<std::string> briefing_;
    std::optional<TransferReason> transfer_reason_;
    int attempts_ = 0;
    bool finished_ = false;
    std::string end_reason_;
    std::chrono::system_clock::time_point created_at_;
};

}
