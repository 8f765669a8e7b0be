#include "warm_transfer/orchestrator/session_controller.hpp"

#include <algorithm>
#include <utility>

#include "warm_transfer/agent/briefing.hpp"
#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/metrics.hpp"

namespace warm_transfer {

namespace {

constexpr auto kIdleWakeup = std::chrono::seconds(1);
const char* const kCustomerLeftReason = "customer disconnected during hold";

double seconds_since(Clock::time_point start) {
    const std::chrono::duration<double> elapsed = Clock::now() - start;
    return elapsed.count();
}

}

SessionController::SessionController(std::string session_id,
                                     CallRequest request,
                                     SessionConfig config,
                                     TelephonyProvider& telephony,
                                     SpeechGateway& speech,
                                     ConversationCapability& capability,
                                     LookupService& lookup)
    : session_id_(std::move(session_id)),
      request_(std::move(request)),
      config_(std::move(config)),
      capability_(capability),
      lookup_(lookup),
      customer_(telephony, speech, ParticipantRole::Customer,
                config_.policy.customer_dial_timeout),
      representative_(telephony, speech, ParticipantRole::Representative,
                      config_.policy.rep_dial_timeout),
      qualifier_(customer_, capability, lookup),
      created_at_(std::chrono::system_clock::now()) {}

SessionController::~SessionController() {
    stop();
    join();
}

void SessionController::set_leg_binder(LegBinder binder) {
    leg_binder_ = std::move(binder);
    customer_.set_on_leg_created(leg_binder_);
    representative_.set_on_leg_created(leg_binder_);
}

void SessionController::start() {
    if (control_thread_.joinable()) {
        return;
    }
    info("Session starting", {kv("session_id", session_id_),
                              kv_number("destination", request_.destination),
                              kv("name", request_.name)});
    control_thread_ = std::thread([this]() { run(); });
}

void SessionController::stop() {
    session_token_.cancel();
    SessionEvent event;
    event.kind = SessionEvent::Kind::Stop;
    channel_.push(std::move(event));
}

void SessionController::join() {
    if (control_thread_.joinable() && control_thread_.get_id() != std::this_thread::get_id()) {
        control_thread_.join();
    }
}

bool SessionController::wait_finished(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this]() { return finished_; });
}

bool SessionController::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

void SessionController::on_telephony_event(const TelephonyEvent& event) {
    SessionEvent session_event;
    session_event.leg = event.leg;
    session_event.text = event.detail;
    if (customer_.handle_event(event)) {
        session_event.role = ParticipantRole::Customer;
    } else if (representative_.handle_event(event)) {
        session_event.role = ParticipantRole::Representative;
    } else {
        return;
    }
    switch (event.type) {
        case TelephonyEventType::Connected:
            session_event.kind = SessionEvent::Kind::LegConnected;
            break;
        case TelephonyEventType::Ended:
            session_event.kind = SessionEvent::Kind::LegEnded;
            break;
        case TelephonyEventType::Error:
            session_event.kind = SessionEvent::Kind::LegError;
            break;
    }
    channel_.push(std::move(session_event));
}

void SessionController::on_transcript(const TranscriptEvent& event) {
    SessionEvent session_event;
    session_event.kind = SessionEvent::Kind::Utterance;
    session_event.leg = event.leg;
    session_event.text = event.text;
    if (customer_.id() == event.leg) {
        session_event.role = ParticipantRole::Customer;
    } else if (representative_.id() == event.leg) {
        session_event.role = ParticipantRole::Representative;
    } else {
        debug("Transcript for stale leg dropped", {kv("session_id", session_id_),
                                                   kv("leg", event.leg)});
        return;
    }
    channel_.push(std::move(session_event));
}

TransferSessionSnapshot SessionController::snapshot() const {
    TransferSessionSnapshot result;
    result.session_id = session_id_;
    result.customer = customer_.leg();
    if (result.customer.id.empty()) {
        result.customer.role = ParticipantRole::Customer;
        result.customer.destination = request_.destination;
    }
    if (representative_.id()) {
        result.representative = representative_.leg();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    result.state = state_;
    result.history = history_;
    result.briefing = briefing_;
    result.transfer_reason = transfer_reason_;
    result.transfer_attempts = attempts_;
    result.finished = finished_;
    result.end_reason = end_reason_;
    result.created_at = created_at_;
    return result;
}

void SessionController::run() {
    try {
        connect_customer();
        event_loop();
    } catch (const std::exception& ex) {
        error("Session failed", {kv("session_id", session_id_),
                                 kv("state", to_string(current_state())),
                                 kv("error", ex.what())});
        finalize(TransferState::Finished, std::string("internal error: ") + ex.what());
    }
    transfer_token_.cancel();
    join_helpers();
    channel_.close();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

void SessionController::connect_customer() {
    if (session_token_.stop_requested()) {
        finalize(TransferState::Finished, "stopped before dialing");
        return;
    }
    try {
        customer_.dial(request_.destination, session_token_);
    } catch (const SessionCancelled&) {
        finalize(TransferState::Finished, "stopped before the customer answered");
        return;
    } catch (const Timeout& ex) {
        finalize(TransferState::AbortedCustomerUnreachable, ex.what());
        return;
    } catch (const DialFailure& ex) {
        finalize(TransferState::AbortedCustomerUnreachable, ex.what());
        return;
    }

    transition(TransferState::Qualifying, "customer answered");
    qualifying_started_ = Clock::now();
    last_customer_activity_ = qualifying_started_;
    try {
        qualifier_.start(AgentRole::OutboundQualifier, config_.script, qualifier_context());
    } catch (const LegEndedUnexpectedly& ex) {
        if (!customer_.is_live()) {
            finalize(TransferState::Finished, "customer hung up");
            return;
        }
        warn("Greeting could not be spoken", {kv("session_id", session_id_),
                                              kv("error", ex.what())});
    } catch (const WarmTransferError& ex) {
        error("Qualifier could not start", {kv("session_id", session_id_),
                                            kv("error", ex.what())});
        finalize(TransferState::Finished, std::string("speech unavailable: ") + ex.what());
    }
}

void SessionController::event_loop() {
    while (!finalized_) {
        auto event = channel_.pop_until(next_deadline());
        if (event) {
            handle_event(*event);
        }
        if (!finalized_) {
            check_deadlines();
        }
    }
}

Clock::time_point SessionController::next_deadline() const {
    auto deadline = Clock::now() + kIdleWakeup;
    for (const auto& candidate : {generation_deadline_, ack_deadline_, closing_deadline_}) {
        if (candidate) {
            deadline = std::min(deadline, *candidate);
        }
    }
    if (current_state() == TransferState::Qualifying) {
        deadline = std::min(deadline,
                            last_customer_activity_ + config_.policy.user_silence_timeout);
        deadline = std::min(deadline,
                            qualifying_started_ + config_.policy.max_qualifying_duration);
    }
    return deadline;
}

void SessionController::handle_event(const SessionEvent& event) {
    debug("Session event", {kv("session_id", session_id_),
                            kv("event", to_string(event.kind)),
                            kv("role", to_string(event.role)),
                            kv("state", to_string(current_state()))});
    switch (event.kind) {
        case SessionEvent::Kind::Stop:
            if (closing_deadline_) {
                finalize(closing_state_, closing_reason_);
            } else {
                finalize(TransferState::Finished, "session stopped");
            }
            return;
        case SessionEvent::Kind::LegConnected:
            return;
        case SessionEvent::Kind::LegError:
            warn("Leg error", {kv("session_id", session_id_),
                               kv("leg", event.leg),
                               kv("detail", event.text)});
            return;
        case SessionEvent::Kind::LegEnded:
            handle_leg_ended(event);
            return;
        case SessionEvent::Kind::Utterance:
            handle_utterance(event);
            return;
        case SessionEvent::Kind::RepDialStarted:
            if (event.attempt == attempts_ &&
                current_state() == TransferState::HoldRequested) {
                transition(TransferState::DialingRep, "dialing representative");
            }
            return;
        case SessionEvent::Kind::RepDialSucceeded:
            if (event.attempt == attempts_) {
                handle_rep_connected(event);
            }
            return;
        case SessionEvent::Kind::RepDialFailed: {
            const auto state = current_state();
            if (event.attempt == attempts_ &&
                (state == TransferState::HoldRequested || state == TransferState::DialingRep)) {
                rep_failed(TransferState::AbortedNoAnswer, event.text);
            }
            return;
        }
        case SessionEvent::Kind::BriefingReady:
            if (event.attempt != attempts_) {
                return;
            }
            pending_briefing_ = event.text;
            if (current_state() == TransferState::Briefing && !presented_) {
                present_briefing(event.text);
            }
            return;
    }
}

void SessionController::handle_leg_ended(const SessionEvent& event) {
    const auto state = current_state();
    if (event.role == ParticipantRole::Customer) {
        if (closing_deadline_) {
            finalize(closing_state_, closing_reason_);
        } else if (state == TransferState::Qualifying) {
            finalize(TransferState::Finished, "customer hung up");
        } else if (is_transfer_in_progress(state)) {
            customer_left(kCustomerLeftReason);
        }
        return;
    }
    if (state == TransferState::Briefing || state == TransferState::Merging) {
        rep_failed(TransferState::AbortedBriefingFailed,
                   "representative hung up during briefing");
    }
}

void SessionController::handle_utterance(const SessionEvent& event) {
    const auto state = current_state();
    if (event.role == ParticipantRole::Customer) {
        last_customer_activity_ = Clock::now();
        qualifier_.on_utterance(event.text, Speaker::Customer);
        if (state != TransferState::Qualifying || closing_deadline_) {
            return;
        }
        const auto decision = qualifier_.decide_transfer();
        if (decision.requested) {
            begin_transfer(decision);
        } else if (qualifier_.end_requested()) {
            begin_closing(TransferState::Finished, "conversation closed by agent");
        }
        return;
    }

    if (state != TransferState::Briefing || !presenter_ || !presented_) {
        return;
    }
    presenter_->on_utterance(event.text, Speaker::Representative);
    if (presenter_->voicemail_detected()) {
        rep_failed(TransferState::AbortedBriefingFailed, "representative voicemail");
    } else if (presenter_->ready_acknowledged()) {
        merge();
    }
}

void SessionController::handle_rep_connected(const SessionEvent& event) {
    if (current_state() != TransferState::DialingRep) {
        representative_.hangup();
        return;
    }
    // A representative answering at the same moment the customer leaves must
    // not be briefed.
    if (!customer_.is_live()) {
        customer_left(kCustomerLeftReason);
        return;
    }
    if (!representative_.is_live()) {
        rep_failed(TransferState::AbortedNoAnswer, "representative leg ended on answer");
        return;
    }
    Metrics::instance().observe_phase("rep_dial", seconds_since(hold_started_));
    transition(TransferState::Briefing, "representative answered");
    info("Representative connected", {kv("session_id", session_id_), kv("leg", event.leg)});
    briefing_started_ = Clock::now();
    if (pending_briefing_) {
        present_briefing(*pending_briefing_);
    } else if (generation_deadline_ && Clock::now() >= *generation_deadline_) {
        warn("Briefing generation timed out, using template",
             {kv("session_id", session_id_)});
        present_briefing(build_briefing(frozen_, request_.phone_number).text());
    }
}

void SessionController::check_deadlines() {
    const auto now = Clock::now();
    if (closing_deadline_) {
        if (now >= *closing_deadline_) {
            finalize(closing_state_, closing_reason_);
        }
        return;
    }

    const auto state = current_state();
    if (state == TransferState::Qualifying) {
        if (now - last_customer_activity_ >= config_.policy.user_silence_timeout) {
            qualifier_.say(config_.script.messages.closing);
            begin_closing(TransferState::Finished, "customer silence timeout");
        } else if (now - qualifying_started_ >= config_.policy.max_qualifying_duration) {
            qualifier_.say(config_.script.messages.closing);
            begin_closing(TransferState::Finished, "maximum qualifying duration reached");
        }
        return;
    }
    if (state != TransferState::Briefing) {
        return;
    }
    if (!presented_ && generation_deadline_ && now >= *generation_deadline_) {
        warn("Briefing generation timed out, using template", {kv("session_id", session_id_)});
        present_briefing(build_briefing(frozen_, request_.phone_number).text());
    } else if (presented_ && ack_deadline_) {
        try {
            check_acknowledged(now);
        } catch (const BriefingTimeout& ex) {
            warn("Briefing not acknowledged, merging",
                 {kv("session_id", session_id_), kv("error", ex.what())});
            merge();
        }
    }
}

void SessionController::check_acknowledged(Clock::time_point now) const {
    if (now >= *ack_deadline_) {
        throw BriefingTimeout("no acknowledgement within " +
                              std::to_string(config_.policy.briefing_ack_timeout.count()) +
                              "ms");
    }
}

void SessionController::begin_transfer(const TransferDecision& decision) {
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempt = ++attempts_;
        transfer_reason_ = decision.reason;
    }
    Metrics::instance().increment_transfer_attempt();
    frozen_ = qualifier_.state();
    info("Transfer requested", {kv("session_id", session_id_),
                                kv("reason", to_string(decision.reason)),
                                kv("trigger", decision.trigger),
                                kv("attempt", attempt)});

    qualifier_.say(config_.script.messages.hold_announcement);
    qualifier_.mute();
    transition(TransferState::HoldRequested,
               std::string("transfer requested: ") + to_string(decision.reason));
    hold_started_ = Clock::now();
    try {
        customer_.play_audio(config_.policy.hold_music_path);
    } catch (const LegEndedUnexpectedly&) {
        customer_left(kCustomerLeftReason);
        return;
    } catch (const TelephonyError& ex) {
        error("Hold audio unavailable", {kv("session_id", session_id_), kv("error", ex.what())});
        rep_failed(TransferState::AbortedNoAnswer,
                   std::string("hold audio failed: ") + ex.what());
        return;
    }

    transfer_token_ = session_token_.child();
    presented_ = false;
    pending_briefing_.reset();
    ack_deadline_.reset();
    generation_deadline_ = hold_started_ + config_.policy.briefing_generation_timeout;
    start_briefing_generation(attempt);
    start_rep_dial(attempt);
}

void SessionController::start_rep_dial(int attempt) {
    if (dial_thread_.joinable()) {
        dial_thread_.join();
    }
    const auto token = transfer_token_;
    dial_thread_ = std::thread([this, attempt, token]() {
        SessionEvent started;
        started.kind = SessionEvent::Kind::RepDialStarted;
        started.role = ParticipantRole::Representative;
        started.attempt = attempt;
        channel_.push(std::move(started));

        std::string failure = "representative unavailable";
        for (int i = 1; i <= config_.policy.rep_dial_attempts; ++i) {
            if (token.stop_requested()) {
                return;
            }
            try {
                const auto leg = representative_.dial(config_.policy.representative_number, token);
                SessionEvent connected;
                connected.kind = SessionEvent::Kind::RepDialSucceeded;
                connected.leg = leg.id;
                connected.role = ParticipantRole::Representative;
                connected.attempt = attempt;
                channel_.push(std::move(connected));
                return;
            } catch (const SessionCancelled&) {
                debug("Representative dial cancelled", {kv("session_id", session_id_)});
                return;
            } catch (const std::exception& ex) {
                failure = ex.what();
            }
            warn("Representative dial attempt failed", {kv("session_id", session_id_),
                                                        kv("dial_attempt", i),
                                                        kv("error", failure)});
        }
        SessionEvent failed;
        failed.kind = SessionEvent::Kind::RepDialFailed;
        failed.role = ParticipantRole::Representative;
        failed.text = failure;
        failed.attempt = attempt;
        channel_.push(std::move(failed));
    });
}

void SessionController::start_briefing_generation(int attempt) {
    auto context = qualifier_context();
    briefing_threads_.emplace_back(
        [this, attempt, token = transfer_token_, frozen = frozen_, context]() {
            std::string text;
            try {
                text = ConversationAgent::synthesize_briefing(frozen, context, capability_);
            } catch (const std::exception& ex) {
                error("Briefing generation failed", {kv("session_id", session_id_),
                                                     kv("error", ex.what())});
                text = build_briefing(frozen, context.phone_number).text();
            }
            if (token.stop_requested()) {
                return;
            }
            SessionEvent ready;
            ready.kind = SessionEvent::Kind::BriefingReady;
            ready.role = ParticipantRole::Representative;
            ready.text = std::move(text);
            ready.attempt = attempt;
            channel_.push(std::move(ready));
        });
}

void SessionController::present_briefing(const std::string& text) {
    presented_ = true;
    generation_deadline_.reset();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        briefing_ = text;
    }
    presenter_ = std::make_unique<ConversationAgent>(representative_, capability_, lookup_);
    auto context = qualifier_context();
    context.briefing = text;
    context.customer_transcript = frozen_.format_transcript();
    try {
        presenter_->start(AgentRole::BriefingPresenter, config_.script, std::move(context));
    } catch (const WarmTransferError& ex) {
        rep_failed(TransferState::AbortedBriefingFailed,
                   std::string("briefing could not be delivered: ") + ex.what());
        return;
    }
    ack_deadline_ = Clock::now() + config_.policy.briefing_ack_timeout;
}

void SessionController::merge() {
    const bool acknowledged = presenter_ && presenter_->ready_acknowledged();
    ack_deadline_.reset();
    transition(TransferState::Merging, acknowledged ? "representative ready"
                                                    : "briefing acknowledgement timed out");
    if (presenter_) {
        presenter_->say(config_.script.messages.connecting_rep);
    }
    try {
        customer_.attach_audio(representative_);
    } catch (const LegEndedUnexpectedly& ex) {
        if (!customer_.is_live()) {
            customer_left(kCustomerLeftReason);
        } else {
            rep_failed(TransferState::AbortedBriefingFailed, ex.what());
        }
        return;
    } catch (const WarmTransferError& ex) {
        rep_failed(TransferState::AbortedBriefingFailed,
                   std::string("merge failed: ") + ex.what());
        return;
    }

    transition(TransferState::Merged, "legs bridged");
    Metrics::instance().observe_phase("hold", seconds_since(hold_started_));
    Metrics::instance().observe_phase("briefing", seconds_since(briefing_started_));
    qualifier_.say(config_.script.messages.handoff);
    qualifier_.stop();
    presenter_->stop();
    customer_.release();
    representative_.release();
    finalize(TransferState::Completed, "customer and representative connected");
}

void SessionController::customer_left(const std::string& reason) {
    transfer_token_.cancel();
    representative_.hangup();
    finalize(TransferState::AbortedCustomerLeft, reason);
}

void SessionController::rep_failed(TransferState abort_state, const std::string& reason) {
    transfer_token_.cancel();
    representative_.hangup();
    if (presenter_) {
        presenter_->stop();
    }
    presented_ = false;
    ack_deadline_.reset();
    generation_deadline_.reset();
    if (!customer_.is_live()) {
        customer_left(kCustomerLeftReason);
        return;
    }

    warn("Transfer attempt failed", {kv("session_id", session_id_),
                                     kv("state", to_string(abort_state)),
                                     kv("reason", reason),
                                     kv("attempt", attempts_)});
    transition(abort_state, reason);
    try {
        customer_.stop_audio();
    } catch (const WarmTransferError& ex) {
        warn("Hold audio stop failed", {kv("session_id", session_id_), kv("error", ex.what())});
    }

    qualifier_.unmute();
    if (config_.policy.resume_after_failure &&
        attempts_ < config_.policy.max_transfer_attempts) {
        qualifier_.reset_decision();
        qualifier_.say(config_.script.messages.rep_unavailable);
        transition(TransferState::Qualifying, "resuming conversation after failed transfer");
        last_customer_activity_ = Clock::now();
        return;
    }
    qualifier_.say(config_.script.messages.apology_closing);
    begin_closing(abort_state, reason);
}

void SessionController::begin_closing(TransferState final_state, const std::string& reason) {
    qualifier_.mute();
    closing_state_ = final_state;
    closing_reason_ = reason;
    closing_deadline_ = Clock::now() + config_.policy.closing_grace;
    info("Closing call", {kv("session_id", session_id_),
                          kv("final_state", to_string(final_state)),
                          kv("reason", reason),
                          kv("grace", config_.policy.closing_grace)});
}

void SessionController::finalize(TransferState final_state, const std::string& reason) {
    if (finalized_) {
        return;
    }
    finalized_ = true;
    closing_deadline_.reset();
    ack_deadline_.reset();
    generation_deadline_.reset();
    transfer_token_.cancel();
    session_token_.cancel();

    const auto state = current_state();
    if (state != final_state) {
        if (!can_transition(state, final_state)) {
            warn("Forcing terminal state", {kv("session_id", session_id_),
                                            kv("from", to_string(state)),
                                            kv("to", to_string(final_state))});
        }
        record_state(final_state, reason);
    }
    qualifier_.stop();
    if (presenter_) {
        presenter_->stop();
    }
    if (final_state != TransferState::Completed) {
        representative_.hangup();
        customer_.hangup();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        end_reason_ = reason;
    }
    Metrics::instance().record_outcome(to_string(final_state));
    info("Session finished", {kv("session_id", session_id_),
                              kv("state", to_string(final_state)),
                              kv("reason", reason),
                              kv("attempts", attempts_)});
}

void SessionController::transition(TransferState to, const std::string& reason) {
    const auto from = current_state();
    if (!can_transition(from, to)) {
        throw WarmTransferError(std::string("illegal transition ") + to_string(from) + " -> " +
                                to_string(to));
    }
    record_state(to, reason);
}

void SessionController::record_state(TransferState to, const std::string& reason) {
    TransferState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        state_ = to;
        history_.push_back({from, to, reason, std::chrono::system_clock::now()});
    }
    info("Session state changed", {kv("session_id", session_id_),
                                   kv("from", to_string(from)),
                                   kv("to", to_string(to)),
                                   kv("reason", reason)});
}

TransferState SessionController::current_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SessionController::join_helpers() {
    if (dial_thread_.joinable()) {
        dial_thread_.join();
    }
    for (auto& thread : briefing_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    briefing_threads_.clear();
}

AgentContext SessionController::qualifier_context() const {
    AgentContext context;
    context.session_id = session_id_;
    context.phone_number = request_.phone_number;
    context.caller_name = request_.name;
    context.metadata = request_.metadata;
    return context;
}

}
