#include "warm_transfer/orchestrator/transfer_orchestrator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/metrics.hpp"

namespace warm_transfer {

TransferOrchestrator::TransferOrchestrator(TelephonyProvider& telephony,
                                           SpeechGateway& speech,
                                           ConversationCapability& capability,
                                           LookupService& lookup,
                                           SessionConfig defaults)
    : telephony_(telephony),
      speech_(speech),
      capability_(capability),
      lookup_(lookup),
      defaults_(std::move(defaults)),
      rng_(std::random_device{}()) {
    telephony_.set_event_handler([this](const TelephonyEvent& event) { router_.route(event); });
    speech_.set_transcript_handler(
        [this](const TranscriptEvent& event) { router_.route(event); });
}

TransferOrchestrator::~TransferOrchestrator() {
    stop_all();
    telephony_.set_event_handler(nullptr);
    speech_.set_transcript_handler(nullptr);
}

std::string TransferOrchestrator::place_call(CallRequest request) {
    return place_call(std::move(request), defaults_);
}

std::string TransferOrchestrator::place_call(CallRequest request, SessionConfig config) {
    if (request.destination.empty()) {
        throw WarmTransferError("destination is required");
    }
    std::shared_ptr<SessionController> session;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id = next_session_id();
        session = std::make_shared<SessionController>(session_id, std::move(request),
                                                      std::move(config), telephony_, speech_,
                                                      capability_, lookup_);
        sessions_[session_id] = session;
        order_.push_back(session_id);
    }
    std::weak_ptr<SessionController> weak = session;
    session->set_leg_binder([this, weak](const LegId& leg) {
        if (auto owner = weak.lock()) {
            router_.bind(leg, owner);
        }
    });
    Metrics::instance().increment_call_placed();
    session->start();
    info("Call placed", {kv("session_id", session_id)});
    return session_id;
}

std::shared_ptr<SessionController> TransferOrchestrator::session(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<TransferSessionSnapshot> TransferOrchestrator::snapshot(
    const std::string& session_id) const {
    const auto found = session(session_id);
    if (!found) {
        return std::nullopt;
    }
    return found->snapshot();
}

std::vector<TransferSessionSnapshot> TransferOrchestrator::snapshots() const {
    std::vector<std::shared_ptr<SessionController>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            sessions.push_back(sessions_.at(id));
        }
    }
    std::vector<TransferSessionSnapshot> result;
    result.reserve(sessions.size());
    for (const auto& item : sessions) {
        result.push_back(item->snapshot());
    }
    return result;
}

size_t TransferOrchestrator::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(sessions_.begin(), sessions_.end(),
                      [](const auto& item) { return !item.second->finished(); }));
}

void TransferOrchestrator::prune_finished(size_t keep) {
    std::vector<std::shared_ptr<SessionController>> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t finished = 0;
        for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
            if (sessions_.at(*it)->finished()) {
                ++finished;
            }
        }
        for (auto it = order_.begin(); it != order_.end() && finished > keep;) {
            auto session = sessions_.at(*it);
            if (!session->finished()) {
                ++it;
                continue;
            }
            removed.push_back(session);
            sessions_.erase(*it);
            it = order_.erase(it);
            --finished;
        }
    }
    for (const auto& session : removed) {
        router_.unbind_session(session->id());
        session->join();
    }
}

void TransferOrchestrator::stop_all() {
    std::vector<std::shared_ptr<SessionController>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : sessions_) {
            sessions.push_back(item.second);
        }
    }
    for (const auto& session : sessions) {
        session->stop();
    }
    for (const auto& session : sessions) {
        session->join();
    }
}

std::string TransferOrchestrator::next_session_id() {
    std::ostringstream out;
    out << "wt-" << std::hex << std::setw(16) << std::setfill('0') << rng_();
    return out.str();
}

}
