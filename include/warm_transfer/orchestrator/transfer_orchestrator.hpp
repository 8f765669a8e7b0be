#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "warm_transfer/agent/capability.hpp"
#include "warm_transfer/agent/lookup.hpp"
#include "warm_transfer/config.hpp"
#include "warm_transfer/orchestrator/leg_router.hpp"
#include "warm_transfer/orchestrator/session_controller.hpp"

namespace warm_transfer {

// Registry of live and finished sessions. Owns the routing of provider and
// speech events to the session that created each leg.
class TransferOrchestrator {
public:
    TransferOrchestrator(TelephonyProvider& telephony,
                         SpeechGateway& speech,
                         ConversationCapability& capability,
                         LookupService& lookup,
                         SessionConfig defaults);
    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    std::string place_call(CallRequest request);
    std::string place_call(CallRequest request, SessionConfig config);

    std::shared_ptr<SessionController> session(const std::string& session_id) const;
    std::optional<TransferSessionSnapshot> snapshot(const std::string& session_id) const;
    std::vector<TransferSessionSnapshot> snapshots() const;
    size_t active_sessions() const;

    // Forgets finished sessions beyond the newest `keep`.
    void prune_finished(size_t keep);
    void stop_all();

    const LegRouter& router() const { return router_; }

private:
    std::string next_session_id();

    TelephonyProvider& telephony_;
    SpeechGateway& speech_;
    ConversationCapability& capability_;
    LookupService& lookup_;
    const SessionConfig defaults_;
    LegRouter router_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionController>> sessions_;
    std::vector<std::string> order_;
    std::mt19937_64 rng_;
};

}
