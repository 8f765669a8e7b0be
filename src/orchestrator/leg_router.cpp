#include "warm_transfer/orchestrator/leg_router.hpp"

#include <algorithm>

#include "warm_transfer/logging.hpp"
#include "warm_transfer/orchestrator/session_controller.hpp"

namespace warm_transfer {

void LegRouter::bind(const LegId& leg, const std::shared_ptr<SessionController>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_[leg] = session;
    auto it = orphans_.begin();
    while (it != orphans_.end()) {
        if (it->leg == leg) {
            debug("Replaying early leg event", {kv("leg", leg), kv("event", to_string(it->type))});
            session->on_telephony_event(*it);
            it = orphans_.erase(it);
        } else {
            ++it;
        }
    }
}

void LegRouter::unbind_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = bindings_.begin(); it != bindings_.end();) {
        const auto session = it->second.lock();
        if (!session || session->id() == session_id) {
            it = bindings_.erase(it);
        } else {
            ++it;
        }
    }
}

void LegRouter::route(const TelephonyEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bindings_.find(event.leg);
    if (it == bindings_.end()) {
        if (orphans_.size() >= kMaxOrphans) {
            warn("Dropping unroutable leg event", {kv("leg", orphans_.front().leg)});
            orphans_.pop_front();
        }
        orphans_.push_back(event);
        return;
    }
    if (auto session = it->second.lock()) {
        session->on_telephony_event(event);
    }
}

void LegRouter::route(const TranscriptEvent& event) {
    const auto session = find(event.leg);
    if (!session) {
        debug("Transcript for unknown leg dropped", {kv("leg", event.leg)});
        return;
    }
    session->on_transcript(event);
}

size_t LegRouter::orphan_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orphans_.size();
}

size_t LegRouter::binding_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

std::shared_ptr<SessionController> LegRouter::find(const LegId& leg) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bindings_.find(leg);
    if (it == bindings_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

}
