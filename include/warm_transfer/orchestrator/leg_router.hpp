#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "warm_transfer/telephony/provider.hpp"
#include "warm_transfer/telephony/speech.hpp"

namespace warm_transfer {

class SessionController;

// Maps leg ids to their owning session. Provider events may arrive before the
// dialing session has learned its leg id; those are held and replayed on bind.
class LegRouter {
public:
    static constexpr size_t kMaxOrphans = 256;

    void bind(const LegId& leg, const std::shared_ptr<SessionController>& session);
    void unbind_session(const std::string& session_id);
    void route(const TelephonyEvent& event);
    void route(const TranscriptEvent& event);

    size_t orphan_count() const;
    size_t binding_count() const;

private:
    std::shared_ptr<SessionController> find(const LegId& leg) const;

    // Held while delivering so events of one leg reach the session in order.
    mutable std::mutex mutex_;
    std::unordered_map<LegId, std::weak_ptr<SessionController>> bindings_;
    std::deque<TelephonyEvent> orphans_;
};

}
