#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace warm_transfer {

// Cooperative cancellation flag shared between a session and the tasks it spawns.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

    // A fresh token that also observes this one.
    CancellationToken child() const {
        CancellationToken token;
        token.parent_ = flag_;
        return token;
    }

    bool stop_requested() const {
        return cancelled() || (parent_ && parent_->load());
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<std::atomic<bool>> parent_;
};

constexpr std::chrono::milliseconds kCancelPollInterval{50};

}
