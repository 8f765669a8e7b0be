#include "warm_transfer/core/shutdown_watcher.hpp"

#include <utility>

namespace warm_transfer {

ShutdownWatcher::ShutdownWatcher(const std::atomic<bool>& requested,
                                 std::function<void()> on_request,
                                 std::chrono::milliseconds poll_interval)
    : requested_(requested),
      on_request_(std::move(on_request)),
      poll_interval_(poll_interval) {
    thread_ = std::thread([this]() {
        while (!done_) {
            if (requested_) {
                if (on_request_) {
                    on_request_();
                }
                return;
            }
            std::this_thread::sleep_for(poll_interval_);
        }
    });
}

ShutdownWatcher::~ShutdownWatcher() {
    stop();
}

void ShutdownWatcher::stop() {
    done_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

}
