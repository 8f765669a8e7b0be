#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace warm_transfer {

// Polls a flag set from a signal handler and runs `on_request` once when it
// flips. The thread is joined on destruction, including during unwinding.
class ShutdownWatcher {
public:
    ShutdownWatcher(const std::atomic<bool>& requested,
                    std::function<void()> on_request,
                    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

    void stop();

private:
    const std::atomic<bool>& requested_;
    std::function<void()> on_request_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

}
