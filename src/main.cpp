#include "warm_transfer/config.hpp"
#include "warm_transfer/core/shutdown_watcher.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/worker_app.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> g_signalled{false};

void on_signal(int) {
    g_signalled = true;
}

}

int main() {
    try {
        const auto config = warm_transfer::Config::load();
        config.validate();
        warm_transfer::logging::init(config);
        warm_transfer::info(
            "Starting warm-transfer-worker",
            {warm_transfer::kv("backend_url", config.backend_url),
             warm_transfer::kv("lookup_url", config.lookup_url),
             warm_transfer::kv("api_port", config.api_port),
             warm_transfer::kv_number("representative", config.representative_number)});
        warm_transfer::WorkerApp app(config);
        app.init();

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        warm_transfer::ShutdownWatcher watcher(g_signalled, [&app]() {
            warm_transfer::info("Shutdown requested");
            app.request_stop();
        });
        app.run();
        watcher.stop();
        app.stop();
    } catch (const std::exception& ex) {
        warm_transfer::error(
            "Worker failed",
            {warm_transfer::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
