#include "warm_transfer/worker_app.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"

namespace warm_transfer {

namespace {

constexpr size_t kFinishedSessionsKept = 256;

BackendRequestOptions backend_options(const Config& config) {
    auto ms = [](double seconds) {
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    };
    return {ms(config.backend_request_timeout),
            ms(config.backend_connect_timeout),
            ms(config.backend_sock_read_timeout)};
}

BackendRequestOptions lookup_options(const Config& config) {
    const std::chrono::milliseconds timeout(config.lookup_timeout_ms);
    return {timeout, timeout, timeout};
}

}

WorkerApp::WorkerApp(Config config)
    : config_(std::move(config)),
      backend_client_(std::make_shared<BackendClient>(config_.backend_url,
                                                      config_.authorization_token,
                                                      backend_options(config_))),
      lookup_backend_(std::make_shared<BackendClient>(config_.lookup_url,
                                                      config_.authorization_token,
                                                      lookup_options(config_))),
      telephony_(config_),
      speech_(backend_client_, telephony_, config_.audio_clock_rate),
      conversation_(backend_client_),
      lookup_(lookup_backend_, config_.lookup_retries) {}

WorkerApp::~WorkerApp() {
    stop();
}

void WorkerApp::init() {
    telephony_.init();
    orchestrator_ = std::make_unique<TransferOrchestrator>(
        telephony_, speech_, conversation_, lookup_, config_.session_config());
    rest_server_ = std::make_unique<RestServer>(
        config_,
        [this](const nlohmann::json& body) { return handle_call(body); },
        [this](const std::string& session_id) { return handle_session(session_id); },
        [this]() { return handle_list(); });
    rest_server_->start();
}

void WorkerApp::run() {
    int consecutive_empty_cycles = 0;
    while (!quitting_) {
        const auto processed = telephony_.handle_events();
        if (processed == 0) {
            ++consecutive_empty_cycles;
            const auto delay =
                consecutive_empty_cycles > 10 ? std::min(config_.async_delay * 2, 0.1)
                                              : config_.async_delay;
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
        } else {
            consecutive_empty_cycles = 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void WorkerApp::stop() {
    quitting_ = true;
    if (stopped_.exchange(true)) {
        return;
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    orchestrator_.reset();
    telephony_.shutdown();
}

RestResponse WorkerApp::handle_call(const nlohmann::json& body) {
    CallRequest request;
    try {
        request = parse_call_request(body);
    } catch (const WarmTransferError& ex) {
        return {400, {{"message", ex.what()}}};
    }
    if (!orchestrator_ || quitting_) {
        return {503, {{"message", "worker not ready"}}};
    }
    orchestrator_->prune_finished(kFinishedSessionsKept);
    logging::info("Placing outbound call", {kv_number("destination", request.destination),
                                            kv("name", request.name.value_or(""))});
    const auto session_id = orchestrator_->place_call(std::move(request));
    return {200, {{"message", "ok"}, {"session_id", session_id}}};
}

RestResponse WorkerApp::handle_session(const std::string& session_id) {
    if (!orchestrator_) {
        return {503, {{"message", "worker not ready"}}};
    }
    const auto snapshot = orchestrator_->snapshot(session_id);
    if (!snapshot) {
        return {404, {{"message", "session not found"}}};
    }
    return {200, snapshot->to_json()};
}

RestResponse WorkerApp::handle_list() {
    if (!orchestrator_) {
        return {503, {{"message", "worker not ready"}}};
    }
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& snapshot : orchestrator_->snapshots()) {
        sessions.push_back({{"session_id", snapshot.session_id},
                            {"state", to_string(snapshot.state)},
                            {"finished", snapshot.finished}});
    }
    return {200, {{"sessions", sessions},
                  {"active", orchestrator_->active_sessions()}}};
}

}
