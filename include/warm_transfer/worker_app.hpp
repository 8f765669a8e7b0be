#pragma once

#include <atomic>
#include <memory>

#include "warm_transfer/backend/client.hpp"
#include "warm_transfer/backend/conversation.hpp"
#include "warm_transfer/backend/lookup_client.hpp"
#include "warm_transfer/backend/speech_gateway.hpp"
#include "warm_transfer/config.hpp"
#include "warm_transfer/orchestrator/transfer_orchestrator.hpp"
#include "warm_transfer/server/rest_server.hpp"
#include "warm_transfer/telephony/pj_provider.hpp"

namespace warm_transfer {

// Process wiring: SIP endpoint, backend collaborators, orchestrator and the
// REST surface. `run` pumps pjsip events on the calling thread until `stop`.
class WorkerApp {
public:
    explicit WorkerApp(Config config);
    ~WorkerApp();

    void init();
    void run();
    // Makes `run` return; safe from any thread.
    void request_stop() { quitting_ = true; }
    void stop();

    RestResponse handle_call(const nlohmann::json& body);
    RestResponse handle_session(const std::string& session_id);
    RestResponse handle_list();

private:
    Config config_;
    std::shared_ptr<BackendClient> backend_client_;
    std::shared_ptr<BackendClient> lookup_backend_;
    PjTelephonyProvider telephony_;
    BackendSpeechGateway speech_;
    BackendConversation conversation_;
    HttpLookupClient lookup_;
    std::unique_ptr<TransferOrchestrator> orchestrator_;
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
    std::atomic<bool> stopped_{false};
};

}
