#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace warm_transfer {

// Reconnecting websocket subscription to `<base>/ws/<session_id>`. Text
// messages carry JSON; binary messages carry raw audio.
class BackendWsClient {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;
    using BinaryHandler = std::function<void(const std::string&)>;
    using EventHandler = std::function<void()>;

    explicit BackendWsClient(std::string base_url,
                             std::chrono::milliseconds reconnect_delay = std::chrono::seconds(5));
    ~BackendWsClient();

    BackendWsClient(const BackendWsClient&) = delete;
    BackendWsClient& operator=(const BackendWsClient&) = delete;

    void connect(const std::string& session_id,
                 MessageHandler on_message,
                 EventHandler on_close,
                 BinaryHandler on_binary = nullptr);
    void send_json(const nlohmann::json& payload);
    // Dropped while disconnected.
    void send_binary(const std::string& payload);
    void stop();
    bool running() const { return running_; }

private:
    void run_loop();
    void wait_reconnect();
    std::string make_ws_url(const std::string& session_id) const;
    void send(const std::string& payload, int opcode);

    std::string base_url_;
    std::chrono::milliseconds reconnect_delay_;
    std::string session_id_;
    MessageHandler on_message_;
    BinaryHandler on_binary_;
    EventHandler on_close_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

}
