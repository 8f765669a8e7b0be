#include "warm_transfer/backend/ws_client.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "warm_transfer/logging.hpp"
#include "warm_transfer/utils/http.hpp"

namespace warm_transfer {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

}

struct BackendWsClient::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

BackendWsClient::BackendWsClient(std::string base_url, std::chrono::milliseconds reconnect_delay)
    : base_url_(std::move(base_url)), reconnect_delay_(reconnect_delay) {}

BackendWsClient::~BackendWsClient() {
    stop();
}

void BackendWsClient::connect(const std::string& session_id,
                              MessageHandler on_message,
                              EventHandler on_close,
                              BinaryHandler on_binary) {
    if (running_) {
        return;
    }
    session_id_ = session_id;
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    on_binary_ = std::move(on_binary);
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

void BackendWsClient::send_json(const nlohmann::json& payload) {
    send(payload.dump(), websocketpp::frame::opcode::text);
}

void BackendWsClient::send_binary(const std::string& payload) {
    send(payload, websocketpp::frame::opcode::binary);
}

void BackendWsClient::send(const std::string& payload, int opcode) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        return;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, payload,
                            static_cast<websocketpp::frame::opcode::value>(opcode), ec);
    if (ec) {
        logging::warn("WebSocket send failed", {kv("session_id", session_id_),
                                                kv("error", ec.message())});
    }
}

void BackendWsClient::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client) {
            websocketpp::lib::error_code ec;
            if (!ws_state_->connection.expired()) {
                ws_state_->client->close(ws_state_->connection,
                                         websocketpp::close::status::going_away,
                                         "shutdown", ec);
            }
            ws_state_->client->stop();
        }
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BackendWsClient::run_loop() {
    while (running_) {
        auto client = std::make_shared<WsClient>();
        client->clear_access_channels(websocketpp::log::alevel::all);
        client->clear_error_channels(websocketpp::log::elevel::all);
        client->init_asio();

        client->set_message_handler([this](websocketpp::connection_hdl,
                                           WsClient::message_ptr msg) {
            if (msg->get_opcode() == websocketpp::frame::opcode::binary) {
                if (on_binary_) {
                    on_binary_(msg->get_payload());
                }
                return;
            }
            try {
                const auto payload = nlohmann::json::parse(msg->get_payload());
                if (payload.value("type", "") == "close") {
                    if (on_close_) {
                        on_close_();
                    }
                } else if (on_message_) {
                    on_message_(payload);
                }
            } catch (const nlohmann::json::exception& ex) {
                logging::warn("WebSocket message ignored", {kv("session_id", session_id_),
                                                            kv("error", ex.what())});
            }
        });
        client->set_fail_handler([this](websocketpp::connection_hdl) {
            logging::warn("WebSocket connection failed", {kv("session_id", session_id_)});
        });

        websocketpp::lib::error_code ec;
        auto conn = client->get_connection(make_ws_url(session_id_), ec);
        if (ec) {
            logging::error("WebSocket connect failed", {kv("session_id", session_id_),
                                                        kv("error", ec.message())});
            wait_reconnect();
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_ = std::make_unique<WsState>();
            ws_state_->client = client;
            ws_state_->connection = conn->get_handle();
        }
        client->connect(conn);
        client->run();

        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_.reset();
        }
        if (running_) {
            wait_reconnect();
        }
    }
}

void BackendWsClient::wait_reconnect() {
    const auto deadline = std::chrono::steady_clock::now() + reconnect_delay_;
    while (running_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

std::string BackendWsClient::make_ws_url(const std::string& session_id) const {
    return utils::to_ws_url(base_url_) + "/ws/" + session_id;
}

}
