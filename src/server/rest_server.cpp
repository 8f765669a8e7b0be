#include "warm_transfer/server/rest_server.hpp"

#include "warm_transfer/logging.hpp"
#include "warm_transfer/metrics.hpp"

namespace warm_transfer {

RestServer::RestServer(const Config& config,
                       CallHandler on_call,
                       SessionHandler on_session,
                       ListHandler on_list)
    : config_(config),
      on_call_(std::move(on_call)),
      on_session_(std::move(on_session)),
      on_list_(std::move(on_list)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/call", [this](const httplib::Request& req, httplib::Response& res) {
        Metrics::instance().increment_request();
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::exception& ex) {
            logging::error(
                "Failed to parse /call request",
                {kv("error", ex.what())});
            res.status = 400;
            res.set_content(R"({"message":"invalid request body"})", "application/json");
            return;
        }
        try {
            write_json(res, on_call_(body));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle /call request",
                {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"failed to start session"})", "application/json");
        }
    });

    server_->Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, on_list_());
    });

    server_->Get(R"(/sessions/([A-Za-z0-9_-]+))",
                 [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, on_session_(req.matches[1].str()));
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.api_port)});
        server_->listen("0.0.0.0", config_.api_port);
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
