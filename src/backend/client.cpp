#include "warm_transfer/backend/client.hpp"

#include <chrono>
#include <utility>

#include "warm_transfer/logging.hpp"
#include "warm_transfer/metrics.hpp"
#include "warm_transfer/utils/http.hpp"

namespace warm_transfer {

namespace {

template <typename T>
void set_timeouts(T& client, const BackendRequestOptions& options) {
    const auto to_parts = [](std::chrono::milliseconds value) {
        return std::make_pair(static_cast<time_t>(value.count() / 1000),
                              static_cast<time_t>((value.count() % 1000) * 1000));
    };
    const auto connect = to_parts(options.connect_timeout);
    const auto read = to_parts(options.sock_read_timeout);
    const auto write = to_parts(options.request_timeout);
    client.set_connection_timeout(connect.first, connect.second);
    client.set_read_timeout(read.first, read.second);
    client.set_write_timeout(write.first, write.second);
}

}

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw BackendError("invalid backend url: " + base_url_);
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        client_https_->enable_server_certificate_verification(false);
#else
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    }
    apply_timeouts();
}

nlohmann::json BackendClient::get_json(const std::string& path) {
    return parse_response(path, send("GET", path, std::nullopt));
}

std::optional<nlohmann::json> BackendClient::find_json(const std::string& path) {
    auto response = send("GET", path, std::nullopt);
    if (response && response->status == 404) {
        return std::nullopt;
    }
    return parse_response(path, response);
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    return parse_response(path, send("POST", path, body));
}

nlohmann::json BackendClient::delete_json(const std::string& path) {
    return parse_response(path, send("DELETE", path, std::nullopt));
}

httplib::Result BackendClient::send(const std::string& method,
                                    const std::string& path,
                                    const std::optional<nlohmann::json>& body) {
    const auto full_path = build_path(path);
    const auto headers = make_headers(body.has_value());
    const auto payload = body ? body->dump() : std::string();
    const auto started = std::chrono::steady_clock::now();

    auto dispatch = [&](auto& client) {
        if (method == "POST") {
            return client.Post(full_path, headers, payload, "application/json");
        }
        if (method == "DELETE") {
            return client.Delete(full_path, headers);
        }
        return client.Get(full_path, headers);
    };
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    auto response = client_https_ ? dispatch(*client_https_) : dispatch(*client_http_);
#else
    auto response = dispatch(*client_http_);
#endif
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    Metrics::instance().observe_response_time(method, elapsed.count());
    return response;
}

nlohmann::json BackendClient::parse_response(const std::string& path,
                                             const httplib::Result& response) {
    if (!response) {
        throw BackendError("Backend request failed: " + path + " (" +
                           httplib::to_string(response.error()) + ")");
    }
    if (response->status == 403) {
        throw BackendPermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        logging::debug("Backend error response", {kv("path", path),
                                                  kv("status", response->status)});
        throw BackendError(response->body.empty() ? path : response->body, response->status);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError(std::string("invalid JSON from backend: ") + ex.what(),
                           response->status);
    }
}

std::string BackendClient::build_path(const std::string& path) const {
    return utils::join_path(base_path_, path);
}

httplib::Headers BackendClient::make_headers(bool with_body) const {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (with_body) {
        headers.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

void BackendClient::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        set_timeouts(*client_https_, options_);
        return;
    }
#endif
    if (client_http_) {
        set_timeouts(*client_http_, options_);
    }
}

}
