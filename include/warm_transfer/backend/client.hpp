#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace warm_transfer {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    // HTTP status, 0 when the request never completed.
    int status() const { return status_; }

private:
    int status_;
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message, 403) {}
};

struct BackendRequestOptions {
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds connect_timeout{60000};
    std::chrono::milliseconds sock_read_timeout{60000};
};

class BackendClient {
public:
    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    // 404 is reported as std::nullopt instead of an error.
    std::optional<nlohmann::json> find_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json delete_json(const std::string& path);

    const std::string& base_url() const { return base_url_; }

private:
    httplib::Result send(const std::string& method,
                         const std::string& path,
                         const std::optional<nlohmann::json>& body);
    nlohmann::json parse_response(const std::string& path, const httplib::Result& response);
    std::string build_path(const std::string& path) const;
    httplib::Headers make_headers(bool with_body) const;
    void apply_timeouts();

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
};

}
