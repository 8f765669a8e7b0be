#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "warm_transfer/utils/http.hpp"

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value && *value ? std::string(value) : fallback;
}

}

// warm-transfer-call <phone> [name] [metadata-json]
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <phone> [name] [metadata-json]" << std::endl;
        return 1;
    }

    nlohmann::json body{{"phone_number", argv[1]}};
    if (argc > 2 && *argv[2]) {
        body["name"] = argv[2];
    }
    if (argc > 3) {
        try {
            body["metadata"] = nlohmann::json::parse(argv[3]);
        } catch (const nlohmann::json::parse_error& ex) {
            std::cerr << "invalid metadata json: " << ex.what() << std::endl;
            return 1;
        }
    }

    const auto worker_url =
        env_or("WORKER_URL", "http://127.0.0.1:" + env_or("API_PORT", "8000"));
    std::string scheme;
    std::string host;
    int port = 0;
    std::string base_path;
    try {
        warm_transfer::utils::parse_url(worker_url, scheme, host, port, base_path);
    } catch (const std::logic_error& ex) {
        std::cerr << "invalid WORKER_URL: " << ex.what() << std::endl;
        return 1;
    }
    if (scheme != "http") {
        std::cerr << "WORKER_URL must be an http:// url" << std::endl;
        return 1;
    }

    httplib::Client client(host, port);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(30, 0);
    httplib::Headers headers;
    const auto token = env_or("AUTHORIZATION_TOKEN", "");
    if (!token.empty()) {
        headers.emplace("Authorization", "Bearer " + token);
    }

    const auto path = warm_transfer::utils::join_path(base_path, "/call");
    const auto response = client.Post(path, headers, body.dump(), "application/json");
    if (!response) {
        std::cerr << "worker unreachable at " << worker_url << ": "
                  << httplib::to_string(response.error()) << std::endl;
        return 1;
    }
    if (response->status != 200) {
        std::cerr << "call rejected (" << response->status << "): " << response->body
                  << std::endl;
        return 1;
    }
    try {
        const auto payload = nlohmann::json::parse(response->body);
        std::cout << payload.value("session_id", "") << std::endl;
    } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "unexpected worker response: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
