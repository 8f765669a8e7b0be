#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "warm_transfer/config.hpp"

namespace warm_transfer {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    using CallHandler = std::function<RestResponse(const nlohmann::json&)>;
    using SessionHandler = std::function<RestResponse(const std::string&)>;
    using ListHandler = std::function<RestResponse()>;

    RestServer(const Config& config,
               CallHandler on_call,
               SessionHandler on_session,
               ListHandler on_list);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    CallHandler on_call_;
    SessionHandler on_session_;
    ListHandler on_list_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
