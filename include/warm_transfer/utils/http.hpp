#pragma once

#include <string>

namespace warm_transfer::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

// Joins a base path ("/api/") and a request path ("/turn") with one slash.
std::string join_path(const std::string& base_path, const std::string& path);

std::string url_encode(const std::string& value);

// "https://host" -> "wss://host"; bare hosts get "ws://".
std::string to_ws_url(const std::string& base_url);

}
