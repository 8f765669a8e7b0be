#pragma once

#include <memory>
#include <optional>
#include <string>

#include "warm_transfer/agent/lookup.hpp"
#include "warm_transfer/backend/client.hpp"

namespace warm_transfer {

// LookupService over HTTP. Transport failures and 5xx answers are retried;
// once retries are exhausted the call fails with ToolUnavailable.
class HttpLookupClient : public LookupService {
public:
    HttpLookupClient(std::shared_ptr<BackendClient> client, int retries);

    std::optional<ContactRecord> lookup_contact(const std::string& phone_number) override;
    std::optional<std::string> lookup_previous_conversation(
        const std::string& phone_number) override;
    std::optional<ProductRecord> lookup_product(const std::string& name) override;

private:
    std::optional<nlohmann::json> fetch(const char* tool, const std::string& path);

    std::shared_ptr<BackendClient> client_;
    int retries_;
};

}
