#include "warm_transfer/backend/lookup_client.hpp"

#include <utility>

#include "warm_transfer/errors.hpp"
#include "warm_transfer/logging.hpp"
#include "warm_transfer/utils/http.hpp"

namespace warm_transfer {

namespace {

bool retryable(const BackendError& error) {
    return error.status() == 0 || error.status() >= 500;
}

std::string text_field(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return "";
    }
    const auto& value = json.at(key);
    return value.is_string() ? value.get<std::string>() : value.dump();
}

}

HttpLookupClient::HttpLookupClient(std::shared_ptr<BackendClient> client, int retries)
    : client_(std::move(client)), retries_(retries) {}

std::optional<ContactRecord> HttpLookupClient::lookup_contact(const std::string& phone_number) {
    const auto json = fetch("contact", "/contacts/" + utils::url_encode(phone_number));
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    ContactRecord record;
    record.name = text_field(*json, "name");
    record.company = text_field(*json, "company");
    record.interest_level = text_field(*json, "interest_level");
    record.last_contact_date = text_field(*json, "last_contact_date");
    return record;
}

std::optional<std::string> HttpLookupClient::lookup_previous_conversation(
    const std::string& phone_number) {
    const auto json = fetch("conversation",
                            "/contacts/" + utils::url_encode(phone_number) + "/conversation");
    if (!json) {
        return std::nullopt;
    }
    const auto summary = json->is_string() ? json->get<std::string>()
                                           : text_field(*json, "summary");
    if (summary.empty()) {
        return std::nullopt;
    }
    return summary;
}

std::optional<ProductRecord> HttpLookupClient::lookup_product(const std::string& name) {
    const auto json = fetch("product", "/products?name=" + utils::url_encode(name));
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    ProductRecord record;
    record.name = text_field(*json, "name");
    record.technical_differentiation = text_field(*json, "technical_differentiation");
    record.benefits = text_field(*json, "benefits");
    record.customer_proof_point = text_field(*json, "customer_proof_point");
    return record;
}

std::optional<nlohmann::json> HttpLookupClient::fetch(const char* tool,
                                                      const std::string& path) {
    std::string last_error;
    for (int attempt = 0; attempt <= retries_; ++attempt) {
        try {
            return client_->find_json(path);
        } catch (const BackendError& ex) {
            last_error = ex.what();
            if (!retryable(ex)) {
                break;
            }
            logging::debug("Lookup failed, retrying", {kv("tool", tool),
                                                       kv("attempt", attempt + 1),
                                                       kv("error", last_error)});
        }
    }
    throw ToolUnavailable(std::string(tool) + " lookup unavailable: " + last_error);
}

}
