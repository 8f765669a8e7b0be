#pragma once

#include <optional>
#include <string>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

// Read-only contact/product lookup. Absence is std::nullopt; transport
// failures surface as ToolUnavailable and are handled by the caller.
class LookupService {
public:
    virtual ~LookupService() = default;

    virtual std::optional<ContactRecord> lookup_contact(const std::string& phone_number) = 0;
    virtual std::optional<std::string> lookup_previous_conversation(
        const std::string& phone_number) = 0;
    virtual std::optional<ProductRecord> lookup_product(const std::string& name) = 0;
};

}
