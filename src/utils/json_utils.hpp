#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace autolab::utils {

// Captured program output is not guaranteed to be valid UTF-8; invalid sequences are
// replaced rather than aborting serialization.
inline std::string DumpJson(const nlohmann::json& value, int indent = -1) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace autolab::utils
