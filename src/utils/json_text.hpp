#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace gradebox::utils {

// Serializes for the wire. Program output is arbitrary bytes, so invalid
// UTF-8 becomes U+FFFD instead of throwing.
inline std::string DumpJson(const nlohmann::json& value, int indent = -1) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace gradebox::utils
