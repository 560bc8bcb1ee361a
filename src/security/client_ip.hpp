#pragma once

#include <string>

#include "httplib.h"

namespace gradebox::security {

// First X-Forwarded-For entry, then X-Real-IP, CF-Connecting-IP, the socket
// peer, else "unknown".
std::string ClientIp(const httplib::Headers& headers, const std::string& remote_addr);
std::string ClientIp(const httplib::Request& request);

}  // namespace gradebox::security
