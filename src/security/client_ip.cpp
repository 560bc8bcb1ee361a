#include "security/client_ip.hpp"

#include "utils/common.hpp"

namespace gradebox::security {
namespace {

std::string HeaderValue(const httplib::Headers& headers, const std::string& name) {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

}  // namespace

std::string ClientIp(const httplib::Headers& headers, const std::string& remote_addr) {
    const auto forwarded_for = HeaderValue(headers, "X-Forwarded-For");
    if (!forwarded_for.empty()) {
        const auto first = utils::Trim(forwarded_for.substr(0, forwarded_for.find(',')));
        if (!first.empty()) {
            return first;
        }
    }
    for (const char* name : {"X-Real-IP", "CF-Connecting-IP"}) {
        const auto value = utils::Trim(HeaderValue(headers, name));
        if (!value.empty()) {
            return value;
        }
    }
    if (!remote_addr.empty()) {
        return remote_addr;
    }
    return "unknown";
}

std::string ClientIp(const httplib::Request& request) {
    return ClientIp(request.headers, request.remote_addr);
}

}  // namespace gradebox::security
