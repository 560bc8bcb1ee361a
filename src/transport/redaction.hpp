#pragma once

#include <string>
#include <vector>

namespace gradebox::transport {

constexpr const char* kRedacted = "[REDACTED]";

// Masks secrets before text leaves the transport layer: literal values of
// the configured environment variables, then credential-shaped substrings.
class Redactor {
public:
    Redactor();
    explicit Redactor(const std::vector<std::string>& secret_env_keys);

    // Literal values shorter than 8 characters are ignored.
    void AddSecret(const std::string& value);
    std::string Redact(const std::string& text) const;

private:
    std::vector<std::string> secrets_;
};

// Redacts with the default secret key list, read once per process.
std::string RedactSecrets(const std::string& text);

struct Truncated {
    std::string value;
    bool truncated = false;
};

// Cuts text above max_bytes to exactly max_bytes; never appends a marker.
Truncated TruncateByBytes(const std::string& text, std::size_t max_bytes);

}  // namespace gradebox::transport
