#include "utils/logging.hpp"

#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace gradebox::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config;
    return config;
}

bool NeedsQuoting(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\n\"=") != std::string::npos;
}

std::string QuoteValue(const std::string& value) {
    std::string out = "\"";
    for (char ch : value) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(ch); break;
        }
    }
    out.push_back('"');
    return out;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

void Log(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << (message.tag.empty() ? "gradebox" : message.tag) << "] "
         << ToString(message.level) << " " << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=" << (NeedsQuoting(value) ? QuoteValue(value) : value);
    }

    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    std::cerr << line.str() << std::endl;
}

}  // namespace gradebox::utils
