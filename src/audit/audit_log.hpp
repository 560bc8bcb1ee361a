#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace gradebox::audit {

enum class AuditLevel {
    kInfo,
    kWarn,
    kError
};

const char* ToString(AuditLevel level);

struct AuditEvent {
    std::string ts;
    AuditLevel level = AuditLevel::kInfo;
    std::string event;
    std::string request_id;
    std::string route;
    std::string user_id;
    std::string ip;
    std::string user_agent;
    std::string exercise_id;
    std::optional<int> runner_status;
    std::string error_code;
    std::string message;
    nlohmann::json meta;
};

nlohmann::json AuditEventToJson(const AuditEvent& event);

// Append-only sink for transport and admission anomalies.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void Record(const AuditEvent& event) = 0;
};

// One JSON line per event on the log stream; optionally appended to a file.
class LogAuditSink : public AuditSink {
public:
    LogAuditSink() = default;
    explicit LogAuditSink(std::filesystem::path file_path);

    void Record(const AuditEvent& event) override;

private:
    void AppendToFile(const std::string& line);

    std::optional<std::filesystem::path> file_path_;
    std::mutex file_mutex_;
};

}  // namespace gradebox::audit
