#include "audit/audit_log.hpp"

#include <fstream>

#include "utils/common.hpp"
#include "utils/json_text.hpp"
#include "utils/logging.hpp"

namespace gradebox::audit {
namespace {

utils::LogLevel ToLogLevel(AuditLevel level) {
    switch (level) {
        case AuditLevel::kInfo: return utils::LogLevel::kInfo;
        case AuditLevel::kWarn: return utils::LogLevel::kWarn;
        case AuditLevel::kError: return utils::LogLevel::kError;
    }
    return utils::LogLevel::kInfo;
}

void PutIfSet(nlohmann::json& json, const char* key, const std::string& value) {
    if (!value.empty()) {
        json[key] = value;
    }
}

}  // namespace

const char* ToString(AuditLevel level) {
    switch (level) {
        case AuditLevel::kInfo: return "info";
        case AuditLevel::kWarn: return "warn";
        case AuditLevel::kError: return "error";
    }
    return "info";
}

nlohmann::json AuditEventToJson(const AuditEvent& event) {
    nlohmann::json json = {
        {"ts", event.ts.empty() ? utils::NowIso() : event.ts},
        {"level", ToString(event.level)},
        {"event", event.event}
    };
    PutIfSet(json, "requestId", event.request_id);
    PutIfSet(json, "route", event.route);
    PutIfSet(json, "userId", event.user_id);
    PutIfSet(json, "ip", event.ip);
    PutIfSet(json, "userAgent", event.user_agent);
    PutIfSet(json, "exerciseId", event.exercise_id);
    if (event.runner_status) {
        json["runnerStatus"] = *event.runner_status;
    }
    PutIfSet(json, "errorCode", event.error_code);
    PutIfSet(json, "message", event.message);
    if (!event.meta.is_null()) {
        json["meta"] = event.meta;
    }
    return json;
}

LogAuditSink::LogAuditSink(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

void LogAuditSink::Record(const AuditEvent& event) {
    const auto line = utils::DumpJson(AuditEventToJson(event));
    utils::Log(utils::LogMessage{ToLogLevel(event.level), "audit", line, {}});
    if (file_path_) {
        AppendToFile(line);
    }
}

void LogAuditSink::AppendToFile(const std::string& line) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::error_code ec;
    if (file_path_->has_parent_path()) {
        std::filesystem::create_directories(file_path_->parent_path(), ec);
    }
    std::ofstream output(*file_path_, std::ios::app);
    if (!output.is_open()) {
        utils::LogWarn("audit", "cannot append to " + file_path_->string());
        return;
    }
    output << line << '\n';
}

}  // namespace gradebox::audit
