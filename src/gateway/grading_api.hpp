#pragma once

#include <map>
#include <optional>
#include <string>

#include "audit/audit_log.hpp"
#include "config/config_schema.hpp"
#include "exercise/exercise_catalog.hpp"
#include "grading/grading_dispatcher.hpp"
#include "security/rate_limiter.hpp"
#include "transport/code_runner.hpp"

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace gradebox::gateway {

constexpr const char* kSchemaVersion = "2026-02-02";
constexpr const char* kServiceName = "gradebox-gateway";
constexpr const char* kServiceVersion = "1.0.0";

struct ApiRequest {
    std::string request_id;
    std::string authorization;
    std::string ip;
    std::string user_agent;
    std::string body;
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
    std::map<std::string, std::string> headers;
};

// Grading boundary: authenticate, rate limit, validate, look up the
// exercise, dispatch, respond. Handlers never throw.
class GradingApi {
public:
    GradingApi(config::GatewayConfig config,
               const exercise::ExerciseCatalog& catalog,
               transport::CodeRunner& runner,
               security::RateLimiter& limiter,
               audit::AuditSink& audit);

    ApiResponse HandleGrade(const ApiRequest& request);
    ApiResponse HandleRun(const ApiRequest& request);
    ApiResponse HandleHints(const ApiRequest& request, const std::string& exercise_id, const std::string& attempts);
    ApiResponse HandleHealth() const;

    void Register(httplib::Server& server);

    static ApiRequest FromHttp(const httplib::Request& request);

private:
    using Handler = ApiResponse (GradingApi::*)(const ApiRequest&, const std::string&);

    // Authentication, rate limiting and the unhandled-error net shared by
    // the execution routes.
    ApiResponse Guarded(const ApiRequest& request, const std::string& route, const std::string& limit_prefix,
                        Handler handler);
    ApiResponse GradeAuthorized(const ApiRequest& request, const std::string& identity);
    ApiResponse RunAuthorized(const ApiRequest& request, const std::string& identity);
    ApiResponse Finish(const ApiRequest& request, ApiResponse response,
                       const std::optional<security::RateLimitResult>& rate) const;

    std::optional<std::string> Authenticate(const ApiRequest& request) const;
    transport::ExecuteOptions MakeOptions(const ApiRequest& request, const std::string& route,
                                          const std::string& identity, const std::string& exercise_id) const;
    audit::AuditEvent MakeEvent(const ApiRequest& request, const std::string& route) const;

    config::GatewayConfig config_;
    const exercise::ExerciseCatalog& catalog_;
    transport::CodeRunner& runner_;
    grading::GradingDispatcher dispatcher_;
    security::RateLimiter& limiter_;
    audit::AuditSink& audit_;
};

}  // namespace gradebox::gateway
