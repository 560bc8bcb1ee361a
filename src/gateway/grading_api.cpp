#include "gateway/grading_api.hpp"

#include "exercise/exercise_codec.hpp"
#include "grading/hint_policy.hpp"
#include "security/client_ip.hpp"
#include "transport/redaction.hpp"
#include "utils/common.hpp"
#include "utils/json_text.hpp"
#include "utils/logging.hpp"

namespace gradebox::gateway {
namespace {

constexpr const char* kGradeRoute = "/api/grade";
constexpr const char* kRunRoute = "/api/run";

ApiResponse Error(int status, const std::string& message) {
    return ApiResponse{status, {{"error", message}}, {}};
}

std::string StringField(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return {};
}

// Code points, not bytes.
std::size_t Utf8Length(const std::string& text) {
    std::size_t count = 0;
    for (const unsigned char ch : text) {
        if ((ch & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string ExerciseIdFrom(const nlohmann::json& data) {
    auto id = StringField(data, "exerciseId");
    return id.empty() ? StringField(data, "questId") : id;
}

std::optional<ApiResponse> CheckExerciseId(const std::string& exercise_id) {
    if (exercise_id.empty()) {
        return Error(400, "Invalid exerciseId");
    }
    if (!exercise::IsValidExerciseId(exercise_id)) {
        return Error(400, "Invalid exerciseId format");
    }
    return std::nullopt;
}

struct PayloadRead {
    std::optional<exercise::SubmissionPayload> payload;
    std::size_t chars = 0;
    std::string error;
};

PayloadRead ReadPayload(const nlohmann::json& data) {
    PayloadRead read{};
    const auto text_field = [&](std::initializer_list<const char*> keys) -> const nlohmann::json* {
        for (const char* key : keys) {
            if (data.contains(key)) {
                return &data[key];
            }
        }
        return nullptr;
    };

    if (const auto* code = text_field({"code", "userCode"})) {
        if (!code->is_string() || code->get<std::string>().empty()) {
            read.error = "Invalid code";
            return read;
        }
        read.chars = Utf8Length(code->get<std::string>());
        read.payload = exercise::CodeAnswer{code->get<std::string>()};
        return read;
    }
    if (const auto* predicted = text_field({"predictedOutput"})) {
        if (!predicted->is_string()) {
            read.error = "Invalid predictedOutput";
            return read;
        }
        read.chars = Utf8Length(predicted->get<std::string>());
        read.payload = exercise::PredictedOutput{predicted->get<std::string>()};
        return read;
    }
    if (const auto* explanation = text_field({"explanationText"})) {
        if (!explanation->is_string()) {
            read.error = "Invalid explanationText";
            return read;
        }
        read.chars = Utf8Length(explanation->get<std::string>());
        read.payload = exercise::ExplanationText{explanation->get<std::string>()};
        return read;
    }
    if (const auto* answers = text_field({"answers"})) {
        if (!answers->is_object()) {
            read.error = "Invalid answers";
            return read;
        }
        exercise::AnswerMap map{};
        for (auto it = answers->begin(); it != answers->end(); ++it) {
            if (!it.value().is_string()) {
                read.error = "Invalid answer for question '" + it.key() + "'";
                return read;
            }
            read.chars += Utf8Length(it.value().get<std::string>());
            map.answers[it.key()] = it.value().get<std::string>();
        }
        read.payload = std::move(map);
        return read;
    }
    read.error = "Missing submission: expected code, predictedOutput, explanationText or answers";
    return read;
}

nlohmann::json OutcomesToJson(const std::vector<grading::TestOutcome>& outcomes) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        array.push_back(grading::TestOutcomeToJson(outcome));
    }
    return array;
}

int TransportStatusCode(const std::string& error_code) {
    return error_code == transport::kRunnerTimeout ? 504 : 503;
}

void WriteResponse(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    for (const auto& [name, value] : response.headers) {
        res.set_header(name, value);
    }
    res.set_content(utils::DumpJson(response.body), "application/json");
}

}  // namespace

GradingApi::GradingApi(config::GatewayConfig config,
                       const exercise::ExerciseCatalog& catalog,
                       transport::CodeRunner& runner,
                       security::RateLimiter& limiter,
                       audit::AuditSink& audit)
    : config_(std::move(config)),
      catalog_(catalog),
      runner_(runner),
      dispatcher_(runner),
      limiter_(limiter),
      audit_(audit) {}

ApiRequest GradingApi::FromHttp(const httplib::Request& request) {
    ApiRequest api{};
    api.request_id = utils::GenerateRequestId();
    api.authorization = request.get_header_value("Authorization");
    api.ip = security::ClientIp(request);
    api.user_agent = request.get_header_value("User-Agent");
    api.body = request.body;
    return api;
}

std::optional<std::string> GradingApi::Authenticate(const ApiRequest& request) const {
    static const std::string kBearer = "bearer ";
    const auto header = utils::Trim(request.authorization);
    if (header.size() <= kBearer.size() || utils::ToLower(header.substr(0, kBearer.size())) != kBearer) {
        return std::nullopt;
    }
    const auto token = utils::Trim(header.substr(kBearer.size()));
    const auto it = config_.api_tokens.find(token);
    if (it == config_.api_tokens.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

audit::AuditEvent GradingApi::MakeEvent(const ApiRequest& request, const std::string& route) const {
    audit::AuditEvent event;
    event.request_id = request.request_id;
    event.route = route;
    event.ip = request.ip;
    event.user_agent = request.user_agent;
    return event;
}

transport::ExecuteOptions GradingApi::MakeOptions(const ApiRequest& request,
                                                  const std::string& route,
                                                  const std::string& identity,
                                                  const std::string& exercise_id) const {
    transport::ExecuteOptions options;
    options.request_id = request.request_id;
    options.route = route;
    options.user_id = identity;
    options.ip = request.ip;
    options.user_agent = request.user_agent;
    options.exercise_id = exercise_id;
    options.timeout_ms = config_.request_timeout_ms;
    options.max_stdout_bytes = static_cast<std::size_t>(config_.max_stdout_bytes);
    options.max_stderr_bytes = static_cast<std::size_t>(config_.max_stderr_bytes);
    return options;
}

ApiResponse GradingApi::Finish(const ApiRequest& request,
                               ApiResponse response,
                               const std::optional<security::RateLimitResult>& rate) const {
    if (!response.body.is_object()) {
        response.body = nlohmann::json::object();
    }
    response.body["schemaVersion"] = kSchemaVersion;
    response.body["requestId"] = request.request_id;
    response.headers["X-Request-Id"] = request.request_id;
    if (rate) {
        for (auto& [name, value] : security::RateLimitHeaders(*rate, limiter_.Now())) {
            response.headers[name] = value;
        }
    }
    return response;
}

ApiResponse GradingApi::Guarded(const ApiRequest& incoming,
                                const std::string& route,
                                const std::string& limit_prefix,
                                Handler handler) {
    ApiRequest request = incoming;
    if (request.request_id.empty()) {
        request.request_id = utils::GenerateRequestId();
    }
    utils::Log(utils::LogMessage{utils::LogLevel::kDebug, "api", route + " request received",
                                 {{"requestId", request.request_id}}});

    std::optional<security::RateLimitResult> rate;
    std::string identity;
    try {
        const auto user = Authenticate(request);
        if (!user) {
            return Finish(request, Error(401, "Unauthorized"), rate);
        }
        identity = *user;

        rate = limiter_.Allow(security::RateLimitKey(limit_prefix, identity, request.ip),
                              config_.rate_limit_max, config_.rate_limit_window_ms);
        if (!rate->allowed) {
            auto event = MakeEvent(request, route);
            event.level = audit::AuditLevel::kWarn;
            event.event = "api.rate_limited";
            event.user_id = identity;
            event.error_code = "RATE_LIMIT";
            event.meta = {{"limit", rate->limit}, {"windowMs", config_.rate_limit_window_ms}};
            audit_.Record(event);
            return Finish(request, Error(429, "Rate limit exceeded"), rate);
        }

        auto response = (this->*handler)(request, identity);
        utils::Log(utils::LogMessage{utils::LogLevel::kInfo, "api", route + " response sent",
                                     {{"requestId", request.request_id},
                                      {"status", std::to_string(response.status)}}});
        return Finish(request, std::move(response), rate);
    } catch (const std::exception& ex) {
        const auto message = transport::RedactSecrets(ex.what());
        utils::LogError("api", "error in " + route + ": " + message);
        auto event = MakeEvent(request, route);
        event.level = audit::AuditLevel::kError;
        event.event = "api.unhandled_error";
        event.user_id = identity;
        event.error_code = "UNHANDLED";
        event.message = message;
        audit_.Record(event);
        ApiResponse response{500, {
            {"success", false},
            {"error", "Internal error"},
            {"stdout", ""},
            {"stderr", "Internal error"},
            {"testResults", nlohmann::json::array()}
        }, {}};
        return Finish(request, std::move(response), rate);
    }
}

ApiResponse GradingApi::HandleGrade(const ApiRequest& request) {
    return Guarded(request, kGradeRoute, "grade", &GradingApi::GradeAuthorized);
}

ApiResponse GradingApi::HandleRun(const ApiRequest& request) {
    return Guarded(request, kRunRoute, "run", &GradingApi::RunAuthorized);
}

ApiResponse GradingApi::GradeAuthorized(const ApiRequest& request, const std::string& identity) {
    const auto data = nlohmann::json::parse(request.body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return Error(400, "Invalid JSON");
    }
    const auto exercise_id = ExerciseIdFrom(data);
    if (auto invalid = CheckExerciseId(exercise_id)) {
        return *invalid;
    }
    auto read = ReadPayload(data);
    if (!read.payload) {
        return Error(400, read.error);
    }
    if (static_cast<long long>(read.chars) > config_.max_code_chars) {
        return Error(413, "Submission too large (max " + std::to_string(config_.max_code_chars) + " chars)");
    }
    const auto* exercise = catalog_.Find(exercise_id);
    if (!exercise) {
        return Error(404, "Exercise not found");
    }

    exercise::Submission submission{exercise_id, identity, request.ip, std::move(*read.payload)};
    const auto outcome = dispatcher_.Grade(*exercise, submission, MakeOptions(request, kGradeRoute, identity, exercise_id));
    if (!outcome.Ok()) {
        const auto& failure = *outcome.failure;
        if (failure.kind == grading::FailureKind::kValidation) {
            return Error(400, failure.message);
        }
        utils::LogError("api", "grading error for " + exercise_id + ": " + failure.message);
        auto event = MakeEvent(request, kGradeRoute);
        event.level = audit::AuditLevel::kError;
        event.event = "grading.invalid_exercise";
        event.user_id = identity;
        event.exercise_id = exercise_id;
        event.error_code = "GRADING_ERROR";
        event.message = transport::RedactSecrets(failure.message);
        audit_.Record(event);
        return Error(500, "Grading failed");
    }

    const auto& result = *outcome.result;
    ApiResponse response{200, grading::GradeResultToJson(result), {}};
    response.body["exerciseId"] = exercise_id;
    if (!result.diagnostics.transport_error_code.empty()) {
        response.status = TransportStatusCode(result.diagnostics.transport_error_code);
    }
    return response;
}

ApiResponse GradingApi::RunAuthorized(const ApiRequest& request, const std::string& identity) {
    const auto data = nlohmann::json::parse(request.body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return Error(400, "Invalid JSON");
    }
    const auto exercise_id = ExerciseIdFrom(data);
    if (auto invalid = CheckExerciseId(exercise_id)) {
        return *invalid;
    }
    auto code = StringField(data, "userCode");
    if (code.empty()) {
        code = StringField(data, "code");
    }
    if (code.empty()) {
        return Error(400, "Invalid userCode");
    }
    if (static_cast<long long>(Utf8Length(code)) > config_.max_code_chars) {
        return Error(413, "Code too large (max " + std::to_string(config_.max_code_chars) + " chars)");
    }
    const auto* exercise = catalog_.Find(exercise_id);
    if (!exercise) {
        return Error(404, "Exercise not found");
    }

    utils::LogInfo("api", "executing code for exercise " + exercise_id + " (user " + identity + ")");
    const auto result = runner_.Execute(code, exercise->tests, exercise->dataset,
                                        MakeOptions(request, kRunRoute, identity, exercise_id));

    ApiResponse response{result.TransportError() ? TransportStatusCode(result.error_code) : 200, {
        {"success", result.success},
        {"exerciseId", exercise_id},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"testResults", OutcomesToJson(result.test_results)},
        {"runtimeMs", result.wall_time_ms},
        {"allPassed", result.all_passed},
        {"truncatedStdout", result.truncated_stdout},
        {"truncatedStderr", result.truncated_stderr},
        {"transportError", result.TransportError()}
    }, {}};
    if (!result.error.empty()) {
        response.body["error"] = result.error;
    }
    if (result.runner_status) {
        response.body["runnerStatus"] = *result.runner_status;
    }
    if (!result.error_code.empty()) {
        response.body["errorCode"] = result.error_code;
    }
    return response;
}

ApiResponse GradingApi::HandleHints(const ApiRequest& incoming,
                                    const std::string& exercise_id,
                                    const std::string& attempts_text) {
    ApiRequest request = incoming;
    if (request.request_id.empty()) {
        request.request_id = utils::GenerateRequestId();
    }
    if (!Authenticate(request)) {
        return Finish(request, Error(401, "Unauthorized"), std::nullopt);
    }
    if (auto invalid = CheckExerciseId(exercise_id)) {
        return Finish(request, *invalid, std::nullopt);
    }

    int attempts = 0;
    if (!attempts_text.empty()) {
        std::size_t consumed = 0;
        try {
            attempts = std::stoi(attempts_text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != attempts_text.size() || attempts < 0) {
            return Finish(request, Error(400, "Invalid attempts"), std::nullopt);
        }
    }

    const auto* exercise = catalog_.Find(exercise_id);
    if (!exercise) {
        return Finish(request, Error(404, "Exercise not found"), std::nullopt);
    }

    const int total = static_cast<int>(exercise->hints.size());
    const int tier = grading::UnlockedTier(attempts, exercise->hint_unlock_attempts, total);
    nlohmann::json hints = nlohmann::json::array();
    for (int i = 0; i < tier; ++i) {
        hints.push_back({{"level", exercise->hints[i].level}, {"text", exercise->hints[i].text}});
    }
    const auto next = grading::NextUnlockAttempt(attempts, exercise->hint_unlock_attempts, total);

    ApiResponse response{200, {
        {"exerciseId", exercise_id},
        {"attempts", attempts},
        {"unlockedTier", tier},
        {"totalHints", total},
        {"hints", hints},
        {"nextHintUnlockAtAttempt", next ? nlohmann::json(*next) : nlohmann::json(nullptr)}
    }, {}};
    return Finish(request, std::move(response), std::nullopt);
}

ApiResponse GradingApi::HandleHealth() const {
    return ApiResponse{200, {
        {"status", "healthy"},
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"exercises", catalog_.Size()}
    }, {}};
}

void GradingApi::Register(httplib::Server& server) {
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        WriteResponse(res, HandleHealth());
    });
    server.Post(kGradeRoute, [this](const httplib::Request& req, httplib::Response& res) {
        WriteResponse(res, HandleGrade(FromHttp(req)));
    });
    server.Post(kRunRoute, [this](const httplib::Request& req, httplib::Response& res) {
        WriteResponse(res, HandleRun(FromHttp(req)));
    });
    server.Get(R"(/api/exercises/([^/]+)/hints)", [this](const httplib::Request& req, httplib::Response& res) {
        const auto attempts = req.has_param("attempts") ? req.get_param_value("attempts") : std::string();
        WriteResponse(res, HandleHints(FromHttp(req), req.matches[1].str(), attempts));
    });
}

}  // namespace gradebox::gateway
