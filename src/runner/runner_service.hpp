#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_executor.hpp"

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace gradebox::runner {

constexpr const char* kServiceName = "gradebox-runner";
constexpr const char* kServiceVersion = "1.0.0";

struct ServiceReply {
    int status = 200;
    nlohmann::json body;
};

// Executes submitted programs in the sandbox and evaluates their tests.
class RunnerService {
public:
    explicit RunnerService(config::RunnerConfig config);

    ServiceReply HandleRun(const std::string& body, const std::string& request_id = "") const;
    ServiceReply HandleHealth() const;

    void Register(httplib::Server& server) const;

private:
    sandbox::SandboxLimits Limits() const;

    config::RunnerConfig config_;
};

}  // namespace gradebox::runner
