#pragma once

#include <string>

#include "audit/audit_log.hpp"
#include "transport/code_runner.hpp"
#include "transport/redaction.hpp"

namespace gradebox::transport {

// The only caller of the runner service. Applies the caller deadline,
// redacts and truncates output, and audits every failure. Never retries.
class RunnerClient : public CodeRunner {
public:
    RunnerClient(std::string runner_url, audit::AuditSink& audit, Redactor redactor = Redactor());

    ExecutionResult Execute(const std::string& code,
                            const std::vector<exercise::TestSpec>& tests,
                            const exercise::Dataset& dataset,
                            const ExecuteOptions& options) override;

    const std::string& RunnerUrl() const { return runner_url_; }

private:
    ExecutionResult Fail(TransportStatus status,
                         const std::string& error_code,
                         const std::string& message,
                         const ExecuteOptions& options,
                         std::optional<int> runner_status = std::nullopt);
    audit::AuditEvent BaseEvent(const ExecuteOptions& options) const;

    std::string runner_url_;
    std::string scheme_host_port_;
    std::string base_path_;
    audit::AuditSink& audit_;
    Redactor redactor_;
};

}  // namespace gradebox::transport
