/**
 * MathViz Sandbox Manager
 *
 * Entry point for callers: validates generated code, confines output
 * paths, dispatches to the executor for the requested mode, and keeps
 * execution statistics and an audit trail. Safe to share between threads;
 * validation and execution run outside the manager lock.
 */
#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <map>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/audit_log.hpp"
#include "policy/security_policy.hpp"
#include "policy/security_validator.hpp"
#include "runtime/executor.hpp"

namespace mathviz::kernel {

struct SandboxExecutionResponse {
    std::optional<policy::CodeValidationResult> validation_result;
    std::optional<runtime::ExecutionResult> execution_result;
    bool overall_success = false;
    std::optional<std::string> error_message;
    runtime::ErrorCode error_code = runtime::ErrorCode::NONE;

    nlohmann::json to_json() const;
};

struct ExecutionStats {
    uint64_t total_executions = 0;
    uint64_t successful_executions = 0;
    uint64_t failed_executions = 0;
    uint64_t validation_failures = 0;
    uint64_t execution_failures = 0;
    uint64_t harness_failures = 0;
    double total_execution_time = 0.0;   // seconds
    double avg_execution_time = 0.0;

    // Counters plus success / failure rates (0.0 before the first execution)
    nlohmann::json to_json() const;
};

class SandboxManager {
public:
    // Loads config.policy_file when set; throws policy::PolicyError if it is invalid
    explicit SandboxManager(SandboxConfig config = SandboxConfig{});
    SandboxManager(SandboxConfig config, policy::SecurityPolicy policy);

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    // Never throws; every failure is reported in the response
    SandboxExecutionResponse execute_code_safely(const std::string& code,
                                                 const std::string& output_path,
                                                 runtime::ExecutionMode mode,
                                                 std::chrono::milliseconds timeout,
                                                 bool validate_first = true);

    // Mode by name; an unknown name yields a HARNESS_FAILURE response
    SandboxExecutionResponse execute_code_safely(const std::string& code,
                                                 const std::string& output_path,
                                                 const std::string& mode,
                                                 std::chrono::milliseconds timeout,
                                                 bool validate_first = true);

    // {code, output_path, execution_mode?, timeout_seconds?} -> response JSON.
    // Always validates; the timeout is capped at max_timeout_seconds.
    nlohmann::json handle_request(const nlohmann::json& request);

    policy::CodeValidationResult validate(const std::string& code) const;

    ExecutionStats stats() const;
    nlohmann::json get_sandbox_stats() const;
    void reset_stats();

    nlohmann::json get_security_report() const;

    // Replace the policy tables; executors are rebuilt on next use.
    // Throws policy::PolicyError if a pattern does not compile.
    void reload_policy(policy::SecurityPolicy policy);

    AuditLogger& audit_log() { return audit_; }
    const AuditLogger& audit_log() const { return audit_; }
    const SandboxConfig& config() const { return config_; }

private:
    SandboxConfig config_;
    AuditLogger audit_;

    mutable std::mutex mutex_;   // Guards everything below
    ExecutionStats stats_;
    std::shared_ptr<const policy::SecurityPolicy> policy_;
    std::shared_ptr<const policy::SecurityValidator> validator_;
    std::map<runtime::ExecutionMode, std::shared_ptr<runtime::CodeExecutor>> executors_;

    std::shared_ptr<const policy::SecurityValidator> current_validator() const;
    std::shared_ptr<runtime::CodeExecutor> executor_for(runtime::ExecutionMode mode);

    // Empty when output_path may be written, otherwise the reason
    std::optional<std::string> check_output_path(const std::string& output_path) const;

    SandboxExecutionResponse run(const std::string& code,
                                 const std::string& output_path,
                                 runtime::ExecutionMode mode,
                                 std::chrono::milliseconds timeout,
                                 bool validate_first);
    SandboxExecutionResponse harness_failure(const std::string& message);
    void record_execution(runtime::ExecutionMode mode, const runtime::ExecutionResult& result);
};

} // namespace mathviz::kernel
