#include "kernel/sandbox_manager.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mathviz::kernel {

using runtime::ErrorCode;
using runtime::ExecutionMode;

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

double rate(uint64_t count, uint64_t total) {
    return total == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(total);
}

// Caller holds the stats mutex
void update_average(ExecutionStats& stats) {
    stats.avg_execution_time = stats.total_executions == 0
        ? 0.0
        : stats.total_execution_time / static_cast<double>(stats.total_executions);
}

policy::SecurityPolicy initial_policy(const SandboxConfig& config) {
    if (config.policy_file.empty()) {
        return policy::SecurityPolicy::defaults();
    }
    spdlog::info("Loading security policy from {}", config.policy_file);
    return policy::load_policy_file(config.policy_file);
}

// Drops the empty element a trailing separator leaves behind
fs::path resolved(const fs::path& path) {
    fs::path p = fs::weakly_canonical(fs::absolute(path));
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

} // anonymous namespace

// ============================================================================
// Response and statistics
// ============================================================================

json SandboxExecutionResponse::to_json() const {
    json j;
    j["overall_success"] = overall_success;
    j["error_code"] = runtime::error_code_to_string(error_code);
    j["error_message"] = error_message ? json(*error_message) : json(nullptr);
    j["validation_result"] = validation_result ? validation_result->to_json() : json(nullptr);
    j["execution_result"] = execution_result ? execution_result->to_json() : json(nullptr);
    return j;
}

json ExecutionStats::to_json() const {
    return {
        {"total_executions", total_executions},
        {"successful_executions", successful_executions},
        {"failed_executions", failed_executions},
        {"validation_failures", validation_failures},
        {"execution_failures", execution_failures},
        {"harness_failures", harness_failures},
        {"total_execution_time", total_execution_time},
        {"avg_execution_time", avg_execution_time},
        {"success_rate", rate(successful_executions, total_executions)},
        {"validation_failure_rate", rate(validation_failures, total_executions)},
        {"execution_failure_rate", rate(execution_failures, total_executions)}
    };
}

// ============================================================================
// SandboxManager
// ============================================================================

SandboxManager::SandboxManager(SandboxConfig config)
    : SandboxManager(config, initial_policy(config)) {}

SandboxManager::SandboxManager(SandboxConfig config, policy::SecurityPolicy policy)
    : config_(std::move(config)),
      audit_(config_.audit_max_entries) {
    policy_ = std::make_shared<const policy::SecurityPolicy>(std::move(policy));
    validator_ = std::make_shared<const policy::SecurityValidator>(policy_);

    spdlog::info("Sandbox manager ready (default mode {}, timeout {}s, memory {} MB, cpu {}s)",
                 config_.default_mode, config_.timeout_seconds,
                 config_.max_memory_mb, config_.max_cpu_seconds);
    if (config_.artifact_root.empty()) {
        spdlog::warn("No artifact root configured: output paths are not confined");
    }
}

SandboxExecutionResponse SandboxManager::execute_code_safely(const std::string& code,
                                                             const std::string& output_path,
                                                             ExecutionMode mode,
                                                             std::chrono::milliseconds timeout,
                                                             bool validate_first) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.total_executions++;
        update_average(stats_);
    }

    try {
        return run(code, output_path, mode, timeout, validate_first);
    } catch (const std::exception& e) {
        return harness_failure(std::string("sandbox manager error: ") + e.what());
    }
}

SandboxExecutionResponse SandboxManager::execute_code_safely(const std::string& code,
                                                             const std::string& output_path,
                                                             const std::string& mode,
                                                             std::chrono::milliseconds timeout,
                                                             bool validate_first) {
    ExecutionMode parsed;
    try {
        parsed = runtime::execution_mode_from_string(mode);
    } catch (const std::invalid_argument& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.total_executions++;
        }
        return harness_failure(std::string("sandbox manager error: ") + e.what());
    }
    return execute_code_safely(code, output_path, parsed, timeout, validate_first);
}

json SandboxManager::handle_request(const json& request) {
    std::string code;
    std::string output_path;
    std::string mode = config_.default_mode;
    double timeout_seconds = config_.timeout_seconds;

    try {
        if (!request.is_object()) {
            throw std::invalid_argument("request must be a JSON object");
        }
        code = request.at("code").get<std::string>();
        output_path = request.at("output_path").get<std::string>();
        mode = request.value("execution_mode", mode);
        timeout_seconds = request.value("timeout_seconds", timeout_seconds);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.total_executions++;
        }
        return harness_failure(std::string("invalid request: ") + e.what()).to_json();
    }

    // Inbound requests are always validated
    return execute_code_safely(code, output_path, mode, config_.timeout_for(timeout_seconds))
        .to_json();
}

policy::CodeValidationResult SandboxManager::validate(const std::string& code) const {
    return current_validator()->validate(code);
}

ExecutionStats SandboxManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

json SandboxManager::get_sandbox_stats() const {
    json j = stats().to_json();
    j["audit"] = audit_.summary();
    return j;
}

void SandboxManager::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = ExecutionStats{};
    spdlog::info("Sandbox statistics reset");
}

json SandboxManager::get_security_report() const {
    json report = current_validator()->get_security_report();
    report["default_mode"] = config_.default_mode;
    report["artifact_root"] = config_.artifact_root;
    return report;
}

void SandboxManager::reload_policy(policy::SecurityPolicy policy) {
    // Build everything first so a bad policy leaves the old one in place
    auto shared = std::make_shared<const policy::SecurityPolicy>(std::move(policy));
    auto validator = std::make_shared<const policy::SecurityValidator>(shared);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        policy_ = shared;
        validator_ = validator;
        executors_.clear();
    }

    audit_.record(AuditCategory::POLICY, "POLICY_RELOADED", {
        {"forbidden_functions", shared->forbidden_functions.size()},
        {"forbidden_modules", shared->forbidden_modules.size()},
        {"allowed_modules", shared->allowed_modules.size()},
        {"dangerous_patterns", shared->dangerous_patterns.size()}
    });
    spdlog::info("Security policy reloaded");
}

// ============================================================================
// Internals
// ============================================================================

std::shared_ptr<const policy::SecurityValidator> SandboxManager::current_validator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validator_;
}

std::shared_ptr<runtime::CodeExecutor> SandboxManager::executor_for(ExecutionMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executors_.find(mode);
    if (it != executors_.end()) {
        return it->second;
    }

    std::shared_ptr<runtime::CodeExecutor> executor =
        runtime::make_executor(mode, policy_, config_.executor_options());
    executors_[mode] = executor;
    spdlog::debug("Created {} executor", runtime::execution_mode_to_string(mode));
    return executor;
}

std::optional<std::string> SandboxManager::check_output_path(const std::string& output_path) const {
    if (config_.artifact_root.empty()) {
        return std::nullopt;
    }

    fs::path root = resolved(config_.artifact_root);
    fs::path target = resolved(output_path);

    auto target_it = target.begin();
    for (const auto& part : root) {
        if (target_it == target.end() || *target_it != part) {
            return std::string("output path escapes artifact root");
        }
        ++target_it;
    }
    if (target_it == target.end()) {
        return std::string("output path escapes artifact root");
    }
    return std::nullopt;
}

SandboxExecutionResponse SandboxManager::run(const std::string& code,
                                             const std::string& output_path,
                                             ExecutionMode mode,
                                             std::chrono::milliseconds timeout,
                                             bool validate_first) {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (timeout > config_.max_timeout()) {
        spdlog::warn("Timeout of {} ms capped at {} ms", timeout.count(), config_.max_timeout().count());
        timeout = config_.max_timeout();
    }
    if (output_path.empty()) {
        throw std::invalid_argument("output_path must not be empty");
    }

    SandboxExecutionResponse response;
    const char* mode_name = runtime::execution_mode_to_string(mode);

    if (validate_first) {
        policy::CodeValidationResult validation = current_validator()->validate(code);
        response.validation_result = validation;

        if (!validation.is_valid) {
            bool syntax = !validation.syntax_errors.empty();
            std::string issues = syntax ? join(validation.syntax_errors, "; ")
                                        : join(validation.security_issues, "; ");
            response.error_code = syntax ? ErrorCode::SYNTAX_INVALID : ErrorCode::SECURITY_REJECTED;
            response.error_message = "code security validation failed: " + issues;
            spdlog::warn("Code rejected before execution: {}", issues);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.validation_failures++;
                stats_.failed_executions++;
            }
            audit_.record_denial("VALIDATION_REJECTED", {
                {"mode", mode_name},
                {"error_code", runtime::error_code_to_string(response.error_code)},
                {"security_issues", validation.security_issues},
                {"syntax_errors", validation.syntax_errors}
            });
            return response;
        }
    }

    if (auto reason = check_output_path(output_path)) {
        response.error_code = ErrorCode::SECURITY_REJECTED;
        response.error_message = *reason;
        spdlog::warn("Output path {} rejected: outside {}", output_path, config_.artifact_root);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.validation_failures++;
            stats_.failed_executions++;
        }
        audit_.record_denial("OUTPUT_PATH_REJECTED", {
            {"output_path", output_path},
            {"artifact_root", config_.artifact_root}
        });
        return response;
    }

    auto executor = executor_for(mode);
    spdlog::info("Executing code in {} mode (timeout {} ms)", mode_name, timeout.count());
    runtime::ExecutionResult result = executor->execute(code, output_path, timeout);
    record_execution(mode, result);

    response.overall_success = result.success;
    if (!result.success) {
        response.error_message = result.error_message;
        response.error_code = result.error_code;
    }
    response.execution_result = std::move(result);
    return response;
}

SandboxExecutionResponse SandboxManager::harness_failure(const std::string& message) {
    spdlog::error("{}", message);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.harness_failures++;
        stats_.failed_executions++;
        update_average(stats_);
    }
    audit_.record(AuditCategory::EXECUTION, "HARNESS_FAILURE", {{"error", message}}, false);

    SandboxExecutionResponse response;
    response.error_code = ErrorCode::HARNESS_FAILURE;
    response.error_message = message;
    return response;
}

void SandboxManager::record_execution(ExecutionMode mode, const runtime::ExecutionResult& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.total_execution_time += result.execution_time;
        if (result.success) {
            stats_.successful_executions++;
        } else {
            stats_.execution_failures++;
            stats_.failed_executions++;
        }
        update_average(stats_);
    }

    const char* mode_name = runtime::execution_mode_to_string(mode);
    const char* code_name = runtime::error_code_to_string(result.error_code);
    audit_.record(AuditCategory::EXECUTION, "EXECUTION_COMPLETED", {
        {"mode", mode_name},
        {"success", result.success},
        {"execution_time", result.execution_time},
        {"memory_usage", result.memory_usage},
        {"error_code", code_name}
    }, result.success);

    if (result.error_code == ErrorCode::EXECUTION_TIMEOUT ||
        result.error_code == ErrorCode::RESOURCE_EXCEEDED) {
        audit_.record(AuditCategory::RESOURCE, code_name, {
            {"mode", mode_name},
            {"error", result.error_message.value_or("")}
        }, false);
    } else if (result.error_code == ErrorCode::HARNESS_FAILURE) {
        audit_.record(AuditCategory::EXECUTION, "HARNESS_FAILURE", {
            {"mode", mode_name},
            {"error", result.error_message.value_or("")}
        }, false);
    }
}

} // namespace mathviz::kernel
