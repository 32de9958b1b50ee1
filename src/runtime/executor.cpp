#include "runtime/executor.hpp"
#include "runtime/restricted_executor.hpp"
#include "runtime/process_executor.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mathviz::runtime {

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

} // anonymous namespace

const char* execution_mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::RESTRICTED: return "restricted";
        case ExecutionMode::PROCESS:    return "process";
        default:                        return "unknown";
    }
}

ExecutionMode execution_mode_from_string(const std::string& name) {
    if (name == "restricted") {
        return ExecutionMode::RESTRICTED;
    }
    if (name == "process") {
        return ExecutionMode::PROCESS;
    }
    throw std::invalid_argument("unknown execution mode: " + name);
}

std::optional<ExecutionResult> CodeExecutor::reject_if_invalid(
        const policy::SecurityValidator& validator, const std::string& code) {
    policy::CodeValidationResult validation = validator.validate(code);
    if (validation.is_valid) {
        return std::nullopt;
    }

    if (!validation.syntax_errors.empty()) {
        return ExecutionResult::failure(ErrorCode::SYNTAX_INVALID,
            "code security validation failed: " + join(validation.syntax_errors, "; "));
    }
    return ExecutionResult::failure(ErrorCode::SECURITY_REJECTED,
        "code security validation failed: " + join(validation.security_issues, "; "));
}

std::optional<ExecutionResult> CodeExecutor::prepare_output_dir(const std::string& output_path) {
    fs::path dir = fs::path(output_path).parent_path();
    if (dir.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create output directory {}: {}", dir.string(), ec.message());
        return ExecutionResult::failure(ErrorCode::HARNESS_FAILURE,
            "cannot create output directory " + dir.string() + ": " + ec.message());
    }
    return std::nullopt;
}

std::string CodeExecutor::truncate_output(std::string text, size_t max_bytes) {
    if (max_bytes == 0 || text.size() <= max_bytes) {
        return text;
    }
    text.resize(max_bytes);
    text += "\n[output truncated]";
    return text;
}

std::unique_ptr<CodeExecutor> make_executor(ExecutionMode mode,
                                            std::shared_ptr<const policy::SecurityPolicy> policy,
                                            const ExecutorOptions& options) {
    switch (mode) {
        case ExecutionMode::RESTRICTED:
            return std::make_unique<RestrictedExecutor>(std::move(policy), options);
        case ExecutionMode::PROCESS:
            return std::make_unique<ProcessExecutor>(std::move(policy), options);
    }
    throw std::invalid_argument("unknown execution mode");
}

} // namespace mathviz::runtime
