/**
 * MathViz Code Executor
 *
 * Common interface of the two execution strategies: in-process
 * (restricted namespace in the embedded interpreter) and process-isolated
 * (child interpreter behind a fixed harness).
 */
#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <optional>
#include "runtime/execution_types.hpp"
#include "runtime/resource_monitor.hpp"
#include "policy/security_policy.hpp"
#include "policy/security_validator.hpp"

namespace mathviz::runtime {

enum class ExecutionMode {
    RESTRICTED,   // In-process, restricted namespace
    PROCESS       // Child interpreter process
};

const char* execution_mode_to_string(ExecutionMode mode);

// Accepts "restricted" and "process"; throws std::invalid_argument otherwise
ExecutionMode execution_mode_from_string(const std::string& name);

struct ExecutorOptions {
    ResourceLimits limits;
    std::string python_path = "python3";      // Interpreter for process mode
    size_t max_output_bytes = 1024 * 1024;    // Captured output cap
};

class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;

    // Never throws for failures of the submitted code; those come back as
    // an unsuccessful ExecutionResult with an error code
    virtual ExecutionResult execute(const std::string& code,
                                    const std::string& output_path,
                                    std::chrono::milliseconds timeout) = 0;

    virtual ExecutionMode mode() const = 0;

protected:
    // Re-check the code; returns the rejection result when it fails
    static std::optional<ExecutionResult> reject_if_invalid(const policy::SecurityValidator& validator,
                                                            const std::string& code);

    // Create the directory that will hold output_path
    static std::optional<ExecutionResult> prepare_output_dir(const std::string& output_path);

    // Keep at most max_bytes of text, marking the cut
    static std::string truncate_output(std::string text, size_t max_bytes);
};

std::unique_ptr<CodeExecutor> make_executor(ExecutionMode mode,
                                            std::shared_ptr<const policy::SecurityPolicy> policy,
                                            const ExecutorOptions& options);

} // namespace mathviz::runtime
