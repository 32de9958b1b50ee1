#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace mathviz::runtime {

// Failure taxonomy shared by executors and the manager
enum class ErrorCode {
    NONE,
    SYNTAX_INVALID,      // Code does not parse
    SECURITY_REJECTED,   // Policy violation, or output path outside the artifact root
    EXECUTION_TIMEOUT,   // Wall-clock deadline expired
    RESOURCE_EXCEEDED,   // Memory or CPU ceiling hit
    RUNTIME_FAILURE,     // The submitted code raised
    HARNESS_FAILURE      // The sandbox machinery itself failed
};

const char* error_code_to_string(ErrorCode code);

// Throws std::invalid_argument for unknown names
ErrorCode error_code_from_string(const std::string& name);

struct ExecutionResult {
    bool success = false;
    std::optional<std::string> image_path;       // Set only if the file exists
    std::optional<nlohmann::json> result_data;   // The script's `result` binding
    double execution_time = 0.0;                 // seconds
    double memory_usage = 0.0;                   // peak RSS in MB, best-effort
    std::optional<std::string> error_message;
    ErrorCode error_code = ErrorCode::NONE;
    std::string output_logs;                     // Captured stdout (and tracebacks)

    static ExecutionResult failure(ErrorCode code, std::string message);

    nlohmann::json to_json() const;
};

} // namespace mathviz::runtime
