#include "runtime/execution_types.hpp"
#include <stdexcept>

namespace mathviz::runtime {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";
        case ErrorCode::SYNTAX_INVALID:    return "SYNTAX_INVALID";
        case ErrorCode::SECURITY_REJECTED: return "SECURITY_REJECTED";
        case ErrorCode::EXECUTION_TIMEOUT: return "EXECUTION_TIMEOUT";
        case ErrorCode::RESOURCE_EXCEEDED: return "RESOURCE_EXCEEDED";
        case ErrorCode::RUNTIME_FAILURE:   return "RUNTIME_FAILURE";
        case ErrorCode::HARNESS_FAILURE:   return "HARNESS_FAILURE";
        default:                           return "UNKNOWN";
    }
}

ErrorCode error_code_from_string(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::NONE, ErrorCode::SYNTAX_INVALID, ErrorCode::SECURITY_REJECTED,
        ErrorCode::EXECUTION_TIMEOUT, ErrorCode::RESOURCE_EXCEEDED,
        ErrorCode::RUNTIME_FAILURE, ErrorCode::HARNESS_FAILURE
    };
    for (ErrorCode code : all) {
        if (name == error_code_to_string(code)) {
            return code;
        }
    }
    throw std::invalid_argument("unknown error code: " + name);
}

ExecutionResult ExecutionResult::failure(ErrorCode code, std::string message) {
    ExecutionResult result;
    result.success = false;
    result.error_code = code;
    result.error_message = std::move(message);
    return result;
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["image_path"] = image_path ? nlohmann::json(*image_path) : nlohmann::json(nullptr);
    j["result_data"] = result_data ? *result_data : nlohmann::json(nullptr);
    j["execution_time"] = execution_time;
    j["memory_usage"] = memory_usage;
    j["error_message"] = error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr);
    j["error_code"] = error_code_to_string(error_code);
    j["output_logs"] = output_logs;
    return j;
}

} // namespace mathviz::runtime
