/**
 * MathViz Sandbox Configuration
 *
 * Defaults, JSON config files, a .env file and MATHVIZ_* environment
 * overrides, applied in that order.
 */
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "runtime/executor.hpp"

namespace mathviz::kernel {

// Raised for unreadable or malformed configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

struct SandboxConfig {
    std::string default_mode = "restricted";
    double timeout_seconds = 30.0;
    double max_timeout_seconds = 600.0;   // Cap for per-request timeouts
    uint64_t max_memory_mb = 512;
    uint64_t max_cpu_seconds = 30;
    size_t max_output_bytes = 1024 * 1024;
    std::string python_path = "python3";
    std::string artifact_root;       // Empty: output paths are not confined
    std::string policy_file;         // Empty: built-in policy tables
    std::string log_level = "info";
    size_t audit_max_entries = 10000;

    // Start from defaults and replace every field present; throws ConfigError
    static SandboxConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Apply MATHVIZ_* variables from the environment; throws ConfigError
    void apply_env();

    runtime::ExecutorOptions executor_options() const;
    std::chrono::milliseconds default_timeout() const;
    std::chrono::milliseconds max_timeout() const;

    // Seconds to milliseconds, capped at max_timeout_seconds; NaN and
    // non-positive values give zero
    std::chrono::milliseconds timeout_for(double seconds) const;
};

SandboxConfig load_config_file(const std::string& path);

// Candidate .env locations: working directory, its parents, the executable's directory
std::vector<std::filesystem::path> default_dotenv_paths();

// Load the first .env found; variables already in the environment win.
// Returns the file that was read.
std::optional<std::filesystem::path> load_dotenv(
    const std::vector<std::filesystem::path>& search_paths = default_dotenv_paths());

// Defaults, then the config file (if any), then .env and environment overrides
SandboxConfig load_config(const std::string& path = "");

} // namespace mathviz::kernel
