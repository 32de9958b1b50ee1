#include "kernel/config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mathviz::kernel {

namespace {

void check(const SandboxConfig& config) {
    try {
        runtime::execution_mode_from_string(config.default_mode);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    if (!(config.timeout_seconds > 0)) {
        throw ConfigError("timeout_seconds must be positive");
    }
    if (!(config.max_timeout_seconds > 0) || !std::isfinite(config.max_timeout_seconds)) {
        throw ConfigError("max_timeout_seconds must be a positive finite number");
    }
    if (config.max_memory_mb == 0) {
        throw ConfigError("max_memory_mb must be positive");
    }
    if (config.max_cpu_seconds == 0) {
        throw ConfigError("max_cpu_seconds must be positive");
    }
    if (config.python_path.empty()) {
        throw ConfigError("python_path must not be empty");
    }
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

uint64_t env_unsigned(const char* name, const char* value) {
    try {
        size_t pos = 0;
        std::string text(value);
        if (!text.empty() && text[0] == '-') {
            throw std::invalid_argument("negative");
        }
        unsigned long long n = std::stoull(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid value for ") + name + ": " + value);
    }
}

double env_double(const char* name, const char* value) {
    try {
        size_t pos = 0;
        std::string text(value);
        double n = std::stod(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid value for ") + name + ": " + value);
    }
}

} // anonymous namespace

// ============================================================================
// SandboxConfig
// ============================================================================

SandboxConfig SandboxConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    SandboxConfig config;
    try {
        config.default_mode = j.value("default_mode", config.default_mode);
        config.timeout_seconds = j.value("timeout_seconds", config.timeout_seconds);
        config.max_timeout_seconds = j.value("max_timeout_seconds", config.max_timeout_seconds);
        config.max_memory_mb = j.value("max_memory_mb", config.max_memory_mb);
        config.max_cpu_seconds = j.value("max_cpu_seconds", config.max_cpu_seconds);
        config.max_output_bytes = j.value("max_output_bytes", config.max_output_bytes);
        config.python_path = j.value("python_path", config.python_path);
        config.artifact_root = j.value("artifact_root", config.artifact_root);
        config.policy_file = j.value("policy_file", config.policy_file);
        config.log_level = j.value("log_level", config.log_level);
        config.audit_max_entries = j.value("audit_max_entries", config.audit_max_entries);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration field: ") + e.what());
    }

    check(config);
    return config;
}

json SandboxConfig::to_json() const {
    return {
        {"default_mode", default_mode},
        {"timeout_seconds", timeout_seconds},
        {"max_timeout_seconds", max_timeout_seconds},
        {"max_memory_mb", max_memory_mb},
        {"max_cpu_seconds", max_cpu_seconds},
        {"max_output_bytes", max_output_bytes},
        {"python_path", python_path},
        {"artifact_root", artifact_root},
        {"policy_file", policy_file},
        {"log_level", log_level},
        {"audit_max_entries", audit_max_entries}
    };
}

void SandboxConfig::apply_env() {
    if (const char* v = env("MATHVIZ_MODE")) {
        default_mode = v;
    }
    if (const char* v = env("MATHVIZ_TIMEOUT")) {
        timeout_seconds = env_double("MATHVIZ_TIMEOUT", v);
    }
    if (const char* v = env("MATHVIZ_MAX_TIMEOUT")) {
        max_timeout_seconds = env_double("MATHVIZ_MAX_TIMEOUT", v);
    }
    if (const char* v = env("MATHVIZ_MAX_MEMORY_MB")) {
        max_memory_mb = env_unsigned("MATHVIZ_MAX_MEMORY_MB", v);
    }
    if (const char* v = env("MATHVIZ_MAX_CPU_SECONDS")) {
        max_cpu_seconds = env_unsigned("MATHVIZ_MAX_CPU_SECONDS", v);
    }
    if (const char* v = env("MATHVIZ_PYTHON")) {
        python_path = v;
    }
    if (const char* v = env("MATHVIZ_ARTIFACT_ROOT")) {
        artifact_root = v;
    }
    if (const char* v = env("MATHVIZ_POLICY_FILE")) {
        policy_file = v;
    }
    if (const char* v = env("MATHVIZ_LOG_LEVEL")) {
        log_level = v;
    }
    check(*this);
}

runtime::ExecutorOptions SandboxConfig::executor_options() const {
    runtime::ExecutorOptions options;
    options.limits.max_memory_bytes = max_memory_mb * 1024 * 1024;
    options.limits.max_cpu_seconds = max_cpu_seconds;
    options.python_path = python_path;
    options.max_output_bytes = max_output_bytes;
    return options;
}

std::chrono::milliseconds SandboxConfig::default_timeout() const {
    return timeout_for(timeout_seconds);
}

std::chrono::milliseconds SandboxConfig::max_timeout() const {
    return std::chrono::milliseconds(static_cast<int64_t>(max_timeout_seconds * 1000.0));
}

std::chrono::milliseconds SandboxConfig::timeout_for(double seconds) const {
    if (!(seconds > 0)) {
        return std::chrono::milliseconds(0);
    }
    // Compare in seconds so the conversion below stays in range
    double capped = std::min(seconds, max_timeout_seconds);
    return std::chrono::milliseconds(static_cast<int64_t>(capped * 1000.0));
}

// ============================================================================
// Loading
// ============================================================================

SandboxConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("malformed config file " + path + ": " + e.what());
    }

    spdlog::debug("Loaded config from {}", path);
    return SandboxConfig::from_json(j);
}

std::vector<fs::path> default_dotenv_paths() {
    std::vector<fs::path> paths;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / ".env");
        paths.push_back(cwd.parent_path() / ".env");
    }

    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = fs::path(exe_path).parent_path();
        paths.push_back(exe_dir / ".env");
        paths.push_back(exe_dir.parent_path() / ".env");
    }
    return paths;
}

std::optional<fs::path> load_dotenv(const std::vector<fs::path>& search_paths) {
    for (const auto& env_path : search_paths) {
        std::error_code ec;
        if (!fs::is_regular_file(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        if (!file) {
            spdlog::warn("Cannot read {}", env_path.string());
            continue;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            if (line.rfind("export ", 0) == 0) {
                line = trim(line.substr(7));
            }

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                continue;
            }

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(line.substr(eq_pos + 1));

            // Remove surrounding quotes
            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (!key.empty() && !value.empty()) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
        return env_path;
    }
    return std::nullopt;
}

SandboxConfig load_config(const std::string& path) {
    SandboxConfig config = path.empty() ? SandboxConfig{} : load_config_file(path);
    load_dotenv();
    config.apply_env();
    return config;
}

} // namespace mathviz::kernel
