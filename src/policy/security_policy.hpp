#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace mathviz::policy {

// Raised for malformed policy files or invalid pattern tables
class PolicyError : public std::runtime_error {
public:
    explicit PolicyError(const std::string& message)
        : std::runtime_error(message) {}
};

// Policy tables shared by the validator and both executors
struct SecurityPolicy {
    // Static checks
    std::set<std::string> forbidden_functions;
    std::set<std::string> forbidden_modules;
    std::set<std::string> allowed_modules;
    std::vector<std::string> dangerous_patterns;       // Python re syntax, IGNORECASE | MULTILINE
    std::vector<std::string> file_operation_patterns;
    std::vector<std::string> network_patterns;

    // Larger submissions are rejected before any analysis
    size_t max_code_bytes = 100000;

    // The one file write that is tolerated, and how close it must be
    std::string sanctioned_save_call = "savefig";
    size_t save_context_window = 50;

    // Runtime namespace
    std::vector<std::string> safe_builtins;
    std::map<std::string, std::string> preloaded_modules;  // binding name -> module path

    // Built-in tables
    static SecurityPolicy defaults();

    // Start from defaults and replace every table present in the JSON.
    // Throws PolicyError on wrong types or patterns that do not compile.
    static SecurityPolicy from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // Compile every pattern with the embedded interpreter's re module;
    // throws PolicyError naming the bad one
    void check_patterns() const;

    // Import gate: the top-level package must not be forbidden, and either the
    // full dotted name or its top-level package must be allow-listed
    bool is_module_allowed(const std::string& module) const;
    bool is_module_forbidden(const std::string& module) const;
    bool is_function_forbidden(const std::string& name) const;

    static std::string top_level_module(const std::string& module);
};

// Read a policy JSON file (tables missing from the file keep their defaults)
SecurityPolicy load_policy_file(const std::string& path);

// Default tables
extern const std::vector<std::string> DEFAULT_FORBIDDEN_FUNCTIONS;
extern const std::vector<std::string> DEFAULT_FORBIDDEN_MODULES;
extern const std::vector<std::string> DEFAULT_ALLOWED_MODULES;
extern const std::vector<std::string> DEFAULT_DANGEROUS_PATTERNS;
extern const std::vector<std::string> DEFAULT_FILE_OPERATION_PATTERNS;
extern const std::vector<std::string> DEFAULT_NETWORK_PATTERNS;
extern const std::vector<std::string> DEFAULT_SAFE_BUILTINS;

} // namespace mathviz::policy
