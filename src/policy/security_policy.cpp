#include "policy/security_policy.hpp"
#include "util/embedded_python.hpp"
#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>
#include <fstream>

namespace py = pybind11;

namespace mathviz::policy {

// ============================================================================
// Default tables
// ============================================================================

const std::vector<std::string> DEFAULT_FORBIDDEN_FUNCTIONS = {
    "eval", "exec", "compile", "__import__",
    "open", "file", "input", "raw_input",
    "exit", "quit", "reload", "help",
    "vars", "locals", "globals", "dir",
    "getattr", "setattr", "delattr", "hasattr",
    "callable", "isinstance", "issubclass",
    "breakpoint", "memoryview", "bytearray",
    "classmethod", "staticmethod", "property",
    "super", "type", "id", "hash"
};

const std::vector<std::string> DEFAULT_FORBIDDEN_MODULES = {
    "os", "sys", "subprocess", "socket", "urllib",
    "urllib2", "urllib3", "requests", "http", "httplib",
    "ftplib", "smtplib", "email", "imaplib", "poplib",
    "pickle", "marshal", "shelve", "dbm", "gdbm",
    "sqlite3", "mysql", "psycopg2", "pymongo",
    "ctypes", "cffi", "gc", "threading", "thread",
    "multiprocessing", "asyncio", "concurrent",
    "importlib", "imp", "pkgutil", "modulefinder",
    "code", "codeop", "ast", "compiler", "py_compile",
    "compileall", "dis", "pickletools",
    "tempfile", "shutil", "glob", "fnmatch",
    "linecache", "fileinput", "filecmp",
    "tarfile", "zipfile", "gzip", "bz2", "lzma",
    "pty", "tty", "grp", "pwd", "spwd",
    "platform", "getpass", "resource", "rlcompleter"
};

const std::vector<std::string> DEFAULT_ALLOWED_MODULES = {
    "matplotlib", "matplotlib.pyplot", "matplotlib.patches",
    "matplotlib.animation", "matplotlib.figure", "matplotlib.axes",
    "numpy", "np",
    "math", "cmath",
    "datetime", "time", "calendar",
    "re", "regex",
    "random",
    "statistics",
    "fractions", "decimal",
    "collections", "itertools", "functools",
    "copy", "deepcopy",
    "json",
    "warnings"
};

const std::vector<std::string> DEFAULT_DANGEROUS_PATTERNS = {
    R"(__.*__)",
    R"(\.system\s*\()",
    R"(\.popen\s*\()",
    R"(\.spawn\s*\()",
    R"(eval\s*\()",
    R"(exec\s*\()",
    R"(import\s+os)",
    R"(from\s+os\s+import)",
    R"(subprocess\.)",
    R"(\.read\s*\()",
    R"(\.write\s*\()",
    R"(\.delete\s*\()",
    R"(\.remove\s*\()",
    R"(\.rmdir\s*\()",
    R"(\.mkdir\s*\()",
    R"(\.chmod\s*\()",
    R"(\.chown\s*\()",
    R"(http[s]?://)",
    R"(ftp://)",
    R"(file://)",
    R"(\.connect\s*\()",
    R"(\.send\s*\()",
    R"(\.recv\s*\()",
    R"(\.listen\s*\()",
    R"(\.bind\s*\()"
};

const std::vector<std::string> DEFAULT_FILE_OPERATION_PATTERNS = {
    R"(open\s*\()",
    R"(\.open\s*\()",
    R"(file\s*\()",
    R"(\.file\s*\()",
    R"(with\s+open\s*\()"
};

const std::vector<std::string> DEFAULT_NETWORK_PATTERNS = {
    R"(http[s]?://)",
    R"(ftp://)",
    R"(\.connect\s*\()",
    R"(\.send\s*\()",
    R"(\.recv\s*\()",
    R"(\.request\s*\()",
    R"(\.get\s*\()",
    R"(\.post\s*\()",
    R"(socket\.)",
    R"(urllib\.)",
    R"(requests\.)"
};

const std::vector<std::string> DEFAULT_SAFE_BUILTINS = {
    // Types and constructors
    "bool", "int", "float", "complex", "str", "list", "dict", "tuple", "set",
    "frozenset", "slice", "object",
    // Iteration and aggregation
    "len", "range", "enumerate", "zip", "map", "filter", "sorted", "reversed",
    "iter", "next", "all", "any", "sum", "min", "max",
    // Arithmetic
    "abs", "round", "pow", "divmod",
    // Formatting
    "repr", "format", "chr", "ord",
    // Exceptions the scripts raise or catch
    "Exception", "ArithmeticError", "ValueError", "TypeError", "ZeroDivisionError",
    "IndexError", "KeyError", "StopIteration", "RuntimeError",
    "OverflowError", "AttributeError", "NameError",
    // Constants
    "True", "False", "None",
    // Needed by class statements; the name itself never passes validation
    "__build_class__"
};

namespace {

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    if (!j[key].is_array()) {
        throw PolicyError(std::string("policy field '") + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            throw PolicyError(std::string("policy field '") + key + "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// Caller holds the GIL
void compile_all(const py::module_& re, const std::vector<std::string>& patterns,
                 const char* table) {
    py::object flags = re.attr("IGNORECASE") | re.attr("MULTILINE");
    for (const auto& pattern : patterns) {
        try {
            re.attr("compile")(pattern, flags);
        } catch (const py::error_already_set& e) {
            throw PolicyError(std::string("invalid ") + table + " pattern '" + pattern +
                              "': " + e.what());
        }
    }
}

} // anonymous namespace

// ============================================================================
// SecurityPolicy Implementation
// ============================================================================

SecurityPolicy SecurityPolicy::defaults() {
    SecurityPolicy policy;
    policy.forbidden_functions.insert(DEFAULT_FORBIDDEN_FUNCTIONS.begin(),
                                      DEFAULT_FORBIDDEN_FUNCTIONS.end());
    policy.forbidden_modules.insert(DEFAULT_FORBIDDEN_MODULES.begin(),
                                    DEFAULT_FORBIDDEN_MODULES.end());
    policy.allowed_modules.insert(DEFAULT_ALLOWED_MODULES.begin(),
                                  DEFAULT_ALLOWED_MODULES.end());
    policy.dangerous_patterns = DEFAULT_DANGEROUS_PATTERNS;
    policy.file_operation_patterns = DEFAULT_FILE_OPERATION_PATTERNS;
    policy.network_patterns = DEFAULT_NETWORK_PATTERNS;
    policy.safe_builtins = DEFAULT_SAFE_BUILTINS;
    policy.preloaded_modules = {
        {"matplotlib", "matplotlib"},
        {"plt", "matplotlib.pyplot"},
        {"np", "numpy"},
        {"numpy", "numpy"},
        {"math", "math"},
        {"re", "re"},
        {"datetime", "datetime"},
        {"random", "random"},
        {"json", "json"}
    };
    return policy;
}

SecurityPolicy SecurityPolicy::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw PolicyError("policy must be a JSON object");
    }

    SecurityPolicy policy = defaults();

    if (j.contains("forbidden_functions")) {
        auto list = string_list(j, "forbidden_functions");
        policy.forbidden_functions = std::set<std::string>(list.begin(), list.end());
    }
    if (j.contains("forbidden_modules")) {
        auto list = string_list(j, "forbidden_modules");
        policy.forbidden_modules = std::set<std::string>(list.begin(), list.end());
    }
    if (j.contains("allowed_modules")) {
        auto list = string_list(j, "allowed_modules");
        policy.allowed_modules = std::set<std::string>(list.begin(), list.end());
    }
    if (j.contains("dangerous_patterns")) {
        policy.dangerous_patterns = string_list(j, "dangerous_patterns");
    }
    if (j.contains("file_operation_patterns")) {
        policy.file_operation_patterns = string_list(j, "file_operation_patterns");
    }
    if (j.contains("network_patterns")) {
        policy.network_patterns = string_list(j, "network_patterns");
    }
    if (j.contains("safe_builtins")) {
        policy.safe_builtins = string_list(j, "safe_builtins");
    }

    try {
        if (j.contains("max_code_bytes")) {
            policy.max_code_bytes = j["max_code_bytes"].get<size_t>();
        }
        if (j.contains("sanctioned_save_call")) {
            policy.sanctioned_save_call = j["sanctioned_save_call"].get<std::string>();
        }
        if (j.contains("save_context_window")) {
            policy.save_context_window = j["save_context_window"].get<size_t>();
        }
        if (j.contains("preloaded_modules")) {
            policy.preloaded_modules =
                j["preloaded_modules"].get<std::map<std::string, std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw PolicyError(std::string("invalid policy field: ") + e.what());
    }

    policy.check_patterns();
    return policy;
}

nlohmann::json SecurityPolicy::to_json() const {
    nlohmann::json j;

    j["forbidden_functions"] = forbidden_functions;
    j["forbidden_modules"] = forbidden_modules;
    j["allowed_modules"] = allowed_modules;
    j["dangerous_patterns"] = dangerous_patterns;
    j["file_operation_patterns"] = file_operation_patterns;
    j["network_patterns"] = network_patterns;
    j["max_code_bytes"] = max_code_bytes;
    j["sanctioned_save_call"] = sanctioned_save_call;
    j["save_context_window"] = save_context_window;
    j["safe_builtins"] = safe_builtins;
    j["preloaded_modules"] = preloaded_modules;

    return j;
}

void SecurityPolicy::check_patterns() const {
    try {
        util::EmbeddedPython::instance();
    } catch (const std::runtime_error& e) {
        throw PolicyError(std::string("cannot check patterns: ") + e.what());
    }

    py::gil_scoped_acquire gil;
    py::module_ re;
    try {
        re = py::module_::import("re");
    } catch (const py::error_already_set& e) {
        throw PolicyError(std::string("cannot check patterns: ") + e.what());
    }
    compile_all(re, dangerous_patterns, "dangerous");
    compile_all(re, file_operation_patterns, "file operation");
    compile_all(re, network_patterns, "network");
}

std::string SecurityPolicy::top_level_module(const std::string& module) {
    return module.substr(0, module.find('.'));
}

bool SecurityPolicy::is_module_forbidden(const std::string& module) const {
    return forbidden_modules.count(top_level_module(module)) > 0;
}

bool SecurityPolicy::is_module_allowed(const std::string& module) const {
    if (module.empty() || is_module_forbidden(module)) {
        return false;
    }
    return allowed_modules.count(module) > 0 ||
           allowed_modules.count(top_level_module(module)) > 0;
}

bool SecurityPolicy::is_function_forbidden(const std::string& name) const {
    return forbidden_functions.count(name) > 0;
}

SecurityPolicy load_policy_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw PolicyError("cannot open policy file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw PolicyError("malformed policy file " + path + ": " + e.what());
    }

    SecurityPolicy policy = SecurityPolicy::from_json(j);
    spdlog::info("Loaded security policy from {} ({} forbidden functions, {} allowed modules)",
                 path, policy.forbidden_functions.size(), policy.allowed_modules.size());
    return policy;
}

} // namespace mathviz::policy
