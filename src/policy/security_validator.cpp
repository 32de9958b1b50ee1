/**
 * MathViz Security Validator Implementation
 */
#include "policy/security_validator.hpp"
#include "util/embedded_python.hpp"
#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace py = pybind11;

namespace mathviz::policy {

const std::vector<std::string> UNCATCHABLE_EXCEPTIONS = {
    "BaseException", "KeyboardInterrupt", "SystemExit", "GeneratorExit"
};

namespace {

constexpr size_t MAX_CODE_LENGTH = 10000;
constexpr size_t MIN_CODE_LENGTH = 100;
constexpr int MAX_NESTING_DEPTH = 4;
constexpr size_t DUPLICATION_MIN_LINES = 50;
constexpr double DUPLICATION_MIN_UNIQUE_RATIO = 0.7;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string position(long line, long column) {
    return " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")";
}

// ============================================================================
// Python helpers (GIL held)
// ============================================================================

// ast node classes, looked up once per validation
struct AstKinds {
    explicit AstKinds(const py::module_& ast)
        : walk(ast.attr("walk")),
          iter_child_nodes(ast.attr("iter_child_nodes")),
          call(ast.attr("Call")),
          name(ast.attr("Name")),
          attribute(ast.attr("Attribute")),
          import(ast.attr("Import")),
          import_from(ast.attr("ImportFrom")),
          except_handler(ast.attr("ExceptHandler")),
          nesting(py::make_tuple(ast.attr("If"), ast.attr("For"), ast.attr("AsyncFor"),
                                 ast.attr("While"), ast.attr("With"), ast.attr("AsyncWith"))) {}

    py::object walk;
    py::object iter_child_nodes;
    py::object call;
    py::object name;
    py::object attribute;
    py::object import;
    py::object import_from;
    py::object except_handler;
    py::tuple nesting;
};

long optional_long(const py::object& value) {
    return value.is_none() ? 0 : value.cast<long>();
}

std::string syntax_error_message(const py::error_already_set& e) {
    const py::object& value = e.value();
    if (e.matches(PyExc_SyntaxError)) {
        std::string msg = py::str(value.attr("msg"));
        return "syntax error: " + msg +
               position(optional_long(value.attr("lineno")), optional_long(value.attr("offset")));
    }
    std::string type = py::str(e.type().attr("__name__"));
    std::string msg = py::str(value);
    return "syntax error: " + type + ": " + msg;
}

// Reports the byte where decoding stopped as line and column (both 1-based)
std::string decode_error_message(const std::string& code, const py::error_already_set& e) {
    size_t start = std::min(code.size(), e.value().attr("start").cast<size_t>());
    size_t line_start = 0;
    if (start > 0) {
        size_t newline = code.rfind('\n', start - 1);
        if (newline != std::string::npos) {
            line_start = newline + 1;
        }
    }
    long line = 1 + static_cast<long>(std::count(code.begin(), code.begin() + start, '\n'));
    return "syntax error: source is not valid UTF-8" +
           position(line, static_cast<long>(start - line_start) + 1);
}

int max_nesting_depth(const py::object& tree, const AstKinds& kinds) {
    int max_depth = 0;
    std::vector<std::pair<py::object, int>> stack;
    stack.emplace_back(tree, 0);
    while (!stack.empty()) {
        auto [node, depth] = std::move(stack.back());
        stack.pop_back();
        max_depth = std::max(max_depth, depth);
        for (auto child : kinds.iter_child_nodes(node)) {
            int child_depth = py::isinstance(child, kinds.nesting) ? depth + 1 : depth;
            stack.emplace_back(py::reinterpret_borrow<py::object>(child), child_depth);
        }
    }
    return max_depth;
}

// ============================================================================
// Syntax tree checks
// ============================================================================

void check_syntax_tree(const SecurityPolicy& policy, const AstKinds& kinds,
                       const std::vector<py::object>& nodes,
                       std::vector<std::string>& issues) {
    const auto& forbidden = policy.forbidden_functions;

    auto uncatchable = [](const std::string& name) {
        return std::find(UNCATCHABLE_EXCEPTIONS.begin(), UNCATCHABLE_EXCEPTIONS.end(), name) !=
               UNCATCHABLE_EXCEPTIONS.end();
    };

    for (const auto& node : nodes) {
        if (py::isinstance(node, kinds.call)) {
            py::object callee = node.attr("func");
            if (py::isinstance(callee, kinds.name)) {
                auto id = callee.attr("id").cast<std::string>();
                if (forbidden.count(id)) {
                    issues.push_back("forbidden function call: " + id);
                }
            } else if (py::isinstance(callee, kinds.attribute)) {
                auto attr = callee.attr("attr").cast<std::string>();
                if (forbidden.count(attr)) {
                    issues.push_back("forbidden method call: " + attr);
                }
            }
        } else if (py::isinstance(node, kinds.attribute)) {
            auto attr = node.attr("attr").cast<std::string>();
            if (forbidden.count(attr)) {
                issues.push_back("forbidden attribute access: " + attr);
            }
            if (!attr.empty() && attr[0] == '_') {
                issues.push_back("private attribute access: " + attr);
            }
            // Modules re-exported by allowed ones, e.g. random._os or matplotlib.os
            size_t bare = attr.find_first_not_of('_');
            if (bare != std::string::npos && policy.is_module_forbidden(attr.substr(bare))) {
                issues.push_back("forbidden module reference: " + attr);
            }
        } else if (py::isinstance(node, kinds.name)) {
            auto id = node.attr("id").cast<std::string>();
            if (forbidden.count(id)) {
                issues.push_back("forbidden name reference: " + id);
            }
        } else if (py::isinstance(node, kinds.except_handler)) {
            py::object caught = node.attr("type");
            if (caught.is_none()) {
                issues.push_back("forbidden exception handler: bare except");
                continue;
            }
            for (auto part : kinds.walk(caught)) {
                std::string name;
                if (py::isinstance(part, kinds.name)) {
                    name = part.attr("id").cast<std::string>();
                } else if (py::isinstance(part, kinds.attribute)) {
                    name = part.attr("attr").cast<std::string>();
                }
                if (uncatchable(name)) {
                    issues.push_back("forbidden exception handler: " + name);
                }
            }
        }
    }
}

void check_imports(const SecurityPolicy& policy, const AstKinds& kinds,
                   const std::vector<py::object>& nodes,
                   std::vector<std::string>& issues) {
    auto authorized = [&policy](const std::string& module) {
        return policy.allowed_modules.count(SecurityPolicy::top_level_module(module)) > 0 ||
               policy.allowed_modules.count(module) > 0;
    };

    for (const auto& node : nodes) {
        if (py::isinstance(node, kinds.import)) {
            for (auto alias : node.attr("names")) {
                auto module = alias.attr("name").cast<std::string>();
                if (policy.is_module_forbidden(module)) {
                    issues.push_back("forbidden module import: " + module);
                } else if (!authorized(module)) {
                    issues.push_back("unauthorized module import: " + module);
                }
            }
        } else if (py::isinstance(node, kinds.import_from)) {
            py::object module_name = node.attr("module");
            std::string module = module_name.is_none() ? "" : module_name.cast<std::string>();
            long level = optional_long(node.attr("level"));
            if (level > 0) {
                issues.push_back("unauthorized module import: " +
                                 std::string(static_cast<size_t>(level), '.') + module);
                continue;
            }
            if (policy.is_module_forbidden(module)) {
                issues.push_back("forbidden import from module: " + module);
            } else if (!authorized(module)) {
                issues.push_back("unauthorized module import: " + module);
            }
        }
    }
}

// ============================================================================
// Text checks
// ============================================================================

// Patterns go through re, whose compiled-pattern cache keeps repeat
// validations cheap
class PatternScanner {
public:
    explicit PatternScanner(py::str source)
        : re_(py::module_::import("re")),
          flags_(re_.attr("IGNORECASE") | re_.attr("MULTILINE")),
          source_(std::move(source)) {}

    bool search(const std::string& pattern) const {
        return !compile(pattern).attr("search")(source_).is_none();
    }

    py::object finditer(const std::string& pattern) const {
        return compile(pattern).attr("finditer")(source_);
    }

    const py::str& source() const { return source_; }

private:
    py::object compile(const std::string& pattern) const {
        return re_.attr("compile")(pattern, flags_);
    }

    py::module_ re_;
    py::object flags_;
    py::str source_;
};

void check_dangerous_patterns(const SecurityPolicy& policy, const PatternScanner& scanner,
                              std::vector<std::string>& issues) {
    for (const auto& pattern : policy.dangerous_patterns) {
        if (scanner.search(pattern)) {
            issues.push_back("dangerous code pattern: " + pattern);
        }
    }
}

// Offsets are in characters of the decoded source
void check_file_operations(const SecurityPolicy& policy, const PatternScanner& scanner,
                           std::vector<std::string>& issues) {
    const auto window = static_cast<py::ssize_t>(policy.save_context_window);
    const std::string sanctioned = to_lower(policy.sanctioned_save_call);

    for (const auto& pattern : policy.file_operation_patterns) {
        for (auto match : scanner.finditer(pattern)) {
            auto start = match.attr("start")().cast<py::ssize_t>();
            auto end = match.attr("end")().cast<py::ssize_t>();

            // Tolerated only within `window` characters of the sanctioned save call
            py::ssize_t ctx_start = std::max<py::ssize_t>(0, start - window);
            py::ssize_t ctx_end = end + window;
            py::object context = scanner.source()[py::slice(ctx_start, ctx_end, 1)];
            std::string nearby = context.attr("lower")().cast<std::string>();
            if (!sanctioned.empty() && contains(nearby, sanctioned)) {
                continue;
            }

            issues.push_back("forbidden file operation: " +
                             match.attr("group")(0).cast<std::string>() +
                             " (offset " + std::to_string(start) + ")");
        }
    }
}

void check_network_access(const SecurityPolicy& policy, const PatternScanner& scanner,
                          std::vector<std::string>& issues) {
    for (const auto& pattern : policy.network_patterns) {
        if (scanner.search(pattern)) {
            issues.push_back("forbidden network access: " + pattern);
        }
    }
}

// ============================================================================
// Warnings
// ============================================================================

void check_code_quality(const std::string& code, int nesting_depth,
                        std::vector<std::string>& warnings) {
    if (code.size() > MAX_CODE_LENGTH) {
        warnings.push_back("code is very long (" + std::to_string(code.size()) +
                           " characters); execution may be slow");
    } else if (code.size() < MIN_CODE_LENGTH) {
        warnings.push_back("code is very short (" + std::to_string(code.size()) +
                           " characters); it may be incomplete");
    }

    if (nesting_depth > MAX_NESTING_DEPTH) {
        warnings.push_back("nesting too deep (depth " + std::to_string(nesting_depth) + ")");
    }

    // Line-level duplication
    size_t total_lines = 0;
    std::unordered_set<std::string> unique_lines;
    std::istringstream stream(code);
    std::string line;
    while (std::getline(stream, line)) {
        total_lines++;
        std::string stripped = trim(line);
        if (!stripped.empty()) {
            unique_lines.insert(stripped);
        }
    }
    if (!code.empty() && code.back() == '\n') {
        total_lines++;
    }
    if (total_lines > DUPLICATION_MIN_LINES &&
        static_cast<double>(unique_lines.size()) / static_cast<double>(total_lines) <
            DUPLICATION_MIN_UNIQUE_RATIO) {
        warnings.push_back("high line duplication (" + std::to_string(unique_lines.size()) +
                           " unique of " + std::to_string(total_lines) + " lines)");
    }
}

void check_required_elements(const std::string& code, std::vector<std::string>& warnings) {
    std::string lower = to_lower(code);

    if (!contains(code, "matplotlib") && !contains(code, "plt")) {
        warnings.push_back("code should use matplotlib for the visualization");
    }
    if (!contains(lower, "font") || !contains(lower, "simhei")) {
        warnings.push_back("set a CJK-capable font (e.g. SimHei) so labels render correctly");
    }
    if (!contains(lower, "savefig")) {
        warnings.push_back("code should save the figure with savefig");
    }
    if (!contains(code, "result")) {
        warnings.push_back("define a 'result' variable to return computed values");
    }
    if (!contains(code, "Agg")) {
        warnings.push_back("select the non-interactive backend with matplotlib.use('Agg')");
    }
}

} // anonymous namespace

nlohmann::json CodeValidationResult::to_json() const {
    return {
        {"is_valid", is_valid},
        {"security_issues", security_issues},
        {"syntax_errors", syntax_errors},
        {"warnings", warnings},
        {"validation_time", validation_time}
    };
}

// ============================================================================
// SecurityValidator
// ============================================================================

SecurityValidator::SecurityValidator(std::shared_ptr<const SecurityPolicy> policy)
    : policy_(std::move(policy)) {
    if (!policy_) {
        throw PolicyError("security validator requires a policy");
    }
    policy_->check_patterns();

    spdlog::debug("Security validator ready: {} forbidden functions, {} forbidden modules, "
                  "{} allowed modules, {} patterns",
                  policy_->forbidden_functions.size(), policy_->forbidden_modules.size(),
                  policy_->allowed_modules.size(),
                  policy_->dangerous_patterns.size() + policy_->file_operation_patterns.size() +
                      policy_->network_patterns.size());
}

CodeValidationResult SecurityValidator::validate(const std::string& code) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    CodeValidationResult result;

    if (code.size() > policy_->max_code_bytes) {
        result.security_issues.push_back("code too large (" + std::to_string(code.size()) +
                                         " bytes, limit " +
                                         std::to_string(policy_->max_code_bytes) + ")");
        result.is_valid = false;
        result.validation_time = elapsed();
        spdlog::warn("Validation: {}", result.security_issues.front());
        return result;
    }

    try {
        analyse(code, result);
    } catch (const std::exception& e) {
        spdlog::error("Validator internal error: {}", e.what());
        CodeValidationResult failed;
        failed.is_valid = false;
        failed.security_issues.push_back(std::string("validator internal error: ") + e.what());
        failed.validation_time = elapsed();
        return failed;
    }

    result.is_valid = result.security_issues.empty() && result.syntax_errors.empty();
    result.validation_time = elapsed();

    if (!result.syntax_errors.empty()) {
        spdlog::debug("Validation: {}", result.syntax_errors.front());
    } else {
        spdlog::debug("Validated {} chars in {:.4f}s: {} issues, {} warnings",
                      code.size(), result.validation_time,
                      result.security_issues.size(), result.warnings.size());
    }
    return result;
}

void SecurityValidator::analyse(const std::string& code, CodeValidationResult& result) const {
    util::EmbeddedPython::instance();
    py::gil_scoped_acquire gil;

    try {
        PyObject* decoded = PyUnicode_DecodeUTF8(code.data(),
                                                 static_cast<py::ssize_t>(code.size()), "strict");
        if (!decoded) {
            py::error_already_set e;
            result.syntax_errors.push_back(decode_error_message(code, e));
            return;
        }
        py::str source = py::reinterpret_steal<py::str>(decoded);

        py::module_ ast = py::module_::import("ast");
        py::object tree;
        try {
            tree = ast.attr("parse")(source, "<generated>", "exec");
        } catch (const py::error_already_set& e) {
            if (!e.matches(PyExc_SyntaxError) && !e.matches(PyExc_ValueError) &&
                !e.matches(PyExc_RecursionError)) {
                throw;
            }
            result.syntax_errors.push_back(syntax_error_message(e));
            return;
        }

        AstKinds kinds(ast);
        std::vector<py::object> nodes;
        for (auto node : kinds.walk(tree)) {
            nodes.push_back(py::reinterpret_borrow<py::object>(node));
        }

        check_syntax_tree(*policy_, kinds, nodes, result.security_issues);
        check_imports(*policy_, kinds, nodes, result.security_issues);

        PatternScanner scanner(source);
        check_dangerous_patterns(*policy_, scanner, result.security_issues);
        check_file_operations(*policy_, scanner, result.security_issues);
        check_network_access(*policy_, scanner, result.security_issues);

        check_code_quality(code, max_nesting_depth(tree, kinds), result.warnings);
        check_required_elements(code, result.warnings);
    } catch (const py::error_already_set& e) {
        throw std::runtime_error(e.what());
    }
}

// ============================================================================
// Reporting
// ============================================================================

nlohmann::json SecurityValidator::get_security_report() const {
    return {
        {"forbidden_functions_count", policy_->forbidden_functions.size()},
        {"forbidden_modules_count", policy_->forbidden_modules.size()},
        {"allowed_modules_count", policy_->allowed_modules.size()},
        {"dangerous_patterns_count", policy_->dangerous_patterns.size()},
        {"file_operation_patterns_count", policy_->file_operation_patterns.size()},
        {"network_patterns_count", policy_->network_patterns.size()},
        {"forbidden_functions", policy_->forbidden_functions},
        {"forbidden_modules", policy_->forbidden_modules},
        {"allowed_modules", policy_->allowed_modules},
        {"max_code_bytes", policy_->max_code_bytes},
        {"sanctioned_save_call", policy_->sanctioned_save_call},
        {"save_context_window", policy_->save_context_window}
    };
}

} // namespace mathviz::policy
