#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/sandbox_manager.hpp"
#include "util/logger.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using mathviz::kernel::SandboxConfig;
using mathviz::kernel::SandboxManager;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CliOptions {
    std::string script_path;
    std::string output_path = "output.png";
    std::string config_path;
    std::string request_path;
    std::string audit_path;
    std::optional<std::string> mode;
    std::optional<double> timeout_seconds;
    std::optional<std::string> log_level;
    bool validate = true;
    bool validate_only = false;
    bool report = false;
    bool help = false;
};

void print_usage(const char* prog) {
    fmt::print(stderr,
        "Usage: {} [options] <script.py>\n"
        "\n"
        "Validate and run a generated visualization script in the sandbox.\n"
        "\n"
        "Options:\n"
        "  --mode restricted|process   Execution strategy (default from config)\n"
        "  --timeout N                 Wall-clock limit in seconds\n"
        "  --output PATH               Image path handed to the script (default output.png)\n"
        "  --config FILE               JSON configuration file\n"
        "  --no-validate               Skip the validation pass before execution\n"
        "  --validate-only             Print the validation result and exit\n"
        "  --report                    Print the security policy report and exit\n"
        "  --request FILE              Run a JSON request {{code, output_path, ...}}\n"
        "  --audit-log FILE            Append this run's audit events to a JSONL file\n"
        "  --log-level LEVEL           trace, debug, info, warn, error, off\n"
        "  -h, --help                  Show this help\n"
        "\n"
        "Exit status: 0 on success, 1 on rejection or failure, 2 on usage errors.\n",
        prog);
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions options;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--mode") {
            options.mode = value_of(i, arg);
        } else if (arg == "--timeout") {
            std::string text = value_of(i, arg);
            try {
                size_t pos = 0;
                options.timeout_seconds = std::stod(text, &pos);
                if (pos != text.size() || *options.timeout_seconds <= 0) {
                    throw std::invalid_argument(text);
                }
            } catch (const std::logic_error&) {
                throw UsageError("--timeout expects a positive number, got '" + text + "'");
            }
        } else if (arg == "--output") {
            options.output_path = value_of(i, arg);
        } else if (arg == "--config") {
            options.config_path = value_of(i, arg);
        } else if (arg == "--request") {
            options.request_path = value_of(i, arg);
        } else if (arg == "--audit-log") {
            options.audit_path = value_of(i, arg);
        } else if (arg == "--log-level") {
            options.log_level = value_of(i, arg);
        } else if (arg == "--no-validate") {
            options.validate = false;
        } else if (arg == "--validate-only") {
            options.validate_only = true;
        } else if (arg == "--report") {
            options.report = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else if (options.script_path.empty()) {
            options.script_path = arg;
        } else {
            throw UsageError("unexpected argument " + arg);
        }
    }

    if (!options.help && !options.report && options.request_path.empty() &&
        options.script_path.empty()) {
        throw UsageError("no script given");
    }
    if (options.validate_only && !options.validate) {
        throw UsageError("--validate-only and --no-validate are mutually exclusive");
    }
    return options;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw UsageError("cannot read " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

void print_summary(const json& response) {
    if (response.value("overall_success", false)) {
        double elapsed = 0.0;
        auto execution = response.find("execution_result");
        if (execution != response.end() && execution->is_object()) {
            elapsed = execution->value("execution_time", 0.0);
        }
        fmt::print(stderr, fg(fmt::color::green) | fmt::emphasis::bold,
                   "✓ execution succeeded in {:.3f}s\n", elapsed);
        return;
    }

    std::string message = "unknown error";
    auto error = response.find("error_message");
    if (error != response.end() && error->is_string()) {
        message = error->get<std::string>();
    }
    fmt::print(stderr, fg(fmt::color::red) | fmt::emphasis::bold, "✗ {}: {}\n",
               response.value("error_code", std::string("UNKNOWN")), message);
}

} // anonymous namespace

int main(int argc, char** argv) {
    // Results go to stdout, so logs go to stderr
    mathviz::util::init_logger("mathviz", true);

    CliOptions options;
    try {
        options = parse_args(argc, argv);
    } catch (const UsageError& e) {
        fmt::print(stderr, "error: {}\n\n", e.what());
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (options.help) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    SandboxConfig config;
    try {
        config = mathviz::kernel::load_config(options.config_path);
        if (options.mode) {
            mathviz::runtime::execution_mode_from_string(*options.mode);
            config.default_mode = *options.mode;
        }
        if (options.timeout_seconds) {
            config.timeout_seconds = *options.timeout_seconds;
        }
        if (options.log_level) {
            config.log_level = *options.log_level;
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return EXIT_USAGE;
    }
    mathviz::util::set_log_level(config.log_level);

    std::unique_ptr<SandboxManager> manager;
    try {
        manager = std::make_unique<SandboxManager>(config);
    } catch (const mathviz::policy::PolicyError& e) {
        spdlog::error("Invalid security policy: {}", e.what());
        return EXIT_USAGE;
    }

    if (options.report) {
        std::cout << manager->get_security_report().dump(2) << std::endl;
        return EXIT_OK;
    }

    json response;
    try {
        if (!options.request_path.empty()) {
            json request;
            try {
                request = json::parse(read_file(options.request_path));
            } catch (const json::parse_error& e) {
                throw UsageError("malformed request file: " + std::string(e.what()));
            }
            response = manager->handle_request(request);
        } else {
            std::string code = read_file(options.script_path);

            if (options.validate_only) {
                mathviz::policy::CodeValidationResult validation = manager->validate(code);
                std::cout << validation.to_json().dump(2) << std::endl;
                return validation.is_valid ? EXIT_OK : EXIT_FAILED;
            }

            response = manager->execute_code_safely(code, options.output_path,
                                                    config.default_mode,
                                                    config.default_timeout(),
                                                    options.validate).to_json();
        }
    } catch (const UsageError& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return EXIT_USAGE;
    }

    std::cout << response.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    print_summary(response);

    if (!options.audit_path.empty()) {
        try {
            manager->audit_log().append_jsonl(options.audit_path);
        } catch (const std::runtime_error& e) {
            spdlog::error("Audit export failed: {}", e.what());
            return EXIT_FAILED;
        }
    }
    return response.value("overall_success", false) ? EXIT_OK : EXIT_FAILED;
}
