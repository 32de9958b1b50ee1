#include <gtest/gtest.h>
#include "kernel/sandbox_manager.hpp"
#include "util/embedded_python.hpp"
#include <filesystem>

using namespace mathviz::kernel;
using mathviz::runtime::ErrorCode;
using mathviz::runtime::ExecutionMode;
using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

#ifndef MATHVIZ_TEST_PYTHON
#define MATHVIZ_TEST_PYTHON "python3"
#endif

namespace {

// Solves a distance problem and plots it through the sanctioned save call
const char* PLOT_SCRIPT = R"PY(import matplotlib
matplotlib.use('Agg')
import matplotlib.pyplot as plt
import numpy as np

speed = 12.5
hours = 4
distance = speed * hours
x = np.linspace(0, hours, 20)
fig, ax = plt.subplots()
ax.plot(x, speed * x)
ax.set_title('distance over time')
plt.savefig(output_path)
result = {'distance': distance, 'speed': speed}
)PY";

bool plotting_available() {
    auto& python = mathviz::util::EmbeddedPython::instance();
    return python.module_available("numpy") && python.module_available("matplotlib");
}

} // anonymous namespace

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / "mathviz_manager_test";
        fs::remove_all(root);
        fs::create_directories(root);

        SandboxConfig config;
        config.default_mode = "process";
        config.python_path = MATHVIZ_TEST_PYTHON;
        config.artifact_root = root.string();
        config.timeout_seconds = 20.0;
        manager = std::make_unique<SandboxManager>(config);
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    std::string inside(const std::string& name = "plot.png") const {
        return (root / name).string();
    }

    size_t count_events(AuditCategory category, const std::string& event_type) {
        AuditQuery filter;
        filter.category = category;
        filter.limit = 0;
        size_t count = 0;
        for (const auto& entry : manager->audit_log().query(filter)) {
            if (entry.event_type == event_type) {
                count++;
            }
        }
        return count;
    }

    fs::path root;
    std::unique_ptr<SandboxManager> manager;
};

TEST_F(SandboxManagerTest, RejectsInvalidCodeBeforeExecution) {
    SandboxExecutionResponse response = manager->execute_code_safely(
        "import os\nos.system('id')\n", inside(), ExecutionMode::PROCESS, 5000ms);

    EXPECT_FALSE(response.overall_success);
    EXPECT_EQ(response.error_code, ErrorCode::SECURITY_REJECTED);
    ASSERT_TRUE(response.validation_result.has_value());
    EXPECT_FALSE(response.validation_result->is_valid);
    EXPECT_FALSE(response.execution_result.has_value());
    EXPECT_EQ(response.error_message.value_or("").rfind("code security validation failed: ", 0), 0u);

    ExecutionStats stats = manager->stats();
    EXPECT_EQ(stats.total_executions, 1u);
    EXPECT_EQ(stats.validation_failures, 1u);
    EXPECT_EQ(stats.failed_executions, 1u);
    EXPECT_EQ(stats.execution_failures, 0u);
    EXPECT_EQ(count_events(AuditCategory::SECURITY, "VALIDATION_REJECTED"), 1u);
}

TEST_F(SandboxManagerTest, ReportsSyntaxErrorCode) {
    SandboxExecutionResponse response = manager->execute_code_safely(
        "def broken(:\n", inside(), ExecutionMode::PROCESS, 5000ms);
    EXPECT_EQ(response.error_code, ErrorCode::SYNTAX_INVALID);
    EXPECT_FALSE(response.validation_result->syntax_errors.empty());
}

TEST_F(SandboxManagerTest, ConfinesOutputPaths) {
    const std::string code = "result = 1\n";

    SandboxExecutionResponse escaped = manager->execute_code_safely(
        code, (root / ".." / "elsewhere.png").string(), ExecutionMode::PROCESS, 5000ms);
    EXPECT_EQ(escaped.error_code, ErrorCode::SECURITY_REJECTED);
    EXPECT_EQ(escaped.error_message.value_or(""), "output path escapes artifact root");

    // A sibling directory sharing the root's name as a prefix is outside
    SandboxExecutionResponse sibling = manager->execute_code_safely(
        code, root.string() + "_other/plot.png", ExecutionMode::PROCESS, 5000ms);
    EXPECT_EQ(sibling.error_code, ErrorCode::SECURITY_REJECTED);

    SandboxExecutionResponse itself = manager->execute_code_safely(
        code, root.string(), ExecutionMode::PROCESS, 5000ms);
    EXPECT_EQ(itself.error_code, ErrorCode::SECURITY_REJECTED);

    EXPECT_EQ(count_events(AuditCategory::SECURITY, "OUTPUT_PATH_REJECTED"), 3u);
    EXPECT_EQ(manager->stats().validation_failures, 3u);
}

TEST_F(SandboxManagerTest, ExecutesInProcessMode) {
    SandboxExecutionResponse response = manager->execute_code_safely(
        "result = {'answer': 6 * 7}\n", inside("runs/one.png"), ExecutionMode::PROCESS, 20000ms);

    ASSERT_TRUE(response.overall_success) << response.error_message.value_or("");
    EXPECT_EQ(response.error_code, ErrorCode::NONE);
    ASSERT_TRUE(response.execution_result.has_value());
    EXPECT_EQ((*response.execution_result->result_data)["answer"], 42);

    ExecutionStats stats = manager->stats();
    EXPECT_EQ(stats.total_executions, 1u);
    EXPECT_EQ(stats.successful_executions, 1u);
    EXPECT_GT(stats.total_execution_time, 0.0);
    EXPECT_DOUBLE_EQ(stats.avg_execution_time, stats.total_execution_time);
    EXPECT_EQ(count_events(AuditCategory::EXECUTION, "EXECUTION_COMPLETED"), 1u);
}

TEST_F(SandboxManagerTest, RecordsTimeoutAsResourceEvent) {
    SandboxExecutionResponse response = manager->execute_code_safely(
        "while True:\n    pass\n", inside(), ExecutionMode::PROCESS, 1000ms);

    EXPECT_EQ(response.error_code, ErrorCode::EXECUTION_TIMEOUT);
    EXPECT_EQ(manager->stats().execution_failures, 1u);
    EXPECT_EQ(count_events(AuditCategory::RESOURCE, "EXECUTION_TIMEOUT"), 1u);
}

TEST_F(SandboxManagerTest, PlotsInRestrictedMode) {
    if (!plotting_available()) {
        GTEST_SKIP() << "numpy and matplotlib are required";
    }
    ASSERT_TRUE(manager->validate(PLOT_SCRIPT).is_valid);

    std::string path = inside("restricted/distance.png");
    SandboxExecutionResponse response = manager->execute_code_safely(
        PLOT_SCRIPT, path, ExecutionMode::RESTRICTED, 20000ms);

    ASSERT_TRUE(response.overall_success) << response.error_message.value_or("");
    ASSERT_TRUE(response.execution_result.has_value());
    EXPECT_TRUE(response.execution_result->success);
    ASSERT_TRUE(response.execution_result->image_path.has_value());
    EXPECT_EQ(*response.execution_result->image_path, path);
    EXPECT_TRUE(fs::exists(path));
    ASSERT_TRUE(response.execution_result->result_data.has_value());
    EXPECT_DOUBLE_EQ((*response.execution_result->result_data)["distance"].get<double>(), 50.0);
    EXPECT_DOUBLE_EQ((*response.execution_result->result_data)["speed"].get<double>(), 12.5);
}

TEST_F(SandboxManagerTest, BothModesAgreeOnSafePlot) {
    if (!plotting_available()) {
        GTEST_SKIP() << "numpy and matplotlib are required";
    }

    std::string restricted_path = inside("parity/restricted.png");
    std::string process_path = inside("parity/process.png");
    SandboxExecutionResponse restricted = manager->execute_code_safely(
        PLOT_SCRIPT, restricted_path, ExecutionMode::RESTRICTED, 20000ms);
    SandboxExecutionResponse process = manager->execute_code_safely(
        PLOT_SCRIPT, process_path, ExecutionMode::PROCESS, 20000ms);

    ASSERT_TRUE(restricted.overall_success) << restricted.error_message.value_or("");
    ASSERT_TRUE(process.overall_success) << process.error_message.value_or("")
                                         << "\n" << process.execution_result->output_logs;
    EXPECT_EQ(process.execution_result->image_path.value_or(""), process_path);
    EXPECT_TRUE(fs::exists(process_path));
    ASSERT_TRUE(process.execution_result->result_data.has_value());
    EXPECT_EQ(process.execution_result->result_data->dump(),
              restricted.execution_result->result_data.value_or(json()).dump());
    EXPECT_EQ(manager->stats().successful_executions, 2u);
}

TEST_F(SandboxManagerTest, RestrictedTimeoutReturnsWithinBound) {
    const char* loops[] = {
        "while True:\n    pass\n",
        "while True:\n    try:\n        while True:\n            pass\n    except Exception:\n        pass\n"
    };
    for (const char* code : loops) {
        auto start = std::chrono::steady_clock::now();
        json response = manager->handle_request({
            {"code", code},
            {"output_path", inside()},
            {"execution_mode", "restricted"},
            {"timeout_seconds", 2}
        });
        auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_EQ(response["error_code"], "EXECUTION_TIMEOUT") << code;
        EXPECT_EQ(response["error_message"], "execution timed out");
        EXPECT_GE(elapsed, 2s);
        EXPECT_LT(elapsed, 4s);
    }
    EXPECT_EQ(count_events(AuditCategory::RESOURCE, "EXECUTION_TIMEOUT"), 2u);
}

TEST_F(SandboxManagerTest, ComputesRates) {
    manager->execute_code_safely("result = 1\n", inside(), ExecutionMode::PROCESS, 20000ms);
    manager->execute_code_safely("import socket\n", inside(), ExecutionMode::PROCESS, 20000ms);
    manager->execute_code_safely("x = 1 / 0\n", inside(), ExecutionMode::PROCESS, 20000ms);
    manager->execute_code_safely("import os\n", inside(), ExecutionMode::PROCESS, 20000ms);

    json stats = manager->get_sandbox_stats();
    EXPECT_EQ(stats["total_executions"], 4);
    EXPECT_EQ(stats["successful_executions"], 1);
    EXPECT_EQ(stats["failed_executions"], 3);
    EXPECT_DOUBLE_EQ(stats["success_rate"].get<double>(), 0.25);
    EXPECT_DOUBLE_EQ(stats["validation_failure_rate"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(stats["execution_failure_rate"].get<double>(), 0.25);

    EXPECT_EQ(stats["audit"]["categories"]["SECURITY"]["failed"], 2);

    manager->reset_stats();
    json cleared = manager->get_sandbox_stats();
    EXPECT_EQ(cleared["total_executions"], 0);
    EXPECT_DOUBLE_EQ(cleared["success_rate"].get<double>(), 0.0);
}

TEST_F(SandboxManagerTest, UnknownModeIsHarnessFailure) {
    SandboxExecutionResponse response = manager->execute_code_safely(
        "result = 1\n", inside(), std::string("docker"), 5000ms);

    EXPECT_EQ(response.error_code, ErrorCode::HARNESS_FAILURE);
    EXPECT_EQ(response.error_message.value_or(""),
              "sandbox manager error: unknown execution mode: docker");
    EXPECT_EQ(manager->stats().total_executions, 1u);
    EXPECT_EQ(manager->stats().harness_failures, 1u);
}

TEST_F(SandboxManagerTest, RejectsBadArguments) {
    SandboxExecutionResponse zero = manager->execute_code_safely(
        "result = 1\n", inside(), ExecutionMode::PROCESS, 0ms);
    EXPECT_EQ(zero.error_code, ErrorCode::HARNESS_FAILURE);
    EXPECT_EQ(zero.error_message.value_or(""), "sandbox manager error: timeout must be positive");

    SandboxExecutionResponse empty = manager->execute_code_safely(
        "result = 1\n", "", ExecutionMode::PROCESS, 5000ms);
    EXPECT_EQ(empty.error_code, ErrorCode::HARNESS_FAILURE);
}

TEST_F(SandboxManagerTest, HandlesJsonRequests) {
    json response = manager->handle_request({
        {"code", "result = [1, 2, 3]\n"},
        {"output_path", inside()},
        {"execution_mode", "process"}
    });
    EXPECT_TRUE(response["overall_success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["error_code"], "NONE");
    EXPECT_EQ(response["execution_result"]["result_data"], json({1, 2, 3}));
    EXPECT_TRUE(response["validation_result"]["is_valid"].get<bool>());

    json invalid = manager->handle_request({{"code", "result = 1\n"}});
    EXPECT_FALSE(invalid["overall_success"].get<bool>());
    EXPECT_EQ(invalid["error_code"], "HARNESS_FAILURE");
    EXPECT_EQ(invalid["error_message"].get<std::string>().rfind("invalid request: ", 0), 0u);
    EXPECT_TRUE(invalid["execution_result"].is_null());

    json not_object = manager->handle_request(json::array());
    EXPECT_EQ(not_object["error_code"], "HARNESS_FAILURE");
    EXPECT_EQ(manager->stats().total_executions, 3u);
}

TEST_F(SandboxManagerTest, RequestsCannotSkipValidation) {
    json response = manager->handle_request({
        {"code", "import os\nos.system('id')\n"},
        {"output_path", inside()},
        {"execution_mode", "process"},
        {"validate_first", false}
    });
    EXPECT_EQ(response["error_code"], "SECURITY_REJECTED");
    EXPECT_FALSE(response["validation_result"].is_null());
    EXPECT_TRUE(response["execution_result"].is_null());
    EXPECT_EQ(manager->stats().validation_failures, 1u);
}

TEST_F(SandboxManagerTest, CapsHugeRequestTimeouts) {
    json response = manager->handle_request({
        {"code", "result = 1\n"},
        {"output_path", inside()},
        {"execution_mode", "process"},
        {"timeout_seconds", 1e300}
    });
    EXPECT_TRUE(response["overall_success"].get<bool>()) << response.dump();
}

TEST_F(SandboxManagerTest, ReloadsPolicy) {
    EXPECT_FALSE(manager->validate("import pandas\n").is_valid);

    mathviz::policy::SecurityPolicy policy = mathviz::policy::SecurityPolicy::defaults();
    policy.allowed_modules.insert("pandas");
    manager->reload_policy(policy);

    EXPECT_TRUE(manager->validate("import pandas\n").is_valid);
    EXPECT_EQ(count_events(AuditCategory::POLICY, "POLICY_RELOADED"), 1u);

    mathviz::policy::SecurityPolicy broken = mathviz::policy::SecurityPolicy::defaults();
    broken.dangerous_patterns.push_back("(unclosed");
    EXPECT_THROW(manager->reload_policy(broken), mathviz::policy::PolicyError);
    EXPECT_TRUE(manager->validate("import pandas\n").is_valid);
}

TEST_F(SandboxManagerTest, SecurityReportIncludesManagerSettings) {
    json report = manager->get_security_report();
    EXPECT_EQ(report["default_mode"], "process");
    EXPECT_EQ(report["artifact_root"], root.string());
    EXPECT_GT(report["forbidden_functions_count"].get<size_t>(), 0u);
}

TEST(SandboxManagerUnconfinedTest, AcceptsAnyPathWithoutRoot) {
    SandboxConfig config;
    config.python_path = MATHVIZ_TEST_PYTHON;
    SandboxManager manager(config);

    fs::path path = fs::temp_directory_path() / "mathviz_unconfined" / "plot.png";
    SandboxExecutionResponse response = manager.execute_code_safely(
        "result = 1\n", path.string(), ExecutionMode::PROCESS, 20000ms);
    EXPECT_TRUE(response.overall_success) << response.error_message.value_or("");
    fs::remove_all(path.parent_path());
}

TEST(SandboxManagerTimeoutCapTest, EnforcesConfiguredMaximum) {
    SandboxConfig config;
    config.python_path = MATHVIZ_TEST_PYTHON;
    config.max_timeout_seconds = 1.0;
    SandboxManager manager(config);

    fs::path path = fs::temp_directory_path() / "mathviz_timeout_cap" / "plot.png";
    auto start = std::chrono::steady_clock::now();
    json response = manager.handle_request({
        {"code", "while True:\n    pass\n"},
        {"output_path", path.string()},
        {"execution_mode", "process"},
        {"timeout_seconds", 1e300}
    });
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(response["error_code"], "EXECUTION_TIMEOUT");
    EXPECT_LT(elapsed, 10s);

    SandboxExecutionResponse direct = manager.execute_code_safely(
        "while True:\n    pass\n", path.string(), ExecutionMode::PROCESS, std::chrono::hours(24));
    EXPECT_EQ(direct.error_code, ErrorCode::EXECUTION_TIMEOUT);
    fs::remove_all(path.parent_path());
}
