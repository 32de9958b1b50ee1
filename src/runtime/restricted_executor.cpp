/**
 * MathViz Restricted Executor Implementation
 */
#include "runtime/restricted_executor.hpp"
#include "util/embedded_python.hpp"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <thread>
#include <vector>

namespace py = pybind11;
namespace fs = std::filesystem;

namespace mathviz::runtime {

namespace {

constexpr auto WATCHDOG_POLL = std::chrono::milliseconds(100);

// BaseException subclass the watchdog raises; `except Exception` cannot
// catch it and executed code has no name for it (GIL held on first call)
PyObject* execution_interrupt() {
    static PyObject* interrupt = PyErr_NewException(
        "mathviz.ExecutionInterrupted", PyExc_BaseException, nullptr);
    if (!interrupt) {
        throw py::error_already_set();
    }
    return interrupt;
}

// ============================================================================
// Watchdog
// ============================================================================

// Raises the execution interrupt in the executing thread once the deadline
// passes (or the CPU ceiling is hit), and keeps raising it every poll
// interval until the run unwinds or the watchdog is disarmed.
class Watchdog {
public:
    Watchdog(unsigned long thread_id, PyObject* interrupt)
        : thread_id_(thread_id), interrupt_(interrupt), thread_(&Watchdog::run, this) {}

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void arm(std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = std::chrono::steady_clock::now() + timeout;
        armed_ = true;
        cv_.notify_all();
    }

    // Caller holds the GIL, so no injection can be in flight
    void disarm() {
        std::lock_guard<std::mutex> lock(mutex_);
        disarmed_ = true;
        cv_.notify_all();
    }

    bool deadline_hit() const { return deadline_hit_.load(); }
    bool cpu_hit() const { return cpu_hit_.load(); }
    unsigned long thread_id() const { return thread_id_; }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopped_) {
            if (!armed_ || disarmed_) {
                cv_.wait(lock);
                continue;
            }

            auto now = std::chrono::steady_clock::now();
            bool expired = now >= deadline_;
            bool cpu = ResourceMonitor::cpu_limit_hit();
            if (!expired && !cpu) {
                cv_.wait_until(lock, std::min(deadline_, now + WATCHDOG_POLL));
                continue;
            }

            // Lock order is GIL first, then mutex_
            lock.unlock();
            {
                py::gil_scoped_acquire gil;
                std::lock_guard<std::mutex> guard(mutex_);
                if (!disarmed_ && !stopped_) {
                    if (expired) {
                        deadline_hit_.store(true);
                    } else {
                        cpu_hit_.store(true);
                    }
                    PyThreadState_SetAsyncExc(thread_id_, interrupt_);
                }
            }
            lock.lock();
            cv_.wait_for(lock, WATCHDOG_POLL, [this] { return stopped_ || disarmed_; });
        }
    }

    unsigned long thread_id_;
    PyObject* interrupt_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_ = false;
    bool disarmed_ = false;
    bool stopped_ = false;
    std::chrono::steady_clock::time_point deadline_;
    std::atomic<bool> deadline_hit_{false};
    std::atomic<bool> cpu_hit_{false};
    std::thread thread_;
};

// Disarms the watchdog and drops any exception it left pending (GIL held)
class WatchdogDisarmer {
public:
    explicit WatchdogDisarmer(Watchdog& watchdog) : watchdog_(watchdog) {}
    ~WatchdogDisarmer() {
        watchdog_.disarm();
        PyThreadState_SetAsyncExc(watchdog_.thread_id(), nullptr);
    }

private:
    Watchdog& watchdog_;
};

// ============================================================================
// Namespace construction
// ============================================================================

struct OutputCapture {
    explicit OutputCapture(size_t max_bytes) : limit(max_bytes) {}

    void append(std::string line) {
        if (truncated) {
            return;
        }
        if (limit > 0 && bytes + line.size() > limit) {
            truncated = true;
            lines.push_back("[output truncated]");
            return;
        }
        bytes += line.size() + 1;
        lines.push_back(std::move(line));
    }

    std::string text() const {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                out += '\n';
            }
            out += lines[i];
        }
        return out;
    }

    size_t limit;
    size_t bytes = 0;
    bool truncated = false;
    std::vector<std::string> lines;
};

py::dict build_namespace(const std::shared_ptr<const policy::SecurityPolicy>& policy,
                         const py::module_& builtins,
                         const std::string& output_path,
                         const std::shared_ptr<OutputCapture>& capture) {
    py::dict safe;
    for (const auto& name : policy->safe_builtins) {
        if (py::hasattr(builtins, name.c_str())) {
            safe[name.c_str()] = builtins.attr(name.c_str());
        } else {
            spdlog::debug("Builtin {} not provided by this interpreter", name);
        }
    }

    safe["print"] = py::cpp_function([capture](py::args args, py::kwargs kwargs) {
        std::string sep = " ";
        if (kwargs.contains("sep") && !kwargs["sep"].is_none()) {
            sep = py::str(kwargs["sep"]);
        }
        std::string line;
        bool first = true;
        for (auto arg : args) {
            if (!first) {
                line += sep;
            }
            line += std::string(py::str(arg));
            first = false;
        }
        capture->append(std::move(line));
    });

    // Every import, including ones hidden from the static walk, is checked
    // against the same allow-list the validator uses
    py::object real_import = builtins.attr("__import__");
    safe["__import__"] = py::cpp_function(
        [policy, real_import](const std::string& name, py::object globals, py::object locals,
                              py::object fromlist, int level) -> py::object {
            if (level != 0) {
                throw py::import_error("relative imports are not allowed");
            }
            if (!policy->is_module_allowed(name)) {
                spdlog::warn("Blocked runtime import of {}", name);
                throw py::import_error("import of module '" + name + "' is not allowed");
            }
            return real_import(name, globals, locals, fromlist, level);
        },
        py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(), py::arg("level") = 0);

    py::dict ns;
    ns["__builtins__"] = safe;
    ns["__name__"] = "__main__";
    ns["output_path"] = output_path;

    // Agg has to be selected before pyplot is first imported
    try {
        py::module_::import("matplotlib").attr("use")("Agg");
    } catch (const py::error_already_set& e) {
        spdlog::warn("matplotlib unavailable, plots cannot be rendered: {}", e.what());
    }

    for (const auto& [binding, module] : policy->preloaded_modules) {
        try {
            ns[binding.c_str()] = py::module_::import(module.c_str());
        } catch (const py::error_already_set& e) {
            spdlog::warn("Preloaded module {} ({}) skipped: {}", binding, module, e.what());
        }
    }
    return ns;
}

// ============================================================================
// Error reporting
// ============================================================================

std::string exception_summary(const py::error_already_set& e) {
    try {
        std::string type = py::str(e.type().attr("__name__"));
        std::string message = py::str(e.value());
        return type + ": " + message;
    } catch (const py::error_already_set& inner) {
        spdlog::debug("Cannot format exception: {}", inner.what());
        return e.what();
    }
}

std::string format_traceback(const py::error_already_set& e) {
    try {
        py::module_ traceback = py::module_::import("traceback");
        py::list lines = traceback.attr("format_exception")(e.type(), e.value(), e.trace());
        std::string text;
        for (auto line : lines) {
            text += std::string(py::str(line));
        }
        return text;
    } catch (const py::error_already_set& inner) {
        spdlog::debug("Cannot format traceback: {}", inner.what());
        return e.what();
    }
}

ExecutionResult classify_failure(const py::error_already_set& e, const Watchdog& watchdog,
                                 std::chrono::milliseconds timeout) {
    if (watchdog.deadline_hit()) {
        spdlog::warn("Restricted execution exceeded its {} ms deadline", timeout.count());
        return ExecutionResult::failure(ErrorCode::EXECUTION_TIMEOUT, "execution timed out");
    }
    if (watchdog.cpu_hit() || ResourceMonitor::cpu_limit_hit()) {
        spdlog::warn("Restricted execution hit the CPU ceiling");
        return ExecutionResult::failure(ErrorCode::RESOURCE_EXCEEDED, "cpu time exceeded");
    }
    if (e.matches(PyExc_MemoryError)) {
        spdlog::warn("Restricted execution hit the memory ceiling");
        return ExecutionResult::failure(ErrorCode::RESOURCE_EXCEEDED, "memory exceeded");
    }
    return ExecutionResult::failure(ErrorCode::RUNTIME_FAILURE,
                                    "execution error: " + exception_summary(e));
}

void close_figures() {
    try {
        py::dict modules = py::module_::import("sys").attr("modules");
        if (modules.contains("matplotlib.pyplot")) {
            modules["matplotlib.pyplot"].attr("close")("all");
        }
    } catch (const py::error_already_set& e) {
        spdlog::warn("Failed to close matplotlib figures: {}", e.what());
    }
}

} // anonymous namespace

// ============================================================================
// RestrictedExecutor
// ============================================================================

RestrictedExecutor::RestrictedExecutor(std::shared_ptr<const policy::SecurityPolicy> policy,
                                       ExecutorOptions options)
    : policy_(std::move(policy)),
      validator_(policy_),
      options_(std::move(options)) {}

ExecutionResult RestrictedExecutor::execute(const std::string& code,
                                            const std::string& output_path,
                                            std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    auto finish = [&start](ExecutionResult result) {
        result.execution_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        return result;
    };

    if (auto rejected = reject_if_invalid(validator_, code)) {
        spdlog::warn("Restricted executor refused code: {}", rejected->error_message.value_or(""));
        return finish(std::move(*rejected));
    }
    if (auto failed = prepare_output_dir(output_path)) {
        return finish(std::move(*failed));
    }

    util::EmbeddedPython* python = nullptr;
    try {
        python = &util::EmbeddedPython::instance();
    } catch (const std::exception& e) {
        spdlog::error("Embedded interpreter unavailable: {}", e.what());
        return finish(ExecutionResult::failure(ErrorCode::HARNESS_FAILURE,
            std::string("embedded interpreter unavailable: ") + e.what()));
    }

    std::lock_guard<std::mutex> run_lock(python->run_mutex());

    ExecutionResult result;
    try {
        result = run_locked(code, output_path, timeout);
    } catch (const std::exception& e) {
        spdlog::error("Restricted executor failure: {}", e.what());
        result = ExecutionResult::failure(ErrorCode::HARNESS_FAILURE,
                                          std::string("executor failure: ") + e.what());
    }

    result = finish(std::move(result));
    spdlog::info("Restricted execution finished in {:.3f}s ({})",
                 result.execution_time, error_code_to_string(result.error_code));
    return result;
}

ExecutionResult RestrictedExecutor::run_locked(const std::string& code,
                                               const std::string& output_path,
                                               std::chrono::milliseconds timeout) {
    PyObject* interrupt = nullptr;
    {
        py::gil_scoped_acquire gil;
        interrupt = execution_interrupt();
    }

    // Constructed before the GIL is taken so its thread is joined after release
    Watchdog watchdog(PyThread_get_thread_ident(), interrupt);
    py::gil_scoped_acquire gil;

    auto capture = std::make_shared<OutputCapture>(options_.max_output_bytes);
    ExecutionResult result;

    try {
        py::module_ builtins = py::module_::import("builtins");
        py::dict ns = build_namespace(policy_, builtins, output_path, capture);

        py::object compiled;
        try {
            compiled = builtins.attr("compile")(code, "<generated>", "exec");
        } catch (const py::error_already_set& e) {
            if (!e.matches(PyExc_SyntaxError)) {
                throw;
            }
            return ExecutionResult::failure(ErrorCode::SYNTAX_INVALID,
                                            "syntax error: " + exception_summary(e));
        }

        try {
            WatchdogDisarmer disarmer(watchdog);
            watchdog.arm(timeout);
            ResourceMonitor monitor(options_.limits);
            builtins.attr("exec")(compiled, ns);
        } catch (const py::error_already_set& e) {
            close_figures();
            result = classify_failure(e, watchdog, timeout);
            result.output_logs = capture->text();
            if (!result.output_logs.empty()) {
                result.output_logs += '\n';
            }
            result.output_logs += format_traceback(e);
            result.memory_usage = peak_rss_mb();
            return result;
        }

        result.success = true;
        result.error_code = ErrorCode::NONE;

        if (ns.contains("result")) {
            try {
                py::object json = py::module_::import("json");
                std::string dumped = py::str(json.attr("dumps")(
                    ns["result"], py::arg("default") = builtins.attr("str"),
                    py::arg("ensure_ascii") = false));
                result.result_data = nlohmann::json::parse(dumped);
            } catch (const py::error_already_set& e) {
                spdlog::warn("Result binding is not serializable: {}", e.what());
                capture->append(std::string("[result not serializable: ") + e.what() + "]");
            } catch (const nlohmann::json::parse_error& e) {
                spdlog::warn("Result payload is not valid JSON: {}", e.what());
            }
        }

        close_figures();
        result.output_logs = capture->text();
    } catch (const py::error_already_set& e) {
        spdlog::error("Restricted executor harness error: {}", e.what());
        result = ExecutionResult::failure(ErrorCode::HARNESS_FAILURE,
                                          std::string("executor failure: ") + e.what());
        result.output_logs = capture->text();
    }

    std::error_code ec;
    if (result.success && fs::exists(output_path, ec)) {
        result.image_path = output_path;
    }
    result.memory_usage = peak_rss_mb();
    return result;
}

} // namespace mathviz::runtime
