#include "runtime/process_executor.hpp"
#include "runtime/harness.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/wait.h>

extern char** environ;

namespace fs = std::filesystem;

namespace mathviz::runtime {

namespace {

constexpr int POLL_INTERVAL_MS = 50;
constexpr size_t READ_CHUNK = 4096;

// Child exit statuses reserved for launch failures
constexpr int CHILD_EXIT_NO_LIMITS = 125;
constexpr int CHILD_EXIT_NO_WORKDIR = 126;
constexpr int CHILD_EXIT_NO_INTERPRETER = 127;

// ============================================================================
// Scoped resources
// ============================================================================

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

// Harness script on disk, removed when the guard goes out of scope
class ScriptFile {
public:
    ScriptFile() = default;
    ~ScriptFile() {
        if (!path_.empty() && ::unlink(path_.c_str()) < 0 && errno != ENOENT) {
            spdlog::warn("Failed to remove harness script {}: {}", path_, strerror(errno));
        }
    }

    ScriptFile(const ScriptFile&) = delete;
    ScriptFile& operator=(const ScriptFile&) = delete;

    // Returns an error description, empty on success
    std::string create(const std::string& contents) {
        std::string pattern = (fs::temp_directory_path() / "mathviz_harness_XXXXXX.py").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        UniqueFd fd(::mkstemps(name.data(), 3));
        if (!fd.valid()) {
            return std::string("mkstemps failed: ") + strerror(errno);
        }
        path_ = name.data();

        size_t written = 0;
        while (written < contents.size()) {
            ssize_t n = ::write(fd.get(), contents.data() + written, contents.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::string("write failed: ") + strerror(errno);
            }
            written += static_cast<size_t>(n);
        }
        return {};
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// Child supervision
// ============================================================================

struct ChildOutcome {
    int status = 0;
    bool timed_out = false;
    bool truncated = false;
    std::string out;
    std::string err;
    struct rusage usage{};
};

struct OutputStream {
    UniqueFd fd;
    std::string* buffer = nullptr;
};

std::vector<std::string> build_environment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string var(*entry);
        if (var.rfind("MPLBACKEND=", 0) == 0 ||
            var.rfind("OPENBLAS_NUM_THREADS=", 0) == 0 ||
            var.rfind("OMP_NUM_THREADS=", 0) == 0) {
            continue;
        }
        env.push_back(std::move(var));
    }
    env.push_back("MPLBACKEND=Agg");
    env.push_back("OPENBLAS_NUM_THREADS=1");
    env.push_back("OMP_NUM_THREADS=1");
    return env;
}

std::vector<char*> to_argv(std::vector<std::string>& items) {
    std::vector<char*> argv;
    for (auto& item : items) {
        argv.push_back(item.data());
    }
    argv.push_back(nullptr);
    return argv;
}

void drain(OutputStream& stream, size_t max_bytes, bool& truncated) {
    char buf[READ_CHUNK];
    while (true) {
        ssize_t n = ::read(stream.fd.get(), buf, sizeof(buf));
        if (n > 0) {
            size_t room = max_bytes > stream.buffer->size() ? max_bytes - stream.buffer->size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            stream.buffer->append(buf, take);
            if (take < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        stream.fd.reset();
        return;
    }
}

// Fork the interpreter and supervise it until it exits or the deadline passes.
// Throws std::runtime_error when the child cannot be started at all.
ChildOutcome run_child(const std::string& python_path,
                       const std::string& script_path,
                       const std::string& workdir,
                       const ResourceLimits& limits,
                       size_t max_output_bytes,
                       std::chrono::milliseconds timeout) {
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("pipe failed: ") + strerror(errno));
    }
    UniqueFd out_read(out_pipe[0]), out_write(out_pipe[1]);
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("pipe failed: ") + strerror(errno));
    }
    UniqueFd err_read(err_pipe[0]), err_write(err_pipe[1]);
    UniqueFd devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull.valid()) {
        throw std::runtime_error(std::string("cannot open /dev/null: ") + strerror(errno));
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> args = {python_path, "-I", "-B", script_path};
    std::vector<std::string> env = build_environment();
    std::vector<char*> argv = to_argv(args);
    std::vector<char*> envp = to_argv(env);
    const char* dir = workdir.empty() ? nullptr : workdir.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        ::dup2(devnull.get(), STDIN_FILENO);
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        if (dir && ::chdir(dir) < 0) {
            _exit(CHILD_EXIT_NO_WORKDIR);
        }
        if (!ResourceLimits::apply_hard(limits)) {
            _exit(CHILD_EXIT_NO_LIMITS);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(CHILD_EXIT_NO_INTERPRETER);
    }

    // Parent
    if (::setpgid(pid, pid) < 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) from parent failed: {}", pid, strerror(errno));
    }
    out_write.reset();
    err_write.reset();
    devnull.reset();

    ChildOutcome outcome;
    OutputStream streams[2];
    streams[0].fd = std::move(out_read);
    streams[0].buffer = &outcome.out;
    streams[1].fd = std::move(err_read);
    streams[1].buffer = &outcome.err;
    for (auto& stream : streams) {
        int flags = ::fcntl(stream.fd.get(), F_GETFL);
        if (flags >= 0) {
            ::fcntl(stream.fd.get(), F_SETFL, flags | O_NONBLOCK);
        }
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool exited = false;

    while (true) {
        bool any_open = streams[0].fd.valid() || streams[1].fd.valid();

        if (!any_open) {
            // Detect exit without reaping so the group id stays reserved
            siginfo_t info{};
            if (::waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
                exited = true;
                break;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            spdlog::warn("Child {} exceeded its {} ms deadline, killing process group",
                         pid, timeout.count());
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, POLL_INTERVAL_MS));

        if (!any_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
            continue;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        OutputStream* polled[2];
        for (auto& stream : streams) {
            if (stream.fd.valid()) {
                fds[count].fd = stream.fd.get();
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                polled[count] = &stream;
                ++count;
            }
        }

        int rc = ::poll(fds, count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on child {} failed: {}", pid, strerror(errno));
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                drain(*polled[i], max_output_bytes, outcome.truncated);
            }
        }
    }

    // Clears stragglers on normal exit, and is the kill on timeout
    if (::killpg(pid, SIGKILL) < 0 && errno != ESRCH) {
        spdlog::debug("killpg({}) failed: {}", pid, strerror(errno));
    }
    if (!exited) {
        spdlog::debug("Reaping child {} after kill", pid);
    }

    while (::wait4(pid, &outcome.status, 0, &outcome.usage) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("wait4 failed: ") + strerror(errno));
        }
    }
    return outcome;
}

// ============================================================================
// Result assembly
// ============================================================================

std::string rtrim(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string last_line(const std::string& text) {
    std::string trimmed = rtrim(text);
    size_t pos = trimmed.find_last_of('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

// Split stdout into captured log text and the serialized result payload
void collect_stdout(const std::string& out, ExecutionResult& result) {
    std::string logs;
    std::string marker = RESULT_MARKER;
    size_t start = 0;
    while (start <= out.size()) {
        size_t end = out.find('\n', start);
        std::string line = out.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (line.rfind(marker, 0) == 0) {
            try {
                result.result_data = nlohmann::json::parse(line.substr(marker.size()));
            } catch (const nlohmann::json::parse_error& e) {
                spdlog::warn("Result payload from child is not valid JSON: {}", e.what());
            }
        } else {
            logs += line;
            logs += '\n';
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    result.output_logs = rtrim(std::move(logs));
}

ExecutionResult classify(const ChildOutcome& outcome) {
    if (outcome.timed_out) {
        return ExecutionResult::failure(ErrorCode::EXECUTION_TIMEOUT, "execution timed out");
    }

    if (WIFSIGNALED(outcome.status)) {
        int sig = WTERMSIG(outcome.status);
        spdlog::warn("Child terminated by signal {} ({})", sig, strsignal(sig));
        if (sig == SIGXCPU) {
            return ExecutionResult::failure(ErrorCode::RESOURCE_EXCEEDED, "cpu time exceeded");
        }
        if (sig == SIGKILL) {
            return ExecutionResult::failure(ErrorCode::RESOURCE_EXCEEDED,
                                            "resource limit exceeded (killed)");
        }
        if (sig == SIGSEGV) {
            return ExecutionResult::failure(ErrorCode::RESOURCE_EXCEEDED, "memory exceeded");
        }
        return ExecutionResult::failure(ErrorCode::RUNTIME_FAILURE,
                                        "terminated by signal " + std::to_string(sig));
    }

    int code = WIFEXITED(outcome.status) ? WEXITSTATUS(outcome.status) : -1;
    switch (code) {
        case 0: {
            ExecutionResult ok;
            ok.success = true;
            return ok;
        }
        case HARNESS_EXIT_MEMORY:
            return ExecutionResult::failure(ErrorCode::RESOURCE_EXCEEDED, "memory exceeded");
        case CHILD_EXIT_NO_INTERPRETER:
            return ExecutionResult::failure(ErrorCode::HARNESS_FAILURE, "python interpreter not found");
        case CHILD_EXIT_NO_WORKDIR:
            return ExecutionResult::failure(ErrorCode::HARNESS_FAILURE, "cannot enter output directory");
        case CHILD_EXIT_NO_LIMITS:
            return ExecutionResult::failure(ErrorCode::HARNESS_FAILURE, "cannot apply resource limits");
        default: {
            std::string reason = last_line(outcome.err);
            return ExecutionResult::failure(ErrorCode::RUNTIME_FAILURE,
                reason.empty() ? "unknown error" : "execution error: " + reason);
        }
    }
}

} // anonymous namespace

// ============================================================================
// ProcessExecutor
// ============================================================================

ProcessExecutor::ProcessExecutor(std::shared_ptr<const policy::SecurityPolicy> policy,
                                 ExecutorOptions options)
    : policy_(std::move(policy)),
      validator_(policy_),
      options_(std::move(options)) {}

ExecutionResult ProcessExecutor::execute(const std::string& code,
                                         const std::string& output_path,
                                         std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();

    ExecutionResult result;
    if (auto rejected = reject_if_invalid(validator_, code)) {
        spdlog::warn("Process executor refused code: {}", rejected->error_message.value_or(""));
        result = std::move(*rejected);
    } else if (auto failed = prepare_output_dir(output_path)) {
        result = std::move(*failed);
    } else {
        try {
            result = run(code, output_path, timeout);
        } catch (const std::exception& e) {
            spdlog::error("Process executor failure: {}", e.what());
            result = ExecutionResult::failure(ErrorCode::HARNESS_FAILURE,
                                              std::string("executor failure: ") + e.what());
        }
    }

    result.execution_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("Process execution finished in {:.3f}s ({})",
                 result.execution_time, error_code_to_string(result.error_code));
    return result;
}

ExecutionResult ProcessExecutor::run(const std::string& code,
                                     const std::string& output_path,
                                     std::chrono::milliseconds timeout) {
    // The child runs in the output directory, so hand it an absolute path
    fs::path absolute_output = fs::absolute(output_path);
    std::string workdir = absolute_output.parent_path().string();

    ScriptFile script;
    std::string error = script.create(render_harness(code, absolute_output.string(), *policy_));
    if (!error.empty()) {
        spdlog::error("Cannot write harness script: {}", error);
        return ExecutionResult::failure(ErrorCode::HARNESS_FAILURE,
                                        "cannot write harness script: " + error);
    }
    spdlog::debug("Harness script {} for output {}", script.path(), absolute_output.string());

    ChildOutcome outcome = run_child(options_.python_path, script.path(), workdir,
                                     options_.limits, options_.max_output_bytes, timeout);

    ExecutionResult result = classify(outcome);
    collect_stdout(outcome.out, result);
    if (outcome.truncated) {
        result.output_logs += "\n[output truncated]";
    }

    std::string err = truncate_output(rtrim(outcome.err), options_.max_output_bytes);
    if (!result.success && !err.empty()) {
        if (!result.output_logs.empty()) {
            result.output_logs += '\n';
        }
        result.output_logs += err;
    } else if (!err.empty()) {
        spdlog::debug("Child stderr: {}", err);
    }

    std::error_code ec;
    if (result.success && fs::exists(output_path, ec)) {
        result.image_path = output_path;
    }
    // ru_maxrss is in kilobytes on Linux
    result.memory_usage = static_cast<double>(outcome.usage.ru_maxrss) / 1024.0;
    return result;
}

} // namespace mathviz::runtime
