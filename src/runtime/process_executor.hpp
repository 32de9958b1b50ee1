/**
 * MathViz Process Executor
 *
 * Runs validated code in a child interpreter behind a fixed harness script.
 * The child gets its own process group, hard rlimits, no stdin, and the
 * output directory as working directory; the parent enforces the
 * wall-clock deadline by killing the whole group.
 */
#pragma once
#include <memory>
#include "runtime/executor.hpp"

namespace mathviz::runtime {

class ProcessExecutor : public CodeExecutor {
public:
    ProcessExecutor(std::shared_ptr<const policy::SecurityPolicy> policy,
                    ExecutorOptions options);

    ExecutionResult execute(const std::string& code,
                            const std::string& output_path,
                            std::chrono::milliseconds timeout) override;

    ExecutionMode mode() const override { return ExecutionMode::PROCESS; }

private:
    std::shared_ptr<const policy::SecurityPolicy> policy_;
    policy::SecurityValidator validator_;
    ExecutorOptions options_;

    ExecutionResult run(const std::string& code,
                        const std::string& output_path,
                        std::chrono::milliseconds timeout);
};

} // namespace mathviz::runtime
