/**
 * MathViz Restricted Executor
 *
 * Runs validated code inside the embedded interpreter with a namespace
 * that exposes only the policy's safe builtins, a capturing print, a
 * gated __import__ and the preloaded plotting/numeric modules. A watchdog
 * thread enforces the wall-clock deadline; a ResourceMonitor caps memory
 * and CPU while the code runs. Runs are serialized process-wide.
 */
#pragma once
#include <memory>
#include "runtime/executor.hpp"

namespace mathviz::runtime {

class RestrictedExecutor : public CodeExecutor {
public:
    RestrictedExecutor(std::shared_ptr<const policy::SecurityPolicy> policy,
                       ExecutorOptions options);

    ExecutionResult execute(const std::string& code,
                            const std::string& output_path,
                            std::chrono::milliseconds timeout) override;

    ExecutionMode mode() const override { return ExecutionMode::RESTRICTED; }

private:
    std::shared_ptr<const policy::SecurityPolicy> policy_;
    policy::SecurityValidator validator_;
    ExecutorOptions options_;

    ExecutionResult run_locked(const std::string& code,
                               const std::string& output_path,
                               std::chrono::milliseconds timeout);
};

} // namespace mathviz::runtime
