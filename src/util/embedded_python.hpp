/**
 * MathViz Embedded Python
 *
 * Process-wide CPython interpreter shared by the validator (ast and re)
 * and the in-process executor. Created on first use, released to other
 * threads immediately, never finalized (extension modules such as numpy
 * do not survive re-initialization).
 */
#pragma once
#include <string>
#include <mutex>

namespace mathviz::util {

class EmbeddedPython {
public:
    // Initializes the interpreter on first call; throws std::runtime_error
    // if it cannot be started
    static EmbeddedPython& instance();

    // Serializes in-process runs: resource ceilings are process-global
    std::mutex& run_mutex() { return run_mutex_; }

    // Whether `import name` succeeds (acquires the GIL)
    bool module_available(const std::string& name);

    EmbeddedPython(const EmbeddedPython&) = delete;
    EmbeddedPython& operator=(const EmbeddedPython&) = delete;

private:
    EmbeddedPython();

    std::mutex run_mutex_;
};

} // namespace mathviz::util
