#pragma once
#include <string>
#include "policy/security_policy.hpp"

namespace mathviz::runtime {

// Prefix of the single stdout line carrying the serialized `result`
constexpr const char* RESULT_MARKER = "__mathviz_result__:";

// Harness exit status for MemoryError inside the executed code
constexpr int HARNESS_EXIT_MEMORY = 3;

// Render the child-interpreter script that runs `code` behind the same
// import gate and builtin table as the in-process executor
std::string render_harness(const std::string& code,
                           const std::string& output_path,
                           const policy::SecurityPolicy& policy);

} // namespace mathviz::runtime
