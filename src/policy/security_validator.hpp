/**
 * MathViz Security Validator
 *
 * Static analysis of generated Python scripts against the policy tables.
 * The embedded interpreter's own ast module parses the source, so the
 * validator accepts exactly what the executors can compile. The tree is
 * walked for forbidden calls, names, private attributes, catch-all except
 * clauses and imports; the raw text is scanned with re for dangerous,
 * file and network idioms. No I/O, safe to call from any thread.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>
#include "policy/security_policy.hpp"

namespace mathviz::policy {

struct CodeValidationResult {
    bool is_valid = false;
    std::vector<std::string> security_issues;
    std::vector<std::string> syntax_errors;
    std::vector<std::string> warnings;
    double validation_time = 0.0;   // seconds

    nlohmann::json to_json() const;
};

// Exception names an except clause may not catch: the in-process watchdog
// interrupts through BaseException
extern const std::vector<std::string> UNCATCHABLE_EXCEPTIONS;

class SecurityValidator {
public:
    // Compiles the policy's patterns once; throws PolicyError if one is invalid
    explicit SecurityValidator(std::shared_ptr<const SecurityPolicy> policy);

    CodeValidationResult validate(const std::string& code) const;

    // Table sizes and sorted contents, for audit/debugging
    nlohmann::json get_security_report() const;

    const SecurityPolicy& policy() const { return *policy_; }
    std::shared_ptr<const SecurityPolicy> shared_policy() const { return policy_; }

private:
    std::shared_ptr<const SecurityPolicy> policy_;

    // Everything after the size check; runs under the GIL and throws
    // std::runtime_error when the analysis machinery itself fails
    void analyse(const std::string& code, CodeValidationResult& result) const;
};

} // namespace mathviz::policy
