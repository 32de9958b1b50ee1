/**
 * MathViz Audit Log
 *
 * Bounded in-memory trail of the sandbox manager's decisions: code and
 * path rejections, completed runs, resource hits and policy reloads.
 * Entries can be queried, summarized per category and exported as JSONL.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mathviz::kernel {

// Audit event categories
enum class AuditCategory {
    SECURITY,    // Validation rejections, path escapes
    EXECUTION,   // Completed runs, harness failures
    RESOURCE,    // Timeouts, memory and CPU ceilings
    POLICY       // Policy reloads
};

const char* audit_category_to_string(AuditCategory cat);

// Throws std::invalid_argument for unknown names
AuditCategory audit_category_from_string(const std::string& str);

struct AuditLogEntry {
    uint64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category = AuditCategory::EXECUTION;
    std::string event_type;          // e.g. "VALIDATION_REJECTED", "EXECUTION_TIMEOUT"
    nlohmann::json details;
    bool success = true;

    nlohmann::json to_json() const;
};

// Filter for AuditLogger::query; unset fields match everything
struct AuditQuery {
    std::optional<AuditCategory> category;
    std::optional<bool> success;
    uint64_t since_id = 0;           // Only entries with a larger id
    size_t limit = 100;              // Newest matches kept, 0 = no limit
};

class AuditLogger {
public:
    explicit AuditLogger(size_t max_entries = 10000);

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    void record(AuditCategory category,
                const std::string& event_type,
                nlohmann::json details,
                bool success = true);

    // Security decisions are always denials
    void record_denial(const std::string& event_type, nlohmann::json details) {
        record(AuditCategory::SECURITY, event_type, std::move(details), false);
    }

    // Matching entries, oldest first
    std::vector<AuditLogEntry> query(const AuditQuery& filter = AuditQuery{}) const;

    // Category by name; throws std::invalid_argument for unknown names
    std::vector<AuditLogEntry> query_category(const std::string& category, size_t limit = 100) const;

    // {entries, dropped, last_id, categories: {NAME: {total, failed}}}
    nlohmann::json summary() const;

    // Newest `limit` entries as one JSON object per line, oldest first; 0 = all
    std::string export_jsonl(size_t limit = 0) const;

    // Append entries newer than since_id to a JSONL file; returns the last id
    // written (since_id if nothing was new). Throws std::runtime_error.
    uint64_t append_jsonl(const std::string& path, uint64_t since_id = 0) const;

    void set_max_entries(size_t max_entries);
    void clear();

    size_t size() const;
    uint64_t last_id() const;

private:
    mutable std::mutex mutex_;
    std::deque<AuditLogEntry> entries_;
    size_t max_entries_;
    uint64_t next_id_ = 1;
    uint64_t dropped_ = 0;

    // Caller holds mutex_
    void evict_overflow();
    std::vector<AuditLogEntry> select(const AuditQuery& filter) const;
};

} // namespace mathviz::kernel
