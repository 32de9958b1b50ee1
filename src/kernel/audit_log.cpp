#include "kernel/audit_log.hpp"
#include <spdlog/spdlog.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace mathviz::kernel {

using json = nlohmann::json;

namespace {

constexpr AuditCategory ALL_CATEGORIES[] = {
    AuditCategory::SECURITY, AuditCategory::EXECUTION,
    AuditCategory::RESOURCE, AuditCategory::POLICY
};

// ISO 8601 in UTC with milliseconds, e.g. 2024-05-01T12:00:00.042Z
std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, millis);
}

std::string jsonl_line(const AuditLogEntry& entry) {
    return entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

} // anonymous namespace

const char* audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::SECURITY:  return "SECURITY";
        case AuditCategory::EXECUTION: return "EXECUTION";
        case AuditCategory::RESOURCE:  return "RESOURCE";
        case AuditCategory::POLICY:    return "POLICY";
        default: return "UNKNOWN";
    }
}

AuditCategory audit_category_from_string(const std::string& str) {
    for (AuditCategory cat : ALL_CATEGORIES) {
        if (str == audit_category_to_string(cat)) {
            return cat;
        }
    }
    throw std::invalid_argument("unknown audit category: " + str);
}

json AuditLogEntry::to_json() const {
    return {
        {"id", id},
        {"timestamp", iso_timestamp(timestamp)},
        {"category", audit_category_to_string(category)},
        {"event_type", event_type},
        {"success", success},
        {"details", details}
    };
}

// ============================================================================
// AuditLogger
// ============================================================================

AuditLogger::AuditLogger(size_t max_entries) : max_entries_(max_entries) {}

void AuditLogger::record(AuditCategory category,
                         const std::string& event_type,
                         json details,
                         bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.details = std::move(details);
    entry.success = success;
    entries_.push_back(std::move(entry));
    evict_overflow();

    spdlog::trace("audit #{} {}/{}{}", next_id_ - 1, audit_category_to_string(category),
                  event_type, success ? "" : " (denied/failed)");
}

std::vector<AuditLogEntry> AuditLogger::select(const AuditQuery& filter) const {
    std::vector<AuditLogEntry> matches;

    // Walk newest to oldest so the limit keeps the most recent matches
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (filter.limit > 0 && matches.size() >= filter.limit) {
            break;
        }
        if (it->id <= filter.since_id) {
            break;
        }
        if (filter.category && it->category != *filter.category) {
            continue;
        }
        if (filter.success && it->success != *filter.success) {
            continue;
        }
        matches.push_back(*it);
    }

    std::reverse(matches.begin(), matches.end());
    return matches;
}

std::vector<AuditLogEntry> AuditLogger::query(const AuditQuery& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return select(filter);
}

std::vector<AuditLogEntry> AuditLogger::query_category(const std::string& category,
                                                       size_t limit) const {
    AuditQuery filter;
    filter.category = audit_category_from_string(category);
    filter.limit = limit;
    return query(filter);
}

json AuditLogger::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json categories = json::object();
    for (AuditCategory cat : ALL_CATEGORIES) {
        categories[audit_category_to_string(cat)] = {{"total", 0}, {"failed", 0}};
    }
    for (const auto& entry : entries_) {
        json& counts = categories[audit_category_to_string(entry.category)];
        counts["total"] = counts["total"].get<uint64_t>() + 1;
        if (!entry.success) {
            counts["failed"] = counts["failed"].get<uint64_t>() + 1;
        }
    }

    return {
        {"entries", entries_.size()},
        {"dropped", dropped_},
        {"last_id", next_id_ - 1},
        {"categories", categories}
    };
}

std::string AuditLogger::export_jsonl(size_t limit) const {
    AuditQuery filter;
    filter.limit = limit;

    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& entry : select(filter)) {
        out += jsonl_line(entry);
    }
    return out;
}

uint64_t AuditLogger::append_jsonl(const std::string& path, uint64_t since_id) const {
    AuditQuery filter;
    filter.since_id = since_id;
    filter.limit = 0;
    std::vector<AuditLogEntry> fresh = query(filter);
    if (fresh.empty()) {
        return since_id;
    }

    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot open audit file " + path + ": " + strerror(errno));
    }
    for (const auto& entry : fresh) {
        out << jsonl_line(entry);
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("cannot write audit file " + path);
    }

    spdlog::debug("Appended {} audit entries to {}", fresh.size(), path);
    return fresh.back().id;
}

void AuditLogger::set_max_entries(size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_entries_ = max_entries;
    evict_overflow();
}

void AuditLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    dropped_ = 0;
}

size_t AuditLogger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::evict_overflow() {
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
        dropped_++;
    }
}

} // namespace mathviz::kernel
