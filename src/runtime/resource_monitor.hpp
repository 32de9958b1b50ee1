/**
 * MathViz Resource Monitor
 *
 * Scoped memory (RLIMIT_AS) and CPU (RLIMIT_CPU) ceilings for in-process
 * execution, and absolute limits for forked children. Only soft limits are
 * touched in-process so that the previous values can always be restored
 * without privileges.
 */
#pragma once
#include <string>
#include <cstdint>
#include <signal.h>
#include <sys/resource.h>

namespace mathviz::runtime {

struct ResourceLimits {
    uint64_t max_memory_bytes = 512ULL * 1024 * 1024;    // 512MB default
    uint64_t max_cpu_seconds = 30;
    uint64_t max_file_size_bytes = 64ULL * 1024 * 1024;  // Largest file a child may write

    // Absolute hard limits for a forked child (address space, CPU, file size,
    // core dumps off). Only async-signal-safe calls; false if any limit failed.
    static bool apply_hard(const ResourceLimits& limits) noexcept;
};

class ResourceMonitor {
public:
    // Lowers the soft limits to the ceilings measured from current usage.
    // Never throws: on failure it logs DEGRADED and becomes a no-op.
    explicit ResourceMonitor(const ResourceLimits& limits);
    ~ResourceMonitor();

    // Non-copyable
    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    bool active() const { return memory_applied_ || cpu_applied_; }
    bool memory_limited() const { return memory_applied_; }
    bool cpu_limited() const { return cpu_applied_; }
    const std::string& degraded_reason() const { return degraded_reason_; }

    // SIGXCPU arrived since this monitor was constructed
    static bool cpu_limit_hit();

private:
    struct rlimit saved_memory_{};
    struct rlimit saved_cpu_{};
    struct sigaction saved_sigxcpu_{};
    bool memory_applied_ = false;
    bool cpu_applied_ = false;
    bool handler_installed_ = false;
    std::string degraded_reason_;

    void degrade(const std::string& reason);
};

// Peak resident set size of this process in MB
double peak_rss_mb();

// Current virtual address space of this process in bytes (0 if unknown)
uint64_t current_address_space_bytes();

// User + system CPU time consumed by this process so far
double process_cpu_seconds();

} // namespace mathviz::runtime
