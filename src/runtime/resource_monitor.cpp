#include "runtime/resource_monitor.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace mathviz::runtime {

namespace {

std::atomic<bool> g_cpu_limit_hit{false};

void on_sigxcpu(int) {
    g_cpu_limit_hit.store(true);
}

rlim_t clamp_to_hard(rlim_t wanted, const struct rlimit& current) {
    if (current.rlim_max != RLIM_INFINITY && wanted > current.rlim_max) {
        return current.rlim_max;
    }
    return wanted;
}

// Lower a soft limit, never loosening one that is already tighter
bool lower_soft_limit(int resource, rlim_t wanted, struct rlimit& saved) {
    if (getrlimit(resource, &saved) != 0) {
        return false;
    }
    struct rlimit next = saved;
    next.rlim_cur = clamp_to_hard(wanted, saved);
    if (saved.rlim_cur != RLIM_INFINITY) {
        next.rlim_cur = std::min(next.rlim_cur, saved.rlim_cur);
    }
    return setrlimit(resource, &next) == 0;
}

bool set_hard_limit(int resource, rlim_t soft, rlim_t hard) noexcept {
    struct rlimit current;
    if (getrlimit(resource, &current) != 0) {
        return false;
    }
    struct rlimit next;
    next.rlim_max = clamp_to_hard(hard, current);
    next.rlim_cur = std::min(clamp_to_hard(soft, current), next.rlim_max);
    return setrlimit(resource, &next) == 0;
}

} // anonymous namespace

// ============================================================================
// ResourceLimits
// ============================================================================

bool ResourceLimits::apply_hard(const ResourceLimits& limits) noexcept {
    bool ok = true;
    if (limits.max_memory_bytes > 0) {
        ok &= set_hard_limit(RLIMIT_AS, limits.max_memory_bytes, limits.max_memory_bytes);
    }
    if (limits.max_cpu_seconds > 0) {
        // SIGXCPU at the soft limit, SIGKILL one second later
        ok &= set_hard_limit(RLIMIT_CPU, limits.max_cpu_seconds, limits.max_cpu_seconds + 1);
    }
    if (limits.max_file_size_bytes > 0) {
        ok &= set_hard_limit(RLIMIT_FSIZE, limits.max_file_size_bytes, limits.max_file_size_bytes);
    }
    ok &= set_hard_limit(RLIMIT_CORE, 0, 0);
    return ok;
}

// ============================================================================
// ResourceMonitor
// ============================================================================

ResourceMonitor::ResourceMonitor(const ResourceLimits& limits) {
    g_cpu_limit_hit.store(false);

    if (limits.max_memory_bytes > 0) {
        uint64_t in_use = current_address_space_bytes();
        if (in_use == 0) {
            degrade("cannot read current address space size");
        } else if (lower_soft_limit(RLIMIT_AS, in_use + limits.max_memory_bytes, saved_memory_)) {
            memory_applied_ = true;
            spdlog::debug("Memory ceiling: {} MB above current {} MB",
                          limits.max_memory_bytes / (1024 * 1024), in_use / (1024 * 1024));
        } else {
            degrade(std::string("setrlimit(RLIMIT_AS) failed: ") + strerror(errno));
        }
    }

    if (limits.max_cpu_seconds > 0) {
        struct sigaction action{};
        action.sa_handler = on_sigxcpu;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        if (sigaction(SIGXCPU, &action, &saved_sigxcpu_) == 0) {
            handler_installed_ = true;
        }

        auto used = static_cast<rlim_t>(std::ceil(process_cpu_seconds()));
        if (lower_soft_limit(RLIMIT_CPU, used + limits.max_cpu_seconds, saved_cpu_)) {
            cpu_applied_ = true;
            spdlog::debug("CPU ceiling: {}s above current {}s", limits.max_cpu_seconds, used);
        } else {
            degrade(std::string("setrlimit(RLIMIT_CPU) failed: ") + strerror(errno));
        }
    }
}

ResourceMonitor::~ResourceMonitor() {
    if (cpu_applied_ && setrlimit(RLIMIT_CPU, &saved_cpu_) != 0) {
        spdlog::error("Failed to restore RLIMIT_CPU: {}", strerror(errno));
    }
    if (memory_applied_ && setrlimit(RLIMIT_AS, &saved_memory_) != 0) {
        spdlog::error("Failed to restore RLIMIT_AS: {}", strerror(errno));
    }
    if (handler_installed_ && sigaction(SIGXCPU, &saved_sigxcpu_, nullptr) != 0) {
        spdlog::error("Failed to restore SIGXCPU handler: {}", strerror(errno));
    }
}

void ResourceMonitor::degrade(const std::string& reason) {
    degraded_reason_ = reason;
    spdlog::warn("DEGRADED ISOLATION: {}", reason);
    spdlog::warn("  -> Code will run without this resource ceiling");
}

bool ResourceMonitor::cpu_limit_hit() {
    return g_cpu_limit_hit.load();
}

// ============================================================================
// Usage queries
// ============================================================================

double peak_rss_mb() {
    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    return static_cast<double>(usage.ru_maxrss) / 1024.0;  // ru_maxrss is in KB
}

uint64_t current_address_space_bytes() {
    std::ifstream statm("/proc/self/statm");
    uint64_t pages = 0;
    if (!(statm >> pages)) {
        return 0;
    }
    long page_size = sysconf(_SC_PAGESIZE);
    return pages * static_cast<uint64_t>(page_size > 0 ? page_size : 4096);
}

double process_cpu_seconds() {
    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    auto seconds = [](const timeval& tv) {
        return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
    };
    return seconds(usage.ru_utime) + seconds(usage.ru_stime);
}

} // namespace mathviz::runtime
