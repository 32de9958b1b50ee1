#include <gtest/gtest.h>
#include "runtime/resource_monitor.hpp"
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace mathviz::runtime;

namespace {

struct rlimit current_limit(int resource) {
    struct rlimit limit{};
    getrlimit(resource, &limit);
    return limit;
}

} // anonymous namespace

TEST(ResourceMonitorTest, LowersAndRestoresSoftLimits) {
    struct rlimit memory_before = current_limit(RLIMIT_AS);
    struct rlimit cpu_before = current_limit(RLIMIT_CPU);

    ResourceLimits limits;
    limits.max_memory_bytes = 256ULL * 1024 * 1024;
    limits.max_cpu_seconds = 20;

    {
        ResourceMonitor monitor(limits);
        EXPECT_TRUE(monitor.active());
        EXPECT_FALSE(ResourceMonitor::cpu_limit_hit());

        if (monitor.memory_limited()) {
            struct rlimit memory = current_limit(RLIMIT_AS);
            EXPECT_NE(memory.rlim_cur, RLIM_INFINITY);
            EXPECT_GT(memory.rlim_cur, current_address_space_bytes());
            EXPECT_EQ(memory.rlim_max, memory_before.rlim_max);
        }
        if (monitor.cpu_limited()) {
            struct rlimit cpu = current_limit(RLIMIT_CPU);
            EXPECT_NE(cpu.rlim_cur, RLIM_INFINITY);
            EXPECT_EQ(cpu.rlim_max, cpu_before.rlim_max);
        }
    }

    struct rlimit memory_after = current_limit(RLIMIT_AS);
    struct rlimit cpu_after = current_limit(RLIMIT_CPU);
    EXPECT_EQ(memory_after.rlim_cur, memory_before.rlim_cur);
    EXPECT_EQ(memory_after.rlim_max, memory_before.rlim_max);
    EXPECT_EQ(cpu_after.rlim_cur, cpu_before.rlim_cur);
    EXPECT_EQ(cpu_after.rlim_max, cpu_before.rlim_max);
}

TEST(ResourceMonitorTest, ZeroLimitsAreNoOp) {
    ResourceLimits limits;
    limits.max_memory_bytes = 0;
    limits.max_cpu_seconds = 0;

    ResourceMonitor monitor(limits);
    EXPECT_FALSE(monitor.active());
    EXPECT_TRUE(monitor.degraded_reason().empty());
}

TEST(ResourceMonitorTest, ApplyHardInChild) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);

    if (pid == 0) {
        ResourceLimits limits;
        limits.max_memory_bytes = 128ULL * 1024 * 1024;
        limits.max_cpu_seconds = 5;
        limits.max_file_size_bytes = 1024 * 1024;
        if (!ResourceLimits::apply_hard(limits)) {
            _exit(2);
        }

        struct rlimit cpu = current_limit(RLIMIT_CPU);
        struct rlimit core = current_limit(RLIMIT_CORE);
        struct rlimit fsize = current_limit(RLIMIT_FSIZE);
        bool ok = cpu.rlim_cur <= 5 && cpu.rlim_max <= 6 &&
                  core.rlim_max == 0 &&
                  fsize.rlim_cur <= 1024 * 1024;
        _exit(ok ? 0 : 1);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(ResourceMonitorTest, UsageQueriesReportValues) {
    EXPECT_GT(current_address_space_bytes(), 0u);
    EXPECT_GT(peak_rss_mb(), 0.0);
    EXPECT_GE(process_cpu_seconds(), 0.0);
}
