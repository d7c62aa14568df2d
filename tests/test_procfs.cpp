#include <gtest/gtest.h>
#include "fake_probe.hpp"
#include "metrics/platform.hpp"
#include "metrics/procfs.hpp"

using namespace perfmon::metrics;
using namespace perfmon::test_support;

TEST(ProcfsTest, ParseIntegers) {
    EXPECT_EQ(procfs::parse_uint64(" 1073741824\n").value_or(0), 1073741824ULL);
    EXPECT_FALSE(procfs::parse_uint64("max").has_value());
    EXPECT_FALSE(procfs::parse_uint64("12abc").has_value());
    EXPECT_FALSE(procfs::parse_uint64("-1").has_value());
    EXPECT_FALSE(procfs::parse_uint64("").has_value());
    EXPECT_FALSE(procfs::parse_uint64("99999999999999999999999").has_value());

    EXPECT_EQ(procfs::parse_int64("-1").value_or(0), -1);
    EXPECT_EQ(procfs::parse_int64("100000\n").value_or(0), 100000);
    EXPECT_FALSE(procfs::parse_int64("1.5").has_value());
}

TEST(ProcfsTest, ReadFile) {
    TempDir dir;
    auto file = dir.write("sample.txt", "first\nsecond\n");

    EXPECT_EQ(procfs::read_file(file).value_or(""), "first\nsecond\n");
    EXPECT_EQ(procfs::read_file_lines(file), (std::vector<std::string>{"first", "second"}));
    EXPECT_FALSE(procfs::read_file(dir.path() / "missing").has_value());
    EXPECT_TRUE(procfs::read_file_lines(dir.path() / "missing").empty());
}

TEST(ProcfsTest, ProcStatSkipsAggregateLine) {
    const std::string stat =
        "cpu  400 10 200 5000 50 5 5 0 0 0\n"
        "cpu0 200 5 100 2500 25 3 2 0 0 0\n"
        "cpu1 200 5 100 2500 25 2 3 1 0 0\n"
        "intr 12345 0 0\n"
        "ctxt 99999\n";

    auto cores = procfs::parse_proc_stat(stat);
    ASSERT_EQ(cores.size(), 2u);
    EXPECT_EQ(cores[0].user, 200u);
    EXPECT_EQ(cores[0].idle, 2500u);
    EXPECT_EQ(cores[0].iowait, 25u);
    EXPECT_EQ(cores[1].steal, 1u);
    EXPECT_EQ(cores[1].total(), 200u + 5 + 100 + 2500 + 2);
    EXPECT_EQ(cores[1].idle_total(), 2500u);
}

TEST(ProcfsTest, ProcStatOldKernel) {
    auto cores = procfs::parse_proc_stat("cpu0 10 0 5 100\n");
    ASSERT_EQ(cores.size(), 1u);
    EXPECT_EQ(cores[0].iowait, 0u);
    EXPECT_EQ(cores[0].total(), 115u);
}

TEST(ProcfsTest, MeminfoAvailable) {
    const std::string meminfo =
        "MemTotal:       16384000 kB\n"
        "MemFree:         1024000 kB\n"
        "MemAvailable:    8192000 kB\n"
        "Buffers:          100000 kB\n";

    EXPECT_EQ(procfs::parse_meminfo_available(meminfo).value_or(0), 8192000ULL * 1024);
    EXPECT_FALSE(procfs::parse_meminfo_available("MemTotal: 100 kB\n").has_value());
    EXPECT_FALSE(procfs::parse_meminfo_available("MemAvailable: lots kB\n").has_value());
}

TEST(ProcfsTest, Cpuinfo) {
    const std::string cpuinfo =
        "processor\t: 0\n"
        "vendor_id\t: GenuineIntel\n"
        "model name\t: Intel(R) Xeon(R) CPU @ 2.20GHz\n"
        "cpu MHz\t\t: 2200.146\n"
        "\n"
        "processor\t: 1\n"
        "model name\t: Intel(R) Xeon(R) CPU @ 2.20GHz\n"
        "cpu MHz\t\t: 2199.998\n";

    auto cpus = procfs::parse_cpuinfo(cpuinfo);
    ASSERT_EQ(cpus.size(), 2u);
    EXPECT_EQ(cpus[0].model, "Intel(R) Xeon(R) CPU @ 2.20GHz");
    EXPECT_NEAR(cpus[0].speed_mhz, 2200.146, 1e-9);
    EXPECT_NEAR(cpus[1].speed_mhz, 2199.998, 1e-9);
}

TEST(ProcfsTest, CpuinfoWithoutModel) {
    // ARM kernels omit "model name" and "cpu MHz"
    auto cpus = procfs::parse_cpuinfo("processor\t: 0\nBogoMIPS\t: 50.00\n");
    ASSERT_EQ(cpus.size(), 1u);
    EXPECT_TRUE(cpus[0].model.empty());
    EXPECT_DOUBLE_EQ(cpus[0].speed_mhz, 0.0);
}

TEST(ProcfsTest, NetDevExcludesLoopback) {
    const std::string net_dev =
        "Inter-|   Receive                                                |  Transmit\n"
        " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
        "    lo: 5000      50    0    0    0     0          0         0     5000      50    0    0    0     0       0          0\n"
        "  eth0: 1000      10    0    0    0     0          0         0     2000      20    0    0    0     0       0          0\n"
        "  eth1: 300        3    0    0    0     0          0         0      400       4    0    0    0     0       0          0\n";

    auto usage = procfs::parse_net_dev(net_dev);
    ASSERT_TRUE(usage.has_value());
    EXPECT_EQ(usage->bytes_received, 1300u);
    EXPECT_EQ(usage->packets_received, 13u);
    EXPECT_EQ(usage->bytes_sent, 2400u);
    EXPECT_EQ(usage->packets_sent, 24u);

    EXPECT_FALSE(procfs::parse_net_dev("garbage\n").has_value());
}

TEST(ProcfsTest, Statm) {
    EXPECT_EQ(procfs::parse_statm_resident("25000 1200 300 10 0 900 0\n").value_or(0), 1200u);
    EXPECT_FALSE(procfs::parse_statm_resident("").has_value());
}

TEST(ProcfsTest, StatStarttimeWithAwkwardComm) {
    const std::string stat =
        "1234 (my (odd) proc) S 1 1234 1234 0 -1 4194560 100 0 0 0 "
        "5 3 0 0 20 0 4 0 987654 123456789 300\n";
    EXPECT_EQ(procfs::parse_stat_starttime(stat).value_or(0), 987654u);
    EXPECT_FALSE(procfs::parse_stat_starttime("1234 (short) S 1 2").has_value());
}

TEST(VmStatTest, AvailableBytes) {
    const std::string output =
        "Mach Virtual Memory Statistics: (page size of 16384 bytes)\n"
        "Pages free:                               10000.\n"
        "Pages active:                            200000.\n"
        "Pages inactive:                           20000.\n"
        "Pages speculative:                         5000.\n"
        "Pages throttled:                              0.\n";

    EXPECT_EQ(parse_vm_stat(output).value_or(0), (10000ULL + 20000 + 5000) * 16384);
}

TEST(VmStatTest, DefaultPageSize) {
    EXPECT_EQ(parse_vm_stat("Pages free:  100.\nPages inactive:  50.\n").value_or(0), 150ULL * 4096);
}

TEST(VmStatTest, MissingFreePages) {
    EXPECT_FALSE(parse_vm_stat("Mach Virtual Memory Statistics: (page size of 4096 bytes)\n").has_value());
    EXPECT_FALSE(parse_vm_stat("").has_value());
}

TEST(RunCommandTest, CapturesStdout) {
    EXPECT_EQ(run_command("echo perfmon").value_or(""), "perfmon\n");
}

TEST(RunCommandTest, NonZeroExitIsFailure) {
    EXPECT_FALSE(run_command("exit 3").has_value());
}

#ifdef __linux__
TEST(PlatformProbeTest, LinuxProbeReadsHost) {
    auto probe = make_platform_probe();

    EXPECT_EQ(probe->os(), "linux");
    EXPECT_FALSE(probe->architecture().empty());
    EXPECT_GT(probe->total_memory(), 0u);
    EXPECT_LE(probe->free_memory(), probe->total_memory());
    EXPECT_GT(probe->process_rss(), 0u);
    EXPECT_EQ(probe->pid(), ::getpid());
    EXPECT_TRUE(probe->has_fs_stats());
    EXPECT_GT(probe->fs_stats("/").blocks, 0u);
    EXPECT_GE(probe->process_uptime_seconds(), 0.0);
    EXPECT_GT(probe->system_uptime_seconds(), 0.0);
}
#endif
