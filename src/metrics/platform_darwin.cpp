/**
 * Darwin platform probe - sysctl(3), Mach host statistics and vm_stat(1).
 */

#ifdef __APPLE__

#include "metrics/platform.hpp"
#include <ctime>
#include <mach/mach.h>
#include <mach/mach_host.h>
#include <mach/processor_info.h>
#include <sys/sysctl.h>
#include <sys/time.h>
#include <spdlog/spdlog.h>

namespace perfmon::metrics {

namespace {

template <typename T>
bool sysctl_value(const char* name, T& out) {
    size_t size = sizeof(T);
    return sysctlbyname(name, &out, &size, nullptr, 0) == 0;
}

std::string sysctl_string(const char* name) {
    size_t size = 0;
    if (sysctlbyname(name, nullptr, &size, nullptr, 0) != 0 || size == 0) return "";
    std::string value(size, '\0');
    if (sysctlbyname(name, value.data(), &size, nullptr, 0) != 0) return "";
    value.resize(size > 0 ? size - 1 : 0);
    return value;
}

} // namespace

uint64_t DarwinProbe::total_memory() const {
    uint64_t memsize = 0;
    if (!sysctl_value("hw.memsize", memsize)) return PosixProbe::total_memory();
    return memsize;
}

uint64_t DarwinProbe::free_memory() const {
    mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
    vm_statistics64_data_t vm;
    if (host_statistics64(mach_host_self(), HOST_VM_INFO64,
                          reinterpret_cast<host_info64_t>(&vm), &count) != KERN_SUCCESS) {
        return 0;
    }
    vm_size_t page_size = 0;
    host_page_size(mach_host_self(), &page_size);
    return static_cast<uint64_t>(vm.free_count) * page_size;
}

std::optional<uint64_t> DarwinProbe::available_memory() const {
    auto output = run_command("vm_stat");
    if (!output) return std::nullopt;

    auto available = parse_vm_stat(*output);
    if (!available) {
        spdlog::debug("vm_stat output not recognised");
    }
    return available;
}

std::vector<CpuCore> DarwinProbe::cpus() const {
    natural_t cpu_count = 0;
    processor_info_array_t info = nullptr;
    mach_msg_type_number_t info_count = 0;

    if (host_processor_info(mach_host_self(), PROCESSOR_CPU_LOAD_INFO,
                            &cpu_count, &info, &info_count) != KERN_SUCCESS) {
        return PosixProbe::cpus();
    }

    std::string model = sysctl_string("machdep.cpu.brand_string");
    uint64_t hz = 0;
    sysctl_value("hw.cpufrequency", hz);

    std::vector<CpuCore> cores(cpu_count);
    for (natural_t i = 0; i < cpu_count; ++i) {
        const integer_t* ticks = info + CPU_STATE_MAX * i;
        cores[i].model = model;
        cores[i].speed_mhz = static_cast<double>(hz) / 1e6;
        cores[i].times.user = static_cast<uint64_t>(ticks[CPU_STATE_USER]);
        cores[i].times.nice = static_cast<uint64_t>(ticks[CPU_STATE_NICE]);
        cores[i].times.system = static_cast<uint64_t>(ticks[CPU_STATE_SYSTEM]);
        cores[i].times.idle = static_cast<uint64_t>(ticks[CPU_STATE_IDLE]);
    }

    vm_deallocate(mach_task_self(), reinterpret_cast<vm_address_t>(info),
                  info_count * sizeof(integer_t));
    return cores;
}

uint64_t DarwinProbe::process_rss() const {
    mach_task_basic_info_data_t task_info_data;
    mach_msg_type_number_t count = MACH_TASK_BASIC_INFO_COUNT;
    if (task_info(mach_task_self(), MACH_TASK_BASIC_INFO,
                  reinterpret_cast<task_info_t>(&task_info_data), &count) != KERN_SUCCESS) {
        return PosixProbe::process_rss();
    }
    return task_info_data.resident_size;
}

double DarwinProbe::system_uptime_seconds() const {
    struct timeval boot;
    if (!sysctl_value("kern.boottime", boot)) return 0.0;
    return std::difftime(std::time(nullptr), boot.tv_sec);
}

} // namespace perfmon::metrics

#endif // __APPLE__
