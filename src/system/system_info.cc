#include "system_info.h"

#include <fstream>
#include <sstream>
#include <sys/utsname.h>
#include <unistd.h>
#include <glog/logging.h>

namespace BulkGen {

namespace {

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\"");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\"\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

void ParseOsRelease(std::istream& in, SystemSnapshot& snapshot) {
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = Trim(line.substr(eq + 1));
        if (value.empty()) continue;
        if (key == "NAME") {
            snapshot.os_name = value;
        } else if (key == "VERSION_ID") {
            snapshot.os_version = value;
        }
    }
}

void ParseMemInfo(std::istream& in, SystemSnapshot& snapshot) {
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    uint64_t free_kb = 0;
    bool have_available = false;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t kb = 0;
        if (!(fields >> key >> kb)) continue;
        if (key == "MemTotal:") {
            total_kb = kb;
        } else if (key == "MemAvailable:") {
            available_kb = kb;
            have_available = true;
        } else if (key == "MemFree:") {
            free_kb = kb;
        }
    }

    // Kernels before 3.14 have no MemAvailable
    uint64_t unused_kb = have_available ? available_kb : free_kb;
    snapshot.total_memory_bytes = total_kb * 1024;
    snapshot.used_memory_bytes = total_kb > unused_kb ? (total_kb - unused_kb) * 1024 : 0;
}

std::string ParseCpuBrand(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 10, "model name") != 0) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string brand = Trim(line.substr(colon + 1));
        if (!brand.empty()) {
            return brand;
        }
    }
    return "";
}

SystemSnapshot TakeSystemSnapshot() {
    SystemSnapshot snapshot;

    std::ifstream os_release("/etc/os-release");
    if (os_release) {
        ParseOsRelease(os_release, snapshot);
    } else {
        LOG(WARNING) << "Failed to open /etc/os-release";
    }

    struct utsname uts;
    if (uname(&uts) == 0) {
        snapshot.kernel_version = uts.release;
    } else {
        LOG(WARNING) << "uname failed";
    }

    long cpus = sysconf(_SC_NPROCESSORS_ONLN);
    snapshot.cpu_count = cpus > 0 ? static_cast<size_t>(cpus) : 0;

    std::ifstream cpuinfo("/proc/cpuinfo");
    if (cpuinfo) {
        std::string brand = ParseCpuBrand(cpuinfo);
        if (!brand.empty()) {
            snapshot.cpu_brand = brand;
        }
    } else {
        LOG(WARNING) << "Failed to open /proc/cpuinfo";
    }

    std::ifstream meminfo("/proc/meminfo");
    if (meminfo) {
        ParseMemInfo(meminfo, snapshot);
    } else {
        LOG(WARNING) << "Failed to open /proc/meminfo";
    }

    return snapshot;
}

} // namespace BulkGen
