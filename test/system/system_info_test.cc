#include <gtest/gtest.h>
#include "../../src/system/system_info.h"
#include <sstream>

using namespace BulkGen;

TEST(SystemInfoTest, ParsesOsRelease) {
    std::istringstream in(
        "PRETTY_NAME=\"Ubuntu 22.04.4 LTS\"\n"
        "NAME=\"Ubuntu\"\n"
        "VERSION_ID=\"22.04\"\n"
        "ID=ubuntu\n");
    SystemSnapshot snapshot;
    ParseOsRelease(in, snapshot);
    EXPECT_EQ(snapshot.os_name, "Ubuntu");
    EXPECT_EQ(snapshot.os_version, "22.04");
}

TEST(SystemInfoTest, OsReleaseWithoutFieldsKeepsDefaults) {
    std::istringstream in("# comment only\n");
    SystemSnapshot snapshot;
    ParseOsRelease(in, snapshot);
    EXPECT_EQ(snapshot.os_name, "Unknown OS");
    EXPECT_EQ(snapshot.os_version, "Unknown");
}

TEST(SystemInfoTest, ParsesMemInfo) {
    std::istringstream in(
        "MemTotal:       16000000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    6000000 kB\n"
        "Buffers:          200000 kB\n");
    SystemSnapshot snapshot;
    ParseMemInfo(in, snapshot);
    EXPECT_EQ(snapshot.total_memory_bytes, 16000000ULL * 1024);
    EXPECT_EQ(snapshot.used_memory_bytes, 10000000ULL * 1024);
}

TEST(SystemInfoTest, MemInfoWithoutAvailableUsesFree) {
    std::istringstream in(
        "MemTotal:       8000000 kB\n"
        "MemFree:        3000000 kB\n");
    SystemSnapshot snapshot;
    ParseMemInfo(in, snapshot);
    EXPECT_EQ(snapshot.used_memory_bytes, 5000000ULL * 1024);
}

TEST(SystemInfoTest, ParsesCpuBrand) {
    std::istringstream in(
        "processor\t: 0\n"
        "vendor_id\t: GenuineIntel\n"
        "model name\t: Intel(R) Xeon(R) Gold 6248 CPU @ 2.50GHz\n"
        "processor\t: 1\n"
        "model name\t: Intel(R) Xeon(R) Gold 6248 CPU @ 2.50GHz\n");
    EXPECT_EQ(ParseCpuBrand(in), "Intel(R) Xeon(R) Gold 6248 CPU @ 2.50GHz");

    std::istringstream none("processor\t: 0\n");
    EXPECT_EQ(ParseCpuBrand(none), "");
}

TEST(SystemInfoTest, SnapshotOfThisHost) {
    SystemSnapshot snapshot = TakeSystemSnapshot();
    EXPECT_GE(snapshot.cpu_count, 1u);
    EXPECT_NE(snapshot.kernel_version, "Unknown");
    EXPECT_GT(snapshot.total_memory_bytes, 0u);
    EXPECT_LE(snapshot.used_memory_bytes, snapshot.total_memory_bytes);
}
