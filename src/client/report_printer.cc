#include "report_printer.h"

#include <iomanip>
#include <sstream>

namespace BulkGen {

namespace {

constexpr double GIB = 1024.0 * 1024.0 * 1024.0;

std::string FormatDuration(std::chrono::nanoseconds elapsed) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    double ns = static_cast<double>(elapsed.count());
    if (ns >= 1e9) {
        oss << ns / 1e9 << "s";
    } else if (ns >= 1e6) {
        oss << ns / 1e6 << "ms";
    } else if (ns >= 1e3) {
        oss << ns / 1e3 << "us";
    } else {
        oss << ns << "ns";
    }
    return oss.str();
}

} // namespace

std::string FormatRecordHex(const Record& record) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : record) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

void PrintSystemInfo(std::ostream& out, const SystemSnapshot& snapshot) {
    std::ios_base::fmtflags flags(out.flags());
    std::streamsize precision = out.precision();
    out << "=== System Information ===\n"
        << "OS: " << snapshot.os_name << " (version: " << snapshot.os_version
        << "), kernel: " << snapshot.kernel_version << "\n"
        << "CPU Count: " << snapshot.cpu_count << "\n"
        << "CPU Brand: " << snapshot.cpu_brand << "\n"
        << std::fixed << std::setprecision(2)
        << "Total Memory: " << snapshot.total_memory_bytes / GIB << " GiB\n"
        << "Used Memory:  " << snapshot.used_memory_bytes / GIB << " GiB\n"
        << "==========================\n\n";
    out.flags(flags);
    out.precision(precision);
}

void PrintRunPlan(std::ostream& out, size_t num_records, size_t num_chunks,
                  size_t chunk_size, size_t num_workers) {
    std::ios_base::fmtflags flags(out.flags());
    std::streamsize precision = out.precision();
    out << "Allocating space for " << num_records << " records (~"
        << std::fixed << std::setprecision(2)
        << static_cast<double>(num_records) * RECORD_SIZE / GIB << " GiB)...\n"
        << "Generating in " << num_chunks << " parallel chunks of " << chunk_size
        << " records each on " << num_workers << " workers...\n\n";
    out.flags(flags);
    out.precision(precision);
}

void PrintRunReport(std::ostream& out, const RunReport& report, const SystemSnapshot& after) {
    std::ios_base::fmtflags flags(out.flags());
    std::streamsize precision = out.precision();
    out << "Generated " << report.num_records << " 128-bit records in "
        << FormatDuration(report.elapsed) << "\n"
        << std::fixed << std::setprecision(0)
        << "Rate: ~" << report.rate << " records/sec (~"
        << std::setprecision(1) << report.rate / 1e6 << " million/sec)\n\n"
        << "=== Memory Usage After ===\n"
        << std::setprecision(2)
        << "Used Memory:  " << after.used_memory_bytes / GIB << " GiB\n\n";
    for (size_t i = 0; i < report.sample.size(); ++i) {
        out << "Record[" << i << "] = " << FormatRecordHex(report.sample[i]) << "\n";
    }
    out.flags(flags);
    out.precision(precision);
}

} // namespace BulkGen
