#include "throughput_reporter.h"

#include <algorithm>
#include <glog/logging.h>

namespace BulkGen {

RunReport ComputeReport(std::chrono::steady_clock::time_point start,
                        std::chrono::steady_clock::time_point end,
                        const RecordBuffer& buffer, size_t sample_count) {
    RunReport report;
    report.num_records = buffer.NumRecords();
    report.elapsed = std::max(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start),
                              std::chrono::nanoseconds(1));
    report.rate = static_cast<double>(report.num_records) / report.ElapsedSeconds();

    size_t n = std::min(sample_count, buffer.NumRecords());
    report.sample.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        report.sample.push_back(buffer.At(i));
    }

    VLOG(1) << "Report: " << report.num_records << " records in " << report.ElapsedSeconds()
            << "s (" << report.rate << " records/s)";
    return report;
}

RunReport Report(std::chrono::steady_clock::time_point start,
                 const RecordBuffer& buffer, size_t sample_count) {
    return ComputeReport(start, std::chrono::steady_clock::now(), buffer, sample_count);
}

} // namespace BulkGen
