#pragma once

#include <ostream>
#include <string>
#include "common/config.h"
#include "generator/throughput_reporter.h"
#include "system/system_info.h"

namespace BulkGen {

/**
 * Lower-case hex of a record, 32 characters
 */
std::string FormatRecordHex(const Record& record);

/**
 * Prints the host snapshot taken before the run
 */
void PrintSystemInfo(std::ostream& out, const SystemSnapshot& snapshot);

/**
 * Prints the allocation banner: record count, output size and chunk layout
 */
void PrintRunPlan(std::ostream& out, size_t num_records, size_t num_chunks,
                  size_t chunk_size, size_t num_workers);

/**
 * Prints timing, rate, memory after the run and the sample records
 */
void PrintRunReport(std::ostream& out, const RunReport& report, const SystemSnapshot& after);

} // namespace BulkGen
