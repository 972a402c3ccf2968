#include <algorithm>
#include <iostream>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "generator/bulk_generator.h"
#include "system/system_info.h"
#include "report_printer.h"

using namespace BulkGen;

namespace {

GeneratorOptions OptionsFromConfig(const Configuration& configuration) {
    const BulkGenConfig& config = configuration.config();
    GeneratorOptions options;
    options.record_count = config.generator.record_count.get();
    options.chunk_size = config.generator.chunk_size.get();
    options.key = configuration.getKeyBytes();
    options.worker_threads = config.generator.worker_threads.get();
    options.sample_count = config.report.sample_count.get();
    options.allocation.use_hugepages = config.memory.use_hugepages.get();
    options.allocation.populate = config.memory.populate.get();
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("bulkgen", "Parallel AES-CTR bulk record generator");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("n,records", "Total number of 16-byte records to generate", cxxopts::value<size_t>())
        ("c,chunk_size", "Records per chunk (must divide the record count)", cxxopts::value<size_t>())
        ("k,key", "AES-128 key as 32 hex characters", cxxopts::value<std::string>())
        ("t,threads", "Worker threads, 0 for one per hardware thread", cxxopts::value<size_t>())
        ("s,samples", "Number of leading records to print", cxxopts::value<size_t>())
        ("no_hugepages", "Do not try MAP_HUGETLB for the output buffer")
        ("populate", "Pre-fault the output buffer before timing starts")
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    // YAML file and flags replace the defaults; a set BULKGEN_* env var wins over both
    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        LOG(ERROR) << "Failed to load configuration file " << result["config"].as<std::string>();
        return 1;
    }
    configuration.overrideFromCommandLine(result);
    if (!configuration.validate()) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return 1;
    }

    PrintSystemInfo(std::cout, TakeSystemSnapshot());

    try {
        BulkGenerator generator(OptionsFromConfig(configuration));
        PrintRunPlan(std::cout, configuration.getRecordCount(), generator.Chunks().size(),
                     configuration.getChunkSize(),
                     std::min(generator.NumWorkers(), generator.Chunks().size()));

        RunReport report = generator.Run();
        PrintRunReport(std::cout, report, TakeSystemSnapshot());
    } catch (const BulkGenError& e) {
        LOG(ERROR) << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Unexpected error: " << e.what();
        return 1;
    }

    return 0;
}
