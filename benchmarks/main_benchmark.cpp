/*
 * StrideDB C++ Benchmark Suite - Main Program
 *
 * Run:
 *   ./stridedb_benchmark --benchmark all
 *   ./stridedb_benchmark --benchmark append --count 500000
 *   ./stridedb_benchmark --benchmark lookup
 *   ./stridedb_benchmark --benchmark index
 *   ./stridedb_benchmark --benchmark iterate
 *   ./stridedb_benchmark --benchmark sequence
 *   ./stridedb_benchmark --benchmark txn
 *   ./stridedb_benchmark --log-level debug
 */

#include "stridedb_benchmark.hpp"
#include "core/Logging.hpp"
#include <cstring>
#include <ctime>
#include <iomanip>
#include <stdexcept>

using namespace stridedb::benchmark;

void print_current_time() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::cout << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << std::endl;
}

int main(int argc, char** argv) {
    BenchmarkSuite::print_header();

    std::string benchmark_type = "all";
    size_t count = BenchConfig::DEFAULT_RECORD_COUNT;

    // Parse command line arguments
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--benchmark") == 0) { benchmark_type = argv[++i]; }
        else if (std::strcmp(argv[i], "--count") == 0) {
            try { count = std::stoul(argv[++i]); }
            catch (const std::exception&) {
                std::cerr << "Invalid --count: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--log-level") == 0) { stridedb::core::set_log_level(stridedb::core::parse_log_level(argv[++i])); }
    }

    if (count == 0) {
        std::cerr << "--count must be positive" << std::endl;
        return 1;
    }

    std::cout << "\nRunning benchmark: " << benchmark_type << " (" << count << " records)" << std::endl;
    std::cout << "Start time: ";
    print_current_time();
    std::cout << std::endl;

    std::cout << "Warming up..." << std::endl;
    for (int i = 0; i < BenchConfig::WARMUP_ITERATIONS; ++i) { AppendBenchmark{}.run(BenchConfig::WARMUP_COUNT); }
    std::cout << std::endl;

    try {
        if (benchmark_type == "all") { BenchmarkSuite::run_all(count); }
        else if (benchmark_type == "append") { BenchmarkSuite::run_append_benchmark(count); }
        else if (benchmark_type == "lookup") { BenchmarkSuite::run_lookup_benchmark(count); }
        else if (benchmark_type == "index") { BenchmarkSuite::run_index_benchmark(count); }
        else if (benchmark_type == "iterate") { BenchmarkSuite::run_iterate_benchmark(count); }
        else if (benchmark_type == "sequence") { BenchmarkSuite::run_sequence_benchmark(count); }
        else if (benchmark_type == "txn") { BenchmarkSuite::run_transaction_benchmark(count); }
        else {
            std::cerr << "Unknown benchmark type: " << benchmark_type << std::endl;
            std::cerr << "Available: all, append, lookup, index, iterate, sequence, txn" << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "\nBenchmark failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nBenchmark completed successfully!" << std::endl;
    std::cout << "End time: ";
    print_current_time();
    std::cout << std::endl;

    return 0;
}
