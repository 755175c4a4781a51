/*
 * GridWire C++ Benchmark Suite - Main Program
 *
 * Run:
 *   ./gridwire_benchmark --benchmark all
 *   ./gridwire_benchmark --benchmark scalar
 *   ./gridwire_benchmark --benchmark structured
 *   ./gridwire_benchmark --benchmark partition
 *   ./gridwire_benchmark --benchmark mt
 */

#include "serialization_benchmark.hpp"
#include <cstring>
#include <ctime>
#include <iomanip>

using namespace gridwire::benchmark;

void print_current_time() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::cout << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << std::endl;
}

int main(int argc, char** argv) {
    BenchmarkSuite::print_header();

    std::string benchmark_type = "structured";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--benchmark") == 0 && i + 1 < argc) {
            benchmark_type = argv[i + 1];
            break;
        }
    }

    std::cout << "\nRunning benchmark: " << benchmark_type << std::endl;
    std::cout << "Start time: ";
    print_current_time();
    std::cout << std::endl;

    try {
        if (benchmark_type == "all") { BenchmarkSuite::run_all(); }
        else if (benchmark_type == "scalar") { BenchmarkSuite::run_scalar_benchmark(); }
        else if (benchmark_type == "structured") { BenchmarkSuite::run_structured_benchmark(); }
        else if (benchmark_type == "partition") { BenchmarkSuite::run_partition_benchmark(); }
        else if (benchmark_type == "mt") { BenchmarkSuite::run_mt_benchmark(); }
        else {
            std::cerr << "Unknown benchmark type: " << benchmark_type << std::endl;
            std::cerr << "Available: all, scalar, structured, partition, mt" << std::endl;
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
