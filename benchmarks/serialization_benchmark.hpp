/*
 * GridWire C++ Benchmark Suite
 *
 * Measures envelope encode/decode latency per serializer family
 */

#pragma once

#include <gridwire/SerializationService.hpp>
#include <gridwire/compact/CompactSerializer.hpp>
#include <gridwire/portable/Portable.hpp>
#include <vector>
#include <string>
#include <algorithm>
#include <numeric>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <atomic>

namespace gridwire::benchmark {
    // ==================== Configuration ====================

    struct BenchConfig {
        static constexpr size_t DEFAULT_OP_COUNT = 200'000;
        static constexpr size_t WARMUP_COUNT = 10'000;
        static constexpr int WARMUP_ITERATIONS = 3;
        static constexpr int32_t BENCH_FACTORY_ID = 100;
    };

    // ==================== Latency Statistics ====================

    struct StatsReport {
        std::string name;
        size_t count;
        double ops_per_sec;
        double p50; // microseconds
        double p90;
        double p99;
        double p999;
        double max;

        std::string to_string() const {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);
            oss << "=== " << name << " ===" << std::endl;
            oss << "  Total ops:    " << std::setw(12) << count << std::endl;
            oss << "  ops/sec:      " << std::setw(12) << static_cast<size_t>(ops_per_sec) << std::endl;
            oss << "  p50:          " << std::setw(8) << p50 << " us" << std::endl;
            oss << "  p90:          " << std::setw(8) << p90 << " us" << std::endl;
            oss << "  p99:          " << std::setw(8) << p99 << " us" << std::endl;
            oss << "  p99.9:        " << std::setw(8) << p999 << " us" << std::endl;
            oss << "  max:          " << std::setw(8) << max << " us" << std::endl;
            return oss.str();
        }
    };

    class LatencyStats {
        public:
            explicit LatencyStats(std::string name) : name_{std::move(name)} { latencies_.reserve(BenchConfig::DEFAULT_OP_COUNT); }

            void record(int64_t nanos) { latencies_.push_back(nanos); }

            void record_all(const std::vector<int64_t>& data) { latencies_.insert(latencies_.end(), data.begin(), data.end()); }

            [[nodiscard]] StatsReport report() const {
                if (latencies_.empty()) { return StatsReport{name_, 0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}; }

                auto sorted = latencies_;
                std::sort(sorted.begin(), sorted.end());

                const size_t count = sorted.size();
                const int64_t sum = std::accumulate(sorted.begin(), sorted.end(), 0LL);
                const double total_sec = static_cast<double>(sum) / 1'000'000'000.0;
                const double ops_per_sec = total_sec > 0.0 ? count / total_sec : 0.0;

                // nanos -> micros
                auto percentile = [&](double p) -> double {
                    const size_t idx = std::min(static_cast<size_t>((p / 100.0) * (count - 1)), count - 1);
                    return sorted[idx] / 1000.0;
                };

                return StatsReport{
                    .name = name_,
                    .count = count,
                    .ops_per_sec = ops_per_sec,
                    .p50 = percentile(50.0),
                    .p90 = percentile(90.0),
                    .p99 = percentile(99.0),
                    .p999 = percentile(99.9),
                    .max = sorted.back() / 1000.0
                };
            }

        private:
            std::string name_;
            std::vector<int64_t> latencies_;
    };

    // ==================== Sample Types ====================

    class BenchTrade final : public IdentifiedDataSerializable {
        public:
            static constexpr int32_t CLASS_ID = 1;

            BenchTrade() = default;
            BenchTrade(std::string symbol, int64_t quantity, double price)
                : symbol_{std::move(symbol)}, quantity_{quantity}, price_{price} {}

            int32_t factory_id() const noexcept override { return BenchConfig::BENCH_FACTORY_ID; }
            int32_t class_id() const noexcept override { return CLASS_ID; }

            void write_data(ObjectDataOutput& out) const override {
                out.write_string(symbol_);
                out.write_long(quantity_);
                out.write_double(price_);
            }

            void read_data(ObjectDataInput& in) override {
                symbol_ = in.read_string();
                quantity_ = in.read_long();
                price_ = in.read_double();
            }

            Value plain_form() const override {
                return Value::object({
                    {"symbol", Value::string(symbol_)},
                    {"quantity", Value::number(static_cast<double>(quantity_))},
                    {"price", Value::number(price_)}
                });
            }

        private:
            std::string symbol_;
            int64_t quantity_ = 0;
            double price_ = 0.0;
    };

    class BenchQuote final : public portable::Portable {
        public:
            static constexpr int32_t CLASS_ID = 2;

            BenchQuote() = default;
            BenchQuote(std::string symbol, double bid, double ask) : symbol_{std::move(symbol)}, bid_{bid}, ask_{ask} {}

            int32_t factory_id() const noexcept override { return BenchConfig::BENCH_FACTORY_ID; }
            int32_t class_id() const noexcept override { return CLASS_ID; }

            void write_portable(portable::PortableWriter& writer) const override {
                writer.write_utf("symbol", symbol_);
                writer.write_double("bid", bid_);
                writer.write_double("ask", ask_);
            }

            void read_portable(portable::PortableReader& reader) override {
                symbol_ = reader.read_utf("symbol");
                bid_ = reader.read_double("bid");
                ask_ = reader.read_double("ask");
            }

        private:
            std::string symbol_;
            double bid_ = 0.0;
            double ask_ = 0.0;
    };

    struct BenchTick final : UserObject {
        BenchTick(std::string symbol, int64_t timestamp, double price)
            : symbol{std::move(symbol)}, timestamp{timestamp}, price{price} {}

        std::string symbol;
        int64_t timestamp;
        double price;
    };

    class BenchTickSerializer final : public compact::CompactSerializer<BenchTick> {
        public:
            std::string type_name() const override { return "BenchTick"; }

            void write(compact::CompactWriter& writer, const BenchTick& tick) const override {
                writer.write_string("symbol", tick.symbol);
                writer.write_int64("timestamp", tick.timestamp);
                writer.write_float64("price", tick.price);
            }

            std::shared_ptr<BenchTick> read(compact::CompactReader& reader) const override {
                return std::make_shared<BenchTick>(
                    reader.read_string("symbol").value_or(""),
                    reader.read_int64("timestamp"),
                    reader.read_float64("price")
                );
            }
    };

    // ==================== Utility Functions ====================

    inline SerializationConfig bench_config() {
        SerializationConfig config;
        config.data_serializable_factories.emplace(
            BenchConfig::BENCH_FACTORY_ID,
            [](int32_t class_id) -> std::shared_ptr<IdentifiedDataSerializable> {
                if (class_id == BenchTrade::CLASS_ID) { return std::make_shared<BenchTrade>(); }
                return nullptr;
            }
        );
        config.portable_factories.emplace(
            BenchConfig::BENCH_FACTORY_ID,
            [](int32_t class_id) -> std::shared_ptr<portable::Portable> {
                if (class_id == BenchQuote::CLASS_ID) { return std::make_shared<BenchQuote>(); }
                return nullptr;
            }
        );
        config.compact.serializers.push_back(std::make_shared<BenchTickSerializer>());
        return config;
    }

    inline std::string generate_symbol(size_t index) { return "SYM" + std::to_string(index % 5'000); }

    inline void print_separator(size_t length = 70) { std::cout << std::string(length, '=') << std::endl; }

    inline void print_dash(size_t length = 70) { std::cout << std::string(length, '-') << std::endl; }

    /**
     * Times encode plus decode of one value per iteration.
     */
    inline StatsReport measure_round_trip(
        const SerializationService& service,
        const std::string& name,
        size_t op_count,
        const std::function<Value(size_t)>& make_value
    ) {
        for (size_t i = 0; i < std::min(BenchConfig::WARMUP_COUNT, op_count); ++i) {
            (void)service.to_object(service.to_data(make_value(i)));
        }

        LatencyStats stats(name);
        std::vector<int64_t> latencies(op_count);
        for (size_t i = 0; i < op_count; ++i) {
            const auto value = make_value(i);

            auto start = std::chrono::high_resolution_clock::now();
            const auto back = service.to_object(service.to_data(value));
            auto end = std::chrono::high_resolution_clock::now();

            latencies[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        }
        stats.record_all(latencies);
        return stats.report();
    }

    inline void print_summary(const std::vector<StatsReport>& results) {
        std::cout << "\nSummary Table:" << std::endl;
        print_dash(90);
        std::cout << std::left << std::setw(40) << "| Case"
            << std::right << std::setw(14) << "ops/sec"
            << std::setw(10) << "p50(us)"
            << std::setw(10) << "p99(us)"
            << std::setw(14) << "p99.9(us) |" << std::endl;
        print_dash(90);

        for (const auto& report : results) {
            std::cout << std::left << "| " << std::setw(38) << report.name
                << std::right << std::setw(14) << static_cast<size_t>(report.ops_per_sec)
                << std::fixed << std::setprecision(2)
                << std::setw(10) << report.p50
                << std::setw(10) << report.p99
                << std::setw(12) << report.p999 << " |" << std::endl;
        }
        print_dash(90);
    }

    // ==================== Benchmark Implementations ====================

    // 1. Built-in codecs for scalars and arrays
    class ScalarBenchmark {
        public:
            void run(size_t op_count = BenchConfig::DEFAULT_OP_COUNT) {
                std::cout << "\n";
                print_separator();
                std::cout << "Scalar Benchmark - Built-in codecs" << std::endl;
                print_separator();

                const SerializationService service{SerializationConfig{}};
                std::vector<StatsReport> results;

                results.push_back(measure_round_trip(service, "int32", op_count, [](size_t i) {
                    return Value::int32(static_cast<int32_t>(i));
                }));
                results.push_back(measure_round_trip(service, "number (double)", op_count, [](size_t i) {
                    return Value::number(static_cast<double>(i) * 0.5);
                }));
                results.push_back(measure_round_trip(service, "string (16 chars)", op_count, [](size_t i) {
                    return Value::string("value-" + std::string(10 - std::min<size_t>(10, std::to_string(i).size()), '0') + std::to_string(i));
                }));
                results.push_back(measure_round_trip(service, "number array (64)", op_count / 4, [](size_t i) {
                    Array items;
                    items.reserve(64);
                    for (size_t k = 0; k < 64; ++k) { items.push_back(Value::number(static_cast<double>(i + k))); }
                    return Value::array(std::move(items));
                }));
                results.push_back(measure_round_trip(service, "buffer (1 KiB)", op_count / 4, [](size_t i) {
                    return Value::buffer(Bytes(1024, static_cast<uint8_t>(i)));
                }));

                print_summary(results);
            }
    };

    // 2. Structured formats against the JSON fallback
    class StructuredBenchmark {
        public:
            void run(size_t op_count = BenchConfig::DEFAULT_OP_COUNT) {
                std::cout << "\n";
                print_separator();
                std::cout << "Structured Benchmark - Identified / Portable / Compact / JSON" << std::endl;
                print_separator();

                const SerializationService service{bench_config()};
                std::vector<StatsReport> results;

                results.push_back(measure_round_trip(service, "identified", op_count, [](size_t i) {
                    return Value::user(std::make_shared<BenchTrade>(generate_symbol(i), static_cast<int64_t>(i), 101.25));
                }));
                results.push_back(measure_round_trip(service, "portable", op_count, [](size_t i) {
                    return Value::user(std::make_shared<BenchQuote>(generate_symbol(i), 99.5, 100.5));
                }));
                results.push_back(measure_round_trip(service, "compact", op_count, [](size_t i) {
                    return Value::user(std::make_shared<BenchTick>(generate_symbol(i), static_cast<int64_t>(i), 42.0));
                }));
                results.push_back(measure_round_trip(service, "json object", op_count, [](size_t i) {
                    return Value::object({
                        {"symbol", Value::string(generate_symbol(i))},
                        {"quantity", Value::number(static_cast<double>(i))},
                        {"price", Value::number(101.25)}
                    });
                }));

                print_summary(results);
            }
    };

    // 3. Partition key hashing
    class PartitionBenchmark {
        public:
            void run(size_t op_count = BenchConfig::DEFAULT_OP_COUNT) {
                std::cout << "\n";
                print_separator();
                std::cout << "Partition Benchmark - Keyed envelopes" << std::endl;
                print_separator();

                const SerializationService service{SerializationConfig{}};
                std::vector<StatsReport> results;

                results.push_back(measure_round_trip(service, "unkeyed object", op_count, [](size_t i) {
                    return Value::object({{"id", Value::number(static_cast<double>(i))}});
                }));
                results.push_back(measure_round_trip(service, "keyed object", op_count, [](size_t i) {
                    return Value::object({
                        {"id", Value::number(static_cast<double>(i))},
                        {"partitionKey", Value::string(generate_symbol(i))}
                    });
                }));

                print_summary(results);
            }
    };

    // 4. One shared service across threads
    class MultiThreadBenchmark {
        public:
            void run(size_t ops_per_thread = 50'000) {
                std::cout << "\n";
                print_separator();
                std::cout << "Multi-threaded Benchmark - Shared service" << std::endl;
                print_separator();

                const SerializationService service{bench_config()};
                std::vector<StatsReport> results;

                for (const size_t thread_count : {1u, 2u, 4u, 8u}) {
                    std::vector<std::vector<int64_t>> per_thread(thread_count, std::vector<int64_t>(ops_per_thread));
                    std::atomic<size_t> failures{0};
                    std::vector<std::thread> threads;

                    for (size_t t = 0; t < thread_count; ++t) {
                        threads.emplace_back([&, t] {
                            for (size_t i = 0; i < ops_per_thread; ++i) {
                                const auto value = Value::user(std::make_shared<BenchTrade>(generate_symbol(i), static_cast<int64_t>(i), 1.0));
                                auto start = std::chrono::high_resolution_clock::now();
                                try { (void)service.to_object(service.to_data(value)); }
                                catch (const SerializationException&) { failures.fetch_add(1, std::memory_order_relaxed); }
                                auto end = std::chrono::high_resolution_clock::now();
                                per_thread[t][i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
                            }
                        });
                    }
                    for (auto& thread : threads) { thread.join(); }

                    LatencyStats stats(std::to_string(thread_count) + " thread(s)");
                    for (const auto& latencies : per_thread) { stats.record_all(latencies); }
                    auto report = stats.report();
                    report.ops_per_sec *= static_cast<double>(thread_count);
                    results.push_back(report);

                    if (failures.load() > 0) { std::cout << "  " << failures.load() << " failed round trips" << std::endl; }
                }

                print_summary(results);
            }
    };

    // ==================== Suite ====================

    class BenchmarkSuite {
        public:
            static void print_header() {
                std::cout << R"(
+======================================================================+
|           GridWire C++ Benchmark Suite                               |
+======================================================================+
|  Usage:                                                              |
|    --benchmark all         Run all benchmarks                        |
|    --benchmark scalar      Built-in scalar and array codecs          |
|    --benchmark structured  Identified / Portable / Compact / JSON    |
|    --benchmark partition   Partition key hashing                     |
|    --benchmark mt          Multi-threaded shared service             |
+======================================================================+
)" << std::endl;
            }

            static void run_all() {
                std::cout << "\nRunning all benchmarks..." << std::endl;

                ScalarBenchmark().run();
                StructuredBenchmark().run();
                PartitionBenchmark().run();
                MultiThreadBenchmark().run();

                std::cout << "\nAll benchmarks completed!" << std::endl;
            }

            static void run_scalar_benchmark() { ScalarBenchmark().run(); }

            static void run_structured_benchmark() { StructuredBenchmark().run(); }

            static void run_partition_benchmark() { PartitionBenchmark().run(); }

            static void run_mt_benchmark() { MultiThreadBenchmark().run(); }
    };
} // namespace gridwire::benchmark
