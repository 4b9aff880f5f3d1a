/*
 * StrideDB C++ Benchmark Suite
 *
 * Latency measurement tools and benchmark implementations for the
 * record view and repository hot paths.
 */

#pragma once

#include "record/OwnedRecord.hpp"
#include "record/RecordView.hpp"
#include "repository/Repository.hpp"
#include "schema/Layout.hpp"
#include "schema/Schema.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace stridedb::benchmark {
    // ==================== Configuration ====================

    struct BenchConfig {
        static constexpr size_t DEFAULT_RECORD_COUNT = 1'000'000;
        static constexpr size_t WARMUP_COUNT = 10'000;
        static constexpr int WARMUP_ITERATIONS = 3;
    };

    // ==================== Latency Statistics ====================

    struct StatsReport {
        std::string name;
        size_t count;
        double ops_per_sec;
        double p50; // nanoseconds
        double p90;
        double p99;
        double p999;
        double max;

        std::string to_string() const {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1);
            oss << "=== " << name << " ===" << std::endl;
            oss << "  Total ops:    " << std::setw(12) << count << std::endl;
            oss << "  ops/sec:      " << std::setw(12) << static_cast<size_t>(ops_per_sec) << std::endl;
            oss << "  p50:          " << std::setw(8) << p50 << " ns" << std::endl;
            oss << "  p90:          " << std::setw(8) << p90 << " ns" << std::endl;
            oss << "  p99:          " << std::setw(8) << p99 << " ns" << std::endl;
            oss << "  p99.9:        " << std::setw(8) << p999 << " ns" << std::endl;
            oss << "  max:          " << std::setw(8) << max << " ns" << std::endl;
            return oss.str();
        }
    };

    class LatencyStats {
        public:
            explicit LatencyStats(std::string name, size_t expected = 0) : name_{std::move(name)} { latencies_.reserve(expected); }

            void record(int64_t nanos) { latencies_.push_back(nanos); }

            [[nodiscard]] StatsReport report() const {
                if (latencies_.empty()) { return StatsReport{name_, 0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}; }

                auto sorted = latencies_;
                std::sort(sorted.begin(), sorted.end());

                const size_t count = sorted.size();
                const int64_t sum = std::accumulate(sorted.begin(), sorted.end(), int64_t{0});
                const double total_sec = static_cast<double>(std::max<int64_t>(sum, 1)) / 1'000'000'000.0;

                auto percentile = [&](double p) -> double {
                    const size_t idx = std::min(static_cast<size_t>((p / 100.0) * (count - 1)), count - 1);
                    return static_cast<double>(sorted[idx]);
                };

                return StatsReport{
                    .name = name_,
                    .count = count,
                    .ops_per_sec = count / total_sec,
                    .p50 = percentile(50.0),
                    .p90 = percentile(90.0),
                    .p99 = percentile(99.0),
                    .p999 = percentile(99.9),
                    .max = static_cast<double>(sorted.back())
                };
            }

        private:
            std::string name_;
            std::vector<int64_t> latencies_;
    };

    /**
     * Times fn() once and records the elapsed nanoseconds.
     */
    template <typename Fn>
    void timed(LatencyStats& stats, Fn&& fn) {
        const auto start = std::chrono::steady_clock::now();
        fn();
        const auto end = std::chrono::steady_clock::now();
        stats.record(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    }

    // ==================== Utility Functions ====================

    inline void print_separator(size_t length = 70) { std::cout << std::string(length, '=') << std::endl; }

    inline void print_dash(size_t length = 70) { std::cout << std::string(length, '-') << std::endl; }

    inline void print_title(const std::string& title) {
        std::cout << "\n";
        print_separator();
        std::cout << title << std::endl;
        print_separator();
    }

    inline std::string order_code(size_t index) {
        const auto digits = std::to_string(index);
        return "ORD" + std::string(9 - std::min<size_t>(9, digits.size()), '0') + digits;
    }

    /**
     * Benchmark schema: an order book entry with a unique order code.
     */
    inline std::shared_ptr<const schema::Layout> order_layout() {
        schema::Schema order{"Order", 7, 1};
        order.add("id", schema::FieldType::Int64, {.key = true})
             .add("qty", schema::FieldType::Int32)
             .add("price", schema::FieldType::Int64, {.indexed = true})
             .add_fixed_string("code", 12, {.indexed = true, .unique = true})
             .add("side", schema::FieldType::Char16)
             .add("active", schema::FieldType::Bool)
             .add("version", schema::FieldType::Int32, {.sequence = true});
        order.set_transactional(true);
        order.set_repository_keyed(true);
        return schema::LayoutBuilder::build(order);
    }

    /**
     * Field ids of order_layout(), resolved once.
     */
    struct OrderFields {
        explicit OrderFields(const schema::Layout& layout)
            : id{layout.require_field("id")}
              , qty{layout.require_field("qty")}
              , price{layout.require_field("price")}
              , code{layout.require_field("code")}
              , side{layout.require_field("side")}
              , active{layout.require_field("active")}
              , version{layout.require_field("version")} {}

        size_t id, qty, price, code, side, active, version;
    };

    inline void print_summary(const std::vector<StatsReport>& reports) {
        std::cout << "\nSummary Table:" << std::endl;
        print_dash(92);
        std::cout << std::left << std::setw(40) << "| Operation"
            << std::right << std::setw(14) << "ops/sec"
            << std::setw(12) << "p50(ns)"
            << std::setw(12) << "p99(ns)"
            << std::setw(14) << "max(ns) |" << std::endl;
        print_dash(92);

        for (const auto& report : reports) {
            std::cout << std::left << "| " << std::setw(38) << report.name
                << std::right << std::setw(14) << static_cast<size_t>(report.ops_per_sec)
                << std::fixed << std::setprecision(1)
                << std::setw(12) << report.p50
                << std::setw(12) << report.p99
                << std::setw(12) << report.max << " |" << std::endl;
        }
        print_dash(92);
    }

    // ==================== Benchmark Implementations ====================

    // 1. Append + field writes
    class AppendBenchmark {
        public:
            StatsReport run(size_t count) {
                print_title("Append Benchmark - append_with_key + 5 field writes");

                const auto layout = order_layout();
                const OrderFields f{*layout};
                auto repo = repository::Repository::create_with_capacity(layout, count);

                LatencyStats stats{"append+write", count};
                for (size_t i = 0; i < count; ++i) {
                    const auto code = order_code(i);
                    timed(stats, [&] {
                        auto* order = repo->append_with_key(static_cast<int64_t>(i));
                        order->write_i32(f.qty, static_cast<int32_t>(i % 100));
                        order->write_i64(f.price, static_cast<int64_t>(1000 + i % 50));
                        order->write_string(f.code, code);
                        order->write_char16(f.side, i % 2 == 0 ? u'B' : u'S');
                        order->write_bool(f.active, true);
                    });
                }

                auto report = stats.report();
                std::cout << report.to_string();
                std::cout << "  records: " << repo->current_count() << ", crc32: 0x" << std::hex << repo->crc32() << std::dec << std::endl;
                return report;
            }
    };

    // 2. Key lookups
    class LookupBenchmark {
        public:
            StatsReport run(size_t count) {
                print_title("Lookup Benchmark - get_by_key (random)");

                const auto layout = order_layout();
                const OrderFields f{*layout};
                auto repo = repository::Repository::create_with_capacity(layout, count);
                for (size_t i = 0; i < count; ++i) {
                    repo->append_with_key(static_cast<int64_t>(i))->write_i32(f.qty, static_cast<int32_t>(i));
                }

                std::mt19937_64 rng{42};
                std::uniform_int_distribution<int64_t> dist{0, static_cast<int64_t>(count) - 1};

                LatencyStats stats{"get_by_key", count};
                int64_t checksum = 0;
                for (size_t i = 0; i < count; ++i) {
                    const int64_t key = dist(rng);
                    timed(stats, [&] { checksum += repo->get_by_key(key)->read_i32(f.qty); });
                }

                auto report = stats.report();
                std::cout << report.to_string() << "  checksum: " << checksum << std::endl;
                return report;
            }
    };

    // 3. Indexed overwrite (forward/reverse rebalance)
    class IndexRebalanceBenchmark {
        public:
            StatsReport run(size_t count) {
                print_title("Index Benchmark - overwrite indexed price");

                const auto layout = order_layout();
                const OrderFields f{*layout};
                auto repo = repository::Repository::create_with_capacity(layout, count);
                for (size_t i = 0; i < count; ++i) {
                    repo->append_with_key(static_cast<int64_t>(i))->write_i64(f.price, 1000);
                }

                LatencyStats stats{"indexed overwrite", count};
                for (size_t i = 0; i < count; ++i) {
                    auto* order = repo->get_by_key(static_cast<int64_t>(i));
                    timed(stats, [&] { order->write_i64(f.price, static_cast<int64_t>(1000 + i % 64)); });
                }

                auto report = stats.report();
                std::cout << report.to_string() << "  price=1000 bucket: " << repo->get_all_with_index_value(f.price, int64_t{1000}).size()
                    << std::endl;
                return report;
            }
    };

    // 4. Full scan through the shared iterator
    class IterateBenchmark {
        public:
            StatsReport run(size_t count) {
                print_title("Iterate Benchmark - all_items scan");

                const auto layout = order_layout();
                const OrderFields f{*layout};
                auto repo = repository::Repository::create_with_capacity(layout, count);
                for (size_t i = 0; i < count; ++i) {
                    repo->append_with_key(static_cast<int64_t>(i))->write_i32(f.qty, 1);
                }

                LatencyStats stats{"iterator next+read", count};
                int64_t total = 0;
                auto& it = repo->all_items().reset();
                while (it.has_next()) {
                    timed(stats, [&] { total += it.next().read_i32(f.qty); });
                }

                auto report = stats.report();
                std::cout << report.to_string() << "  total qty: " << total << std::endl;
                return report;
            }
    };

    // 5. Sequence counter on an atomic-capable buffer
    class SequenceBenchmark {
        public:
            StatsReport run(size_t count) {
                print_title("Sequence Benchmark - next_sequence");

                const auto layout = order_layout();
                const OrderFields f{*layout};
                auto order = record::OwnedRecord::instance(layout);

                LatencyStats stats{"next_sequence", count};
                int64_t last = 0;
                for (size_t i = 0; i < count; ++i) {
                    timed(stats, [&] { last = order->next_sequence(f.version); });
                }

                auto report = stats.report();
                std::cout << report.to_string() << "  last version: " << last << std::endl;
                return report;
            }
    };

    // 6. Repository snapshot + rollback
    class TransactionBenchmark {
        public:
            StatsReport run(size_t count, size_t rounds = 100) {
                print_title("Transaction Benchmark - begin/append/rollback");

                const auto layout = order_layout();
                const OrderFields f{*layout};
                auto repo = repository::Repository::create_with_capacity(layout, count + rounds);
                for (size_t i = 0; i < count; ++i) {
                    repo->append_with_key(static_cast<int64_t>(i))->write_string(f.code, order_code(i));
                }

                LatencyStats stats{"snapshot+rollback", rounds};
                for (size_t r = 0; r < rounds; ++r) {
                    timed(stats, [&] {
                        repo->begin_transaction();
                        (void)repo->append_with_key(static_cast<int64_t>(count + r));
                        repo->rollback();
                    });
                }

                auto report = stats.report();
                std::cout << report.to_string() << "  records after rollbacks: " << repo->current_count() << std::endl;
                return report;
            }
    };

    // ==================== Suite ====================

    class BenchmarkSuite {
        public:
            static void print_header() {
                print_separator();
                std::cout << "StrideDB Benchmark Suite" << std::endl;
                print_separator();
            }

            static void run_all(size_t count) {
                std::vector<StatsReport> reports;
                reports.push_back(AppendBenchmark{}.run(count));
                reports.push_back(LookupBenchmark{}.run(count));
                reports.push_back(IndexRebalanceBenchmark{}.run(count));
                reports.push_back(IterateBenchmark{}.run(count));
                reports.push_back(SequenceBenchmark{}.run(count));
                reports.push_back(TransactionBenchmark{}.run(std::min<size_t>(count, 100'000)));
                print_summary(reports);
            }

            static void run_append_benchmark(size_t count) { AppendBenchmark{}.run(count); }
            static void run_lookup_benchmark(size_t count) { LookupBenchmark{}.run(count); }
            static void run_index_benchmark(size_t count) { IndexRebalanceBenchmark{}.run(count); }
            static void run_iterate_benchmark(size_t count) { IterateBenchmark{}.run(count); }
            static void run_sequence_benchmark(size_t count) { SequenceBenchmark{}.run(count); }
            static void run_transaction_benchmark(size_t count) { TransactionBenchmark{}.run(std::min<size_t>(count, 100'000)); }
    };
} // namespace stridedb::benchmark
