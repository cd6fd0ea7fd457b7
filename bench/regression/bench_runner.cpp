/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for the merge and store paths.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs a single double: nanoseconds per operation, to stdout.
 * Returns 0 on success, 1 on unknown benchmark name.
 *
 * Each benchmark runs for a wall-clock duration of at least 500ms to get
 * stable measurements, then divides total time by iteration count.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "datahub/log.hpp"
#include "datahub/merge.hpp"
#include "datahub/store.hpp"

using namespace datahub;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 20) {
    // Warmup
    for (long i = 0; i < std::min(min_iters / 10L, 100L); ++i) fn();

    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn();
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        ++iters;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

// ── Fixtures ──────────────────────────────────────────────────────────────────

/// `symbols` keys on SSE with `days` bars each, dates from 2020-01-01.
StoreSnapshot make_market(int symbols, int days) {
    StoreSnapshot::RecordMap records;
    for (int s = 0; s < symbols; ++s) {
        SymbolKey key{.exchange = "SSE", .symbol = std::to_string(600000 + s)};
        SymbolRecord record{.key = key, .name = "bench", .daily = {}};
        record.daily.reserve(static_cast<std::size_t>(days));
        for (int d = 0; d < days; ++d) {
            const int year  = 2020 + d / 336;
            const int month = 1 + (d / 28) % 12;
            const int dom   = 1 + d % 28;
            record.daily.push_back(Bar{
                .date   = year * 10000 + month * 100 + dom,
                .open   = 10.0, .high = 10.5, .low = 9.5, .close = 10.0 + d * 0.01,
                .volume = 1'000'000, .amount = 1.0e7,
            });
        }
        records.emplace(key, std::move(record));
    }
    return StoreSnapshot(std::move(records));
}

/// One new day for every stored key, overlapping the last stored day.
std::vector<SymbolBatch> make_daily_update(const StoreSnapshot& market) {
    std::vector<SymbolBatch> batches;
    for (const auto& [key, record] : market) {
        Bar last = record.daily.back();
        last.close += 1.0;
        batches.push_back(SymbolBatch{.key = key, .name = "", .bars = {last}});
    }
    return batches;
}

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_merge_incremental_5000x200() {
    const auto market  = make_market(5000, 200);
    const auto batches = make_daily_update(market);
    const merge::MergeEngine engine(merge::MergeOptions{.max_records = 200});
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        auto r = engine.run(market, batches);
        sink += r.snapshot.size();
    });
}

double bench_merge_full_replace_5000x200() {
    const auto market = make_market(5000, 200);
    std::vector<SymbolBatch> batches;
    for (const auto& [key, record] : market) {
        batches.push_back(SymbolBatch{.key = key, .name = "", .bars = record.daily});
    }
    const merge::MergeEngine engine(merge::MergeOptions{.mode = merge::MergeMode::FullReplace});
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        auto r = engine.run(market, batches);
        sink += r.snapshot.size();
    });
}

double bench_store_encode_5000x200() {
    const auto market = make_market(5000, 200);
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += store::encode(market).size();
    });
}

double bench_store_decode_5000x200() {
    const auto bytes = store::encode(make_market(5000, 200));
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += store::decode(bytes).size();
    });
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <benchmark_name>\n", argv[0]);
        return 1;
    }
    log::set_level(log::Level::Off);

    const std::string name = argv[1];
    double result = -1.0;

    if (name == "merge_incremental_5000x200")        result = bench_merge_incremental_5000x200();
    else if (name == "merge_full_replace_5000x200")  result = bench_merge_full_replace_5000x200();
    else if (name == "store_encode_5000x200")        result = bench_store_encode_5000x200();
    else if (name == "store_decode_5000x200")        result = bench_store_decode_5000x200();
    else {
        std::fprintf(stderr, "Unknown benchmark: %s\n", name.c_str());
        return 1;
    }

    std::printf("%.2f\n", result);
    return 0;
}
