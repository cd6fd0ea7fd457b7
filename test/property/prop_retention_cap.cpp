/**
 * @file  prop_retention_cap.cpp
 * @brief Property: ∀ N: after a merge with max_records = N a touched series
 *        holds min(N, |merged|) bars, and they are the most recent ones.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_retention_cap
 *
 * Failure modes this test guards against:
 *   • Off-by-one in the trim count
 *   • Trimming the newest bars instead of the oldest
 *   • Trimming when the series already fits
 */

#include <rapidcheck.h>

#include <algorithm>
#include <set>
#include <vector>

#include "datahub/log.hpp"
#include "datahub/merge.hpp"

using namespace datahub;
using namespace datahub::merge;

namespace {

const SymbolKey KEY{.exchange = "SZSE", .symbol = "000001"};

std::vector<Bar> series_of(const std::set<std::int32_t>& dates) {
    std::vector<Bar> bars;
    for (auto d : dates) {
        bars.push_back(Bar{.date = d, .open = 1, .high = 1, .low = 1, .close = 1,
                           .volume = 1, .amount = 1});
    }
    return bars;
}

}  // anonymous namespace

int main() {
    log::set_level(log::Level::Off);

    rc::check(
        "retention_cap: keeps exactly the N most recent dates",
        []() {
            const auto count = *rc::gen::inRange<std::size_t>(1, 120);
            const auto cap   = *rc::gen::inRange<std::size_t>(0, 150);

            std::set<std::int32_t> dates;
            for (std::size_t i = 0; i < count; ++i) {
                // 20250101 .. 20250128, then February and March, all valid.
                const auto month = static_cast<std::int32_t>(1 + i / 28);
                const auto dom   = static_cast<std::int32_t>(1 + i % 28);
                dates.insert(20250000 + month * 100 + dom);
            }
            const std::vector<SymbolBatch> batches{
                {.key = KEY, .name = "", .bars = series_of(dates)},
            };

            const auto result = MergeEngine(MergeOptions{.max_records = cap})
                                    .run(StoreSnapshot{}, batches);

            const std::size_t expected = std::min(cap, dates.size());
            const auto& outcome = result.outcomes.at(0);
            RC_ASSERT(outcome.bars_trimmed == dates.size() - expected);

            const auto* record = result.snapshot.find(KEY);
            RC_ASSERT(record != nullptr);
            RC_ASSERT(record->daily.size() == expected);
            if (expected > 0) {
                RC_ASSERT(record->daily.back().date == *dates.rbegin());
                auto it = dates.end();
                std::advance(it, -static_cast<std::ptrdiff_t>(expected));
                RC_ASSERT(record->daily.front().date == *it);
            }
        });

    rc::check(
        "retention_cap: apply_retention is a no-op when the series fits",
        []() {
            const auto count = *rc::gen::inRange<std::size_t>(0, 50);
            const auto slack = *rc::gen::inRange<std::size_t>(0, 50);
            std::set<std::int32_t> dates;
            for (std::size_t i = 0; i < count; ++i) {
                dates.insert(static_cast<std::int32_t>(20250101 + i % 28 + 100 * (i / 28)));
            }
            auto series = series_of(dates);
            const auto before = series;
            RC_ASSERT(MergeEngine::apply_retention(series, series.size() + slack) == 0u);
            RC_ASSERT(series == before);
        });

    return 0;
}
