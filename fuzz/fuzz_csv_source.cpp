/**
 * @file  fuzz_csv_source.cpp
 * @brief libFuzzer target for CsvBarSource::parse_csv_string followed by a
 *        merge of whatever it produced.
 *
 * Build:
 *   cmake -DDATAHUB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_csv_source
 *
 * Run for 60 seconds:
 *   ./fuzz_csv_source -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every batch carries the exchange it was parsed for and no symbol
 *      appears in two batches.
 *   3. Merging the batches never throws, and every stored series is
 *      strictly ascending with calendar-valid dates.
 *   4. Outcome counts add up: accepted + rejected == received.
 *
 * Fuzzer strategy:
 *   The first byte picks the exchange; the rest is CSV text. The parser
 *   must handle binary garbage, CR/LF mixes, huge numbers ("1e308",
 *   "99999999999999999999"), NaN/inf tokens and short or long rows.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include "datahub/csv_source.hpp"
#include "datahub/date.hpp"
#include "datahub/log.hpp"
#include "datahub/merge.hpp"

using namespace datahub;
using namespace datahub::source;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    log::set_level(log::Level::Off);
    if (size == 0) {
        return 0;
    }

    const Exchange exchange = (data[0] & 1) ? Exchange::SZSE : Exchange::SSE;
    const std::string csv(reinterpret_cast<const char*>(data + 1), size - 1);

    const auto batches = CsvBarSource::parse_csv_string(exchange, csv, {});

    // Invariant 2
    std::set<std::string> symbols;
    for (const auto& batch : batches) {
        assert(batch.key.exchange == to_string(exchange));
        assert(!batch.bars.empty());
        const bool fresh = symbols.insert(batch.key.symbol).second;
        assert(fresh);
        (void)fresh;
    }

    // Invariants 3 and 4
    const auto result = merge::MergeEngine(merge::MergeOptions{.max_records = 50})
                            .run(StoreSnapshot{}, batches);
    for (const auto& [key, record] : result.snapshot) {
        assert(merge::is_strictly_ascending(record.daily));
        assert(record.daily.size() <= 50);
        for (const auto& bar : record.daily) {
            assert(date::is_valid(bar.date));
            (void)bar;
        }
    }
    for (const auto& outcome : result.outcomes) {
        assert(outcome.bars_accepted + outcome.rejections.size() == outcome.bars_received);
        (void)outcome;
    }

    return 0;
}
