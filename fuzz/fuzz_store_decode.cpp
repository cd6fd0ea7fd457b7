/**
 * @file  fuzz_store_decode.cpp
 * @brief libFuzzer target for store::decode (Arrow IPC bytes → snapshot)
 *
 * Build:
 *   cmake -DDATAHUB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_store_decode
 *
 * Run for 60 seconds, seeded with a real store:
 *   mkdir corpus && cp data/stock.arrow corpus/
 *   ./fuzz_store_decode corpus -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed input surfaces only as SchemaError.
 *   3. If a snapshot is returned:
 *      a. every series is strictly ascending by date
 *      b. re-encoding and decoding it yields an equal snapshot
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "datahub/errors.hpp"
#include "datahub/log.hpp"
#include "datahub/merge.hpp"
#include "datahub/store.hpp"

using namespace datahub;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    log::set_level(log::Level::Off);

    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    StoreSnapshot snapshot;
    try {
        snapshot = store::decode(input);
    } catch (const SchemaError&) {
        return 0;
    }

    // Invariant 3a: decoded series are ordered
    for (const auto& [key, record] : snapshot) {
        assert(merge::is_strictly_ascending(record.daily));
        assert(record.key == key);
    }

    // Invariant 3b: stable under re-encoding
    const auto again = store::decode(store::encode(snapshot));
    assert(again == snapshot);

    return 0;
}
