/// @file src/store/snapshot.cpp
/// @brief StoreSnapshot accessors.

#include "datahub/snapshot.hpp"

#include <utility>

namespace datahub {

StoreSnapshot::StoreSnapshot(RecordMap records) noexcept
    : records_(std::move(records))
{}

std::optional<StoreSnapshot>
StoreSnapshot::from_records(std::vector<SymbolRecord> records) {
    RecordMap map;
    for (auto& record : records) {
        SymbolKey key = record.key;
        auto [it, inserted] = map.emplace(std::move(key), std::move(record));
        if (!inserted) {
            return std::nullopt;
        }
    }
    return StoreSnapshot(std::move(map));
}

const SymbolRecord* StoreSnapshot::find(const SymbolKey& key) const noexcept {
    const auto it = records_.find(key);
    return it == records_.end() ? nullptr : &it->second;
}

bool StoreSnapshot::contains(const SymbolKey& key) const noexcept {
    return records_.find(key) != records_.end();
}

std::size_t StoreSnapshot::bar_count() const noexcept {
    std::size_t total = 0;
    for (const auto& [key, record] : records_) {
        total += record.daily.size();
    }
    return total;
}

std::optional<std::int32_t> StoreSnapshot::latest_date() const noexcept {
    std::optional<std::int32_t> latest;
    for (const auto& [key, record] : records_) {
        // Series are ascending, so the last bar is the newest.
        if (record.daily.empty()) {
            continue;
        }
        const std::int32_t d = record.daily.back().date;
        if (!latest || d > *latest) {
            latest = d;
        }
    }
    return latest;
}

}  // namespace datahub
