#pragma once

/// @file include/datahub/snapshot.hpp
/// @brief StoreSnapshot: immutable collection of every SymbolRecord.
///
/// # Module: Store Snapshot
///
/// ## Responsibility
/// Hold the complete state of the store at one point in time, keyed uniquely
/// by (exchange, symbol). A snapshot is never modified after construction;
/// the merge engine builds a new one on every run.
///
/// ## Guarantees
/// - No two records share a key
/// - Iteration order is (exchange, symbol)
/// - All accessors are const and safe to call concurrently

#include "datahub/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace datahub {

class StoreSnapshot {
public:
    using RecordMap = std::map<SymbolKey, SymbolRecord>;

    /// Empty snapshot (first-run bootstrap).
    StoreSnapshot() = default;

    /// Take ownership of an already keyed record map.
    explicit StoreSnapshot(RecordMap records) noexcept;

    /// Build from a flat list of records.
    ///
    /// # Returns
    /// `nullopt` if two records share a key.
    [[nodiscard]] static std::optional<StoreSnapshot>
    from_records(std::vector<SymbolRecord> records);

    /// Record for `key`, or nullptr.
    [[nodiscard]] const SymbolRecord* find(const SymbolKey& key) const noexcept;

    [[nodiscard]] bool contains(const SymbolKey& key) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /// Total number of bars over all records.
    [[nodiscard]] std::size_t bar_count() const noexcept;

    /// Most recent bar date over all records; `nullopt` if there are no bars.
    [[nodiscard]] std::optional<std::int32_t> latest_date() const noexcept;

    [[nodiscard]] const RecordMap& records() const noexcept { return records_; }

    [[nodiscard]] RecordMap::const_iterator begin() const noexcept { return records_.begin(); }
    [[nodiscard]] RecordMap::const_iterator end() const noexcept { return records_.end(); }

    bool operator==(const StoreSnapshot&) const = default;

private:
    RecordMap records_;
};

}  // namespace datahub
