#pragma once

/// @file include/datahub/types.hpp
/// @brief Shared value types for the datahub daily-bar store.
///
/// Every module includes this file. It defines the bar, the record identity,
/// the nested per-symbol record and the batch shape produced by sources.

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

namespace datahub {

// ─── Bar ──────────────────────────────────────────────────────────────────────

/// One trading day for one symbol.
///
/// Prices are stored exactly as received. `low <= open, close <= high` is
/// not enforced anywhere; only `date` is validated by the merge engine.
struct Bar {
    std::int32_t date;    ///< Trading day as YYYYMMDD, e.g. 20250515
    double       open;    ///< Opening price
    double       high;    ///< High price
    double       low;     ///< Low price
    double       close;   ///< Closing price
    std::int64_t volume;  ///< Share count
    double       amount;  ///< Traded value

    bool operator==(const Bar&) const = default;
};

// ─── SymbolKey ────────────────────────────────────────────────────────────────

/// Identity of a record: the (exchange, symbol) pair.
///
/// Both strings are case-preserved and compared exactly. The same symbol on
/// two exchanges yields two distinct keys. Ordering is by exchange, then
/// symbol.
struct SymbolKey {
    std::string exchange;
    std::string symbol;

    auto operator<=>(const SymbolKey&) const = default;
    bool operator==(const SymbolKey&) const = default;
};

/// "EXCHANGE:SYMBOL", used in log lines and reports.
[[nodiscard]] std::string to_string(const SymbolKey& key);

// ─── SymbolRecord ─────────────────────────────────────────────────────────────

/// All stored data for one key.
///
/// Invariant: `daily` is strictly ascending by `date` (no duplicates).
struct SymbolRecord {
    SymbolKey         key;
    std::string       name;   ///< Display name, last write wins
    std::vector<Bar>  daily;  ///< Ascending by date

    bool operator==(const SymbolRecord&) const = default;
};

// ─── SymbolBatch ──────────────────────────────────────────────────────────────

/// A freshly fetched set of bars for one key, as produced by a source.
///
/// Bars may arrive unsorted and may repeat a date; the merge engine
/// normalises them. An empty `name` means "keep the stored name".
struct SymbolBatch {
    SymbolKey        key;
    std::string      name;
    std::vector<Bar> bars;
};

}  // namespace datahub
