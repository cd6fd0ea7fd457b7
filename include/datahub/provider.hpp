#pragma once

/// @file include/datahub/provider.hpp
/// @brief DataProvider: indexed, read-only access to a loaded snapshot.
///
/// Built once by the caller and passed to whatever needs to read the store.
/// It never reloads: to observe a newer store, load it and build a new
/// provider.
///
/// All lookups are total. Absence is an empty vector or an empty optional,
/// never an exception. Returned references stay valid for the provider's
/// lifetime.

#include "datahub/snapshot.hpp"
#include "datahub/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datahub {

/// Non-owning handle to a record held by the provider's snapshot.
using RecordRef = std::reference_wrapper<const SymbolRecord>;

class DataProvider {
public:
    /// Take ownership of `snapshot` and index it.
    explicit DataProvider(StoreSnapshot snapshot);

    /// Share an existing snapshot instead of copying it.
    explicit DataProvider(std::shared_ptr<const StoreSnapshot> snapshot);

    /// Look up a symbol.
    ///
    /// With `exchange`, this is an exact key lookup. Without it, the first
    /// record in (exchange, symbol) order whose symbol matches is returned;
    /// pass the exchange when a symbol is listed on more than one.
    [[nodiscard]] std::optional<RecordRef>
    get_by_symbol(const std::optional<std::string>& exchange,
                  std::string_view symbol) const;

    /// Every record listed on `exchange`, ordered by symbol.
    [[nodiscard]] std::vector<RecordRef>
    list_by_exchange(std::string_view exchange) const;

    /// Every record, ordered by exchange then symbol.
    [[nodiscard]] std::vector<RecordRef> list_all() const;

    /// Distinct exchanges present, sorted.
    [[nodiscard]] std::vector<std::string> exchanges() const;

    /// Most recent bar date across the store.
    [[nodiscard]] std::optional<std::int32_t> latest_trading_date() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return snapshot_->size(); }

    [[nodiscard]] const StoreSnapshot& snapshot() const noexcept { return *snapshot_; }

private:
    void build_indices();

    std::shared_ptr<const StoreSnapshot> snapshot_;

    /// symbol → records with that symbol, in exchange order
    std::map<std::string, std::vector<RecordRef>, std::less<>> symbol_index_;

    /// exchange → records on that exchange, in symbol order
    std::map<std::string, std::vector<RecordRef>, std::less<>> exchange_index_;
};

}  // namespace datahub
