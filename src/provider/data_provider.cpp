/// @file src/provider/data_provider.cpp
/// @brief DataProvider index construction and lookups.

#include "datahub/provider.hpp"

#include <functional>
#include <utility>

namespace datahub {

DataProvider::DataProvider(StoreSnapshot snapshot)
    : snapshot_(std::make_shared<const StoreSnapshot>(std::move(snapshot)))
{
    build_indices();
}

DataProvider::DataProvider(std::shared_ptr<const StoreSnapshot> snapshot)
    : snapshot_(snapshot ? std::move(snapshot)
                         : std::make_shared<const StoreSnapshot>())
{
    build_indices();
}

// ─── build_indices ────────────────────────────────────────────────────────────

void DataProvider::build_indices() {
    // The snapshot iterates in (exchange, symbol) order, so both index
    // vectors come out sorted without a separate pass.
    for (const auto& [key, record] : *snapshot_) {
        symbol_index_[key.symbol].push_back(std::cref(record));
        exchange_index_[key.exchange].push_back(std::cref(record));
    }
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

std::optional<RecordRef>
DataProvider::get_by_symbol(const std::optional<std::string>& exchange,
                            std::string_view symbol) const {
    if (exchange) {
        const SymbolRecord* record = snapshot_->find(SymbolKey{
            .exchange = *exchange,
            .symbol   = std::string(symbol),
        });
        if (record == nullptr) {
            return std::nullopt;
        }
        return std::cref(*record);
    }

    const auto it = symbol_index_.find(symbol);
    if (it == symbol_index_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<RecordRef>
DataProvider::list_by_exchange(std::string_view exchange) const {
    const auto it = exchange_index_.find(exchange);
    if (it == exchange_index_.end()) {
        return {};
    }
    return it->second;
}

std::vector<RecordRef> DataProvider::list_all() const {
    std::vector<RecordRef> all;
    all.reserve(snapshot_->size());
    for (const auto& [key, record] : *snapshot_) {
        all.push_back(std::cref(record));
    }
    return all;
}

std::vector<std::string> DataProvider::exchanges() const {
    std::vector<std::string> out;
    out.reserve(exchange_index_.size());
    for (const auto& [exchange, records] : exchange_index_) {
        out.push_back(exchange);
    }
    return out;
}

std::optional<std::int32_t> DataProvider::latest_trading_date() const noexcept {
    return snapshot_->latest_date();
}

}  // namespace datahub
