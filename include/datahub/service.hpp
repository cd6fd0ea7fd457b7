#pragma once

/// @file include/datahub/service.hpp
/// @brief DataService: one `scrape` run from fetch to persisted store.
///
/// # Module: Data Service
///
/// ## Pipeline
///   store::load → collect_batches (listing) → history backfill →
///   MergeEngine::run → store::persist → ScrapeReport
///
/// ## Usage
/// ```cpp
/// source::SourceRegistry sources;
/// sources.add(std::make_unique<source::CsvBarSource>(Exchange::SSE, "data/raw"));
/// DataService service(ScrapeConfig{.output = "data/stock.arrow"}, sources);
/// auto report = service.scrape();
/// ```
///
/// ## Errors
/// Per-bar and per-key problems end up in the report. Only `SchemaError`
/// (existing store unreadable) and `IoError` (load or persist failed)
/// escape `scrape`; the previously persisted store is then unchanged.

#include "datahub/constants.hpp"
#include "datahub/merge.hpp"
#include "datahub/source.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace datahub {

// ─── ScrapeConfig ─────────────────────────────────────────────────────────────

struct ScrapeConfig {
    /// Exchanges to pull from. Empty means every registered exchange.
    std::vector<source::Exchange> exchanges;

    /// Only bars of this trading day (YYYYMMDD) in the listing pass.
    std::optional<std::int32_t> date;

    /// Restrict the run to one symbol.
    std::optional<std::string> symbol;

    /// Replace stored history instead of merging into it.
    bool force_full = false;

    /// Retention cap per symbol; `nullopt` keeps everything.
    std::optional<std::size_t> max_records = constants::DEFAULT_MAX_RECORDS;

    /// Store file to read and replace.
    std::filesystem::path output{constants::DEFAULT_STORE_PATH};

    /// Keep only the first N symbols per exchange (debug runs).
    std::optional<std::size_t> symbol_limit;

    /// Fetch pool configuration.
    source::CollectOptions fetch{};
};

// ─── ScrapeReport ─────────────────────────────────────────────────────────────

struct ScrapeReport {
    merge::MergeMode                      mode = merge::MergeMode::Incremental;
    std::vector<merge::PerSymbolOutcome>  outcomes;
    std::vector<source::FetchFailure>     fetch_failures;
    std::size_t                           records_before = 0;
    std::size_t                           records_after  = 0;
    std::filesystem::path                 store_path;

    /// True when at least one key was skipped or one fetch failed.
    [[nodiscard]] bool partial() const noexcept;

    /// One-paragraph human summary.
    [[nodiscard]] std::string to_string() const;
};

// ─── DataService ──────────────────────────────────────────────────────────────

class DataService {
public:
    /// `sources` must outlive the service.
    DataService(ScrapeConfig config, const source::SourceRegistry& sources);

    /// Execute one run. Throws SchemaError / IoError on store failures.
    [[nodiscard]] ScrapeReport scrape() const;

    [[nodiscard]] const ScrapeConfig& config() const noexcept { return config_; }

    [[nodiscard]] merge::MergeOptions merge_options() const noexcept;

private:
    /// Listing jobs for the selected exchanges.
    [[nodiscard]] std::vector<source::FetchJob>
    listing_jobs(const StoreSnapshot& existing) const;

    /// Refetch full history for keys the listing pass cannot fill.
    void backfill_history(const StoreSnapshot& existing,
                          std::vector<SymbolBatch>& batches,
                          std::vector<source::FetchFailure>& failures) const;

    /// Apply `symbol_limit` per exchange.
    void apply_symbol_limit(std::vector<SymbolBatch>& batches) const;

    [[nodiscard]] std::vector<source::Exchange> selected_exchanges() const;

    ScrapeConfig                  config_;
    const source::SourceRegistry& sources_;
};

}  // namespace datahub
