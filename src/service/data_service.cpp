/// @file src/service/data_service.cpp
/// @brief DataService: one scrape run, fetch → merge → persist.

#include "datahub/service.hpp"
#include "datahub/log.hpp"
#include "datahub/store.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace datahub {

// ─── ScrapeReport ─────────────────────────────────────────────────────────────

bool ScrapeReport::partial() const noexcept {
    if (!fetch_failures.empty()) {
        return true;
    }
    return std::any_of(outcomes.begin(), outcomes.end(),
        [](const merge::PerSymbolOutcome& o) {
            return o.status == merge::OutcomeStatus::Skipped;
        });
}

std::string ScrapeReport::to_string() const {
    std::size_t created = 0, updated = 0, skipped = 0, rejected = 0, trimmed = 0;
    for (const auto& o : outcomes) {
        switch (o.status) {
            case merge::OutcomeStatus::Created: ++created; break;
            case merge::OutcomeStatus::Updated: ++updated; break;
            case merge::OutcomeStatus::Skipped: ++skipped; break;
        }
        rejected += o.rejections.size();
        trimmed  += o.bars_trimmed;
    }

    std::string out = fmt::format(
        "{} run: {} batches → {} created, {} updated, {} skipped; "
        "{} bars rejected, {} trimmed; {} fetch failures; "
        "store {} → {} records ({})",
        merge::to_string(mode), outcomes.size(), created, updated, skipped,
        rejected, trimmed, fetch_failures.size(),
        records_before, records_after, store_path.string());

    for (const auto& o : outcomes) {
        if (o.status == merge::OutcomeStatus::Skipped) {
            out += fmt::format("\n  skipped {}: {}", datahub::to_string(o.key),
                               merge::to_string(o.skip_reason));
        }
    }
    for (const auto& f : fetch_failures) {
        out += fmt::format("\n  fetch failed {} {}: {}", source::to_string(f.exchange),
                           source::describe(f.request), f.reason);
    }
    return out;
}

// ─── DataService ──────────────────────────────────────────────────────────────

DataService::DataService(ScrapeConfig config, const source::SourceRegistry& sources)
    : config_(std::move(config))
    , sources_(sources)
{}

merge::MergeOptions DataService::merge_options() const noexcept {
    return merge::MergeOptions{
        .mode        = config_.force_full ? merge::MergeMode::FullReplace
                                          : merge::MergeMode::Incremental,
        .max_records = config_.max_records,
    };
}

std::vector<source::Exchange> DataService::selected_exchanges() const {
    if (config_.exchanges.empty()) {
        return sources_.exchanges();
    }
    return config_.exchanges;
}

// ─── DataService::listing_jobs ────────────────────────────────────────────────

std::vector<source::FetchJob>
DataService::listing_jobs(const StoreSnapshot& existing) const {
    std::vector<source::FetchJob> jobs;
    for (source::Exchange exchange : selected_exchanges()) {
        source::FetchRequest request{
            .symbol = config_.symbol,
            .date   = config_.date,
        };

        // A single known symbol only needs what came after its last stored bar.
        if (config_.symbol && !config_.date && !config_.force_full) {
            const SymbolRecord* record = existing.find(SymbolKey{
                .exchange = std::string(source::to_string(exchange)),
                .symbol   = *config_.symbol,
            });
            if (record != nullptr && !record->daily.empty()) {
                request.since = record->daily.back().date;
            }
        }

        jobs.push_back(source::FetchJob{.exchange = exchange, .request = std::move(request)});
    }
    return jobs;
}

// ─── DataService::apply_symbol_limit ──────────────────────────────────────────

void DataService::apply_symbol_limit(std::vector<SymbolBatch>& batches) const {
    if (!config_.symbol_limit) {
        return;
    }
    std::map<std::string, std::set<std::string>> seen;  // exchange → symbols kept
    std::vector<SymbolBatch> kept;
    kept.reserve(batches.size());
    for (auto& batch : batches) {
        auto& symbols = seen[batch.key.exchange];
        if (symbols.count(batch.key.symbol) == 0 && symbols.size() >= *config_.symbol_limit) {
            continue;
        }
        symbols.insert(batch.key.symbol);
        kept.push_back(std::move(batch));
    }
    log::info("symbol limit {}: keeping {} of {} batches",
              *config_.symbol_limit, kept.size(), batches.size());
    batches = std::move(kept);
}

// ─── DataService::backfill_history ────────────────────────────────────────────

void DataService::backfill_history(const StoreSnapshot& existing,
                                   std::vector<SymbolBatch>& batches,
                                   std::vector<source::FetchFailure>& failures) const {
    // Without a date filter the listing pass already carried full history.
    if (!config_.date) {
        return;
    }

    std::vector<std::size_t>      targets;
    std::vector<source::FetchJob> jobs;
    for (std::size_t i = 0; i < batches.size(); ++i) {
        const auto& key = batches[i].key;
        const auto exchange = source::parse_exchange(key.exchange);
        if (!exchange) {
            continue;
        }
        const SymbolRecord* record = existing.find(key);
        const bool needs_history = config_.force_full
                                || record == nullptr
                                || record->daily.empty();
        if (!needs_history) {
            continue;
        }
        targets.push_back(i);
        jobs.push_back(source::FetchJob{
            .exchange = *exchange,
            .request  = source::FetchRequest{.symbol = key.symbol},
        });
    }
    if (jobs.empty()) {
        return;
    }

    log::info("fetching full history for {} symbol(s)", jobs.size());

    std::vector<bool> drop(batches.size(), false);
    for (std::size_t j = 0; j < jobs.size(); ++j) {
        SymbolBatch& batch = batches[targets[j]];
        source::BarSource* src = sources_.find(jobs[j].exchange);
        std::optional<std::vector<SymbolBatch>> history;
        if (src != nullptr) {
            history = source::fetch_with_retry(*src, jobs[j].request, config_.fetch.retry);
        }

        const SymbolBatch* found = nullptr;
        if (history) {
            for (const auto& h : *history) {
                if (h.key == batch.key) {
                    found = &h;
                    break;
                }
            }
        }

        if (found != nullptr && !found->bars.empty()) {
            if (!found->name.empty()) {
                batch.name = found->name;
            }
            batch.bars = found->bars;
            continue;
        }

        if (config_.force_full) {
            // A one-day listing must not replace a whole history.
            drop[targets[j]] = true;
            failures.push_back(source::FetchFailure{
                .exchange = jobs[j].exchange,
                .request  = jobs[j].request,
                .reason   = "full history unavailable; key left unchanged",
            });
        } else {
            log::warn("{}: full history unavailable, merging listing bars only",
                      to_string(batch.key));
        }
    }

    std::vector<SymbolBatch> kept;
    kept.reserve(batches.size());
    for (std::size_t i = 0; i < batches.size(); ++i) {
        if (!drop[i]) {
            kept.push_back(std::move(batches[i]));
        }
    }
    batches = std::move(kept);
}

// ─── DataService::scrape ──────────────────────────────────────────────────────

ScrapeReport DataService::scrape() const {
    const auto options = merge_options();
    log::info("scrape: mode={} max_records={} store={}",
              merge::to_string(options.mode),
              options.max_records ? fmt::format("{}", *options.max_records)
                                  : std::string("unlimited"),
              config_.output.string());

    const StoreSnapshot existing = store::load(config_.output);

    const auto jobs = listing_jobs(existing);
    auto collected  = source::collect_batches(sources_, jobs, config_.fetch);
    apply_symbol_limit(collected.batches);
    backfill_history(existing, collected.batches, collected.failures);

    log::info("collected {} batch(es), {} fetch failure(s)",
              collected.batches.size(), collected.failures.size());

    auto merged = merge::MergeEngine(options).run(existing, collected.batches);

    store::persist(merged.snapshot, config_.output);

    ScrapeReport report{
        .mode           = options.mode,
        .outcomes       = std::move(merged.outcomes),
        .fetch_failures = std::move(collected.failures),
        .records_before = existing.size(),
        .records_after  = merged.snapshot.size(),
        .store_path     = config_.output,
    };
    log::info("{}", report.to_string());
    return report;
}

}  // namespace datahub
