/// @file src/merge/merge_engine.cpp
/// @brief Merge Engine: per-key reconciliation of stored and fetched bars.
///
/// The run works on a private copy of the existing record map:
///   1. Group batches by key, validating dates and collecting rejections
///   2. Skip a key if nothing survived (prior record stays as is)
///   3. Combine with the stored series (Incremental) or not (FullReplace)
///   4. Apply the retention cap and store the record in the working map
/// The working map becomes the new snapshot once every key is applied.

#include "datahub/merge.hpp"
#include "datahub/date.hpp"
#include "datahub/log.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace datahub::merge {

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(MergeMode mode) noexcept {
    switch (mode) {
        case MergeMode::Incremental: return "incremental";
        case MergeMode::FullReplace: return "full-replace";
    }
    return "unknown";
}

std::string_view to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Created: return "created";
        case OutcomeStatus::Updated: return "updated";
        case OutcomeStatus::Skipped: return "skipped";
    }
    return "unknown";
}

std::string_view to_string(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::None:           return "none";
        case SkipReason::AllBarsInvalid: return "all bars invalid";
        case SkipReason::EmptyBatch:     return "empty batch";
    }
    return "unknown";
}

// ─── MergeResult counters ─────────────────────────────────────────────────────

namespace {

std::size_t count_status(const std::vector<PerSymbolOutcome>& outcomes,
                         OutcomeStatus status) noexcept {
    return static_cast<std::size_t>(std::count_if(
        outcomes.begin(), outcomes.end(),
        [status](const PerSymbolOutcome& o) { return o.status == status; }));
}

}  // anonymous namespace

std::size_t MergeResult::created() const noexcept {
    return count_status(outcomes, OutcomeStatus::Created);
}

std::size_t MergeResult::updated() const noexcept {
    return count_status(outcomes, OutcomeStatus::Updated);
}

std::size_t MergeResult::skipped() const noexcept {
    return count_status(outcomes, OutcomeStatus::Skipped);
}

std::size_t MergeResult::rejected_bars() const noexcept {
    std::size_t total = 0;
    for (const auto& o : outcomes) {
        total += o.rejections.size();
    }
    return total;
}

// ─── MergeEngine ──────────────────────────────────────────────────────────────

MergeEngine::MergeEngine(MergeOptions options) noexcept
    : options_(std::move(options))
{}

// ─── MergeEngine::validate_bars ───────────────────────────────────────────────

std::vector<Bar>
MergeEngine::validate_bars(std::span<const Bar> bars,
                           std::vector<BarRejection>& rejections) {
    std::vector<Bar> valid;
    valid.reserve(bars.size());

    for (const auto& bar : bars) {
        if (date::is_valid(bar.date)) {
            valid.push_back(bar);
        } else {
            rejections.push_back(BarRejection{
                .date   = bar.date,
                .reason = date::describe_invalid(bar.date),
            });
        }
    }
    return valid;
}

// ─── MergeEngine::combine ─────────────────────────────────────────────────────

std::vector<Bar>
MergeEngine::combine(std::span<const Bar> stored, std::span<const Bar> incoming) {
    // Keyed by date: later insertions overwrite earlier ones, so incoming
    // bars (inserted last) supersede stored bars for the same day.
    std::map<std::int32_t, Bar> by_date;
    for (const auto& bar : stored) {
        by_date.insert_or_assign(bar.date, bar);
    }
    for (const auto& bar : incoming) {
        by_date.insert_or_assign(bar.date, bar);
    }

    std::vector<Bar> series;
    series.reserve(by_date.size());
    for (auto& [d, bar] : by_date) {
        series.push_back(bar);
    }
    return series;
}

// ─── MergeEngine::apply_retention ─────────────────────────────────────────────

std::size_t MergeEngine::apply_retention(std::vector<Bar>& series,
                                         std::size_t max_records) {
    if (series.size() <= max_records) {
        return 0;
    }
    const std::size_t excess = series.size() - max_records;
    series.erase(series.begin(),
                 series.begin() + static_cast<std::ptrdiff_t>(excess));
    return excess;
}

// ─── MergeEngine::run ─────────────────────────────────────────────────────────

namespace {

/// Every batch for one key, folded in input order.
struct KeyedInput {
    SymbolKey                 key;
    std::string               name;           ///< Last non-empty batch name
    std::size_t               bars_received = 0;
    std::vector<Bar>          valid;          ///< Valid bars, input order
    std::vector<BarRejection> rejections;
};

}  // anonymous namespace

MergeResult MergeEngine::run(const StoreSnapshot& existing,
                             std::span<const SymbolBatch> batches) const {
    // Group first so that each key is reconciled exactly once against
    // `existing`, whatever the number of batches carrying it.
    std::vector<KeyedInput> inputs;
    std::map<SymbolKey, std::size_t> slot_of;
    for (const auto& batch : batches) {
        auto [slot, inserted] = slot_of.try_emplace(batch.key, inputs.size());
        if (inserted) {
            inputs.push_back(KeyedInput{.key = batch.key});
        }
        KeyedInput& input = inputs[slot->second];
        if (!batch.name.empty()) {
            input.name = batch.name;
        }
        input.bars_received += batch.bars.size();
        auto valid = validate_bars(batch.bars, input.rejections);
        input.valid.insert(input.valid.end(), valid.begin(), valid.end());
    }

    StoreSnapshot::RecordMap working = existing.records();

    MergeResult result;
    result.outcomes.reserve(inputs.size());

    for (auto& input : inputs) {
        PerSymbolOutcome outcome{
            .key           = input.key,
            .bars_received = input.bars_received,
            .bars_accepted = input.valid.size(),
            .rejections    = std::move(input.rejections),
        };

        for (const auto& rej : outcome.rejections) {
            log::warn("{}: dropping bar: {}", to_string(input.key), rej.reason);
        }

        auto it = working.find(input.key);
        const bool existed = it != working.end();

        if (input.valid.empty()) {
            outcome.status      = OutcomeStatus::Skipped;
            outcome.skip_reason = input.bars_received == 0 ? SkipReason::EmptyBatch
                                                           : SkipReason::AllBarsInvalid;
            outcome.bars_stored = existed ? it->second.daily.size() : 0;
            log::warn("{}: update skipped ({}), {}",
                      to_string(input.key), to_string(outcome.skip_reason),
                      existed ? "stored history kept" : "key not created");
            result.outcomes.push_back(std::move(outcome));
            continue;
        }

        std::vector<Bar> series;
        if (existed && options_.mode == MergeMode::Incremental) {
            series = combine(it->second.daily, input.valid);
        } else {
            series = combine({}, input.valid);
        }

        if (options_.max_records) {
            outcome.bars_trimmed = apply_retention(series, *options_.max_records);
            if (outcome.bars_trimmed > 0) {
                log::debug("{}: retention cap {} dropped {} oldest bars",
                           to_string(input.key), *options_.max_records,
                           outcome.bars_trimmed);
            }
        }
        outcome.bars_stored = series.size();

        if (existed) {
            SymbolRecord& record = it->second;
            if (!input.name.empty()) {
                record.name = std::move(input.name);
            }
            record.daily   = std::move(series);
            outcome.status = OutcomeStatus::Updated;
        } else {
            working.emplace(input.key, SymbolRecord{
                .key   = input.key,
                .name  = std::move(input.name),
                .daily = std::move(series),
            });
            outcome.status = OutcomeStatus::Created;
        }

        result.outcomes.push_back(std::move(outcome));
    }

    result.snapshot = StoreSnapshot(std::move(working));
    return result;
}

// ─── Free functions ───────────────────────────────────────────────────────────

MergeResult merge(const StoreSnapshot& existing,
                  std::span<const SymbolBatch> batches,
                  const MergeOptions& options) {
    return MergeEngine(options).run(existing, batches);
}

bool is_strictly_ascending(std::span<const Bar> series) noexcept {
    return std::adjacent_find(series.begin(), series.end(),
                              [](const Bar& a, const Bar& b) {
                                  return a.date >= b.date;
                              }) == series.end();
}

}  // namespace datahub::merge
