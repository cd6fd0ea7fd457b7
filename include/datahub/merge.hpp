#pragma once

/// @file include/datahub/merge.hpp
/// @brief Merge Engine: reconcile a snapshot with freshly fetched batches.
///
/// # Module: Merge Engine
///
/// ## Responsibility
/// Produce a new StoreSnapshot from an existing one plus a sequence of
/// SymbolBatch values, in one of two modes:
///   - `Incremental`: union stored and new bars by date, new bar wins
///   - `FullReplace`: the batch replaces the stored series entirely
/// then sort, apply the retention cap and attach the record under its key.
///
/// ## Failure Isolation
/// A bar whose date is not a valid YYYYMMDD calendar day is dropped and
/// reported. A key left with no valid bars is skipped and reported; its
/// stored record (if any) is carried over untouched. Neither affects any
/// other key, and neither fails the merge.
///
/// ## Guarantees
/// - Pure: output depends only on (existing, batches, options)
/// - `existing` is never modified
/// - Every output series is strictly ascending by date
/// - Keys absent from `batches` are carried over unchanged

#include "datahub/snapshot.hpp"
#include "datahub/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace datahub::merge {

// ─── Options ──────────────────────────────────────────────────────────────────

enum class MergeMode {
    Incremental,  ///< Union with stored history, new bars win on overlap
    FullReplace,  ///< Discard stored history for every key in the batches
};

/// Run-wide merge configuration.
struct MergeOptions {
    MergeMode mode = MergeMode::Incremental;

    /// Keep at most this many most recent bars per touched key.
    std::optional<std::size_t> max_records;
};

[[nodiscard]] std::string_view to_string(MergeMode mode) noexcept;

// ─── Outcomes ─────────────────────────────────────────────────────────────────

enum class OutcomeStatus {
    Created,  ///< Key did not exist before this run
    Updated,  ///< Existing key received new bars
    Skipped,  ///< No valid bars; prior record (if any) kept as is
};

enum class SkipReason {
    None,
    AllBarsInvalid,  ///< Every bar failed date validation
    EmptyBatch,      ///< The batch carried no bars at all
};

[[nodiscard]] std::string_view to_string(OutcomeStatus status) noexcept;
[[nodiscard]] std::string_view to_string(SkipReason reason) noexcept;

/// A bar dropped because its date failed validation.
struct BarRejection {
    std::int32_t date;
    std::string  reason;
};

/// What happened to one key, summed over every batch carrying it.
struct PerSymbolOutcome {
    SymbolKey                 key;
    OutcomeStatus             status       = OutcomeStatus::Skipped;
    SkipReason                skip_reason  = SkipReason::None;
    std::size_t               bars_received = 0;  ///< Bars across the key's batches
    std::size_t               bars_accepted = 0;  ///< Bars that passed validation
    std::size_t               bars_stored   = 0;  ///< Series length after merge
    std::size_t               bars_trimmed  = 0;  ///< Oldest bars cut by the cap
    std::vector<BarRejection> rejections;
};

/// New snapshot plus one outcome per distinct key, in order of first
/// appearance in the input.
struct MergeResult {
    StoreSnapshot                 snapshot;
    std::vector<PerSymbolOutcome> outcomes;

    [[nodiscard]] std::size_t created() const noexcept;
    [[nodiscard]] std::size_t updated() const noexcept;
    [[nodiscard]] std::size_t skipped() const noexcept;
    [[nodiscard]] std::size_t rejected_bars() const noexcept;
};

// ─── MergeEngine ──────────────────────────────────────────────────────────────

class MergeEngine {
public:
    explicit MergeEngine(MergeOptions options = MergeOptions{}) noexcept;

    /// Merge `batches` into `existing`.
    ///
    /// Batches sharing a key are grouped first: their valid bars are
    /// concatenated in input order (a later bar wins on a repeated date) and
    /// the last non-empty name is kept. The mode is then applied once per
    /// key against `existing`, so under `FullReplace` every batch of the run
    /// contributes to the replacement series.
    [[nodiscard]] MergeResult run(const StoreSnapshot& existing,
                                  std::span<const SymbolBatch> batches) const;

    [[nodiscard]] const MergeOptions& options() const noexcept { return options_; }

    /// Split `bars` into valid bars and rejections.
    /// Valid bars keep their input order.
    [[nodiscard]] static std::vector<Bar>
    validate_bars(std::span<const Bar> bars,
                  std::vector<BarRejection>& rejections);

    /// Combine stored and new bars into one ascending, date-unique series.
    ///
    /// For a date present more than once, the last occurrence in `incoming`
    /// wins, and any `incoming` bar wins over `stored`.
    [[nodiscard]] static std::vector<Bar>
    combine(std::span<const Bar> stored, std::span<const Bar> incoming);

    /// Drop the oldest bars so that at most `max_records` remain.
    ///
    /// # Returns
    /// Number of bars removed (0 when the series already fits).
    static std::size_t apply_retention(std::vector<Bar>& series,
                                       std::size_t max_records);

private:
    MergeOptions options_;
};

/// Convenience wrapper: `MergeEngine(options).run(existing, batches)`.
[[nodiscard]] MergeResult merge(const StoreSnapshot& existing,
                                std::span<const SymbolBatch> batches,
                                const MergeOptions& options);

/// True if `series` is strictly ascending by date.
[[nodiscard]] bool is_strictly_ascending(std::span<const Bar> series) noexcept;

}  // namespace datahub::merge
