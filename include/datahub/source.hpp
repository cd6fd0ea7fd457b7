#pragma once

/// @file include/datahub/source.hpp
/// @brief Source adapter boundary: exchanges, fetch requests, retry and the
///        bounded fetch pool.
///
/// # Module: Source
///
/// ## Responsibility
/// Define the one capability every exchange adapter implements (`fetch`),
/// dispatch requests to adapters by exchange identifier, and turn network or
/// parse trouble into an explicit "no batch" result before anything reaches
/// the merge engine.
///
/// ## Contract
/// `BarSource::fetch` returns `nullopt` when no data is available for the
/// request. It must not throw; adapters translate their own failures.
/// Adapters must tolerate concurrent `fetch` calls.
///
/// ## NOT Responsible For
/// - Reconciling batches with stored data (see merge.hpp)
/// - Persisting anything (see store.hpp)

#include "datahub/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace datahub::source {

// ─── Exchange ─────────────────────────────────────────────────────────────────

/// Closed set of supported exchanges.
enum class Exchange {
    SSE,   ///< Shanghai Stock Exchange
    SZSE,  ///< Shenzhen Stock Exchange
};

/// Canonical code stored in records: "SSE" / "SZSE".
[[nodiscard]] std::string_view to_string(Exchange exchange) noexcept;

/// Case-insensitive parse of "sse" / "szse".
[[nodiscard]] std::optional<Exchange> parse_exchange(std::string_view text) noexcept;

/// Every supported exchange, in declaration order.
[[nodiscard]] std::span<const Exchange> all_exchanges() noexcept;

// ─── Requests ─────────────────────────────────────────────────────────────────

/// What to fetch. Every filter is optional; an empty request asks for
/// everything the source has, across all symbols.
struct FetchRequest {
    std::optional<std::string>  symbol;  ///< Restrict to one symbol
    std::optional<std::int32_t> date;    ///< Only bars on this trading day
    std::optional<std::int32_t> since;   ///< Only bars strictly after this day
};

[[nodiscard]] std::string describe(const FetchRequest& request);

// ─── BarSource ────────────────────────────────────────────────────────────────

class BarSource {
public:
    virtual ~BarSource() = default;

    [[nodiscard]] virtual Exchange exchange() const noexcept = 0;

    /// One batch per symbol that matched, or `nullopt` if no data could be
    /// obtained. An empty vector means the source answered with nothing.
    [[nodiscard]] virtual std::optional<std::vector<SymbolBatch>>
    fetch(const FetchRequest& request) = 0;
};

// ─── SourceRegistry ───────────────────────────────────────────────────────────

/// Owns one adapter per exchange and dispatches by exchange identifier.
class SourceRegistry {
public:
    /// Register `source`, replacing any adapter for the same exchange.
    void add(std::unique_ptr<BarSource> source);

    /// Adapter for `exchange`, or nullptr if none is registered.
    [[nodiscard]] BarSource* find(Exchange exchange) const noexcept;

    /// Registered exchanges, in declaration order.
    [[nodiscard]] std::vector<Exchange> exchanges() const;

    [[nodiscard]] bool empty() const noexcept { return sources_.empty(); }

private:
    std::vector<std::unique_ptr<BarSource>> sources_;
};

// ─── Retry ────────────────────────────────────────────────────────────────────

/// Bounded-attempt retry with exponential backoff.
struct RetryPolicy {
    std::size_t               max_attempts    = 3;  ///< First try included; 0 acts as 1
    std::chrono::milliseconds initial_backoff{500};
    double                    multiplier      = 2.0;
    std::chrono::milliseconds max_backoff{30'000};  ///< Upper bound on any single wait
};

/// Sleep hook, replaceable in tests.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Call `source.fetch(request)` until it yields a value or the attempts run
/// out. Waits `initial_backoff * multiplier^(n-1)` before attempt n+1,
/// capped at `max_backoff`.
///
/// # Returns
/// The first successful result, or `nullopt` after the last failed attempt.
[[nodiscard]] std::optional<std::vector<SymbolBatch>>
fetch_with_retry(BarSource& source,
                 const FetchRequest& request,
                 const RetryPolicy& policy,
                 const Sleeper& sleep = {});

// ─── Bounded fetch pool ───────────────────────────────────────────────────────

/// One unit of work for the pool.
struct FetchJob {
    Exchange     exchange;
    FetchRequest request;
};

/// A job that produced no batch after all retries.
struct FetchFailure {
    Exchange     exchange;
    FetchRequest request;
    std::string  reason;
};

struct CollectOptions {
    std::size_t max_concurrency = 4;  ///< Worker threads; 0 acts as 1
    RetryPolicy retry{};
};

/// Every batch from every successful job, in job order.
struct CollectResult {
    std::vector<SymbolBatch>  batches;
    std::vector<FetchFailure> failures;
};

/// Run `jobs` on at most `options.max_concurrency` threads and return once
/// all of them have finished. Output order follows `jobs`, not completion
/// order, so repeated runs merge identically.
[[nodiscard]] CollectResult collect_batches(const SourceRegistry& registry,
                                            std::span<const FetchJob> jobs,
                                            const CollectOptions& options,
                                            const Sleeper& sleep = {});

}  // namespace datahub::source
