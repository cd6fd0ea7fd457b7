/// @file src/source/batch_collector.cpp
/// @brief Bounded retry and the bounded worker pool that materialises every
///        batch before a merge starts.
///
/// Workers pull job indices from a shared atomic counter and write into a
/// slot per job, so no lock is needed and the output order is the job order.

#include "datahub/source.hpp"
#include "datahub/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace datahub::source {

namespace {

void default_sleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

/// Result slot for one job.
struct JobSlot {
    std::optional<std::vector<SymbolBatch>> batches;
    std::string                             failure;
};

}  // anonymous namespace

// ─── fetch_with_retry ─────────────────────────────────────────────────────────

std::optional<std::vector<SymbolBatch>>
fetch_with_retry(BarSource& source,
                 const FetchRequest& request,
                 const RetryPolicy& policy,
                 const Sleeper& sleep) {
    const std::size_t attempts = std::max<std::size_t>(policy.max_attempts, 1);
    double backoff_ms = static_cast<double>(policy.initial_backoff.count());

    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        std::optional<std::vector<SymbolBatch>> result;
        try {
            result = source.fetch(request);
        } catch (const std::exception& e) {
            // Adapters should not throw; treat it as "no data" for this attempt.
            log::warn("{} {}: fetch threw: {}",
                      to_string(source.exchange()), describe(request), e.what());
        }
        if (result) {
            if (attempt > 1) {
                log::info("{} {}: succeeded on attempt {}",
                          to_string(source.exchange()), describe(request), attempt);
            }
            return result;
        }

        if (attempt == attempts) {
            break;
        }

        const double capped_ms = std::max(
            std::min(backoff_ms, static_cast<double>(policy.max_backoff.count())), 0.0);
        const auto delay = std::chrono::milliseconds(
            static_cast<std::int64_t>(std::llround(capped_ms)));
        log::warn("{} {}: attempt {}/{} returned no data, retrying in {} ms",
                  to_string(source.exchange()), describe(request),
                  attempt, attempts, delay.count());
        if (sleep) {
            sleep(delay);
        } else {
            default_sleep(delay);
        }
        // Stop growing once the cap is reached so the value never overflows.
        backoff_ms = std::min(backoff_ms * policy.multiplier,
                              static_cast<double>(policy.max_backoff.count()));
    }

    return std::nullopt;
}

// ─── collect_batches ──────────────────────────────────────────────────────────

CollectResult collect_batches(const SourceRegistry& registry,
                              std::span<const FetchJob> jobs,
                              const CollectOptions& options,
                              const Sleeper& sleep) {
    std::vector<JobSlot> slots(jobs.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (std::size_t i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1)) {
            const FetchJob& job = jobs[i];
            BarSource* source = registry.find(job.exchange);
            if (source == nullptr) {
                slots[i].failure = fmt::format("no source registered for {}",
                                               to_string(job.exchange));
                continue;
            }
            // An escaping exception would end the process from a pool thread;
            // record it against this job and move on to the next one.
            try {
                slots[i].batches = fetch_with_retry(*source, job.request, options.retry, sleep);
            } catch (const std::exception& e) {
                slots[i].batches.reset();
                slots[i].failure = fmt::format("fetch aborted: {}", e.what());
                continue;
            }
            if (!slots[i].batches) {
                slots[i].failure = fmt::format("no data after {} attempt(s)",
                                               std::max<std::size_t>(options.retry.max_attempts, 1));
            }
        }
    };

    const std::size_t threads = std::min(std::max<std::size_t>(options.max_concurrency, 1),
                                         std::max<std::size_t>(jobs.size(), 1));
    if (threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            try {
                pool.emplace_back(worker);
            } catch (const std::system_error& e) {
                log::warn("fetch pool: started {} of {} workers: {}",
                          pool.size(), threads, e.what());
                break;
            }
        }
        // Workers share the job counter, so fewer threads still drain every job.
        if (pool.empty()) {
            worker();
        }
        for (auto& th : pool) {
            th.join();
        }
    }

    CollectResult result;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        if (slots[i].batches) {
            for (auto& batch : *slots[i].batches) {
                result.batches.push_back(std::move(batch));
            }
        } else {
            log::warn("{} {}: {}", to_string(jobs[i].exchange),
                      describe(jobs[i].request), slots[i].failure);
            result.failures.push_back(FetchFailure{
                .exchange = jobs[i].exchange,
                .request  = jobs[i].request,
                .reason   = std::move(slots[i].failure),
            });
        }
    }
    return result;
}

}  // namespace datahub::source
