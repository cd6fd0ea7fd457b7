/// @file tests/source/test_batch_collector.cpp
/// @brief Tests for SourceRegistry dispatch, fetch_with_retry and the
///        bounded fetch pool.

#include "datahub/source.hpp"
#include "datahub/log.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace datahub;
using namespace datahub::source;
using namespace std::chrono_literals;

// ─── Fake adapter ─────────────────────────────────────────────────────────────

namespace {

/// Returns one batch per request after `failures_before_success` empty answers.
class ScriptedSource final : public BarSource {
public:
    ScriptedSource(Exchange exchange, int failures_before_success, bool throws = false)
        : exchange_(exchange)
        , failures_left_(failures_before_success)
        , throws_(throws)
    {}

    [[nodiscard]] Exchange exchange() const noexcept override { return exchange_; }

    [[nodiscard]] std::optional<std::vector<SymbolBatch>>
    fetch(const FetchRequest& request) override {
        ++calls_;
        const int in_flight = ++in_flight_;
        int seen = max_in_flight_.load();
        while (in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, in_flight)) {}
        std::this_thread::sleep_for(2ms);
        --in_flight_;

        if (failures_left_.fetch_sub(1) > 0) {
            if (throws_) {
                throw std::runtime_error("upstream timeout");
            }
            return std::nullopt;
        }
        return std::vector<SymbolBatch>{SymbolBatch{
            .key  = {.exchange = std::string(to_string(exchange_)),
                     .symbol   = request.symbol.value_or("ALL")},
            .name = "",
            .bars = {Bar{.date = request.date.value_or(20250101), .open = 1, .high = 1,
                         .low = 1, .close = 1, .volume = 1, .amount = 1}},
        }};
    }

    [[nodiscard]] int calls() const noexcept { return calls_.load(); }
    [[nodiscard]] int max_in_flight() const noexcept { return max_in_flight_.load(); }

private:
    Exchange         exchange_;
    std::atomic<int> failures_left_;
    bool             throws_;
    std::atomic<int> calls_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

const Sleeper NO_SLEEP = [](std::chrono::milliseconds) {};

class BatchCollectorTest : public ::testing::Test {
protected:
    void SetUp() override { log::set_level(log::Level::Off); }
};

}  // anonymous namespace

// ─── SourceRegistry ───────────────────────────────────────────────────────────

TEST_F(BatchCollectorTest, RegistryDispatchesByExchange) {
    SourceRegistry registry;
    EXPECT_TRUE(registry.empty());
    registry.add(std::make_unique<ScriptedSource>(Exchange::SZSE, 0));
    registry.add(std::make_unique<ScriptedSource>(Exchange::SSE, 0));

    ASSERT_NE(registry.find(Exchange::SSE), nullptr);
    EXPECT_EQ(registry.find(Exchange::SSE)->exchange(), Exchange::SSE);
    EXPECT_EQ(registry.exchanges(), (std::vector<Exchange>{Exchange::SSE, Exchange::SZSE}));
}

TEST_F(BatchCollectorTest, RegistryReplacesAdapterForSameExchange) {
    SourceRegistry registry;
    registry.add(std::make_unique<ScriptedSource>(Exchange::SSE, 0));
    auto replacement = std::make_unique<ScriptedSource>(Exchange::SSE, 0);
    BarSource* raw = replacement.get();
    registry.add(std::move(replacement));
    EXPECT_EQ(registry.find(Exchange::SSE), raw);
    EXPECT_EQ(registry.exchanges().size(), 1u);
    EXPECT_EQ(registry.find(Exchange::SZSE), nullptr);
}

// ─── fetch_with_retry ─────────────────────────────────────────────────────────

TEST_F(BatchCollectorTest, RetrySucceedsWithinAttempts) {
    ScriptedSource source(Exchange::SSE, 2);
    std::vector<std::chrono::milliseconds> waits;
    const Sleeper record = [&waits](std::chrono::milliseconds d) { waits.push_back(d); };

    const auto result = fetch_with_retry(
        source, {}, RetryPolicy{.max_attempts = 3, .initial_backoff = 100ms, .multiplier = 2.0},
        record);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(source.calls(), 3);
    EXPECT_EQ(waits, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST_F(BatchCollectorTest, BackoffIsCappedAtMaxBackoff) {
    ScriptedSource source(Exchange::SSE, 100);
    std::vector<std::chrono::milliseconds> waits;
    const Sleeper record = [&waits](std::chrono::milliseconds d) { waits.push_back(d); };

    const auto result = fetch_with_retry(
        source, {},
        RetryPolicy{.max_attempts = 8, .initial_backoff = 500ms, .multiplier = 1000.0,
                    .max_backoff = 2s},
        record);

    EXPECT_FALSE(result.has_value());
    ASSERT_EQ(waits.size(), 7u);
    EXPECT_EQ(waits.front(), 500ms);
    for (const auto& wait : waits) {
        EXPECT_GE(wait.count(), 0);
        EXPECT_LE(wait, 2s);
    }
    EXPECT_EQ(waits.back(), 2s);
}

TEST_F(BatchCollectorTest, RetryGivesUpAfterMaxAttempts) {
    ScriptedSource source(Exchange::SSE, 10);
    const auto result = fetch_with_retry(source, {}, RetryPolicy{.max_attempts = 3}, NO_SLEEP);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(source.calls(), 3);
}

TEST_F(BatchCollectorTest, ZeroAttemptsStillTriesOnce) {
    ScriptedSource source(Exchange::SSE, 0);
    const auto result = fetch_with_retry(source, {}, RetryPolicy{.max_attempts = 0}, NO_SLEEP);
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(source.calls(), 1);
}

TEST_F(BatchCollectorTest, ThrowingAdapterCountsAsNoData) {
    ScriptedSource source(Exchange::SSE, 1, /*throws=*/true);
    const auto result = fetch_with_retry(source, {}, RetryPolicy{.max_attempts = 2}, NO_SLEEP);
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(source.calls(), 2);
}

// ─── collect_batches ──────────────────────────────────────────────────────────

TEST_F(BatchCollectorTest, OutputFollowsJobOrder) {
    SourceRegistry registry;
    registry.add(std::make_unique<ScriptedSource>(Exchange::SSE, 0));

    std::vector<FetchJob> jobs;
    for (int i = 0; i < 12; ++i) {
        jobs.push_back(FetchJob{.exchange = Exchange::SSE,
                                .request  = FetchRequest{.symbol = std::to_string(600000 + i)}});
    }

    const auto result = collect_batches(registry, jobs,
        CollectOptions{.max_concurrency = 4, .retry = RetryPolicy{.max_attempts = 1}}, NO_SLEEP);

    ASSERT_EQ(result.batches.size(), jobs.size());
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        EXPECT_EQ(result.batches[i].key.symbol, *jobs[i].request.symbol);
    }
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(BatchCollectorTest, ConcurrencyIsBounded) {
    SourceRegistry registry;
    auto owned = std::make_unique<ScriptedSource>(Exchange::SSE, 0);
    const ScriptedSource* source = owned.get();
    registry.add(std::move(owned));

    const std::vector<FetchJob> jobs(16, FetchJob{.exchange = Exchange::SSE, .request = {}});
    const auto result = collect_batches(registry, jobs,
        CollectOptions{.max_concurrency = 3, .retry = RetryPolicy{.max_attempts = 1}}, NO_SLEEP);

    EXPECT_EQ(result.batches.size(), 16u);
    EXPECT_EQ(source->calls(), 16);
    EXPECT_LE(source->max_in_flight(), 3);
}

TEST_F(BatchCollectorTest, FailuresAreReportedNotThrown) {
    SourceRegistry registry;
    registry.add(std::make_unique<ScriptedSource>(Exchange::SSE, 100));

    const std::vector<FetchJob> jobs{
        FetchJob{.exchange = Exchange::SSE,  .request = FetchRequest{.symbol = "600000"}},
        FetchJob{.exchange = Exchange::SZSE, .request = FetchRequest{.symbol = "000001"}},
    };
    const auto result = collect_batches(registry, jobs,
        CollectOptions{.max_concurrency = 1, .retry = RetryPolicy{.max_attempts = 2}}, NO_SLEEP);

    EXPECT_TRUE(result.batches.empty());
    ASSERT_EQ(result.failures.size(), 2u);
    EXPECT_EQ(result.failures[0].exchange, Exchange::SSE);
    EXPECT_NE(result.failures[0].reason.find("2 attempt"), std::string::npos);
    EXPECT_EQ(result.failures[1].exchange, Exchange::SZSE);
    EXPECT_NE(result.failures[1].reason.find("no source"), std::string::npos);
}

TEST_F(BatchCollectorTest, ThrowingSleeperBecomesJobFailure) {
    SourceRegistry registry;
    registry.add(std::make_unique<ScriptedSource>(Exchange::SSE, 100));
    const Sleeper interrupted = [](std::chrono::milliseconds) {
        throw std::runtime_error("sleep interrupted");
    };

    const std::vector<FetchJob> jobs{
        FetchJob{.exchange = Exchange::SSE, .request = FetchRequest{.symbol = "600000"}},
        FetchJob{.exchange = Exchange::SSE, .request = FetchRequest{.symbol = "600001"}},
    };
    const auto result = collect_batches(registry, jobs,
        CollectOptions{.max_concurrency = 2, .retry = RetryPolicy{.max_attempts = 2}},
        interrupted);

    EXPECT_TRUE(result.batches.empty());
    ASSERT_EQ(result.failures.size(), 2u);
    for (const auto& failure : result.failures) {
        EXPECT_NE(failure.reason.find("sleep interrupted"), std::string::npos);
    }
}

TEST_F(BatchCollectorTest, NoJobsIsAnEmptyResult) {
    SourceRegistry registry;
    const auto result = collect_batches(registry, {}, CollectOptions{}, NO_SLEEP);
    EXPECT_TRUE(result.batches.empty());
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(BatchCollectorTest, DescribeMentionsFilters) {
    const auto text = describe(FetchRequest{.symbol = "600000", .date = 20250515});
    EXPECT_NE(text.find("600000"), std::string::npos);
    EXPECT_NE(text.find("2025-05-15"), std::string::npos);
    EXPECT_EQ(describe(FetchRequest{}), "all symbols");
}
