/// @file tests/integration/test_scrape_pipeline.cpp
/// @brief End-to-end tests for DataService: CSV sources → bounded fetch →
///        merge → atomic persist → DataProvider.

#include "datahub/service.hpp"
#include "datahub/csv_source.hpp"
#include "datahub/errors.hpp"
#include "datahub/log.hpp"
#include "datahub/provider.hpp"
#include "datahub/store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

using namespace datahub;
using namespace datahub::source;
namespace fs = std::filesystem;

// ─── Fixture ──────────────────────────────────────────────────────────────────

namespace {

constexpr const char* HEADER = "symbol,name,date,open,high,low,close,volume,amount\n";

std::string row(const char* symbol, const char* name, const char* day, double close) {
    return std::string(symbol) + "," + name + "," + day + ","
         + std::to_string(close) + "," + std::to_string(close + 1) + ","
         + std::to_string(close - 1) + "," + std::to_string(close) + ",1000,"
         + std::to_string(close * 1000) + "\n";
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Records every request it receives; answers from a fixed CSV text.
class RecordingSource final : public BarSource {
public:
    RecordingSource(Exchange exchange, std::string csv)
        : exchange_(exchange), csv_(std::move(csv)) {}

    [[nodiscard]] Exchange exchange() const noexcept override { return exchange_; }

    [[nodiscard]] std::optional<std::vector<SymbolBatch>>
    fetch(const FetchRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        return CsvBarSource::parse_csv_string(exchange_, csv_, request);
    }

    [[nodiscard]] std::vector<FetchRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Exchange                  exchange_;
    std::string               csv_;
    mutable std::mutex        mutex_;
    std::vector<FetchRequest> requests_;
};

/// Lists bars but never answers a history request.
class ListingOnlySource final : public BarSource {
public:
    ListingOnlySource(Exchange exchange, std::string csv)
        : exchange_(exchange), csv_(std::move(csv)) {}

    [[nodiscard]] Exchange exchange() const noexcept override { return exchange_; }

    [[nodiscard]] std::optional<std::vector<SymbolBatch>>
    fetch(const FetchRequest& request) override {
        if (!request.date) {
            return std::nullopt;
        }
        return CsvBarSource::parse_csv_string(exchange_, csv_, request);
    }

private:
    Exchange    exchange_;
    std::string csv_;
};

class ScrapePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::set_level(log::Level::Off);
        static std::atomic<int> counter{0};
        root_ = fs::temp_directory_path()
              / ("datahub_pipeline_test_" + std::to_string(::getpid()) + "_"
                 + std::to_string(counter++));
        fs::create_directories(root_ / "raw");
        store_ = root_ / "data" / "stock.arrow";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_csv(const char* file, const std::string& body) {
        std::ofstream(root_ / "raw" / file, std::ios::trunc) << HEADER << body;
    }

    [[nodiscard]] SourceRegistry csv_sources() const {
        SourceRegistry registry;
        registry.add(std::make_unique<CsvBarSource>(Exchange::SSE, root_ / "raw"));
        registry.add(std::make_unique<CsvBarSource>(Exchange::SZSE, root_ / "raw"));
        return registry;
    }

    [[nodiscard]] ScrapeConfig config() const {
        ScrapeConfig cfg;
        cfg.output = store_;
        cfg.fetch.retry.max_attempts = 1;
        return cfg;
    }

    ScrapeReport scrape(ScrapeConfig cfg) const {
        const auto registry = csv_sources();
        return DataService(std::move(cfg), registry).scrape();
    }

    const SymbolRecord* stored(const char* exchange, const char* symbol) {
        loaded_ = store::load(store_);
        return loaded_.find(SymbolKey{.exchange = exchange, .symbol = symbol});
    }

    fs::path      root_;
    fs::path      store_;
    StoreSnapshot loaded_;
};

}  // anonymous namespace

// ─── Full pipeline ────────────────────────────────────────────────────────────

TEST_F(ScrapePipelineTest, FirstRunCreatesStoreFromAllExchanges) {
    write_csv("sse.csv", row("600000", "浦发银行", "20250102", 10)
                       + row("600000", "浦发银行", "20250103", 11));
    write_csv("szse.csv", row("000001", "平安银行", "20250103", 12)
                        + row("600000", "same code", "20250103", 99));

    const auto report = scrape(config());

    EXPECT_EQ(report.records_before, 0u);
    EXPECT_EQ(report.records_after, 3u);
    EXPECT_EQ(report.outcomes.size(), 3u);
    EXPECT_FALSE(report.partial());
    EXPECT_EQ(report.store_path, store_);

    const DataProvider provider(store::load(store_));
    EXPECT_EQ(provider.size(), 3u);
    EXPECT_EQ(provider.get_by_symbol(std::string("SSE"), "600000")->get().daily.size(), 2u);
    EXPECT_EQ(provider.get_by_symbol(std::string("SZSE"), "600000")->get().name, "same code");
    EXPECT_EQ(provider.latest_trading_date(), 20250103);
}

TEST_F(ScrapePipelineTest, SecondRunMergesAndLatestFetchWins) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 10) + row("600000", "PF", "20250102", 11));
    (void)scrape(config());

    write_csv("sse.csv", row("600000", "PF", "20250102", 12) + row("600000", "PF", "20250103", 13));
    const auto report = scrape(config());

    EXPECT_EQ(report.records_before, 1u);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].status, merge::OutcomeStatus::Updated);

    const auto* record = stored("SSE", "600000");
    ASSERT_NE(record, nullptr);
    ASSERT_EQ(record->daily.size(), 3u);
    EXPECT_DOUBLE_EQ(record->daily[0].close, 10);
    EXPECT_DOUBLE_EQ(record->daily[1].close, 12);
    EXPECT_DOUBLE_EQ(record->daily[2].close, 13);
}

TEST_F(ScrapePipelineTest, RetentionCapAppliesAcrossRuns) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 1) + row("600000", "PF", "20250102", 2)
                       + row("600000", "PF", "20250103", 3));
    auto cfg = config();
    cfg.max_records = 2;
    (void)scrape(cfg);

    const auto* record = stored("SSE", "600000");
    ASSERT_EQ(record->daily.size(), 2u);
    EXPECT_EQ(record->daily.front().date, 20250102);
}

TEST_F(ScrapePipelineTest, InvalidBarsAreReportedAndKeyedUpdatesIsolated) {
    write_csv("sse.csv", row("600000", "PF", "20250230", 1)
                       + row("600001", "OK", "20250102", 2));
    const auto report = scrape(config());

    EXPECT_TRUE(report.partial());
    EXPECT_EQ(report.records_after, 1u);
    EXPECT_NE(report.to_string().find("skipped SSE:600000"), std::string::npos);
    EXPECT_EQ(stored("SSE", "600000"), nullptr);
    EXPECT_NE(stored("SSE", "600001"), nullptr);
}

TEST_F(ScrapePipelineTest, MissingSourceFileIsAFetchFailureNotAnError) {
    write_csv("sse.csv", row("600000", "PF", "20250102", 1));
    const auto report = scrape(config());

    ASSERT_EQ(report.fetch_failures.size(), 1u);
    EXPECT_EQ(report.fetch_failures[0].exchange, Exchange::SZSE);
    EXPECT_TRUE(report.partial());
    EXPECT_EQ(report.records_after, 1u);
}

TEST_F(ScrapePipelineTest, ExchangeSelectionLimitsJobs) {
    write_csv("sse.csv", row("600000", "PF", "20250102", 1));
    write_csv("szse.csv", row("000001", "PA", "20250102", 1));
    auto cfg = config();
    cfg.exchanges = {Exchange::SZSE};
    const auto report = scrape(cfg);
    EXPECT_EQ(report.records_after, 1u);
    EXPECT_NE(stored("SZSE", "000001"), nullptr);
}

TEST_F(ScrapePipelineTest, SymbolLimitKeepsFirstSymbolsPerExchange) {
    write_csv("sse.csv", row("600000", "A", "20250102", 1) + row("600001", "B", "20250102", 1)
                       + row("600002", "C", "20250102", 1));
    auto cfg = config();
    cfg.exchanges = {Exchange::SSE};
    cfg.symbol_limit = 2;
    const auto report = scrape(cfg);
    EXPECT_EQ(report.records_after, 2u);
    EXPECT_EQ(stored("SSE", "600002"), nullptr);
}

// ─── Date-filtered runs and history backfill ──────────────────────────────────

TEST_F(ScrapePipelineTest, DatedRunBackfillsHistoryForNewKeys) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 1) + row("600000", "PF", "20250102", 2)
                       + row("600000", "PF", "20250103", 3));
    auto cfg = config();
    cfg.exchanges = {Exchange::SSE};
    cfg.date = 20250103;
    (void)scrape(cfg);

    const auto* record = stored("SSE", "600000");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->daily.size(), 3u);
}

TEST_F(ScrapePipelineTest, DatedIncrementalRunOnlyAddsThatDayForKnownKeys) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 1));
    (void)scrape(config());

    write_csv("sse.csv", row("600000", "PF", "20241231", 0) + row("600000", "PF", "20250102", 2)
                       + row("600000", "PF", "20250103", 3));
    auto cfg = config();
    cfg.exchanges = {Exchange::SSE};
    cfg.date = 20250103;
    (void)scrape(cfg);

    const auto* record = stored("SSE", "600000");
    ASSERT_EQ(record->daily.size(), 2u);
    EXPECT_EQ(record->daily[0].date, 20250101);
    EXPECT_EQ(record->daily[1].date, 20250103);
}

TEST_F(ScrapePipelineTest, ForceFullReplacesHistory) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 1) + row("600000", "PF", "20250102", 2));
    (void)scrape(config());

    write_csv("sse.csv", row("600000", "PF", "20250105", 5));
    auto cfg = config();
    cfg.force_full = true;
    const auto report = scrape(cfg);

    EXPECT_EQ(report.mode, merge::MergeMode::FullReplace);
    const auto* record = stored("SSE", "600000");
    ASSERT_EQ(record->daily.size(), 1u);
    EXPECT_EQ(record->daily[0].date, 20250105);
}

TEST_F(ScrapePipelineTest, ForceFullWithoutHistoryLeavesKeyUnchanged) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 1) + row("600000", "PF", "20250102", 2));
    (void)scrape(config());

    SourceRegistry registry;
    registry.add(std::make_unique<ListingOnlySource>(
        Exchange::SSE, std::string(HEADER) + row("600000", "PF", "20250103", 3)));
    auto cfg = config();
    cfg.exchanges = {Exchange::SSE};
    cfg.date = 20250103;
    cfg.force_full = true;
    const auto report = DataService(cfg, registry).scrape();

    EXPECT_EQ(report.fetch_failures.size(), 1u);
    EXPECT_TRUE(report.outcomes.empty());
    const auto* record = stored("SSE", "600000");
    ASSERT_EQ(record->daily.size(), 2u);
    EXPECT_EQ(record->daily.back().date, 20250102);
}

TEST_F(ScrapePipelineTest, SingleSymbolIncrementalRunAsksOnlyForNewerBars) {
    write_csv("sse.csv", row("600000", "PF", "20250101", 1) + row("600000", "PF", "20250102", 2));
    (void)scrape(config());

    SourceRegistry registry;
    auto owned = std::make_unique<RecordingSource>(
        Exchange::SSE, std::string(HEADER) + row("600000", "PF", "20250102", 20)
                                            + row("600000", "PF", "20250103", 3));
    const RecordingSource* source = owned.get();
    registry.add(std::move(owned));

    auto cfg = config();
    cfg.symbol = "600000";
    (void)DataService(cfg, registry).scrape();

    const auto requests = source->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].since, 20250102);

    const auto* record = stored("SSE", "600000");
    ASSERT_EQ(record->daily.size(), 3u);
    EXPECT_DOUBLE_EQ(record->daily[1].close, 2);
}

// ─── Store failures ───────────────────────────────────────────────────────────

TEST_F(ScrapePipelineTest, CorruptStoreAbortsRunAndIsLeftUntouched) {
    fs::create_directories(store_.parent_path());
    std::ofstream(store_, std::ios::binary) << "not a store";
    write_csv("sse.csv", row("600000", "PF", "20250102", 1));

    EXPECT_THROW((void)scrape(config()), SchemaError);
    EXPECT_EQ(read_file(store_), "not a store");
}

TEST_F(ScrapePipelineTest, MergeOptionsFollowConfig) {
    SourceRegistry registry;
    auto cfg = config();
    cfg.force_full = true;
    cfg.max_records = std::nullopt;
    const DataService service(cfg, registry);
    EXPECT_EQ(service.merge_options().mode, merge::MergeMode::FullReplace);
    EXPECT_FALSE(service.merge_options().max_records.has_value());
}
