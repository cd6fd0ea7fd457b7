/// @file src/main.cpp
/// @brief datahub CLI entry point.
///
/// Usage:
///   datahub scrape --exchange sse|szse|all [options]   Fetch, merge and persist
///   datahub explore [--store PATH] [--symbol S]         Inspect a store
///   datahub latest [--store PATH]                       Latest trading date
///   datahub init [--output PATH]                        Write an empty store
///   datahub --help                                      Print usage

#include "datahub/constants.hpp"
#include "datahub/csv_source.hpp"
#include "datahub/date.hpp"
#include "datahub/errors.hpp"
#include "datahub/log.hpp"
#include "datahub/provider.hpp"
#include "datahub/service.hpp"
#include "datahub/store.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace datahub;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  datahub [--log-level LEVEL] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  scrape   --exchange sse|szse|all  Fetch daily bars and merge them into the store\n"
        "           [--date YYYY-MM-DD]      Only bars of this trading day\n"
        "           [--symbol S]             Only this symbol\n"
        "           [--force-full]           Replace stored history instead of merging\n"
        "           [--max-records N]        Bars kept per symbol (0 = unlimited, default {})\n"
        "           [--output PATH]          Store file (default {})\n"
        "           [--input DIR]            Directory with <exchange>.csv (default {})\n"
        "           [--limit N]              Only the first N symbols per exchange\n"
        "           [--concurrency N]        Parallel fetches (default {})\n"
        "           [--retries N]            Attempts per fetch (default {})\n"
        "  explore  [--store PATH] [--symbol S] [--exchange E] [--limit N]\n"
        "  latest   [--store PATH]           Print latest trading date and version tag\n"
        "  init     [--output PATH]          Write an empty store\n"
        "\n"
        "LEVEL is one of debug, info, warn, error, off (env: DATAHUB_LOG_LEVEL).\n",
        constants::DEFAULT_MAX_RECORDS, constants::DEFAULT_STORE_PATH,
        constants::DEFAULT_INPUT_DIR, constants::DEFAULT_FETCH_CONCURRENCY,
        constants::DEFAULT_FETCH_ATTEMPTS);
}

/// Cursor over argv that reports missing or malformed values.
class Args {
public:
    Args(int argc, char** argv, int start)
        : argv_(argv + start, argv + argc) {}

    [[nodiscard]] bool done() const noexcept { return pos_ >= argv_.size(); }

    [[nodiscard]] std::string_view next() { return argv_[pos_++]; }

    /// Value following `flag`, or nullopt (with an error) if absent.
    [[nodiscard]] std::optional<std::string> value(std::string_view flag) {
        if (done()) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        return std::string(next());
    }

    [[nodiscard]] std::optional<std::size_t> count(std::string_view flag) {
        auto text = value(flag);
        if (!text) {
            return std::nullopt;
        }
        std::size_t n = 0;
        const char* first = text->data();
        const char* last  = first + text->size();
        auto [ptr, ec] = std::from_chars(first, last, n);
        if (ec != std::errc{} || ptr != last) {
            fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n",
                       flag, *text);
            return std::nullopt;
        }
        return n;
    }

private:
    std::vector<std::string_view> argv_;
    std::size_t                   pos_ = 0;
};

[[nodiscard]] std::optional<std::vector<source::Exchange>>
parse_exchange_arg(std::string_view text) {
    if (text == "all" || text == "ALL") {
        const auto all = source::all_exchanges();
        return std::vector<source::Exchange>(all.begin(), all.end());
    }
    if (auto exchange = source::parse_exchange(text)) {
        return std::vector<source::Exchange>{*exchange};
    }
    fmt::print(stderr, "Error: unknown exchange '{}' (expected sse, szse or all)\n", text);
    return std::nullopt;
}

// ─── scrape ───────────────────────────────────────────────────────────────────

int run_scrape(Args& args) {
    ScrapeConfig config;
    config.fetch.max_concurrency    = constants::DEFAULT_FETCH_CONCURRENCY;
    config.fetch.retry.max_attempts = constants::DEFAULT_FETCH_ATTEMPTS;
    std::filesystem::path input_dir{constants::DEFAULT_INPUT_DIR};
    bool exchange_given = false;

    while (!args.done()) {
        const auto flag = args.next();
        if (flag == "--exchange") {
            auto text = args.value(flag);
            if (!text) return 1;
            auto exchanges = parse_exchange_arg(*text);
            if (!exchanges) return 1;
            config.exchanges = std::move(*exchanges);
            exchange_given = true;
        } else if (flag == "--date") {
            auto text = args.value(flag);
            if (!text) return 1;
            auto parsed = date::parse(*text);
            if (!parsed || !date::is_valid(*parsed)) {
                fmt::print(stderr, "Error: invalid --date '{}' (expected YYYY-MM-DD)\n", *text);
                return 1;
            }
            config.date = *parsed;
        } else if (flag == "--symbol") {
            auto text = args.value(flag);
            if (!text) return 1;
            config.symbol = std::move(*text);
        } else if (flag == "--force-full") {
            config.force_full = true;
        } else if (flag == "--max-records") {
            auto n = args.count(flag);
            if (!n) return 1;
            config.max_records = *n == 0 ? std::nullopt : std::optional<std::size_t>(*n);
        } else if (flag == "--output") {
            auto text = args.value(flag);
            if (!text) return 1;
            config.output = *text;
        } else if (flag == "--input") {
            auto text = args.value(flag);
            if (!text) return 1;
            input_dir = *text;
        } else if (flag == "--limit") {
            auto n = args.count(flag);
            if (!n) return 1;
            config.symbol_limit = *n;
        } else if (flag == "--concurrency") {
            auto n = args.count(flag);
            if (!n) return 1;
            config.fetch.max_concurrency = *n;
        } else if (flag == "--retries") {
            auto n = args.count(flag);
            if (!n) return 1;
            config.fetch.retry.max_attempts = *n;
        } else {
            fmt::print(stderr, "Error: unknown scrape option '{}'\n", flag);
            return 1;
        }
    }

    if (!exchange_given) {
        fmt::print(stderr, "Error: scrape requires --exchange sse|szse|all\n");
        return 1;
    }

    source::SourceRegistry sources;
    for (auto exchange : config.exchanges) {
        sources.add(std::make_unique<source::CsvBarSource>(exchange, input_dir));
    }

    DataService service(std::move(config), sources);
    const auto report = service.scrape();

    fmt::print("{}\n", report.to_string());
    return 0;
}

// ─── explore ──────────────────────────────────────────────────────────────────

void print_record(const SymbolRecord& record, std::size_t limit) {
    fmt::print("{} {} ({} bars)\n", to_string(record.key), record.name, record.daily.size());
    if (record.daily.empty()) {
        return;
    }
    fmt::print("  {:<10} {:>10} {:>10} {:>10} {:>10} {:>14} {:>16}\n",
               "date", "open", "high", "low", "close", "volume", "amount");
    const std::size_t shown = std::min(limit, record.daily.size());
    for (auto it = record.daily.end() - static_cast<std::ptrdiff_t>(shown);
         it != record.daily.end(); ++it) {
        fmt::print("  {:<10} {:>10.2f} {:>10.2f} {:>10.2f} {:>10.2f} {:>14} {:>16.2f}\n",
                   date::to_iso(it->date), it->open, it->high, it->low, it->close,
                   it->volume, it->amount);
    }
}

int run_explore(Args& args) {
    std::filesystem::path store_path{constants::DEFAULT_STORE_PATH};
    std::optional<std::string> symbol;
    std::optional<std::string> exchange;
    std::size_t limit = constants::DEFAULT_EXPLORE_LIMIT;

    while (!args.done()) {
        const auto flag = args.next();
        if (flag == "--store") {
            auto text = args.value(flag);
            if (!text) return 1;
            store_path = *text;
        } else if (flag == "--symbol") {
            symbol = args.value(flag);
            if (!symbol) return 1;
        } else if (flag == "--exchange") {
            auto text = args.value(flag);
            if (!text) return 1;
            auto parsed = source::parse_exchange(*text);
            if (!parsed) {
                fmt::print(stderr, "Error: unknown exchange '{}'\n", *text);
                return 1;
            }
            exchange = std::string(source::to_string(*parsed));
        } else if (flag == "--limit") {
            auto n = args.count(flag);
            if (!n) return 1;
            limit = *n;
        } else {
            fmt::print(stderr, "Error: unknown explore option '{}'\n", flag);
            return 1;
        }
    }

    const DataProvider provider(store::load(store_path));
    fmt::print("{}: {} records", store_path.string(), provider.size());
    if (auto latest = provider.latest_trading_date()) {
        fmt::print(", latest trading date {}", date::to_iso(*latest));
    }
    fmt::print("\n");

    if (symbol) {
        const auto record = provider.get_by_symbol(exchange, *symbol);
        if (!record) {
            fmt::print(stderr, "Error: symbol '{}' not found\n", *symbol);
            return 1;
        }
        print_record(record->get(), limit);
        return 0;
    }

    const auto records = exchange ? provider.list_by_exchange(*exchange) : provider.list_all();
    for (const SymbolRecord& record : records) {
        fmt::print("{} {} {} bars", to_string(record.key), record.name, record.daily.size());
        if (!record.daily.empty()) {
            fmt::print(", last {} close {:.2f}", date::to_iso(record.daily.back().date),
                       record.daily.back().close);
        }
        fmt::print("\n");
    }
    return 0;
}

// ─── latest / init ────────────────────────────────────────────────────────────

int run_latest(Args& args) {
    std::filesystem::path store_path{constants::DEFAULT_STORE_PATH};
    while (!args.done()) {
        const auto flag = args.next();
        if (flag == "--store") {
            auto text = args.value(flag);
            if (!text) return 1;
            store_path = *text;
        } else {
            fmt::print(stderr, "Error: unknown latest option '{}'\n", flag);
            return 1;
        }
    }

    const auto snapshot = store::load(store_path);
    const auto latest = snapshot.latest_date();
    if (!latest) {
        fmt::print(stderr, "Error: store '{}' holds no bars\n", store_path.string());
        return 1;
    }
    fmt::print("{} {}\n", date::to_iso(*latest), date::to_version_tag(*latest));
    return 0;
}

int run_init(Args& args) {
    std::filesystem::path output{constants::DEFAULT_STORE_PATH};
    while (!args.done()) {
        const auto flag = args.next();
        if (flag == "--output") {
            auto text = args.value(flag);
            if (!text) return 1;
            output = *text;
        } else {
            fmt::print(stderr, "Error: unknown init option '{}'\n", flag);
            return 1;
        }
    }
    store::create_empty(output);
    fmt::print("Initialised empty store at '{}'\n", output.string());
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    datahub::log::init_from_env();

    int i = 1;
    while (i < argc) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg != "--log-level") {
            break;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: --log-level requires a value\n");
            return 1;
        }
        auto level = datahub::log::parse_level(argv[i + 1]);
        if (!level) {
            fmt::print(stderr, "Error: unknown log level '{}'\n", argv[i + 1]);
            return 1;
        }
        datahub::log::set_level(*level);
        i += 2;
    }

    if (i >= argc) {
        print_usage();
        return 1;
    }

    const std::string_view command = argv[i];
    Args args(argc, argv, i + 1);

    try {
        if (command == "scrape")  return run_scrape(args);
        if (command == "explore") return run_explore(args);
        if (command == "latest")  return run_latest(args);
        if (command == "init")    return run_init(args);
    } catch (const datahub::StoreError& e) {
        datahub::log::error("{}", e.what());
        return 1;
    }

    fmt::print(stderr, "Error: unknown command '{}'\n", command);
    print_usage();
    return 1;
}
