/// @file src/source/csv_source.cpp
/// @brief CsvBarSource: per-exchange CSV files as an offline bar source.

#include "datahub/csv_source.hpp"
#include "datahub/date.hpp"
#include "datahub/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <utility>

namespace datahub::source {

namespace {

constexpr std::size_t FIELD_COUNT = 9;

std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

std::optional<double> parse_double(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const double v = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::int64_t> parse_int64(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const long long v = std::stoll(token, &pos);
        if (pos != token.size()) {
            // Some feeds print volumes as "35120000.0".
            auto d = parse_double(token);
            if (!d || *d != std::floor(*d) || std::fabs(*d) >= 9.2e18) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(*d);
        }
        return static_cast<std::int64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

CsvBarSource::CsvBarSource(Exchange exchange, const std::filesystem::path& input_dir)
    : exchange_(exchange)
    , path_(input_dir / file_name(exchange))
{}

std::string CsvBarSource::file_name(Exchange exchange) {
    return lower(to_string(exchange)) + ".csv";
}

// ─── CsvBarSource::parse_row ──────────────────────────────────────────────────

std::optional<CsvBarSource::Row> CsvBarSource::parse_row(const std::string& line) {
    std::istringstream ss(line);
    std::string token;
    std::vector<std::string> fields;
    fields.reserve(FIELD_COUNT);

    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    // A trailing comma leaves an empty last field that getline drops.
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    if (fields.size() != FIELD_COUNT || fields[0].empty()) {
        return std::nullopt;
    }

    const auto d      = date::parse(fields[2]);
    const auto open   = parse_double(fields[3]);
    const auto high   = parse_double(fields[4]);
    const auto low    = parse_double(fields[5]);
    const auto close  = parse_double(fields[6]);
    const auto volume = parse_int64(fields[7]);
    const auto amount = parse_double(fields[8]);
    if (!d || !open || !high || !low || !close || !volume || !amount) {
        return std::nullopt;
    }

    return Row{
        .symbol = fields[0],
        .name   = fields[1],
        .bar    = Bar{
            .date   = *d,
            .open   = *open,
            .high   = *high,
            .low    = *low,
            .close  = *close,
            .volume = *volume,
            .amount = *amount,
        },
    };
}

// ─── CsvBarSource::matches ────────────────────────────────────────────────────

bool CsvBarSource::matches(const Row& row, const FetchRequest& request) noexcept {
    if (request.symbol && row.symbol != *request.symbol) return false;
    if (request.date   && row.bar.date != *request.date) return false;
    if (request.since  && row.bar.date <= *request.since) return false;
    return true;
}

// ─── CsvBarSource::parse_csv_string ───────────────────────────────────────────

std::vector<SymbolBatch>
CsvBarSource::parse_csv_string(Exchange exchange,
                               const std::string& csv_content,
                               const FetchRequest& request) {
    std::vector<SymbolBatch> batches;
    std::map<std::string, std::size_t> slot_of;  // symbol → index in batches

    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        auto row = parse_row(line);
        if (!row) {
            log::warn("{} csv line {}: malformed row skipped: {}",
                      to_string(exchange), line_no, line);
            continue;
        }
        if (!matches(*row, request)) {
            continue;
        }

        auto [it, inserted] = slot_of.try_emplace(row->symbol, batches.size());
        if (inserted) {
            batches.push_back(SymbolBatch{
                .key = SymbolKey{
                    .exchange = std::string(to_string(exchange)),
                    .symbol   = row->symbol,
                },
            });
        }
        SymbolBatch& batch = batches[it->second];
        if (!row->name.empty()) {
            batch.name = std::move(row->name);
        }
        batch.bars.push_back(row->bar);
    }

    return batches;
}

// ─── CsvBarSource::fetch ──────────────────────────────────────────────────────

std::optional<std::vector<SymbolBatch>>
CsvBarSource::fetch(const FetchRequest& request) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        log::warn("{}: cannot open source file {}", to_string(exchange_), path_.string());
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        log::warn("{}: reading {} failed", to_string(exchange_), path_.string());
        return std::nullopt;
    }

    auto batches = parse_csv_string(exchange_, contents.str(), request);
    log::debug("{} {}: {} symbol batch(es) from {}",
               to_string(exchange_), describe(request), batches.size(), path_.string());
    return batches;
}

}  // namespace datahub::source
