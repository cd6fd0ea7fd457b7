#pragma once

/// @file include/datahub/csv_source.hpp
/// @brief Offline BarSource reading one CSV file per exchange.
///
/// ## Expected CSV Format
/// ```
/// symbol,name,date,open,high,low,close,volume,amount
/// 600000,浦发银行,20250514,10.01,10.20,9.95,10.11,35120000,355400000.0
/// 600000,浦发银行,2025-05-15,10.11,10.30,10.05,10.25,30010000,308100000.0
/// ```
/// The first non-comment line is the header and is skipped. Lines starting
/// with `#` and blank lines are ignored. Dates may be `YYYYMMDD` or
/// `YYYY-MM-DD`.
///
/// ## Guarantees
/// - Malformed rows are skipped with a warning, never fatal
/// - Calendar validity of dates is NOT checked here (the merge engine does it)
/// - An unreadable file yields `nullopt` from `fetch`
/// - Safe for concurrent `fetch` calls (each call re-reads the file)

#include "datahub/source.hpp"
#include "datahub/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace datahub::source {

class CsvBarSource final : public BarSource {
public:
    /// Read `<input_dir>/<exchange>.csv`, e.g. `data/raw/sse.csv`.
    CsvBarSource(Exchange exchange, const std::filesystem::path& input_dir);

    [[nodiscard]] Exchange exchange() const noexcept override { return exchange_; }

    [[nodiscard]] std::optional<std::vector<SymbolBatch>>
    fetch(const FetchRequest& request) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// File name used for `exchange`: lower-case code plus ".csv".
    [[nodiscard]] static std::string file_name(Exchange exchange);

    /// Parse CSV content into per-symbol batches for `exchange`, keeping only
    /// rows that match `request`. Batches keep first-appearance order.
    [[nodiscard]] static std::vector<SymbolBatch>
    parse_csv_string(Exchange exchange,
                     const std::string& csv_content,
                     const FetchRequest& request);

private:
    struct Row {
        std::string symbol;
        std::string name;
        Bar         bar;
    };

    /// Parse one data line. `nullopt` if the row is malformed.
    [[nodiscard]] static std::optional<Row> parse_row(const std::string& line);

    [[nodiscard]] static bool matches(const Row& row, const FetchRequest& request) noexcept;

    Exchange              exchange_;
    std::filesystem::path path_;
};

}  // namespace datahub::source
