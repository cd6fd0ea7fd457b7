#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

/// @file include/datahub/constants.hpp
/// @brief Store format and run defaults for datahub.

namespace datahub::constants {

// ─── Store Format ─────────────────────────────────────────────────────────────

/// Schema metadata key written into every store file.
static constexpr std::string_view SCHEMA_VERSION_KEY = "datahub.schema_version";

/// Current logical schema version. Bump on any column or type change.
static constexpr std::string_view SCHEMA_VERSION = "2";

/// Default store location used by the CLI.
static constexpr std::string_view DEFAULT_STORE_PATH = "data/stock.arrow";

/// Default directory the offline CSV source reads from.
static constexpr std::string_view DEFAULT_INPUT_DIR = "data/raw";

// ─── Run Defaults ─────────────────────────────────────────────────────────────

/// Default retention cap: most recent bars kept per symbol.
static constexpr std::size_t DEFAULT_MAX_RECORDS = 200;

/// Default number of symbols shown by `explore`, and bars per symbol.
static constexpr std::size_t DEFAULT_EXPLORE_LIMIT = 10;

/// Default size of the fetch worker pool.
static constexpr std::size_t DEFAULT_FETCH_CONCURRENCY = 4;

/// Default number of fetch attempts per request (first try included).
static constexpr std::size_t DEFAULT_FETCH_ATTEMPTS = 3;

// ─── Calendar Bounds ──────────────────────────────────────────────────────────

/// Smallest and largest YYYYMMDD values.
static constexpr std::int32_t MIN_YYYYMMDD = 10000101;
static constexpr std::int32_t MAX_YYYYMMDD = 99991231;

}  // namespace datahub::constants
