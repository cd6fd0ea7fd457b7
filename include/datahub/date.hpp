#pragma once

/// @file include/datahub/date.hpp
/// @brief YYYYMMDD trading-date helpers.
///
/// Dates travel through the system as `int32` values in YYYYMMDD form. These
/// helpers validate them as calendar dates and convert to and from the text
/// forms used on the command line and in source files.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace datahub::date {

/// True if `value` has eight digits and names a real calendar day
/// (Gregorian, leap years honoured).
[[nodiscard]] bool is_valid(std::int32_t value) noexcept;

/// Human-readable reason `value` is not a valid date, or empty if it is.
[[nodiscard]] std::string describe_invalid(std::int32_t value);

/// Parse "20250515" or "2025-05-15" into 20250515.
///
/// Only the shape is checked here (digits, separators, length). Calendar
/// validity is left to `is_valid` so that callers can report it separately.
///
/// # Returns
/// `nullopt` on any other shape, including surrounding garbage.
[[nodiscard]] std::optional<std::int32_t> parse(std::string_view text) noexcept;

/// Format 20250515 as "2025-05-15". Invalid values are printed as digits.
[[nodiscard]] std::string to_iso(std::int32_t value);

/// Format 20250515 as the release tag "2025.5.15" (no leading zeros).
[[nodiscard]] std::string to_version_tag(std::int32_t value);

/// Local calendar date of the host clock as YYYYMMDD.
[[nodiscard]] std::int32_t today() noexcept;

}  // namespace datahub::date
