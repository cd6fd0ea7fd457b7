/// @file src/core/date.cpp
/// @brief YYYYMMDD validation and formatting.

#include "datahub/date.hpp"
#include "datahub/constants.hpp"

#include <fmt/format.h>

#include <cctype>
#include <ctime>

namespace datahub::date {

namespace {

bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/// Parse exactly `text.size()` ASCII digits.
std::optional<int> parse_digits(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // anonymous namespace

// ─── is_valid ─────────────────────────────────────────────────────────────────

bool is_valid(std::int32_t value) noexcept {
    if (value < constants::MIN_YYYYMMDD || value > constants::MAX_YYYYMMDD) {
        return false;
    }
    const int year  = value / 10000;
    const int month = (value / 100) % 100;
    const int day   = value % 100;

    if (month < 1 || month > 12) return false;
    if (day < 1)                 return false;

    return day <= days_in_month(year, month);
}

// ─── describe_invalid ─────────────────────────────────────────────────────────

std::string describe_invalid(std::int32_t value) {
    if (is_valid(value)) {
        return {};
    }
    if (value < constants::MIN_YYYYMMDD || value > constants::MAX_YYYYMMDD) {
        return fmt::format("date {} is not an 8-digit YYYYMMDD value", value);
    }
    return fmt::format("date {} is not a valid calendar day", value);
}

// ─── parse ────────────────────────────────────────────────────────────────────

std::optional<std::int32_t> parse(std::string_view text) noexcept {
    if (text.size() == 8) {
        auto v = parse_digits(text);
        if (!v) return std::nullopt;
        return static_cast<std::int32_t>(*v);
    }

    // YYYY-MM-DD
    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        auto y = parse_digits(text.substr(0, 4));
        auto m = parse_digits(text.substr(5, 2));
        auto d = parse_digits(text.substr(8, 2));
        if (!y || !m || !d) return std::nullopt;
        return static_cast<std::int32_t>(*y * 10000 + *m * 100 + *d);
    }

    return std::nullopt;
}

// ─── Formatting ───────────────────────────────────────────────────────────────

std::string to_iso(std::int32_t value) {
    if (value < constants::MIN_YYYYMMDD || value > constants::MAX_YYYYMMDD) {
        return fmt::format("{}", value);
    }
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       value / 10000, (value / 100) % 100, value % 100);
}

std::string to_version_tag(std::int32_t value) {
    return fmt::format("{}.{}.{}", value / 10000, (value / 100) % 100, value % 100);
}

std::int32_t today() noexcept {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return static_cast<std::int32_t>((local.tm_year + 1900) * 10000
                                     + (local.tm_mon + 1) * 100
                                     + local.tm_mday);
}

}  // namespace datahub::date
