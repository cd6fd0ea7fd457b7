#pragma once

/// @file include/datahub/log.hpp
/// @brief Levelled logging on top of {fmt}.
///
/// Lines go to stderr as `[datahub] LEVEL message`. The threshold is process
/// wide and defaults to `Info`; `DATAHUB_LOG_LEVEL` or `--log-level` change it.
///
/// ```cpp
/// log::warn("dropping bar {} for {}", bar.date, to_string(key));
/// ```

#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <utility>

namespace datahub::log {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

/// Set the minimum level that is written.
void set_level(Level level) noexcept;

/// Current threshold.
[[nodiscard]] Level level() noexcept;

/// True if a message at `lvl` would be written.
[[nodiscard]] bool enabled(Level lvl) noexcept;

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
[[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;

/// Apply `DATAHUB_LOG_LEVEL` if it is set and valid.
void init_from_env() noexcept;

/// Write one already-formatted line. Never throws.
void write(Level lvl, std::string_view message) noexcept;

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Debug)) {
        write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Info)) {
        write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Warn)) {
        write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Error)) {
        write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

}  // namespace datahub::log
