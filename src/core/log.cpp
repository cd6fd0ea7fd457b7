/// @file src/core/log.cpp
/// @brief Process-wide log threshold and the stderr sink.

#include "datahub/log.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

namespace datahub::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::string_view label(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Off:   break;
    }
    return "";
}

}  // anonymous namespace

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) noexcept {
    const Level threshold = level();
    return threshold != Level::Off && lvl >= threshold;
}

std::optional<Level> parse_level(std::string_view text) noexcept {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug")                     return Level::Debug;
    if (lower == "info")                      return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error")                     return Level::Error;
    if (lower == "off" || lower == "none")    return Level::Off;
    return std::nullopt;
}

void init_from_env() noexcept {
    const char* value = std::getenv("DATAHUB_LOG_LEVEL");
    if (value == nullptr) {
        return;
    }
    if (auto lvl = parse_level(value)) {
        set_level(*lvl);
    }
}

void write(Level lvl, std::string_view message) noexcept {
    if (lvl == Level::Off) {
        return;
    }
    try {
        fmt::print(stderr, "[datahub] {} {}\n", label(lvl), message);
    } catch (const std::exception&) {
        // stderr is gone; nowhere left to report to.
    }
}

}  // namespace datahub::log
