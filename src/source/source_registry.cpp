/// @file src/source/source_registry.cpp
/// @brief Exchange identifiers, request description and adapter dispatch.

#include "datahub/source.hpp"
#include "datahub/date.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace datahub::source {

namespace {

constexpr std::array<Exchange, 2> ALL_EXCHANGES = {Exchange::SSE, Exchange::SZSE};

}  // anonymous namespace

// ─── Exchange ─────────────────────────────────────────────────────────────────

std::string_view to_string(Exchange exchange) noexcept {
    switch (exchange) {
        case Exchange::SSE:  return "SSE";
        case Exchange::SZSE: return "SZSE";
    }
    return "UNKNOWN";
}

std::optional<Exchange> parse_exchange(std::string_view text) noexcept {
    for (Exchange e : ALL_EXCHANGES) {
        const std::string_view code = to_string(e);
        if (code.size() != text.size()) {
            continue;
        }
        const bool same = std::equal(code.begin(), code.end(), text.begin(),
            [](char a, char b) {
                return std::toupper(static_cast<unsigned char>(a)) ==
                       std::toupper(static_cast<unsigned char>(b));
            });
        if (same) {
            return e;
        }
    }
    return std::nullopt;
}

std::span<const Exchange> all_exchanges() noexcept {
    return ALL_EXCHANGES;
}

// ─── describe ─────────────────────────────────────────────────────────────────

std::string describe(const FetchRequest& request) {
    std::string out = request.symbol ? fmt::format("symbol={}", *request.symbol)
                                     : std::string("all symbols");
    if (request.date) {
        out += fmt::format(" date={}", date::to_iso(*request.date));
    }
    if (request.since) {
        out += fmt::format(" since={}", date::to_iso(*request.since));
    }
    return out;
}

// ─── SourceRegistry ───────────────────────────────────────────────────────────

void SourceRegistry::add(std::unique_ptr<BarSource> source) {
    if (!source) {
        return;
    }
    const Exchange exchange = source->exchange();
    auto it = std::find_if(sources_.begin(), sources_.end(),
        [exchange](const auto& s) { return s->exchange() == exchange; });
    if (it != sources_.end()) {
        *it = std::move(source);
    } else {
        sources_.push_back(std::move(source));
    }
}

BarSource* SourceRegistry::find(Exchange exchange) const noexcept {
    for (const auto& s : sources_) {
        if (s->exchange() == exchange) {
            return s.get();
        }
    }
    return nullptr;
}

std::vector<Exchange> SourceRegistry::exchanges() const {
    std::vector<Exchange> out;
    for (Exchange e : ALL_EXCHANGES) {
        if (find(e) != nullptr) {
            out.push_back(e);
        }
    }
    return out;
}

}  // namespace datahub::source
