/// @file src/store/store.cpp
/// @brief Store load / persist lifecycle around the Arrow codec.

#include "datahub/store.hpp"
#include "datahub/atomic_file.hpp"
#include "datahub/errors.hpp"
#include "datahub/log.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace datahub::store {

// ─── load ─────────────────────────────────────────────────────────────────────

StoreSnapshot load(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        log::info("no store at {}, starting from an empty snapshot", path.string());
        return StoreSnapshot{};
    }
    if (ec) {
        throw IoError(fmt::format("cannot stat store {}: {}", path.string(), ec.message()));
    }
    if (status.type() != std::filesystem::file_type::regular) {
        throw IoError(fmt::format("store path {} is not a regular file", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(fmt::format("cannot open store {}: {}", path.string(), std::strerror(errno)));
    }
    const std::string bytes((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IoError(fmt::format("reading store {} failed", path.string()));
    }

    StoreSnapshot snapshot;
    try {
        snapshot = decode(bytes);
    } catch (const SchemaError& e) {
        throw SchemaError(fmt::format("{}: {}", path.string(), e.what()));
    }

    log::info("loaded {} records ({} bars) from {}",
              snapshot.size(), snapshot.bar_count(), path.string());
    return snapshot;
}

// ─── persist ──────────────────────────────────────────────────────────────────

void persist(const StoreSnapshot& snapshot, const std::filesystem::path& path) {
    const std::string bytes = encode(snapshot);

    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw IoError(fmt::format("cannot create directory {}: {}",
                                      parent.string(), ec.message()));
        }
    }

    AtomicFileWriter out(path);
    out.write(bytes);
    out.commit();

    log::info("persisted {} records ({} bars, {} bytes) to {}",
              snapshot.size(), snapshot.bar_count(), bytes.size(), path.string());
}

void create_empty(const std::filesystem::path& path) {
    persist(StoreSnapshot{}, path);
}

}  // namespace datahub::store
