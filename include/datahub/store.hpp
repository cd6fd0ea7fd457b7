#pragma once

/// @file include/datahub/store.hpp
/// @brief Persisted store: Arrow IPC file load / persist.
///
/// # Module: Store
///
/// ## Responsibility
/// Move a StoreSnapshot to and from its on-disk form. The file is an Arrow
/// IPC file with one row per record:
///
/// ```
/// exchange: utf8
/// symbol:   utf8
/// name:     utf8
/// daily:    list<item: struct<date: int32, open: float64, high: float64,
///                             low: float64, close: float64,
///                             volume: int64, amount: float64>>
/// metadata: datahub.schema_version = "2"
/// ```
///
/// The logical schema above is the compatibility contract with other
/// programs reading the file; Arrow owns the byte layout.
///
/// ## Errors
/// - `SchemaError`: version metadata missing or different, column shape
///   different, or records violating the snapshot invariants
/// - `IoError`: the file cannot be opened, read, written or replaced
///
/// ## Guarantees
/// - `persist` is atomic: the destination holds the old or the new
///   snapshot, never a mix
/// - `encode` is deterministic: equal snapshots give identical bytes

#include "datahub/snapshot.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace datahub::store {

/// Load the snapshot stored at `path`.
///
/// A missing file yields an empty snapshot (first run). Throws SchemaError
/// or IoError.
[[nodiscard]] StoreSnapshot load(const std::filesystem::path& path);

/// Atomically replace `path` with `snapshot`, creating parent directories
/// as needed. Throws IoError (StoreError if encoding fails); the previous
/// file is then unchanged.
void persist(const StoreSnapshot& snapshot, const std::filesystem::path& path);

/// Write an empty but valid store to `path`.
void create_empty(const std::filesystem::path& path);

/// Serialise `snapshot` to Arrow IPC file bytes.
[[nodiscard]] std::string encode(const StoreSnapshot& snapshot);

/// Parse Arrow IPC file bytes. Throws SchemaError.
[[nodiscard]] StoreSnapshot decode(std::string_view bytes);

}  // namespace datahub::store
