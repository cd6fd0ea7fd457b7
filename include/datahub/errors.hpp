#pragma once

/// @file include/datahub/errors.hpp
/// @brief Store-level failures.
///
/// Only failures that make a whole run invalid are exceptions. Per-bar and
/// per-key problems are reported as data in `merge::MergeResult`.

#include <stdexcept>
#include <string>

namespace datahub {

/// Base of every failure raised by the store layer.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The file on disk is not a store this build can read: wrong schema
/// version, wrong column shape, or records that break the store invariants.
class SchemaError final : public StoreError {
public:
    using StoreError::StoreError;
};

/// Opening, reading, writing, syncing or renaming a file failed.
/// The previously persisted store is still intact when this is raised.
class IoError final : public StoreError {
public:
    using StoreError::StoreError;
};

}  // namespace datahub
