#pragma once
/// @file StoreOptions.hpp
/// @brief Per-repository configuration

#include "../record/JsonRecord.hpp"

#include <string>

namespace FsStore {

/// @brief Inter-operation locking
enum class LockPolicy {
    None,    ///< No locking. Concurrent read-modify-write cycles can lose updates.
    Advisory ///< fcntl whole-file lock held for the duration of each operation
};

struct StoreOptions {
    /// Reserved identifier key written by append() and matched by the *ById calls
    std::string idField = kDefaultIdField;
    /// Spaces per nesting level when writing the file (0 = compact)
    unsigned indent = 2;
    LockPolicy lockPolicy = LockPolicy::None;
    /// fsync after each whole-file write
    bool syncOnWrite = true;
};

} // namespace FsStore
