#pragma once

/**
 * @file fsstore.hpp
 * @brief Main convenience header for FsStore
 *
 * @code
 * #include <fsstore/fsstore.hpp>
 *
 * int main() {
 *     std::error_code ec;
 *     FsStore::FsOps::createFolder("data", ec);
 *     FsStore::FsOps::createJsonFile("data/users.json", ec);
 *
 *     FsStore::JsonFileRepositoryImpl repo("data/users.json");
 *     FsStore::json user;
 *     user["name"] = "Mitali";
 *     std::string id = repo.append(user, ec);
 *     auto found = repo.findById(id, ec);
 * }
 * @endcode
 */

// =============================================================================
// Errors
// =============================================================================
#include "error/StoreError.hpp"

// =============================================================================
// Records / Repositories
// =============================================================================
#include "record/JsonRecord.hpp"
#include "repository/JsonFileRepositoryImpl.hpp"
#include "repository/RecordRepository.hpp"
#include "repository/StoreOptions.hpp"

// =============================================================================
// Filesystem operations
// =============================================================================
#include "fs/FsOps.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "util/IdGenerator.hpp"
#include "util/Log.hpp"
#include "util/jsonUtil.hpp"

/**
 * @namespace FsStore
 * @brief Root namespace for the FsStore library
 *
 * - StoreErrc: error taxonomy carried in std::error_code
 * - JsonFileRepositoryImpl: record store over one JSON array file
 * - FsOps: folder / file helpers
 */
namespace FsStore {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace FsStore
