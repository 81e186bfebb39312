#pragma once
/// @file RecordRepository.hpp
/// @brief Record repository interface

#include "../record/JsonRecord.hpp"

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace FsStore {

/// @brief CRUD access to records keyed by a generated identifier
/// @details Every method reports failure through ec (see StoreErrc) and never throws
///          for I/O or content problems.
class RecordRepository {
  public:
    virtual ~RecordRepository() = default;

    // =========================================================================
    // CRUD Operations
    // =========================================================================

    /// @brief Append a new record with a freshly generated identifier
    /// @param data Object payload; a caller-supplied identifier field is overwritten
    /// @param ec Error code set on failure
    /// @return The assigned identifier, or "" on failure
    virtual std::string append(const json& data, std::error_code& ec) = 0;

    /// @brief Find the first record with the given identifier
    /// @param id Identifier to match exactly
    /// @param ec NotFound if absent, ParseError / IOError on read failure
    /// @return Copy of the record or nullptr
    virtual std::unique_ptr<JsonRecord> findById(const std::string& id, std::error_code& ec) = 0;

    /// @brief Shallow-merge newData into every record with the given identifier
    /// @return true on success, including when nothing matched
    virtual bool updateById(const std::string& id, const json& newData,
                            std::error_code& ec) = 0;

    /// @brief Remove every record with the given identifier
    /// @return true on success, including when nothing matched
    virtual bool deleteById(const std::string& id, std::error_code& ec) = 0;

    /// @brief All records in file order
    virtual std::vector<std::unique_ptr<JsonRecord>> findAll(std::error_code& ec) = 0;

    /// @brief Remove every record
    virtual bool deleteAll(std::error_code& ec) = 0;

    /// @brief Number of records
    virtual size_t count(std::error_code& ec) = 0;

    /// @brief Whether a record with the identifier exists (absence is not an error)
    virtual bool existsById(const std::string& id, std::error_code& ec) = 0;
};

} // namespace FsStore
