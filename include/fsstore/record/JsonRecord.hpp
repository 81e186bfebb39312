#pragma once
/// @file JsonRecord.hpp
/// @brief One record of the store: a JSON object with a reserved identifier field

#include "../util/jsonUtil.hpp"

#include <memory>
#include <string>

namespace FsStore {

/// @brief Default reserved identifier key
inline constexpr const char* kDefaultIdField = "uuid";

/// @brief JSON object record
/// @details Members keep their insertion order, but two records are equal when
///          they hold the same keys with equal values in any order. The identifier
///          lives in the record itself under idField().
class JsonRecord {
  public:
    /// @brief Empty object record with the default identifier key
    JsonRecord();

    /// @brief Wrap an existing value
    /// @param fields Must be an object (a null value becomes an empty object)
    /// @param idField Reserved identifier key
    explicit JsonRecord(json fields, std::string idField = kDefaultIdField);

    /// @brief Identifier value, or "" if absent or not a string
    std::string id() const;

    const char* typeName() const { return "JsonRecord"; }

    const std::string& idField() const noexcept { return idField_; }

    const json& fields() const noexcept { return fields_; }
    json& fields() noexcept { return fields_; }

    bool has(const std::string& key) const { return fields_.contains(key); }

    /// @brief Member value, or a null value if absent
    const json& get(const std::string& key) const;

    /// @brief Overwrite / add every member of patch (new values win)
    /// @note The identifier field is not protected; a patch carrying it replaces it.
    void merge(const json& patch);

    std::unique_ptr<JsonRecord> clone() const { return std::make_unique<JsonRecord>(*this); }

    bool operator==(const JsonRecord& other) const {
        return util::sameContent(fields_, other.fields_);
    }
    bool operator!=(const JsonRecord& other) const { return !(*this == other); }

  private:
    json fields_;
    std::string idField_;
};

} // namespace FsStore
