#pragma once
/// @file IdGenerator.hpp
/// @brief Record identifier generation

#include <string>

namespace FsStore {

/// @brief Source of record identifiers
/// @details Implementations must make collisions negligible; the store does
///          not check uniqueness.
class IdGenerator {
  public:
    virtual ~IdGenerator() = default;

    /// @brief Produce a fresh identifier
    virtual std::string next() = 0;
};

/// @brief Random (version 4) UUIDs from libuuid
/// @details Output is the lowercase 36-character canonical form,
///          e.g. "fc345e52-a208-46de-85f1-6584a6f467fc".
class UuidGenerator : public IdGenerator {
  public:
    std::string next() override;
};

namespace util {

/// @brief Check the canonical 8-4-4-4-12 lowercase/uppercase hex layout
bool isCanonicalUuid(const std::string& s);

} // namespace util

} // namespace FsStore
