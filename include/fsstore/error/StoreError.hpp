#pragma once
/// @file StoreError.hpp
/// @brief Typed error taxonomy for store and filesystem operations

#include <system_error>

namespace FsStore {

/// @brief Error values reported by every store / filesystem operation
/// @details Carried in std::error_code with storeCategory().
///          Zero is reserved for success.
enum class StoreErrc {
    NotFound = 1,  ///< Target file, folder or record absent
    AlreadyExists, ///< Create on an existing path
    ParseError,    ///< Content is not valid JSON, or not a store shape
    IOError        ///< Any other read/write/rename/delete failure
};

/// @brief Category for StoreErrc
const std::error_category& storeCategory() noexcept;

/// @brief ADL hook used by std::error_code's converting constructor
std::error_code make_error_code(StoreErrc e) noexcept;

/// @brief Translate a platform (errno-style) error into the store taxonomy
/// @param ec Error from a POSIX call or std::filesystem
/// @return Equivalent StoreErrc code. Empty ec stays empty.
///         Codes already in storeCategory() and invalid_argument pass through.
std::error_code classify(const std::error_code& ec) noexcept;

/// @brief Shortcut for classify(std::error_code(err, std::generic_category()))
std::error_code classifyErrno(int err) noexcept;

} // namespace FsStore

namespace std {
template <> struct is_error_code_enum<FsStore::StoreErrc> : true_type {};
} // namespace std
