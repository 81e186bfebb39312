#pragma once
/// @file fdIo.hpp
/// @brief Whole-file read / write helpers over a raw file descriptor

#include <string>
#include <system_error>

namespace FsStore::util {

/// @brief Read from offset 0 to EOF
/// @param fd Open, readable descriptor
/// @param[out] out File content
/// @param ec Raw errno-based error on failure
/// @return true on success
bool readAll(int fd, std::string& out, std::error_code& ec);

/// @brief write(2) loop that survives short writes and EINTR
bool writeAll(int fd, const std::string& data, std::error_code& ec);

/// @brief Replace the whole file content with data
/// @details ftruncate(0) + lseek(0) + writeAll, optionally followed by fsync.
///          The old content is gone once the truncate succeeds.
/// @param sync Call fsync after the write
bool replaceContent(int fd, const std::string& data, bool sync, std::error_code& ec);

} // namespace FsStore::util
