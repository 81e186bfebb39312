#pragma once
/// @file FsOps.hpp
/// @brief Folder / file operations around the store file
/// @details Every function reports through ec using StoreErrc
///          (NotFound, AlreadyExists, IOError) and never throws.

#include <string>
#include <system_error>
#include <vector>

namespace FsStore::FsOps {

/// @brief Create a folder and any missing parents
/// @return false with AlreadyExists if the directory is already there
bool createFolder(const std::string& path, std::error_code& ec);

/// @brief Create a new store file holding the empty sentinel `{}`
/// @return false with AlreadyExists if the path exists, NotFound if the parent is missing
bool createJsonFile(const std::string& path, std::error_code& ec);

/// @brief Rename / move a folder
bool renameFolder(const std::string& oldPath, const std::string& newPath, std::error_code& ec);

/// @brief Rename a file inside folder
bool renameFileInFolder(const std::string& folder, const std::string& oldName,
                        const std::string& newName, std::error_code& ec);

/// @brief Names of the non-directory entries of folder, sorted
std::vector<std::string> listFilesInFolder(const std::string& folder, std::error_code& ec);

/// @brief Whole file content as text
std::string readFileInFolder(const std::string& folder, const std::string& name,
                             std::error_code& ec);

/// @brief Delete a folder and everything below it
bool deleteFolder(const std::string& path, std::error_code& ec);

/// @brief Delete one file inside folder
bool deleteFileInFolder(const std::string& folder, const std::string& name, std::error_code& ec);

} // namespace FsStore::FsOps
