#pragma once
/// @file Log.hpp
/// @brief Minimal tagged, leveled line logger

#include <ostream>
#include <string>

namespace FsStore::log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

/// @brief Lines below this level are dropped (default: Warn)
void setLevel(Level level);
Level level();

/// @brief Redirect output; nullptr restores std::cerr
/// @note The stream must outlive every later log call.
void setSink(std::ostream* sink);

/// @brief Parse "debug" / "info" / "warn" / "error" / "off" (case-insensitive)
/// @return false if name is not a level; out is left unchanged
bool parseLevel(const std::string& name, Level& out);

void debug(const std::string& tag, const std::string& msg);
void info(const std::string& tag, const std::string& msg);
void warn(const std::string& tag, const std::string& msg);
void error(const std::string& tag, const std::string& msg);

} // namespace FsStore::log
