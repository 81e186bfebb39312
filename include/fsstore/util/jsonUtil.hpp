#pragma once
/// @file jsonUtil.hpp
/// @brief JSON text <-> value helpers (nlohmann/json)

#include <nlohmann/json.hpp>

#include <string>
#include <system_error>

namespace FsStore {

/// @brief JSON value with insertion-ordered objects
/// @details Members keep the order they were read or added in, so rewriting a
///          file leaves untouched records byte-identical.
using json = nlohmann::ordered_json;

namespace util {

/// @brief Parse one complete JSON document
/// @details Strict RFC 8259 input: no comments, no single quotes, no trailing
///          content. Any value is accepted at the root. Empty or
///          whitespace-only text is a parse failure.
/// @param text Document text
/// @param[out] out Parsed value (null on failure)
/// @param ec StoreErrc::ParseError on failure
/// @param errors Optional parser diagnostics
/// @return true on success
bool parseJson(const std::string& text, json& out, std::error_code& ec,
               std::string* errors = nullptr);

/// @brief Serialize a value
/// @details Numbers are written in their shortest round-trip form.
/// @param indent Spaces per nesting level. 0 writes a single compact line.
std::string formatJson(const json& value, unsigned indent);

/// @brief Shallow merge: every member of patch overwrites the same key in base
/// @details Both must be objects; otherwise base is left untouched. Existing
///          keys keep their position, new keys are added at the end.
void mergeShallow(json& base, const json& patch);

/// @brief Structural equality that ignores object member order
bool sameContent(const json& a, const json& b);

} // namespace util
} // namespace FsStore
