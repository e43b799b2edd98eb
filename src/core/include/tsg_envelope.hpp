#pragma once

/**
 * @file tsg_envelope.hpp
 * @brief "tsg-span/1" envelope helpers: serialization, text hygiene,
 *        bounded structure checks
 *
 * Nothing here recurses over untrusted input. Depth is measured by a
 * byte scan before parsing and reference graphs are checked iteratively.
 */

#include "tsg_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace tsg {

constexpr const char* kEnvelopeProtocol = "tsg-span/1";

/// Canonical envelope for a record (keys sorted, identity encoding).
nlohmann::json to_envelope(const TrafficRecord& rec);

/// Compact, byte-stable dump of to_envelope().
std::string serialize_envelope(const TrafficRecord& rec);

/// Maximum array/object nesting depth of a JSON text, ignoring brackets
/// inside strings. Stops counting once @p stop_after is exceeded.
size_t scan_nesting_depth(std::string_view raw, size_t stop_after = SIZE_MAX);

bool is_valid_utf8(std::string_view s) noexcept;

/// Identifier charset is [A-Za-z0-9._:@-], length 1..max_len.
bool is_valid_identifier(std::string_view s, size_t max_len) noexcept;

/// Strip C0 controls (except \t \n \r), DEL, BOM, zero-width and bidi
/// control code points. Input must be valid UTF-8. Returns true if changed.
bool sanitize_text(std::string& text);

/// Truncate to at most @p max_bytes without splitting a code point.
/// Returns true if anything was cut.
bool truncate_utf8(std::string& text, size_t max_bytes);

/**
 * @brief Check every {"$ref": "#/..."} object in @p root
 *
 * Throws MalformedInputError (STRUCTURE) for dangling pointers, chains
 * longer than @p max_hops, more than @p max_refs references, and any set
 * of references whose expansion would never terminate (direct cycles and
 * references into their own ancestors alike).
 */
void check_references(const nlohmann::json& root, size_t max_hops, size_t max_refs = 1024);

} // namespace tsg
