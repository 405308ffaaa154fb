#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/fingerprint.h — Cache keys for persisted-query requests
// ═══════════════════════════════════════════════════════════════════
//
//  fingerprint(id, variables) = hex(SHA-256(id + canonical(variables)))
//
//  Object keys serialize in sorted order, so variable sets that differ
//  only in key order map to the same fingerprint.
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pqcache {

// Empty for absent or non-object variables. Throws SerializationError
// when the object cannot be written as JSON (e.g. invalid UTF-8).
std::string canonicalVariables(const std::optional<nlohmann::json>& variables);

// 64 lowercase hex characters.
std::string fingerprint(const std::string& persistHash,
                        const std::optional<nlohmann::json>& variables = std::nullopt);

} // namespace pqcache
