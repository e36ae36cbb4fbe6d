#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON for reports, cache entries and cache keys
 *
 * Keys are emitted in lexicographic order without whitespace. Floating point
 * values are rejected so that a document has exactly one byte form.
 */

#include "ecv/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace ecv::canonical {

/**
 * Serialize to canonical form.
 * @return Error "FloatingPointNotAllowed" naming the JSON pointer of the first
 *         float, or "InvalidUtf8"
 */
[[nodiscard]] ecv::Result<std::string> canonicalize(const nlohmann::json& j);

/// "sha256:<hex>" of the canonical form.
[[nodiscard]] ecv::Result<std::string> hash_canonical(const nlohmann::json& j);

}  // namespace ecv::canonical
