/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "ecv/canonical_json.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ecv::canonical {

namespace {

/// JSON pointer of the first floating point value in document order.
[[nodiscard]] std::optional<std::string> first_float(const nlohmann::json& j,
                                                     const nlohmann::json::json_pointer& at)
{
    if (j.is_number_float()) {
        return at.to_string().empty() ? std::string("/") : at.to_string();
    }
    if (j.is_object()) {
        for (const auto& [key, value] : j.items()) {
            if (auto found = first_float(value, at / key)) {
                return found;
            }
        }
    } else if (j.is_array()) {
        for (std::size_t i = 0; i < j.size(); ++i) {
            if (auto found = first_float(j[i], at / i)) {
                return found;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

ecv::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto at = first_float(j, nlohmann::json::json_pointer{})) {
        return std::unexpected(Error::make("FloatingPointNotAllowed",
                                           "Floating point value at " + *at
                                               + " has no canonical form"));
    }
    // nlohmann::json keeps object members in a std::map, so dump() is key-sorted.
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(Error::make("InvalidUtf8", ex.what()));
    }
}

ecv::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

}  // namespace ecv::canonical
