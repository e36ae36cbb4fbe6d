#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "ecv/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ecv::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * `$ref` values of the form "ecv:schema/<name>" are resolved to
 * `<schema dir>/<name>.schema.json`.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error listing every failing location otherwise
 */
[[nodiscard]] ecv::VoidResult validate_json(const nlohmann::json& j,
                                            const std::filesystem::path& schema_path);

/**
 * Validate JSON against `<schema_dir>/<schema_name>.schema.json`.
 */
[[nodiscard]] ecv::VoidResult validate_document(const nlohmann::json& j,
                                                const std::filesystem::path& schema_dir,
                                                std::string_view schema_name);

}  // namespace ecv::common
