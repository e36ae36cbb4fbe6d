#pragma once

/**
 * @file json_file.hpp
 * @brief JSON document file I/O
 */

#include "ecv/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace ecv::common {

/**
 * Read and parse a JSON file.
 * @return Error "IOError" or "ParseError"
 */
[[nodiscard]] ecv::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write `payload` in canonical form followed by a newline. Parent
 * directories are created; the file is replaced atomically.
 */
[[nodiscard]] ecv::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                        const nlohmann::json& payload);

}  // namespace ecv::common
