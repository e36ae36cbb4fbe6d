#pragma once

/**
 * @file config.hpp
 * @brief Verification pass configuration (config.v1)
 */

#include "ecv/common.hpp"
#include "ecv/effect_propagator.hpp"
#include "ecv/elision.hpp"
#include "ecv/smt_verifier.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace ecv::pipeline {

inline constexpr std::string_view kConfigSchemaVersion = "ecv.config.v1";

struct VerificationConfig
{
    bool static_enabled = true;
    bool enforce_effects = true;
    effects::UnknownMode unknown_mode = effects::UnknownMode::kStrict;
    smt::VerifierOptions verifier{};
    ElisionOptions elision{};
    std::optional<std::filesystem::path> cache_dir;
    std::size_t jobs = 0;  ///< 0 = hardware concurrency
};

/**
 * Apply a config.v1 document on top of `base`. Keys that are absent keep
 * their value from `base`.
 * @return Error "InvalidConfig" for values of the wrong shape
 */
[[nodiscard]] ecv::Result<VerificationConfig> apply_config(const nlohmann::json& j,
                                                           VerificationConfig base = {});

/// Read, schema-validate and apply a configuration file.
[[nodiscard]] ecv::Result<VerificationConfig> load_config_file(
    const std::filesystem::path& path,
    const std::filesystem::path& schema_dir,
    VerificationConfig base = {});

/// Effective configuration, as embedded in reports.
[[nodiscard]] nlohmann::json to_json(const VerificationConfig& config);

}  // namespace ecv::pipeline
