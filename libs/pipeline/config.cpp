/**
 * @file config.cpp
 * @brief config.v1 parsing
 */

#include "ecv/config.hpp"

#include "ecv/json_file.hpp"
#include "ecv/schema_validate.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace ecv::pipeline {

namespace {

using nlohmann::json;

[[nodiscard]] ecv::Error invalid(std::string_view key, std::string_view expected)
{
    return Error::make("InvalidConfig",
                       "Config key '" + std::string(key) + "' must be " + std::string(expected));
}

[[nodiscard]] ecv::VoidResult read_bool(const json& obj, std::string_view key, std::string_view path,
                                        bool& out)
{
    auto it = obj.find(std::string(key));
    if (it == obj.end()) {
        return {};
    }
    if (!it->is_boolean()) {
        return std::unexpected(invalid(path, "a boolean"));
    }
    out = it->get<bool>();
    return {};
}

[[nodiscard]] ecv::VoidResult read_count(const json& obj, std::string_view key,
                                         std::string_view path, std::size_t& out)
{
    auto it = obj.find(std::string(key));
    if (it == obj.end()) {
        return {};
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(invalid(path, "a non-negative integer"));
    }
    out = it->get<std::size_t>();
    return {};
}

[[nodiscard]] ecv::Result<std::chrono::milliseconds> to_millis(const json& value,
                                                              std::string_view path)
{
    if (!value.is_number_unsigned()) {
        return std::unexpected(invalid(path, "a non-negative integer (milliseconds)"));
    }
    return std::chrono::milliseconds(value.get<std::uint64_t>());
}

[[nodiscard]] ecv::VoidResult apply_effects(const json& section, VerificationConfig& config)
{
    if (!section.is_object()) {
        return std::unexpected(invalid("effects", "an object"));
    }
    if (auto r = read_bool(section, "enforce", "effects.enforce", config.enforce_effects); !r) {
        return r;
    }
    if (auto it = section.find("unknown_mode"); it != section.end()) {
        const auto mode = it->is_string() ? it->get<std::string>() : std::string{};
        if (mode == "strict") {
            config.unknown_mode = effects::UnknownMode::kStrict;
        } else if (mode == "permissive") {
            config.unknown_mode = effects::UnknownMode::kPermissive;
        } else {
            return std::unexpected(invalid("effects.unknown_mode", "\"strict\" or \"permissive\""));
        }
    }
    return {};
}

[[nodiscard]] ecv::VoidResult apply_verification(const json& section, VerificationConfig& config)
{
    if (!section.is_object()) {
        return std::unexpected(invalid("verification", "an object"));
    }
    auto& verifier = config.verifier;
    if (auto r = read_bool(section, "enabled", "verification.enabled", config.static_enabled); !r) {
        return r;
    }
    if (auto r = read_bool(section, "disproven_is_error", "verification.disproven_is_error",
                           config.elision.disproven_is_error);
        !r) {
        return r;
    }
    if (auto r = read_bool(section, "check_preconditions", "verification.check_preconditions",
                           verifier.check_preconditions);
        !r) {
        return r;
    }
    if (auto r = read_count(section, "max_paths", "verification.max_paths", verifier.max_paths);
        !r) {
        return r;
    }
    if (auto r = read_count(section, "max_quantifier_expansion",
                            "verification.max_quantifier_expansion",
                            verifier.max_quantifier_expansion);
        !r) {
        return r;
    }
    if (auto it = section.find("timeout_ms"); it != section.end()) {
        auto timeout = to_millis(*it, "verification.timeout_ms");
        if (!timeout) {
            return std::unexpected(timeout.error());
        }
        verifier.timeout = *timeout;
    }
    if (auto it = section.find("function_timeouts_ms"); it != section.end()) {
        if (!it->is_object()) {
            return std::unexpected(invalid("verification.function_timeouts_ms", "an object"));
        }
        for (const auto& [function_id, value] : it->items()) {
            auto timeout = to_millis(value, "verification.function_timeouts_ms." + function_id);
            if (!timeout) {
                return std::unexpected(timeout.error());
            }
            verifier.function_timeouts.insert_or_assign(function_id, *timeout);
        }
    }
    if (auto it = section.find("cache_dir"); it != section.end()) {
        if (it->is_null()) {
            config.cache_dir.reset();
        } else if (it->is_string()) {
            config.cache_dir = it->get<std::string>();
        } else {
            return std::unexpected(invalid("verification.cache_dir", "a string or null"));
        }
    }
    return {};
}

}  // namespace

ecv::Result<VerificationConfig> apply_config(const nlohmann::json& j, VerificationConfig base)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidConfig", "Config document must be an object"));
    }
    if (auto it = j.find("schema_version"); it != j.end()) {
        if (!it->is_string() || it->get<std::string>() != kConfigSchemaVersion) {
            return std::unexpected(Error::make(
                "UnsupportedSchemaVersion",
                "Unsupported config schema_version (expected " + std::string(kConfigSchemaVersion)
                    + ")"));
        }
    }
    if (auto r = read_count(j, "jobs", "jobs", base.jobs); !r) {
        return std::unexpected(r.error());
    }
    if (auto it = j.find("effects"); it != j.end()) {
        if (auto r = apply_effects(*it, base); !r) {
            return std::unexpected(r.error());
        }
    }
    if (auto it = j.find("verification"); it != j.end()) {
        if (auto r = apply_verification(*it, base); !r) {
            return std::unexpected(r.error());
        }
    }
    return base;
}

ecv::Result<VerificationConfig> load_config_file(const std::filesystem::path& path,
                                                 const std::filesystem::path& schema_dir,
                                                 VerificationConfig base)
{
    auto doc = common::read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (auto validation = common::validate_document(*doc, schema_dir, "config.v1"); !validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid", "config schema validation failed: " + validation.error().message));
    }
    return apply_config(*doc, std::move(base));
}

nlohmann::json to_json(const VerificationConfig& config)
{
    json function_timeouts = json::object();
    for (const auto& [id, timeout] : config.verifier.function_timeouts) {
        function_timeouts[id] = static_cast<std::uint64_t>(timeout.count());
    }
    json verification{
        {                 "enabled",                       config.static_enabled},
        {              "timeout_ms",              static_cast<std::uint64_t>(config.verifier.timeout.count())},
        {    "function_timeouts_ms",                            function_timeouts},
        {      "disproven_is_error",            config.elision.disproven_is_error},
        {     "check_preconditions",          config.verifier.check_preconditions},
        {               "max_paths",                    config.verifier.max_paths},
        {"max_quantifier_expansion",     config.verifier.max_quantifier_expansion},
        {               "cache_dir",                                     nullptr}
    };
    if (config.cache_dir) {
        verification["cache_dir"] = config.cache_dir->string();
    }
    return json{
        {"schema_version", std::string(kConfigSchemaVersion)},
        {          "jobs",                       config.jobs},
        {       "effects",
         {{"enforce", config.enforce_effects},
         {"unknown_mode",
         config.unknown_mode == effects::UnknownMode::kStrict ? "strict" : "permissive"}}},
        {  "verification",                      verification}
    };
}

}  // namespace ecv::pipeline
