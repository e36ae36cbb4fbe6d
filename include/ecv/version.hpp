#pragma once

/**
 * @file version.hpp
 * @brief ECV version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

#include <string>

namespace ecv {

/// ECV version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Semantic versions (embedded in reports and proof cache keys)
constexpr const char* kEffectSemanticsVersion = "effects.v1";
constexpr const char* kProofSystemVersion = "smt.bv.v1";
constexpr const char* kReportSchemaVersion = "ecv.report.v1";

struct VersionTriple
{
    std::string effect_semantics;
    std::string proof_system;
    std::string report_schema;
};

[[nodiscard]] inline VersionTriple default_version_triple()
{
    return VersionTriple{.effect_semantics = kEffectSemanticsVersion,
                         .proof_system = kProofSystemVersion,
                         .report_schema = kReportSchemaVersion};
}

}  // namespace ecv
