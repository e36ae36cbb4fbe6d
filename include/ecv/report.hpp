#pragma once

/**
 * @file report.hpp
 * @brief report.v1 JSON and text rendering of a verification pass
 */

#include "ecv/ast.hpp"
#include "ecv/common.hpp"
#include "ecv/config.hpp"
#include "ecv/pipeline.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ecv::report {

enum class ReportFormat { kText, kJson };

struct TextOptions
{
    bool verbose = false;       ///< Include the ledger and cache notes
    bool effects_table = false;  ///< Include declared/computed effects per function
};

/// Build the report.v1 document. Content is deterministic for a given input.
[[nodiscard]] nlohmann::json build_report(const ast::Program& program,
                                          const pipeline::PassResult& result,
                                          const pipeline::VerificationConfig& config);

/// Validate a report against `<schema_dir>/report.v1.schema.json`.
[[nodiscard]] ecv::VoidResult validate_report(const nlohmann::json& report,
                                              const std::filesystem::path& schema_dir);

/// Human-readable lines, one diagnostic block per finding, summary last.
[[nodiscard]] std::vector<std::string> render_text(const ast::Program& program,
                                                   const pipeline::PassResult& result,
                                                   const TextOptions& options);

}  // namespace ecv::report
