/**
 * @file report.cpp
 * @brief report.v1 document and text rendering
 */

#include "ecv/report.hpp"

#include "ecv/elision.hpp"
#include "ecv/schema_validate.hpp"
#include "ecv/smt_verifier.hpp"
#include "ecv/version.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace ecv::report {

namespace {

using nlohmann::json;

[[nodiscard]] std::string_view status_name(manifest::ResolutionStatus status)
{
    switch (status) {
        case manifest::ResolutionStatus::kKnown:
            return "known";
        case manifest::ResolutionStatus::kUnknown:
            return "unknown";
        case manifest::ResolutionStatus::kError:
            return "error";
    }
    return "unknown";
}

[[nodiscard]] json function_entries(const ast::Program& program, const pipeline::PassResult& result)
{
    json functions = json::array();
    for (const auto& function : program.functions) {
        json entry{
            {  "id",   function.id},
            {"name", function.name}
        };
        if (result.effects) {
            auto it = result.effects->functions.find(function.id);
            if (it != result.effects->functions.end()) {
                entry["effects"] = {
                    {"declared", it->second.declared.codes()},
                    {   "local",    it->second.local.codes()},
                    {"computed", it->second.computed.codes()}
                };
            }
        }
        if (auto it = result.verifications.find(function.id); it != result.verifications.end()) {
            entry["verification"] = {
                {             "solver_queries",              it->second.solver_queries},
                {                 "from_cache",                  it->second.from_cache},
                {"preconditions_unsatisfiable", it->second.preconditions_unsatisfiable}
            };
        }
        functions.push_back(std::move(entry));
    }
    return functions;
}

[[nodiscard]] json external_entries(const pipeline::PassResult& result)
{
    json externals = json::array();
    if (!result.effects) {
        return externals;
    }
    for (const auto& [name, resolution] : result.effects->resolutions) {
        json entry{
            {  "name",                                name},
            {"status", std::string(status_name(resolution.status))}
        };
        if (resolution.status == manifest::ResolutionStatus::kKnown) {
            entry["effects"] = resolution.effects.codes();
            entry["source"] = resolution.source;
        }
        if (resolution.status == manifest::ResolutionStatus::kError) {
            entry["detail"] = resolution.detail;
            entry["source"] = resolution.source;
        }
        externals.push_back(std::move(entry));
    }
    return externals;
}

[[nodiscard]] json summary_json(const ast::Program& program, const pipeline::PassResult& result)
{
    const auto errors = std::ranges::count_if(result.diagnostics, [](const diag::Diagnostic& d) {
        return d.severity == diag::Severity::kError;
    });
    const auto& s = result.summary;
    return json{
        {  "functions", program.functions.size()},
        {     "proven",                 s.proven},
        {  "disproven",              s.disproven},
        {   "unproven",               s.unproven},
        {"unsupported",            s.unsupported},
        { "unverified",             s.unverified},
        {     "elided",                 s.elided},
        {       "kept",                   s.kept},
        {     "errors",                   errors},
        {   "warnings", result.diagnostics.size() - static_cast<std::size_t>(errors)},
        {  "cancelled",              result.cancelled},
        {  "exit_code", pipeline::exit_code(result)}
    };
}

[[nodiscard]] std::string loc_text(const ast::SourceLoc& loc)
{
    return std::format("{}:{}:{}", loc.file, loc.line, loc.col);
}

[[nodiscard]] std::string function_label(const ast::Program& program, const std::string& id)
{
    auto it = std::ranges::find(program.functions, id, &ast::Function::id);
    return it == program.functions.end() ? id : std::format("{} ({})", it->name, id);
}

void append_diagnostic(std::vector<std::string>& lines,
                       const ast::Program& program,
                       const diag::Diagnostic& d)
{
    lines.push_back(std::format("{}[{}] {}: {}",
                                diag::severity_name(d.severity),
                                diag::kind_name(d.kind),
                                function_label(program, d.function_id),
                                d.message));
    if (!d.chain.empty()) {
        lines.push_back(std::format("  chain: {}", diag::render_chain(d.chain)));
    }
    if (!d.counterexample.empty()) {
        lines.push_back(std::format("  counterexample: {}", pipeline::describe_counterexample(d.counterexample)));
    }
    if (d.loc) {
        lines.push_back(std::format("  at {}", loc_text(*d.loc)));
    }
}

}  // namespace

json build_report(const ast::Program& program,
                  const pipeline::PassResult& result,
                  const pipeline::VerificationConfig& config)
{
    json contracts = json::array();
    for (const auto& decision : result.decisions) {
        contracts.push_back(pipeline::to_json(decision));
    }
    json diagnostics = json::array();
    for (const auto& d : result.diagnostics) {
        diagnostics.push_back(diag::to_json(d));
    }
    json ledger = json::array();
    for (const auto& entry : result.ledger) {
        ledger.push_back(pipeline::to_json(entry));
    }

    const auto versions = default_version_triple();
    json report{
        {"schema_version", versions.report_schema},
        {          "tool",
         {{"name", "ecv"},
         {"version", kVersion},
         {"build_id", kBuildId},
         {"effect_semantics", versions.effect_semantics},
         {"proof_system", versions.proof_system},
         {"solver", smt::solver_version()}}},
        {        "module",                      program.module},
        {        "config",          pipeline::to_json(config)},
        {     "functions",   function_entries(program, result)},
        {     "externals",            external_entries(result)},
        {     "contracts",                           contracts},
        {   "diagnostics",                         diagnostics},
        {        "ledger",                              ledger},
        {         "notes",                        result.notes},
        {       "summary",       summary_json(program, result)}
    };
    if (result.cache) {
        report["cache"] = {
            {  "hits",   result.cache->hits},
            {"misses", result.cache->misses},
            {"stored", result.cache->stored}
        };
    }
    return report;
}

ecv::VoidResult validate_report(const json& report, const std::filesystem::path& schema_dir)
{
    if (auto validation = common::validate_document(report, schema_dir, "report.v1"); !validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid", std::format("report schema validation failed: {}", validation.error().message)));
    }
    return {};
}

std::vector<std::string> render_text(const ast::Program& program,
                                     const pipeline::PassResult& result,
                                     const TextOptions& options)
{
    std::vector<std::string> lines;
    lines.push_back(std::format("Module {}: {} functions",
                                program.module.empty() ? std::string("<unnamed>") : program.module,
                                program.functions.size()));

    if (options.effects_table && result.effects) {
        lines.emplace_back("Effects:");
        for (const auto& function : program.functions) {
            auto it = result.effects->functions.find(function.id);
            if (it == result.effects->functions.end()) {
                continue;
            }
            lines.push_back(std::format("  {}: declared {}, computed {}",
                                        function_label(program, function.id),
                                        it->second.declared.to_display_string(),
                                        it->second.computed.to_display_string()));
        }
    }

    for (const auto& d : result.diagnostics) {
        append_diagnostic(lines, program, d);
    }

    if (options.verbose) {
        for (const auto& entry : result.ledger) {
            lines.push_back(std::format("note: {} kept at runtime, {}", entry.contract_id, entry.note));
        }
        for (const auto& note : result.notes) {
            lines.push_back(std::format("note: {}", note));
        }
    }

    const auto& s = result.summary;
    lines.push_back(std::format("Contract verification: {} proven, {} unproven, {} potentially violated, {} unsupported",
                                s.proven,
                                s.unproven,
                                s.disproven,
                                s.unsupported));
    lines.push_back(std::format("Runtime checks: {} elided, {} kept", s.elided, s.kept));
    if (result.cache) {
        lines.push_back(std::format("Proof cache: {} hits, {} misses", result.cache->hits, result.cache->misses));
    }
    if (result.cancelled) {
        lines.emplace_back("Verification was cancelled; remaining contracts stay checked at runtime");
    }
    return lines;
}

}  // namespace ecv::report
