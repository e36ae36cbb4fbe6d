#pragma once

/**
 * @file pipeline.hpp
 * @brief One verification pass over a program snapshot
 */

#include "ecv/ast.hpp"
#include "ecv/common.hpp"
#include "ecv/config.hpp"
#include "ecv/diagnostics.hpp"
#include "ecv/effect_propagator.hpp"
#include "ecv/elision.hpp"
#include "ecv/manifest.hpp"
#include "ecv/smt_verifier.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace ecv::pipeline {

struct OutcomeSummary
{
    std::size_t proven = 0;
    std::size_t disproven = 0;
    std::size_t unproven = 0;
    std::size_t unsupported = 0;
    std::size_t unverified = 0;  ///< Postconditions with static verification disabled
    std::size_t elided = 0;
    std::size_t kept = 0;  ///< Runtime checks kept, preconditions included
};

struct CacheStats
{
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t stored = 0;
};

struct PassResult
{
    /// Function ids in program order.
    std::vector<std::string> function_ids;
    /// Absent when effect enforcement is disabled or the pass was cancelled first.
    std::optional<effects::PropagationResult> effects;
    std::map<std::string, smt::FunctionVerification> verifications;
    std::vector<ContractDecision> decisions;
    /// Effect and contract diagnostics, sorted.
    std::vector<diag::Diagnostic> diagnostics;
    std::vector<LedgerEntry> ledger;
    /// Non-fatal remarks such as unreadable cache entries.
    std::vector<std::string> notes;
    OutcomeSummary summary;
    std::optional<CacheStats> cache;
    bool cancelled = false;
};

/**
 * @brief Runs effect enforcement and contract verification
 *
 * The program and resolver are read-only for the duration of `run`; a pass
 * object may be run several times.
 */
class VerificationPass
{
public:
    VerificationPass(VerificationConfig config,
                     const manifest::ManifestResolver& resolver,
                     std::filesystem::path schema_dir);

    /**
     * @return Errors for malformed input ("MalformedInput", "UnknownEffectCode")
     *         and internal invariant failures; findings are part of the result
     */
    [[nodiscard]] ecv::Result<PassResult> run(const ast::Program& program,
                                              std::stop_token stop = {}) const;

    [[nodiscard]] const VerificationConfig& config() const { return m_config; }

private:
    VerificationConfig m_config;
    const manifest::ManifestResolver& m_resolver;
    std::filesystem::path m_schema_dir;
};

/// Exit status for a finished pass: 1 if any error diagnostic, else 0.
[[nodiscard]] int exit_code(const PassResult& result);

}  // namespace ecv::pipeline
