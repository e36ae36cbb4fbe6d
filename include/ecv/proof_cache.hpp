#pragma once

/**
 * @file proof_cache.hpp
 * @brief Content-addressed on-disk cache of contract verification results
 *
 * Layout: `<dir>/objects/<first two digest chars>/<digest>.json`, one
 * proof_cache_entry.v1 document per function. Entries holding an Unproven
 * outcome are never written.
 */

#include "ecv/ast.hpp"
#include "ecv/common.hpp"
#include "ecv/smt_verifier.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ecv::cache {

inline constexpr std::string_view kEntrySchemaVersion = "ecv.proof_cache_entry.v1";

class ProofCache
{
public:
    ProofCache(std::filesystem::path base_dir, std::filesystem::path schema_dir);

    /**
     * @brief Cache key of a function under the given verifier options
     *
     * Covers the function's canonical JSON, the options that change outcomes
     * (the timeout is excluded), the tool versions and the solver version.
     * @return "sha256:<hex>" or the canonicalization error
     */
    [[nodiscard]] static ecv::Result<std::string> key_for(const ast::Function& function,
                                                          const smt::VerifierOptions& options);

    /**
     * @brief Look up a stored verification
     * @return std::nullopt on a miss; an error for unreadable or invalid entries
     */
    [[nodiscard]] ecv::Result<std::optional<smt::FunctionVerification>> lookup(
        const ast::Function& function,
        const std::string& key) const;

    /**
     * @brief Store a verification
     * @return false if the verification was not cacheable (contains Unproven)
     */
    [[nodiscard]] ecv::Result<bool> store(const std::string& key,
                                          const smt::FunctionVerification& verification);

    [[nodiscard]] std::size_t hits() const { return m_hits.load(); }
    [[nodiscard]] std::size_t misses() const { return m_misses.load(); }

    [[nodiscard]] static bool cacheable(const smt::FunctionVerification& verification);

private:
    [[nodiscard]] ecv::Result<std::filesystem::path> object_path_for_key(
        const std::string& key) const;

    std::filesystem::path m_base_dir;
    std::filesystem::path m_schema_dir;
    mutable std::atomic<std::size_t> m_hits{0};
    mutable std::atomic<std::size_t> m_misses{0};
};

}  // namespace ecv::cache
