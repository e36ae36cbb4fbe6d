/**
 * @file proof_cache.cpp
 * @brief Content-addressed proof cache implementation
 */

#include "ecv/proof_cache.hpp"

#include "ecv/canonical_json.hpp"
#include "ecv/json_file.hpp"
#include "ecv/schema_validate.hpp"
#include "ecv/version.hpp"

#include <algorithm>
#include <map>
#include <string_view>
#include <system_error>
#include <utility>

namespace ecv::cache {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kHashPrefix = "sha256:";

}  // namespace

ProofCache::ProofCache(fs::path base_dir, fs::path schema_dir)
    : m_base_dir(std::move(base_dir))
    , m_schema_dir(std::move(schema_dir))
{}

ecv::Result<std::string> ProofCache::key_for(const ast::Function& function,
                                             const smt::VerifierOptions& options)
{
    const auto versions = default_version_triple();
    const nlohmann::json material{
        {"function", ast::to_json(function)},
        { "options",
         {{"max_paths", options.max_paths},
         {"max_quantifier_expansion", options.max_quantifier_expansion},
         {"check_preconditions", options.check_preconditions}}},
        {   "tool",
         {{"version", kVersion},
         {"proof_system", versions.proof_system},
         {"solver", smt::solver_version()}}}
    };
    return canonical::hash_canonical(material);
}

bool ProofCache::cacheable(const smt::FunctionVerification& verification)
{
    return std::ranges::none_of(verification.contracts, [](const smt::ContractResult& c) {
        return c.outcome && c.outcome->kind == smt::OutcomeKind::kUnproven;
    });
}

ecv::Result<fs::path> ProofCache::object_path_for_key(const std::string& key) const
{
    const std::string_view digest = std::string_view(key).starts_with(kHashPrefix)
                                        ? std::string_view(key).substr(kHashPrefix.size())
                                        : std::string_view(key);
    if (digest.size() < 2 || !std::ranges::all_of(digest, [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        })) {
        return std::unexpected(Error::make("InvalidHash", "Invalid cache key: " + key));
    }
    return m_base_dir / "objects" / std::string(digest.substr(0, 2))
           / (std::string(digest) + ".json");
}

ecv::Result<std::optional<smt::FunctionVerification>> ProofCache::lookup(
    const ast::Function& function,
    const std::string& key) const
{
    auto path = object_path_for_key(key);
    if (!path) {
        return std::unexpected(path.error());
    }
    std::error_code ec;
    if (!fs::exists(*path, ec)) {
        ++m_misses;
        return std::optional<smt::FunctionVerification>{};
    }

    auto entry = common::read_json_file(*path);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    if (auto valid = common::validate_document(*entry, m_schema_dir, "proof_cache_entry.v1");
        !valid) {
        return std::unexpected(Error::make(valid.error().code,
                                           "Cache entry " + path->string()
                                               + " failed validation: " + valid.error().message));
    }
    if (entry->at("key").get<std::string>() != key
        || entry->at("function_id").get<std::string>() != function.id) {
        return std::unexpected(
            Error::make("HashMismatch", "Cache entry " + path->string() + " does not match its key"));
    }

    std::map<std::string, smt::Outcome> outcomes;
    for (const auto& c : entry->at("contracts")) {
        auto outcome = smt::outcome_from_json(c.at("outcome"));
        if (!outcome) {
            return std::unexpected(Error::make(
                "InvalidCacheEntry", "Cache entry " + path->string() + " holds a malformed outcome"));
        }
        outcomes.emplace(c.at("contract_id").get<std::string>(), std::move(*outcome));
    }

    smt::FunctionVerification verification = smt::unverified(function);
    for (auto& contract : verification.contracts) {
        if (contract.kind == smt::ContractKind::kPrecondition) {
            continue;
        }
        auto it = outcomes.find(contract.contract_id);
        if (it == outcomes.end()) {
            return std::unexpected(Error::make("InvalidCacheEntry",
                                               "Cache entry " + path->string() + " lacks "
                                                   + contract.contract_id));
        }
        contract.outcome = it->second;
    }
    verification.preconditions_unsatisfiable =
        entry->at("preconditions_unsatisfiable").get<bool>();
    verification.from_cache = true;
    ++m_hits;
    return std::optional<smt::FunctionVerification>{std::move(verification)};
}

ecv::Result<bool> ProofCache::store(const std::string& key,
                                    const smt::FunctionVerification& verification)
{
    if (!cacheable(verification)) {
        return false;
    }
    auto path = object_path_for_key(key);
    if (!path) {
        return std::unexpected(path.error());
    }

    nlohmann::json contracts = nlohmann::json::array();
    for (const auto& contract : verification.contracts) {
        if (!contract.outcome) {
            continue;
        }
        contracts.push_back({
            {"contract_id",              contract.contract_id},
            {    "outcome", smt::to_json(*contract.outcome)}
        });
    }
    const nlohmann::json entry{
        {             "schema_version",                std::string(kEntrySchemaVersion)},
        {                        "key",                                              key},
        {                "function_id",                        verification.function_id},
        {"preconditions_unsatisfiable",        verification.preconditions_unsatisfiable},
        {                  "contracts",                                        contracts}
    };

    if (auto valid = common::validate_document(entry, m_schema_dir, "proof_cache_entry.v1");
        !valid) {
        return std::unexpected(Error::make(
            valid.error().code, "Cache entry schema validation failed: " + valid.error().message));
    }
    if (auto written = common::write_canonical_json_file(*path, entry); !written) {
        return std::unexpected(written.error());
    }
    return true;
}

}  // namespace ecv::cache
