#pragma once

/**
 * @file manifest.hpp
 * @brief Manifest resolver: effects of external members by qualified name
 */

#include "ecv/common.hpp"
#include "ecv/effects.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ecv::manifest {

enum class ResolutionStatus { kKnown, kUnknown, kError };

struct Resolution
{
    ResolutionStatus status = ResolutionStatus::kUnknown;
    effects::EffectSet effects;
    /// Which rule matched, e.g. "member System.IO.File::ReadAllText" (empty if unknown).
    std::string source;
    /// Error detail for kError.
    std::string detail;

    [[nodiscard]] static Resolution unknown() { return {}; }
};

/**
 * @brief Resolves qualified external member names to effect sets
 *
 * Implementations must be safe to call concurrently from several threads.
 */
class ManifestResolver
{
public:
    virtual ~ManifestResolver() = default;

    [[nodiscard]] virtual Resolution resolve(std::string_view qualified_name) const = 0;
};

/**
 * @brief Split of a qualified name into namespace, type and member
 *
 * `Ns.Sub.Type.Member` and `Ns.Sub.Type::Member` both split as
 * {"Ns.Sub", "Type", "Member"}.
 */
struct QualifiedName
{
    std::string ns;
    std::string type;
    std::string member;
};

[[nodiscard]] std::optional<QualifiedName> split_qualified_name(std::string_view qualified_name);

/**
 * @brief Layered manifest documents (manifest.v1)
 *
 * Later documents take priority at every resolution step. Effect code lists
 * are kept raw so that an invalid code surfaces as a kError resolution for
 * the names that reach it rather than rejecting the whole manifest.
 */
class JsonManifestResolver final : public ManifestResolver
{
public:
    JsonManifestResolver() = default;

    /**
     * Add a manifest document on top of the existing layers.
     * @param origin Label used in resolution sources (file path or "<inline>")
     */
    [[nodiscard]] ecv::VoidResult add_document(const nlohmann::json& doc, std::string origin);

    /// Read, schema-validate and add a manifest file.
    [[nodiscard]] ecv::VoidResult add_file(const std::string& path, const std::string& schema_dir);

    [[nodiscard]] Resolution resolve(std::string_view qualified_name) const override;

    [[nodiscard]] std::size_t layer_count() const { return m_layers.size(); }

private:
    using CodeList = std::vector<std::string>;

    struct TypeEntry
    {
        std::optional<CodeList> default_codes;
        std::map<std::string, CodeList, std::less<>> members;
    };

    struct NamespaceEntry
    {
        std::optional<CodeList> default_codes;
        std::map<std::string, TypeEntry, std::less<>> types;
    };

    struct Layer
    {
        std::string origin;
        std::map<std::string, NamespaceEntry, std::less<>> namespaces;
    };

    std::vector<Layer> m_layers;
};

}  // namespace ecv::manifest
