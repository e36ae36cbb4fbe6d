/**
 * @file manifest.cpp
 * @brief Layered JSON manifest resolver
 */

#include "ecv/manifest.hpp"

#include "ecv/json_file.hpp"
#include "ecv/schema_validate.hpp"

#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ecv::manifest {

namespace {

using nlohmann::json;

[[nodiscard]] ecv::Result<std::vector<std::string>> parse_code_list(const json& value,
                                                                    const std::string& where)
{
    if (!value.is_array()) {
        return std::unexpected(
            Error::make("InvalidManifest", "Expected effect code array at " + where));
    }
    std::vector<std::string> codes;
    codes.reserve(value.size());
    for (const auto& code : value) {
        if (!code.is_string()) {
            return std::unexpected(
                Error::make("InvalidManifest", "Effect codes must be strings at " + where));
        }
        codes.push_back(code.get<std::string>());
    }
    return codes;
}

[[nodiscard]] Resolution to_resolution(const std::vector<std::string>& codes, std::string source)
{
    auto set = effects::EffectSet::from_codes(codes);
    if (!set) {
        return Resolution{.status = ResolutionStatus::kError,
                          .effects = effects::EffectSet::top(),
                          .source = std::move(source),
                          .detail = set.error().message};
    }
    return Resolution{.status = ResolutionStatus::kKnown,
                      .effects = std::move(*set),
                      .source = std::move(source),
                      .detail = {}};
}

/// `Company.*` matches `Company` and every namespace below it.
[[nodiscard]] bool pattern_matches(std::string_view pattern, std::string_view ns)
{
    if (!pattern.ends_with(".*")) {
        return false;
    }
    const auto prefix = pattern.substr(0, pattern.size() - 2);
    if (ns == prefix) {
        return true;
    }
    return ns.size() > prefix.size() && ns.starts_with(prefix) && ns[prefix.size()] == '.';
}

}  // namespace

std::optional<QualifiedName> split_qualified_name(std::string_view qualified_name)
{
    auto name = qualified_name;
    if (auto paren = name.find('('); paren != std::string_view::npos) {
        name = name.substr(0, paren);
    }

    std::string_view owner;
    std::string_view member;
    if (auto colons = name.rfind("::"); colons != std::string_view::npos) {
        owner = name.substr(0, colons);
        member = name.substr(colons + 2);
    } else {
        auto dot = name.rfind('.');
        if (dot == std::string_view::npos) {
            return std::nullopt;
        }
        owner = name.substr(0, dot);
        member = name.substr(dot + 1);
    }
    if (owner.empty() || member.empty()) {
        return std::nullopt;
    }

    QualifiedName out;
    out.member = std::string(member);
    if (auto dot = owner.rfind('.'); dot != std::string_view::npos) {
        out.ns = std::string(owner.substr(0, dot));
        out.type = std::string(owner.substr(dot + 1));
    } else {
        out.type = std::string(owner);
    }
    if (out.type.empty()) {
        return std::nullopt;
    }
    return out;
}

ecv::VoidResult JsonManifestResolver::add_document(const nlohmann::json& doc, std::string origin)
{
    if (!doc.is_object()) {
        return std::unexpected(
            Error::make("InvalidManifest", "Manifest must be a JSON object: " + origin));
    }
    Layer layer;
    layer.origin = std::move(origin);

    auto ns_it = doc.find("namespaces");
    if (ns_it == doc.end()) {
        m_layers.push_back(std::move(layer));
        return {};
    }
    if (!ns_it->is_object()) {
        return std::unexpected(
            Error::make("InvalidManifest", "'namespaces' must be an object: " + layer.origin));
    }

    for (const auto& [ns_name, ns_value] : ns_it->items()) {
        const std::string ns_where = layer.origin + " namespace '" + ns_name + "'";
        if (!ns_value.is_object()) {
            return std::unexpected(Error::make("InvalidManifest", "Expected object at " + ns_where));
        }
        NamespaceEntry ns_entry;
        if (auto def = ns_value.find("default"); def != ns_value.end()) {
            auto codes = parse_code_list(*def, ns_where + " default");
            if (!codes) {
                return std::unexpected(codes.error());
            }
            ns_entry.default_codes = std::move(*codes);
        }
        if (auto types = ns_value.find("types"); types != ns_value.end()) {
            if (!types->is_object()) {
                return std::unexpected(
                    Error::make("InvalidManifest", "'types' must be an object at " + ns_where));
            }
            for (const auto& [type_name, type_value] : types->items()) {
                const std::string type_where = ns_where + " type '" + type_name + "'";
                if (!type_value.is_object()) {
                    return std::unexpected(
                        Error::make("InvalidManifest", "Expected object at " + type_where));
                }
                TypeEntry type_entry;
                if (auto def = type_value.find("default"); def != type_value.end()) {
                    auto codes = parse_code_list(*def, type_where + " default");
                    if (!codes) {
                        return std::unexpected(codes.error());
                    }
                    type_entry.default_codes = std::move(*codes);
                }
                if (auto members = type_value.find("members"); members != type_value.end()) {
                    if (!members->is_object()) {
                        return std::unexpected(Error::make(
                            "InvalidManifest", "'members' must be an object at " + type_where));
                    }
                    for (const auto& [member_name, member_value] : members->items()) {
                        auto codes =
                            parse_code_list(member_value, type_where + " member '" + member_name + "'");
                        if (!codes) {
                            return std::unexpected(codes.error());
                        }
                        type_entry.members.emplace(member_name, std::move(*codes));
                    }
                }
                ns_entry.types.emplace(type_name, std::move(type_entry));
            }
        }
        layer.namespaces.emplace(ns_name, std::move(ns_entry));
    }
    m_layers.push_back(std::move(layer));
    return {};
}

ecv::VoidResult JsonManifestResolver::add_file(const std::string& path,
                                               const std::string& schema_dir)
{
    auto doc = common::read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (auto validation = common::validate_document(*doc, schema_dir, "manifest.v1");
        !validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid", "manifest schema validation failed (" + path + "): "
                                 + validation.error().message));
    }
    return add_document(*doc, path);
}

Resolution JsonManifestResolver::resolve(std::string_view qualified_name) const
{
    auto name = split_qualified_name(qualified_name);
    if (!name) {
        return Resolution::unknown();
    }

    const auto find_type = [&name](const Layer& layer) -> const TypeEntry* {
        auto ns_it = layer.namespaces.find(name->ns);
        if (ns_it == layer.namespaces.end()) {
            return nullptr;
        }
        auto type_it = ns_it->second.types.find(name->type);
        return type_it == ns_it->second.types.end() ? nullptr : &type_it->second;
    };
    const std::string type_label = name->ns.empty() ? name->type : name->ns + "." + name->type;

    for (const auto& layer : m_layers | std::views::reverse) {
        if (const auto* type = find_type(layer)) {
            if (auto it = type->members.find(name->member); it != type->members.end()) {
                return to_resolution(it->second,
                                     layer.origin + ": member " + type_label + "::" + name->member);
            }
        }
    }
    for (const auto& layer : m_layers | std::views::reverse) {
        if (const auto* type = find_type(layer)) {
            if (auto it = type->members.find("*"); it != type->members.end()) {
                return to_resolution(it->second, layer.origin + ": wildcard " + type_label + "::*");
            }
        }
    }
    for (const auto& layer : m_layers | std::views::reverse) {
        if (const auto* type = find_type(layer); type != nullptr && type->default_codes) {
            return to_resolution(*type->default_codes,
                                 layer.origin + ": type default " + type_label);
        }
    }
    for (const auto& layer : m_layers | std::views::reverse) {
        auto ns_it = layer.namespaces.find(name->ns);
        if (ns_it != layer.namespaces.end() && ns_it->second.default_codes) {
            return to_resolution(*ns_it->second.default_codes,
                                 layer.origin + ": namespace default " + name->ns);
        }
    }
    for (const auto& layer : m_layers | std::views::reverse) {
        const std::pair<const std::string, NamespaceEntry>* best = nullptr;
        for (const auto& entry : layer.namespaces) {
            if (!entry.second.default_codes || !pattern_matches(entry.first, name->ns)) {
                continue;
            }
            if (best == nullptr || entry.first.size() > best->first.size()) {
                best = &entry;
            }
        }
        if (best != nullptr) {
            return to_resolution(*best->second.default_codes,
                                 layer.origin + ": namespace pattern " + best->first);
        }
    }
    return Resolution::unknown();
}

}  // namespace ecv::manifest
