/**
 * @file effects.cpp
 * @brief Effect code table, subtyping and primitive catalog
 */

#include "ecv/effects.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ecv::effects {

namespace {

struct CodeEntry
{
    Effect effect;
    std::string_view code;
};

constexpr std::array<CodeEntry, kEffectCount> kCodes = {
    {{Effect::kAlloc, "alloc"},
     {Effect::kConsoleRead, "cr"},
     {Effect::kConsoleWrite, "cw"},
     {Effect::kDbRead, "db:r"},
     {Effect::kDbReadWrite, "db:rw"},
     {Effect::kDbWrite, "db:w"},
     {Effect::kEnvRead, "env:r"},
     {Effect::kEnvReadWrite, "env:rw"},
     {Effect::kEnvWrite, "env:w"},
     {Effect::kFsRead, "fs:r"},
     {Effect::kFsReadWrite, "fs:rw"},
     {Effect::kFsWrite, "fs:w"},
     {Effect::kMutation, "mut"},
     {Effect::kNetRead, "net:r"},
     {Effect::kNetReadWrite, "net:rw"},
     {Effect::kNetWrite, "net:w"},
     {Effect::kProcess, "proc"},
     {Effect::kRandom, "rand"},
     {Effect::kThrow, "throw"},
     {Effect::kTime, "time"},
     {Effect::kUnsafe, "unsafe"}}
};

constexpr std::array<CodeEntry, 10> kLegacyAliases = {
    {{Effect::kFsRead, "fr"},
     {Effect::kFsWrite, "fw"},
     {Effect::kFsWrite, "fd"},
     {Effect::kNetReadWrite, "net"},
     {Effect::kNetReadWrite, "http"},
     {Effect::kDbReadWrite, "db"},
     {Effect::kDbRead, "dbr"},
     {Effect::kDbWrite, "dbw"},
     {Effect::kEnvReadWrite, "env"},
     {Effect::kRandom, "rng"}}
};

/// Read/write families: {read, write, read-write}.
struct Family
{
    Effect read;
    Effect write;
    Effect read_write;
};

constexpr std::array<Family, 4> kFamilies = {
    {{Effect::kFsRead, Effect::kFsWrite, Effect::kFsReadWrite},
     {Effect::kNetRead, Effect::kNetWrite, Effect::kNetReadWrite},
     {Effect::kDbRead, Effect::kDbWrite, Effect::kDbReadWrite},
     {Effect::kEnvRead, Effect::kEnvWrite, Effect::kEnvReadWrite}}
};

[[nodiscard]] std::size_t index_of(Effect effect)
{
    return static_cast<std::size_t>(std::to_underlying(effect));
}

[[nodiscard]] std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

const std::map<std::string, EffectSet, std::less<>>& primitive_catalog()
{
    static const std::map<std::string, EffectSet, std::less<>> kCatalog = {
        {      "abs",                       {}},
        {    "alloc",         {Effect::kAlloc}},
        {  "env_get",       {Effect::kEnvRead}},
        {  "env_set",      {Effect::kEnvWrite}},
        {     "exec",       {Effect::kProcess}},
        { "http_get",       {Effect::kNetRead}},
        {"http_post",      {Effect::kNetWrite}},
        {      "len",                       {}},
        {      "max",                       {}},
        {      "min",                       {}},
        {   "mutate",      {Effect::kMutation}},
        {      "now",          {Effect::kTime}},
        {    "print",  {Effect::kConsoleWrite}},
        {  "println",  {Effect::kConsoleWrite}},
        {   "random",        {Effect::kRandom}},
        {"read_file",        {Effect::kFsRead}},
        {"read_line",   {Effect::kConsoleRead}},
        {    "throw",         {Effect::kThrow}},
        {   "unsafe",        {Effect::kUnsafe}},
        {"write_file",      {Effect::kFsWrite}},
    };
    return kCatalog;
}

}  // namespace

std::string_view effect_code(Effect effect)
{
    return kCodes[index_of(effect)].code;
}

std::optional<Effect> parse_effect_code(std::string_view code)
{
    const auto lowered = to_lower(code);
    for (const auto& entry : kCodes) {
        if (entry.code == lowered) {
            return entry.effect;
        }
    }
    for (const auto& entry : kLegacyAliases) {
        if (entry.code == lowered) {
            return entry.effect;
        }
    }
    return std::nullopt;
}

const std::vector<Effect>& all_effects()
{
    static const std::vector<Effect> kAll = [] {
        std::vector<Effect> out;
        out.reserve(kCodes.size());
        for (const auto& entry : kCodes) {
            out.push_back(entry.effect);
        }
        return out;
    }();
    return kAll;
}

EffectSet::EffectSet(std::initializer_list<Effect> effects)
{
    for (const Effect effect : effects) {
        insert(effect);
    }
}

EffectSet EffectSet::top()
{
    EffectSet set;
    set.m_top = true;
    return set;
}

ecv::Result<EffectSet> EffectSet::from_codes(const std::vector<std::string>& codes)
{
    EffectSet set;
    for (const auto& code : codes) {
        if (code == "*") {
            return top();
        }
        auto effect = parse_effect_code(code);
        if (!effect) {
            return std::unexpected(
                Error::make("UnknownEffectCode", "Unknown effect code '" + code + "'"));
        }
        set.insert(*effect);
    }
    return set;
}

bool EffectSet::contains(Effect effect) const
{
    return m_top || m_bits.test(index_of(effect));
}

void EffectSet::insert(Effect effect)
{
    if (!m_top) {
        m_bits.set(index_of(effect));
    }
}

EffectSet EffectSet::join(const EffectSet& other) const
{
    EffectSet result = *this;
    result.join_in(other);
    return result;
}

bool EffectSet::join_in(const EffectSet& other)
{
    if (m_top) {
        return false;
    }
    if (other.m_top) {
        m_bits.reset();
        m_top = true;
        return true;
    }
    const auto before = m_bits;
    m_bits |= other.m_bits;
    return m_bits != before;
}

bool EffectSet::covers(Effect required) const
{
    if (contains(required)) {
        return true;
    }
    for (const auto& family : kFamilies) {
        if ((required == family.read || required == family.write) && contains(family.read_write)) {
            return true;
        }
        if (required == family.read_write && contains(family.read) && contains(family.write)) {
            return true;
        }
    }
    return false;
}

bool EffectSet::covers(const EffectSet& required) const
{
    if (m_top) {
        return true;
    }
    if (required.m_top) {
        return false;
    }
    return std::ranges::all_of(required.members(), [this](Effect e) { return covers(e); });
}

EffectSet EffectSet::uncovered_by(const EffectSet& declared) const
{
    if (declared.m_top) {
        return {};
    }
    if (m_top) {
        return top();
    }
    EffectSet out;
    for (const Effect effect : members()) {
        if (!declared.covers(effect)) {
            out.insert(effect);
        }
    }
    return out;
}

std::vector<Effect> EffectSet::members() const
{
    std::vector<Effect> out;
    if (m_top) {
        return out;
    }
    for (const auto& entry : kCodes) {
        if (m_bits.test(index_of(entry.effect))) {
            out.push_back(entry.effect);
        }
    }
    return out;
}

std::vector<std::string> EffectSet::codes() const
{
    if (m_top) {
        return {"*"};
    }
    std::vector<std::string> out;
    for (const Effect effect : members()) {
        out.emplace_back(effect_code(effect));
    }
    return out;
}

std::string EffectSet::to_display_string() const
{
    if (m_top) {
        return "[unknown]";
    }
    if (is_empty()) {
        return "[pure]";
    }
    std::string out;
    for (const auto& code : codes()) {
        if (!out.empty()) {
            out += ", ";
        }
        out += code;
    }
    return out;
}

std::optional<EffectSet> primitive_effects(std::string_view op)
{
    const auto& catalog = primitive_catalog();
    auto it = catalog.find(op);
    if (it == catalog.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace ecv::effects
