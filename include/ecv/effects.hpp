#pragma once

/**
 * @file effects.hpp
 * @brief Effect codes, subtyping and the effect-set join-semilattice
 */

#include "ecv/common.hpp"

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ecv::effects {

/// Closed set of effect codes. Order is the display order of surface codes.
enum class Effect : std::uint8_t {
    kAlloc,
    kConsoleRead,
    kConsoleWrite,
    kDbRead,
    kDbReadWrite,
    kDbWrite,
    kEnvRead,
    kEnvReadWrite,
    kEnvWrite,
    kFsRead,
    kFsReadWrite,
    kFsWrite,
    kMutation,
    kNetRead,
    kNetReadWrite,
    kNetWrite,
    kProcess,
    kRandom,
    kThrow,
    kTime,
    kUnsafe,
};

inline constexpr std::size_t kEffectCount = 21;

/// Surface code of an effect ("cw", "fs:r", ...).
[[nodiscard]] std::string_view effect_code(Effect effect);

/// Parse a surface code or legacy alias (case-insensitive).
[[nodiscard]] std::optional<Effect> parse_effect_code(std::string_view code);

/// All effects in display order.
[[nodiscard]] const std::vector<Effect>& all_effects();

/**
 * @brief Join-semilattice of effects with an absorbing top element
 *
 * Top means "all effects" and is used for unknown resolutions in permissive
 * mode. Join is set union; top absorbs.
 */
class EffectSet
{
public:
    EffectSet() = default;
    EffectSet(std::initializer_list<Effect> effects);

    [[nodiscard]] static EffectSet top();

    /**
     * Build from surface codes. "*" yields top.
     * @return Error "UnknownEffectCode" naming the first unknown code
     */
    [[nodiscard]] static ecv::Result<EffectSet> from_codes(const std::vector<std::string>& codes);

    [[nodiscard]] bool is_top() const { return m_top; }
    [[nodiscard]] bool is_empty() const { return !m_top && m_bits.none(); }

    /// Exact membership. Top contains everything.
    [[nodiscard]] bool contains(Effect effect) const;

    void insert(Effect effect);

    [[nodiscard]] EffectSet join(const EffectSet& other) const;

    /// In-place join. Returns true when this set grew.
    bool join_in(const EffectSet& other);

    /// True when `required` is permitted by this set under subtyping.
    [[nodiscard]] bool covers(Effect required) const;
    [[nodiscard]] bool covers(const EffectSet& required) const;

    /**
     * Members of this set not covered by `declared`.
     * Returns top when this set is top and `declared` is not.
     */
    [[nodiscard]] EffectSet uncovered_by(const EffectSet& declared) const;

    /// Members in display order (empty for top).
    [[nodiscard]] std::vector<Effect> members() const;

    /// Sorted surface codes; ["*"] for top.
    [[nodiscard]] std::vector<std::string> codes() const;

    /// "cw, db:r", "[pure]" or "[unknown]".
    [[nodiscard]] std::string to_display_string() const;

    bool operator==(const EffectSet& other) const = default;

private:
    std::bitset<kEffectCount> m_bits;
    bool m_top = false;
};

/**
 * Effects of a built-in primitive operation.
 * @return std::nullopt for operations outside the catalog
 */
[[nodiscard]] std::optional<EffectSet> primitive_effects(std::string_view op);

}  // namespace ecv::effects
