#pragma once

/**
 * @file formula.hpp
 * @brief Solver-independent formulas and the contract translator
 */

#include "ecv/ast.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ecv::contracts {

enum class Sort { kInt, kBool };

/// Two's complement integer of a fixed bit width.
struct IntType
{
    unsigned width = 32;
    bool is_signed = true;

    bool operator==(const IntType&) const = default;
};

inline constexpr IntType kInt32{.width = 32, .is_signed = true};
inline constexpr IntType kInt64{.width = 64, .is_signed = true};

/**
 * Formula operators over fixed-width integers. Arithmetic wraps modulo
 * 2^width; kDiv and kMod truncate toward zero (bvsdiv/bvsrem) for signed
 * operands and are bvudiv/bvurem for unsigned ones. Operands of an integer
 * operator always share one IntType; kConvert changes it.
 */
enum class FormulaOp {
    kIntConst,
    kBoolConst,
    kVar,
    kConvert,
    kNeg,
    kAdd,
    kSub,
    kMul,
    kDiv,
    kMod,
    kNot,
    kAnd,
    kOr,
    kImplies,
    kIte,
    kEq,
    kNe,
    kLt,
    kLe,
    kGt,
    kGe,
};

struct Formula;
using FormulaPtr = std::shared_ptr<const Formula>;

struct Formula
{
    FormulaOp op = FormulaOp::kIntConst;
    Sort sort = Sort::kInt;
    IntType int_type;  ///< Meaningful for Int-sorted nodes only
    std::int64_t int_value = 0;
    bool bool_value = false;
    std::string name;
    std::vector<FormulaPtr> args;
};

[[nodiscard]] FormulaPtr int_const(std::int64_t value, IntType type);
[[nodiscard]] FormulaPtr bool_const(bool value);
[[nodiscard]] FormulaPtr variable(std::string name, Sort sort, IntType type = {});
/// Sign- or zero-extend, or truncate, an Int formula to `type`.
[[nodiscard]] FormulaPtr convert(FormulaPtr value, IntType type);
/// Build an operator node. Sort and IntType are derived from `op` and `args`.
[[nodiscard]] FormulaPtr apply(FormulaOp op, std::vector<FormulaPtr> args);

/// S-expression rendering in SMT-LIB bitvector notation, for debugging.
[[nodiscard]] std::string to_string(const Formula& formula);

// ============================================================================
// Types
// ============================================================================

/// Integer parameter types, all fixed width.
[[nodiscard]] bool is_integer_type(std::string_view type);

/// Width and signedness of an integer source type.
[[nodiscard]] std::optional<IntType> int_type_of(std::string_view type);

/// Sort of a source type, std::nullopt if not representable.
[[nodiscard]] std::optional<Sort> sort_of_type(std::string_view type);

/// True if `value` is representable in `type`.
[[nodiscard]] bool fits(std::int64_t value, IntType type);

// ============================================================================
// Translation
// ============================================================================

enum class FailureKind {
    kUnsupported,  ///< Construct outside the decidable fragment
    kTooComplex,   ///< Within the fragment but beyond configured limits
};

struct TranslationFailure
{
    FailureKind kind = FailureKind::kUnsupported;
    std::string construct;

    [[nodiscard]] static TranslationFailure unsupported(std::string construct)
    {
        return {FailureKind::kUnsupported, std::move(construct)};
    }
    [[nodiscard]] static TranslationFailure too_complex(std::string construct)
    {
        return {FailureKind::kTooComplex, std::move(construct)};
    }
};

template <typename T>
using Translation = std::expected<T, TranslationFailure>;

inline constexpr std::string_view kResultName = "result";

/// A solver variable: a parameter or `result`.
struct Variable
{
    std::string name;
    Sort sort = Sort::kInt;
    IntType int_type;
};

struct TranslatorOptions
{
    std::size_t max_quantifier_expansion = 64;
};

/**
 * @brief Lowers contract expressions of one function to formulas
 *
 * Variables in scope are the parameters and `result`. Translation never
 * encodes a construct partially: the first failure classifies the whole
 * expression.
 *
 * Integer operands are promoted the way C# promotes them: types narrower
 * than 32 bits widen to `int`, `int` with `uint` widens to `long`, and a
 * literal takes the type of the other operand when it fits. Mixing a
 * signed operand with `ulong` is Unsupported.
 */
class FormulaTranslator
{
public:
    FormulaTranslator(const ast::Function& function, TranslatorOptions options);

    /// Translate a Bool-sorted expression (contract, branch predicate).
    [[nodiscard]] Translation<FormulaPtr> translate_condition(const ast::Expr& expr) const;

    /// Translate an expression of any supported sort.
    [[nodiscard]] Translation<FormulaPtr> translate_term(const ast::Expr& expr) const;

    /// `result == returned`, the returned value converted to the return type.
    [[nodiscard]] Translation<FormulaPtr> translate_result_binding(const ast::Expr& returned) const;

    /// Sort of `result`, std::nullopt for void or unsupported return types.
    [[nodiscard]] std::optional<Sort> result_sort() const;

    /// `result` as a variable, std::nullopt for void or unsupported return types.
    [[nodiscard]] std::optional<Variable> result_variable() const;

    /// Parameters with a representable sort, in declaration order.
    [[nodiscard]] const std::vector<Variable>& variables() const
    {
        return m_variables;
    }

private:
    struct VarInfo
    {
        std::string type;
        std::optional<Sort> sort;
        IntType int_type;
    };

    [[nodiscard]] Translation<FormulaPtr> lower(const ast::Expr& expr) const;
    [[nodiscard]] Translation<FormulaPtr> lower_binary(const ast::Expr& expr) const;
    [[nodiscard]] Translation<FormulaPtr> lower_quantifier(const ast::Expr& expr) const;
    [[nodiscard]] Translation<std::pair<FormulaPtr, FormulaPtr>>
    unify(FormulaPtr lhs, FormulaPtr rhs, const ast::Expr& expr) const;

    const ast::Function& m_function;
    TranslatorOptions m_options;
    std::map<std::string, VarInfo, std::less<>> m_scope;
    std::vector<Variable> m_variables;
};

/// Fold an integer expression over literals, negation, +, -, *.
[[nodiscard]] std::optional<std::int64_t> fold_constant(const ast::Expr& expr);

}  // namespace ecv::contracts
