/**
 * @file translator.cpp
 * @brief Contract expression -> formula lowering (linear fixed-width integer arithmetic)
 */

#include "ecv/formula.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ecv::contracts {

namespace {

using ast::BinaryOp;
using ast::ExprKind;

[[nodiscard]] TranslationFailure ill_sorted(std::string_view what, const ast::Expr& expr)
{
    return TranslationFailure::unsupported("ill-sorted operand of " + std::string(what) + " in '"
                                           + ast::to_string(expr) + "'");
}

[[nodiscard]] std::optional<std::int64_t> checked(BinaryOp op, std::int64_t a, std::int64_t b)
{
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    switch (op) {
        case BinaryOp::kAdd:
            if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
                return std::nullopt;
            }
            return a + b;
        case BinaryOp::kSub:
            if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) {
                return std::nullopt;
            }
            return a - b;
        case BinaryOp::kMul:
            if (a == 0 || b == 0) {
                return 0;
            }
            if (a > 0 ? (b > 0 ? a > kMax / b : b < kMin / a)
                      : (b > 0 ? a < kMin / b : a < kMax / b)) {
                return std::nullopt;
            }
            return a * b;
        default:
            return std::nullopt;
    }
}

/// C# literal typing: `int` when the value fits, `long` otherwise.
[[nodiscard]] FormulaPtr literal(std::int64_t value)
{
    return int_const(value, fits(value, kInt32) ? kInt32 : kInt64);
}

/// Operands narrower than 32 bits take part in arithmetic as `int`.
[[nodiscard]] FormulaPtr promote(FormulaPtr value)
{
    if (value->int_type.width < 32) {
        return convert(std::move(value), kInt32);
    }
    return value;
}

/// Common type of two promoted operands; std::nullopt for a signed/`ulong` mix.
[[nodiscard]] std::optional<IntType> common_type(IntType a, IntType b)
{
    if (a == b) {
        return a;
    }
    if (a.width == b.width) {
        if (a.width < 64) {
            return kInt64;
        }
        return std::nullopt;
    }
    const IntType wider = a.width > b.width ? a : b;
    const IntType narrower = a.width > b.width ? b : a;
    if (wider.is_signed || !narrower.is_signed) {
        return wider;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::int64_t> fold_constant(const ast::Expr& expr)
{
    switch (expr.kind) {
        case ExprKind::kIntLit:
            return expr.int_value;
        case ExprKind::kUnary: {
            if (expr.unary_op != ast::UnaryOp::kNeg) {
                return std::nullopt;
            }
            auto inner = fold_constant(*expr.operands[0]);
            if (!inner || *inner == std::numeric_limits<std::int64_t>::min()) {
                return std::nullopt;
            }
            return -*inner;
        }
        case ExprKind::kBinary: {
            auto lhs = fold_constant(*expr.operands[0]);
            auto rhs = fold_constant(*expr.operands[1]);
            if (!lhs || !rhs) {
                return std::nullopt;
            }
            return checked(expr.binary_op, *lhs, *rhs);
        }
        default:
            return std::nullopt;
    }
}

FormulaTranslator::FormulaTranslator(const ast::Function& function, TranslatorOptions options)
    : m_function(function)
    , m_options(options)
{
    for (const auto& param : function.params) {
        const VarInfo info{.type = param.type,
                           .sort = sort_of_type(param.type),
                           .int_type = int_type_of(param.type).value_or(IntType{})};
        m_scope.insert_or_assign(param.name, info);
        if (info.sort) {
            m_variables.push_back(Variable{.name = param.name, .sort = *info.sort, .int_type = info.int_type});
        }
    }
    if (function.return_type != "void" && !function.return_type.empty()) {
        m_scope.insert_or_assign(std::string(kResultName),
                                 VarInfo{.type = function.return_type,
                                         .sort = sort_of_type(function.return_type),
                                         .int_type = int_type_of(function.return_type).value_or(IntType{})});
    }
}

std::optional<Sort> FormulaTranslator::result_sort() const
{
    auto it = m_scope.find(kResultName);
    return it == m_scope.end() ? std::nullopt : it->second.sort;
}

std::optional<Variable> FormulaTranslator::result_variable() const
{
    auto it = m_scope.find(kResultName);
    if (it == m_scope.end() || !it->second.sort) {
        return std::nullopt;
    }
    return Variable{.name = std::string(kResultName), .sort = *it->second.sort, .int_type = it->second.int_type};
}

Translation<FormulaPtr> FormulaTranslator::translate_result_binding(const ast::Expr& returned) const
{
    const auto result = result_variable();
    if (!result) {
        return std::unexpected(TranslationFailure::unsupported(
            "return value of type '" + m_function.return_type + "'"));
    }
    auto value = lower(returned);
    if (!value) {
        return value;
    }
    if ((*value)->sort != result->sort) {
        return std::unexpected(TranslationFailure::unsupported(
            "ill-sorted return value '" + ast::to_string(returned) + "'"));
    }
    auto bound = std::move(*value);
    if (result->sort == Sort::kInt) {
        bound = convert(std::move(bound), result->int_type);
    }
    return apply(FormulaOp::kEq,
                 {variable(result->name, result->sort, result->int_type), std::move(bound)});
}

Translation<FormulaPtr> FormulaTranslator::translate_condition(const ast::Expr& expr) const
{
    auto formula = lower(expr);
    if (!formula) {
        return formula;
    }
    if ((*formula)->sort != Sort::kBool) {
        return std::unexpected(TranslationFailure::unsupported(
            "non-boolean condition '" + ast::to_string(expr) + "'"));
    }
    return formula;
}

Translation<FormulaPtr> FormulaTranslator::translate_term(const ast::Expr& expr) const
{
    return lower(expr);
}

Translation<FormulaPtr> FormulaTranslator::lower(const ast::Expr& expr) const
{
    switch (expr.kind) {
        case ExprKind::kIntLit:
            return literal(expr.int_value);
        case ExprKind::kBoolLit:
            return bool_const(expr.bool_value);
        case ExprKind::kFloatLit:
            return std::unexpected(TranslationFailure::unsupported("floating-point literal"));
        case ExprKind::kStringLit:
            return std::unexpected(TranslationFailure::unsupported("string literal"));
        case ExprKind::kVar: {
            auto it = m_scope.find(expr.name);
            if (it == m_scope.end()) {
                return std::unexpected(
                    TranslationFailure::unsupported("unknown variable '" + expr.name + "'"));
            }
            if (!it->second.sort) {
                return std::unexpected(TranslationFailure::unsupported(
                    "variable '" + expr.name + "' of type '" + it->second.type + "'"));
            }
            return variable(expr.name, *it->second.sort, it->second.int_type);
        }
        case ExprKind::kUnary: {
            if (auto folded = fold_constant(expr)) {
                return literal(*folded);
            }
            auto operand = lower(*expr.operands[0]);
            if (!operand) {
                return operand;
            }
            if (expr.unary_op != ast::UnaryOp::kNeg) {
                if ((*operand)->sort != Sort::kBool) {
                    return std::unexpected(ill_sorted("'!'", expr));
                }
                return apply(FormulaOp::kNot, {std::move(*operand)});
            }
            if ((*operand)->sort != Sort::kInt) {
                return std::unexpected(ill_sorted("'-'", expr));
            }
            auto value = promote(std::move(*operand));
            if (!value->int_type.is_signed) {
                if (value->int_type.width >= 64) {
                    return std::unexpected(TranslationFailure::unsupported(
                        "negation of unsigned 64-bit operand '" + ast::to_string(expr) + "'"));
                }
                value = convert(std::move(value), kInt64);
            }
            return apply(FormulaOp::kNeg, {std::move(value)});
        }
        case ExprKind::kBinary:
            if (auto folded = fold_constant(expr)) {
                return literal(*folded);
            }
            return lower_binary(expr);
        case ExprKind::kCond: {
            auto c = lower(*expr.operands[0]);
            if (!c) {
                return c;
            }
            auto t = lower(*expr.operands[1]);
            if (!t) {
                return t;
            }
            auto e = lower(*expr.operands[2]);
            if (!e) {
                return e;
            }
            if ((*c)->sort != Sort::kBool || (*t)->sort != (*e)->sort) {
                return std::unexpected(ill_sorted("conditional", expr));
            }
            if ((*t)->sort == Sort::kInt) {
                auto branches = unify(std::move(*t), std::move(*e), expr);
                if (!branches) {
                    return std::unexpected(branches.error());
                }
                return apply(FormulaOp::kIte,
                             {std::move(*c), std::move(branches->first), std::move(branches->second)});
            }
            return apply(FormulaOp::kIte, {std::move(*c), std::move(*t), std::move(*e)});
        }
        case ExprKind::kCall:
            return std::unexpected(
                TranslationFailure::unsupported("function call '" + expr.name + "'"));
        case ExprKind::kPrimitive:
            return std::unexpected(
                TranslationFailure::unsupported("primitive operation '" + expr.name + "'"));
        case ExprKind::kForall:
        case ExprKind::kExists:
            return lower_quantifier(expr);
    }
    return std::unexpected(TranslationFailure::unsupported("unknown expression"));
}

Translation<std::pair<FormulaPtr, FormulaPtr>>
FormulaTranslator::unify(FormulaPtr lhs, FormulaPtr rhs, const ast::Expr& expr) const
{
    const bool lhs_literal = lhs->op == FormulaOp::kIntConst;
    const bool rhs_literal = rhs->op == FormulaOp::kIntConst;
    if (lhs_literal && !rhs_literal && fits(lhs->int_value, rhs->int_type)) {
        lhs = int_const(lhs->int_value, rhs->int_type);
    } else if (rhs_literal && !lhs_literal && fits(rhs->int_value, lhs->int_type)) {
        rhs = int_const(rhs->int_value, lhs->int_type);
    }
    lhs = promote(std::move(lhs));
    rhs = promote(std::move(rhs));
    const auto common = common_type(lhs->int_type, rhs->int_type);
    if (!common) {
        return std::unexpected(TranslationFailure::unsupported(
            "mixed signed and unsigned 64-bit operands in '" + ast::to_string(expr) + "'"));
    }
    return std::pair{convert(std::move(lhs), *common), convert(std::move(rhs), *common)};
}

Translation<FormulaPtr> FormulaTranslator::lower_binary(const ast::Expr& expr) const
{
    const auto op = expr.binary_op;
    const auto& lhs_expr = *expr.operands[0];
    const auto& rhs_expr = *expr.operands[1];
    const std::string symbol = "'" + std::string(ast::binary_op_symbol(op)) + "'";

    auto lhs = lower(lhs_expr);
    if (!lhs) {
        return lhs;
    }
    auto rhs = lower(rhs_expr);
    if (!rhs) {
        return rhs;
    }
    const Sort ls = (*lhs)->sort;
    const Sort rs = (*rhs)->sort;

    auto arithmetic = [&](FormulaOp fop) -> Translation<FormulaPtr> {
        auto operands = unify(std::move(*lhs), std::move(*rhs), expr);
        if (!operands) {
            return std::unexpected(operands.error());
        }
        return apply(fop, {std::move(operands->first), std::move(operands->second)});
    };

    switch (op) {
        case BinaryOp::kAdd:
        case BinaryOp::kSub:
            if (ls != Sort::kInt || rs != Sort::kInt) {
                return std::unexpected(ill_sorted(symbol, expr));
            }
            return arithmetic(op == BinaryOp::kAdd ? FormulaOp::kAdd : FormulaOp::kSub);
        case BinaryOp::kMul:
            if (ls != Sort::kInt || rs != Sort::kInt) {
                return std::unexpected(ill_sorted(symbol, expr));
            }
            if (!fold_constant(lhs_expr) && !fold_constant(rhs_expr)) {
                return std::unexpected(TranslationFailure::unsupported(
                    "nonlinear multiplication '" + ast::to_string(expr) + "'"));
            }
            return arithmetic(FormulaOp::kMul);
        case BinaryOp::kDiv:
        case BinaryOp::kMod: {
            if (ls != Sort::kInt || rs != Sort::kInt) {
                return std::unexpected(ill_sorted(symbol, expr));
            }
            auto divisor = fold_constant(rhs_expr);
            if (!divisor) {
                return std::unexpected(TranslationFailure::unsupported(
                    "division by non-constant '" + ast::to_string(rhs_expr) + "'"));
            }
            if (*divisor == 0) {
                return std::unexpected(TranslationFailure::unsupported("division by zero"));
            }
            return arithmetic(op == BinaryOp::kDiv ? FormulaOp::kDiv : FormulaOp::kMod);
        }
        case BinaryOp::kEq:
        case BinaryOp::kNe: {
            if (ls != rs) {
                return std::unexpected(ill_sorted(symbol, expr));
            }
            const FormulaOp fop = op == BinaryOp::kEq ? FormulaOp::kEq : FormulaOp::kNe;
            if (ls == Sort::kInt) {
                return arithmetic(fop);
            }
            return apply(fop, {std::move(*lhs), std::move(*rhs)});
        }
        case BinaryOp::kLt:
        case BinaryOp::kLe:
        case BinaryOp::kGt:
        case BinaryOp::kGe: {
            if (ls != Sort::kInt || rs != Sort::kInt) {
                return std::unexpected(ill_sorted(symbol, expr));
            }
            const FormulaOp fop = op == BinaryOp::kLt   ? FormulaOp::kLt
                                  : op == BinaryOp::kLe ? FormulaOp::kLe
                                  : op == BinaryOp::kGt ? FormulaOp::kGt
                                                        : FormulaOp::kGe;
            return arithmetic(fop);
        }
        case BinaryOp::kAnd:
        case BinaryOp::kOr:
        case BinaryOp::kImplies: {
            if (ls != Sort::kBool || rs != Sort::kBool) {
                return std::unexpected(ill_sorted(symbol, expr));
            }
            const FormulaOp fop = op == BinaryOp::kAnd  ? FormulaOp::kAnd
                                  : op == BinaryOp::kOr ? FormulaOp::kOr
                                                        : FormulaOp::kImplies;
            return apply(fop, {std::move(*lhs), std::move(*rhs)});
        }
    }
    return std::unexpected(TranslationFailure::unsupported("operator " + symbol));
}

Translation<FormulaPtr> FormulaTranslator::lower_quantifier(const ast::Expr& expr) const
{
    const bool is_forall = expr.kind == ExprKind::kForall;
    const std::string keyword = is_forall ? "forall" : "exists";
    if (!is_integer_type(expr.var_type)) {
        return std::unexpected(TranslationFailure::unsupported(
            keyword + " over non-integer type '" + expr.var_type + "'"));
    }
    auto lo = fold_constant(*expr.operands[0]);
    auto hi = fold_constant(*expr.operands[1]);
    if (!lo || !hi) {
        return std::unexpected(TranslationFailure::unsupported(
            keyword + " with non-constant bounds '" + ast::to_string(expr) + "'"));
    }
    if (*hi <= *lo) {
        return bool_const(is_forall);
    }
    // Compare in unsigned space so that extreme bounds do not overflow.
    const auto span = static_cast<std::uint64_t>(*hi) - static_cast<std::uint64_t>(*lo);
    if (span > m_options.max_quantifier_expansion) {
        return std::unexpected(TranslationFailure::too_complex(
            keyword + " range of " + std::to_string(span) + " values exceeds expansion limit "
            + std::to_string(m_options.max_quantifier_expansion)));
    }

    std::vector<FormulaPtr> instances;
    instances.reserve(static_cast<std::size_t>(span));
    for (std::int64_t i = *lo; i < *hi; ++i) {
        auto body = ast::substitute(expr.operands[2], {{expr.name, ast::int_lit(i)}});
        auto lowered = lower(*body);
        if (!lowered) {
            return lowered;
        }
        if ((*lowered)->sort != Sort::kBool) {
            return std::unexpected(ill_sorted(keyword, expr));
        }
        instances.push_back(std::move(*lowered));
    }
    if (instances.size() == 1) {
        return instances.front();
    }
    return apply(is_forall ? FormulaOp::kAnd : FormulaOp::kOr, std::move(instances));
}

}  // namespace ecv::contracts
