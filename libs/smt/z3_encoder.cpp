/**
 * @file z3_encoder.cpp
 * @brief Formula -> z3::expr encoding
 */

#include "z3_encoder.hpp"

#include <cstdint>
#include <string>

namespace ecv::smt {

using contracts::FormulaOp;
using contracts::IntType;
using contracts::Sort;

namespace {

[[nodiscard]] z3::expr convert(const z3::expr& value, IntType from, IntType to)
{
    if (to.width > from.width) {
        const unsigned extra = to.width - from.width;
        return from.is_signed ? z3::sext(value, extra) : z3::zext(value, extra);
    }
    if (to.width < from.width) {
        return value.extract(to.width - 1, 0);
    }
    return value;
}

}  // namespace

z3::expr Z3Encoder::variable(const contracts::Variable& var)
{
    auto it = m_vars.find(var.name);
    if (it != m_vars.end()) {
        return it->second;
    }
    z3::expr expr = var.sort == Sort::kInt ? m_ctx.bv_const(var.name.c_str(), var.int_type.width)
                                           : m_ctx.bool_const(var.name.c_str());
    m_vars.emplace(var.name, expr);
    return expr;
}

z3::expr Z3Encoder::encode(const contracts::Formula& formula)
{
    switch (formula.op) {
        case FormulaOp::kIntConst:
            return m_ctx.bv_val(static_cast<int64_t>(formula.int_value), formula.int_type.width);
        case FormulaOp::kBoolConst:
            return m_ctx.bool_val(formula.bool_value);
        case FormulaOp::kVar:
            return variable({.name = formula.name, .sort = formula.sort, .int_type = formula.int_type});
        default:
            break;
    }

    z3::expr_vector args(m_ctx);
    for (const auto& arg : formula.args) {
        args.push_back(encode(*arg));
    }
    const bool is_signed = formula.args.empty() || formula.args.front()->int_type.is_signed;

    switch (formula.op) {
        case FormulaOp::kConvert:
            return convert(args[0], formula.args[0]->int_type, formula.int_type);
        case FormulaOp::kNeg:
            return -args[0];
        case FormulaOp::kAdd:
            return args[0] + args[1];
        case FormulaOp::kSub:
            return args[0] - args[1];
        case FormulaOp::kMul:
            return args[0] * args[1];
        case FormulaOp::kDiv:
            return is_signed ? args[0] / args[1] : z3::udiv(args[0], args[1]);
        case FormulaOp::kMod:
            return is_signed ? z3::srem(args[0], args[1]) : z3::urem(args[0], args[1]);
        case FormulaOp::kNot:
            return !args[0];
        case FormulaOp::kAnd:
            return z3::mk_and(args);
        case FormulaOp::kOr:
            return z3::mk_or(args);
        case FormulaOp::kImplies:
            return z3::implies(args[0], args[1]);
        case FormulaOp::kIte:
            return z3::ite(args[0], args[1], args[2]);
        case FormulaOp::kEq:
            return args[0] == args[1];
        case FormulaOp::kNe:
            return args[0] != args[1];
        case FormulaOp::kLt:
            return is_signed ? z3::slt(args[0], args[1]) : z3::ult(args[0], args[1]);
        case FormulaOp::kLe:
            return is_signed ? z3::sle(args[0], args[1]) : z3::ule(args[0], args[1]);
        case FormulaOp::kGt:
            return is_signed ? z3::sgt(args[0], args[1]) : z3::ugt(args[0], args[1]);
        case FormulaOp::kGe:
            return is_signed ? z3::sge(args[0], args[1]) : z3::uge(args[0], args[1]);
        case FormulaOp::kIntConst:
        case FormulaOp::kBoolConst:
        case FormulaOp::kVar:
            break;
    }
    throw z3::exception("unsupported formula operator");
}

}  // namespace ecv::smt
