/**
 * @file ast.cpp
 * @brief AST node construction, structural equality, substitution
 */

#include "ecv/ast.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ecv::ast {

namespace {

[[nodiscard]] ExprPtr make_expr(Expr expr)
{
    return std::make_shared<const Expr>(std::move(expr));
}

[[nodiscard]] StmtPtr make_stmt(Stmt stmt)
{
    return std::make_shared<const Stmt>(std::move(stmt));
}

[[nodiscard]] bool is_quantifier(ExprKind kind)
{
    return kind == ExprKind::kForall || kind == ExprKind::kExists;
}

[[nodiscard]] bool needs_parens(const Expr& expr)
{
    return expr.kind == ExprKind::kBinary || expr.kind == ExprKind::kCond
           || is_quantifier(expr.kind);
}

[[nodiscard]] std::string operand_string(const ExprPtr& expr)
{
    if (!expr) {
        return "<null>";
    }
    auto text = to_string(*expr);
    return needs_parens(*expr) ? "(" + text + ")" : text;
}

[[nodiscard]] std::string join_args(const std::vector<ExprPtr>& args)
{
    std::string out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += args[i] ? to_string(*args[i]) : "<null>";
    }
    return out;
}

}  // namespace

ExprPtr int_lit(std::int64_t value)
{
    return make_expr(Expr{.kind = ExprKind::kIntLit, .int_value = value});
}

ExprPtr bool_lit(bool value)
{
    return make_expr(Expr{.kind = ExprKind::kBoolLit, .bool_value = value});
}

ExprPtr float_lit(double value)
{
    return make_expr(Expr{.kind = ExprKind::kFloatLit, .float_value = value});
}

ExprPtr string_lit(std::string value)
{
    return make_expr(Expr{.kind = ExprKind::kStringLit, .name = std::move(value)});
}

ExprPtr var(std::string name)
{
    return make_expr(Expr{.kind = ExprKind::kVar, .name = std::move(name)});
}

ExprPtr unary(UnaryOp op, ExprPtr operand)
{
    return make_expr(
        Expr{.kind = ExprKind::kUnary, .unary_op = op, .operands = {std::move(operand)}});
}

ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs)
{
    return make_expr(Expr{.kind = ExprKind::kBinary,
                          .binary_op = op,
                          .operands = {std::move(lhs), std::move(rhs)}});
}

ExprPtr cond(ExprPtr condition, ExprPtr then_expr, ExprPtr else_expr)
{
    return make_expr(
        Expr{.kind = ExprKind::kCond,
             .operands = {std::move(condition), std::move(then_expr), std::move(else_expr)}});
}

ExprPtr call(std::string callee, std::vector<ExprPtr> args)
{
    return make_expr(
        Expr{.kind = ExprKind::kCall, .name = std::move(callee), .operands = std::move(args)});
}

ExprPtr primitive(std::string op, std::vector<ExprPtr> args)
{
    return make_expr(
        Expr{.kind = ExprKind::kPrimitive, .name = std::move(op), .operands = std::move(args)});
}

ExprPtr quantifier(ExprKind kind,
                   std::string bound_var,
                   std::string var_type,
                   ExprPtr lo,
                   ExprPtr hi,
                   ExprPtr body)
{
    return make_expr(Expr{.kind = kind,
                          .name = std::move(bound_var),
                          .var_type = std::move(var_type),
                          .operands = {std::move(lo), std::move(hi), std::move(body)}});
}

ExprPtr negate(const ExprPtr& expr)
{
    if (expr->kind == ExprKind::kBoolLit) {
        return bool_lit(!expr->bool_value);
    }
    if (expr->kind == ExprKind::kUnary && expr->unary_op == UnaryOp::kNot) {
        return expr->operands.front();
    }
    return unary(UnaryOp::kNot, expr);
}

bool structurally_equal(const Expr& lhs, const Expr& rhs)
{
    if (lhs.kind != rhs.kind || lhs.operands.size() != rhs.operands.size()) {
        return false;
    }
    switch (lhs.kind) {
        case ExprKind::kIntLit:
            return lhs.int_value == rhs.int_value;
        case ExprKind::kBoolLit:
            return lhs.bool_value == rhs.bool_value;
        case ExprKind::kFloatLit:
            return lhs.float_value == rhs.float_value;
        case ExprKind::kStringLit:
        case ExprKind::kVar:
            return lhs.name == rhs.name;
        case ExprKind::kUnary:
            if (lhs.unary_op != rhs.unary_op) {
                return false;
            }
            break;
        case ExprKind::kBinary:
            if (lhs.binary_op != rhs.binary_op) {
                return false;
            }
            break;
        case ExprKind::kCall:
        case ExprKind::kPrimitive:
            if (lhs.name != rhs.name) {
                return false;
            }
            break;
        case ExprKind::kForall:
        case ExprKind::kExists:
            if (lhs.name != rhs.name || lhs.var_type != rhs.var_type) {
                return false;
            }
            break;
        case ExprKind::kCond:
            break;
    }
    for (std::size_t i = 0; i < lhs.operands.size(); ++i) {
        const auto& a = lhs.operands[i];
        const auto& b = rhs.operands[i];
        if (!a || !b) {
            if (a != b) {
                return false;
            }
            continue;
        }
        if (!structurally_equal(*a, *b)) {
            return false;
        }
    }
    return true;
}

ExprPtr substitute(const ExprPtr& expr, const std::map<std::string, ExprPtr>& env)
{
    if (!expr || env.empty()) {
        return expr;
    }
    if (expr->kind == ExprKind::kVar) {
        auto it = env.find(expr->name);
        return it == env.end() ? expr : it->second;
    }
    if (expr->operands.empty()) {
        return expr;
    }

    std::vector<ExprPtr> operands;
    operands.reserve(expr->operands.size());
    bool changed = false;
    if (is_quantifier(expr->kind)) {
        // Bounds are evaluated outside the binder; the body sees the bound name.
        operands.push_back(substitute(expr->operands[0], env));
        operands.push_back(substitute(expr->operands[1], env));
        auto inner = env;
        inner.erase(expr->name);
        operands.push_back(substitute(expr->operands[2], inner));
    } else {
        for (const auto& operand : expr->operands) {
            operands.push_back(substitute(operand, env));
        }
    }
    for (std::size_t i = 0; i < operands.size(); ++i) {
        changed = changed || operands[i] != expr->operands[i];
    }
    if (!changed) {
        return expr;
    }
    Expr copy = *expr;
    copy.operands = std::move(operands);
    return make_expr(std::move(copy));
}

std::string_view binary_op_symbol(BinaryOp op)
{
    switch (op) {
        case BinaryOp::kAdd:
            return "+";
        case BinaryOp::kSub:
            return "-";
        case BinaryOp::kMul:
            return "*";
        case BinaryOp::kDiv:
            return "/";
        case BinaryOp::kMod:
            return "%";
        case BinaryOp::kEq:
            return "==";
        case BinaryOp::kNe:
            return "!=";
        case BinaryOp::kLt:
            return "<";
        case BinaryOp::kLe:
            return "<=";
        case BinaryOp::kGt:
            return ">";
        case BinaryOp::kGe:
            return ">=";
        case BinaryOp::kAnd:
            return "&&";
        case BinaryOp::kOr:
            return "||";
        case BinaryOp::kImplies:
            return "->";
    }
    return "?";
}

std::string to_string(const Expr& expr)
{
    switch (expr.kind) {
        case ExprKind::kIntLit:
            return std::to_string(expr.int_value);
        case ExprKind::kBoolLit:
            return expr.bool_value ? "true" : "false";
        case ExprKind::kFloatLit: {
            auto text = std::to_string(expr.float_value);
            while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') {
                text.pop_back();
            }
            return text;
        }
        case ExprKind::kStringLit:
            return "\"" + expr.name + "\"";
        case ExprKind::kVar:
            return expr.name;
        case ExprKind::kUnary:
            return std::string(expr.unary_op == UnaryOp::kNeg ? "-" : "!")
                   + operand_string(expr.operands.front());
        case ExprKind::kBinary:
            return operand_string(expr.operands[0]) + " "
                   + std::string(binary_op_symbol(expr.binary_op)) + " "
                   + operand_string(expr.operands[1]);
        case ExprKind::kCond:
            return operand_string(expr.operands[0]) + " ? " + operand_string(expr.operands[1])
                   + " : " + operand_string(expr.operands[2]);
        case ExprKind::kCall:
        case ExprKind::kPrimitive:
            return expr.name + "(" + join_args(expr.operands) + ")";
        case ExprKind::kForall:
        case ExprKind::kExists:
            return std::string(expr.kind == ExprKind::kForall ? "forall " : "exists ") + expr.name
                   + " in [" + operand_string(expr.operands[0]) + ", "
                   + operand_string(expr.operands[1]) + "): " + operand_string(expr.operands[2]);
    }
    return "?";
}

StmtPtr let_stmt(std::string name, ExprPtr value)
{
    return make_stmt(Stmt{.kind = StmtKind::kLet, .name = std::move(name), .value = std::move(value)});
}

StmtPtr assign_stmt(std::string name, ExprPtr value)
{
    return make_stmt(
        Stmt{.kind = StmtKind::kAssign, .name = std::move(name), .value = std::move(value)});
}

StmtPtr if_stmt(ExprPtr condition, std::vector<StmtPtr> then_body, std::vector<StmtPtr> else_body)
{
    return make_stmt(Stmt{.kind = StmtKind::kIf,
                          .cond = std::move(condition),
                          .then_body = std::move(then_body),
                          .else_body = std::move(else_body)});
}

StmtPtr return_stmt(ExprPtr value)
{
    return make_stmt(Stmt{.kind = StmtKind::kReturn, .value = std::move(value)});
}

StmtPtr expr_stmt(ExprPtr value)
{
    return make_stmt(Stmt{.kind = StmtKind::kExpr, .value = std::move(value)});
}

StmtPtr throw_stmt(ExprPtr value)
{
    return make_stmt(Stmt{.kind = StmtKind::kThrow, .value = std::move(value)});
}

StmtPtr while_stmt(ExprPtr condition, std::vector<StmtPtr> body)
{
    return make_stmt(
        Stmt{.kind = StmtKind::kWhile, .cond = std::move(condition), .then_body = std::move(body)});
}

}  // namespace ecv::ast
