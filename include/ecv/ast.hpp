#pragma once

/**
 * @file ast.hpp
 * @brief Immutable function-level AST consumed by the verification core
 *
 * Nodes are shared, immutable trees (`std::shared_ptr<const ...>`). The
 * verification core never mutates a loaded program; substitution builds new
 * nodes and shares untouched subtrees.
 */

#include "ecv/common.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ecv::ast {

inline constexpr std::string_view kProgramSchemaVersion = "ecv.program.v1";

struct SourceLoc
{
    std::string file;
    int line = 0;
    int col = 0;

    bool operator==(const SourceLoc&) const = default;
};

// ============================================================================
// Expressions
// ============================================================================

enum class ExprKind {
    kIntLit,
    kBoolLit,
    kFloatLit,
    kStringLit,
    kVar,
    kUnary,
    kBinary,
    kCond,
    kCall,
    kPrimitive,
    kForall,
    kExists,
};

enum class UnaryOp { kNeg, kNot };

enum class BinaryOp {
    kAdd,
    kSub,
    kMul,
    kDiv,
    kMod,
    kEq,
    kNe,
    kLt,
    kLe,
    kGt,
    kGe,
    kAnd,
    kOr,
    kImplies,
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/**
 * @brief Tagged expression node
 *
 * Operand layout by kind:
 * - kUnary: [operand]
 * - kBinary: [lhs, rhs]
 * - kCond: [cond, then, else]
 * - kCall, kPrimitive: arguments
 * - kForall, kExists: [lo, hi, body]
 */
struct Expr
{
    ExprKind kind = ExprKind::kIntLit;
    std::int64_t int_value = 0;
    bool bool_value = false;
    double float_value = 0.0;
    /// Variable name, string literal text, callee, primitive op or bound variable.
    std::string name;
    /// Bound variable type of a quantifier.
    std::string var_type;
    UnaryOp unary_op = UnaryOp::kNeg;
    BinaryOp binary_op = BinaryOp::kAdd;
    std::vector<ExprPtr> operands;
    std::optional<SourceLoc> loc;
};

[[nodiscard]] ExprPtr int_lit(std::int64_t value);
[[nodiscard]] ExprPtr bool_lit(bool value);
[[nodiscard]] ExprPtr float_lit(double value);
[[nodiscard]] ExprPtr string_lit(std::string value);
[[nodiscard]] ExprPtr var(std::string name);
[[nodiscard]] ExprPtr unary(UnaryOp op, ExprPtr operand);
[[nodiscard]] ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr cond(ExprPtr condition, ExprPtr then_expr, ExprPtr else_expr);
[[nodiscard]] ExprPtr call(std::string callee, std::vector<ExprPtr> args);
[[nodiscard]] ExprPtr primitive(std::string op, std::vector<ExprPtr> args);
[[nodiscard]] ExprPtr quantifier(ExprKind kind,
                                 std::string bound_var,
                                 std::string var_type,
                                 ExprPtr lo,
                                 ExprPtr hi,
                                 ExprPtr body);

/// Logical negation that folds `!!e` to `e` and literals to their opposite.
[[nodiscard]] ExprPtr negate(const ExprPtr& expr);

/// Structural equality, ignoring source locations.
[[nodiscard]] bool structurally_equal(const Expr& lhs, const Expr& rhs);

/// Replace free variables bound in `env`. Quantifier-bound names shadow `env`.
[[nodiscard]] ExprPtr substitute(const ExprPtr& expr, const std::map<std::string, ExprPtr>& env);

/// Compact infix rendering used in messages and ledger notes.
[[nodiscard]] std::string to_string(const Expr& expr);

[[nodiscard]] std::string_view binary_op_symbol(BinaryOp op);

// ============================================================================
// Statements
// ============================================================================

enum class StmtKind {
    kLet,
    kAssign,
    kIf,
    kReturn,
    kExpr,
    kThrow,
    kWhile,
    kFor,
};

struct Stmt;
using StmtPtr = std::shared_ptr<const Stmt>;

/**
 * @brief Statement node
 *
 * `value` holds the bound/assigned value (let, assign), the returned or
 * thrown value (return, throw; may be null) or the evaluated expression
 * (expr). `cond` is the branch or loop condition (may be null for `for`).
 * `then_body` doubles as the loop body.
 */
struct Stmt
{
    StmtKind kind = StmtKind::kExpr;
    std::string name;
    ExprPtr value;
    ExprPtr cond;
    std::vector<StmtPtr> then_body;
    std::vector<StmtPtr> else_body;
    std::optional<SourceLoc> loc;
};

[[nodiscard]] StmtPtr let_stmt(std::string name, ExprPtr value);
[[nodiscard]] StmtPtr assign_stmt(std::string name, ExprPtr value);
[[nodiscard]] StmtPtr if_stmt(ExprPtr condition,
                              std::vector<StmtPtr> then_body,
                              std::vector<StmtPtr> else_body = {});
[[nodiscard]] StmtPtr return_stmt(ExprPtr value);
[[nodiscard]] StmtPtr expr_stmt(ExprPtr value);
[[nodiscard]] StmtPtr throw_stmt(ExprPtr value = nullptr);
[[nodiscard]] StmtPtr while_stmt(ExprPtr condition, std::vector<StmtPtr> body);

// ============================================================================
// Functions and programs
// ============================================================================

struct Param
{
    std::string name;
    std::string type;
};

struct Function
{
    std::string id;
    std::string name;
    std::vector<Param> params;
    std::string return_type;
    /// Declared effect codes as written (aliases not yet normalized).
    std::vector<std::string> effects;
    std::vector<ExprPtr> preconditions;
    std::vector<ExprPtr> postconditions;
    std::vector<StmtPtr> body;
    std::optional<SourceLoc> loc;
};

struct Program
{
    std::string schema_version{kProgramSchemaVersion};
    std::string module;
    std::vector<Function> functions;
};

/**
 * Build a program from a program.v1 JSON document.
 *
 * Structural checks only; schema validation is the caller's concern.
 */
[[nodiscard]] ecv::Result<Program> program_from_json(const nlohmann::json& j);

/// Serialize back to program.v1 form (stable key order via canonical JSON).
[[nodiscard]] nlohmann::json to_json(const Program& program);
[[nodiscard]] nlohmann::json to_json(const Function& function);
[[nodiscard]] nlohmann::json to_json(const Expr& expr);
[[nodiscard]] nlohmann::json to_json(const Stmt& stmt);

/**
 * Read, schema-validate and load a program.v1 file.
 * @param schema_dir Directory containing program.v1.schema.json
 */
[[nodiscard]] ecv::Result<Program> load_program_file(const std::string& path,
                                                     const std::string& schema_dir);

}  // namespace ecv::ast
