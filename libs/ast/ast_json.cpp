/**
 * @file ast_json.cpp
 * @brief program.v1 JSON <-> AST conversion
 */

#include "ecv/ast.hpp"
#include "ecv/json_file.hpp"
#include "ecv/schema_validate.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ecv::ast {

namespace {

using nlohmann::json;

const std::map<std::string, BinaryOp, std::less<>> kBinaryOps = {
    { "+",     BinaryOp::kAdd},
    { "-",     BinaryOp::kSub},
    { "*",     BinaryOp::kMul},
    { "/",     BinaryOp::kDiv},
    { "%",     BinaryOp::kMod},
    {"==",      BinaryOp::kEq},
    {"!=",      BinaryOp::kNe},
    { "<",      BinaryOp::kLt},
    {"<=",      BinaryOp::kLe},
    { ">",      BinaryOp::kGt},
    {">=",      BinaryOp::kGe},
    {"&&",     BinaryOp::kAnd},
    {"||",      BinaryOp::kOr},
    {"->", BinaryOp::kImplies},
};

[[nodiscard]] ecv::Error missing_field(std::string_view key, std::string_view context)
{
    return Error::make("MissingField",
                       "Missing required field '" + std::string(key) + "' in "
                           + std::string(context));
}

[[nodiscard]] ecv::Error wrong_type(std::string_view key,
                                    std::string_view expected,
                                    std::string_view context)
{
    return Error::make("InvalidFieldType",
                       "Expected " + std::string(expected) + " field '" + std::string(key)
                           + "' in " + std::string(context));
}

[[nodiscard]] ecv::Result<std::string> require_string(const json& obj,
                                                      std::string_view key,
                                                      std::string_view context)
{
    auto it = obj.find(std::string(key));
    if (it == obj.end()) {
        return std::unexpected(missing_field(key, context));
    }
    if (!it->is_string()) {
        return std::unexpected(wrong_type(key, "string", context));
    }
    return it->get<std::string>();
}

[[nodiscard]] ecv::Result<const json*> require_array(const json& obj,
                                                     std::string_view key,
                                                     std::string_view context)
{
    auto it = obj.find(std::string(key));
    if (it == obj.end()) {
        return std::unexpected(missing_field(key, context));
    }
    if (!it->is_array()) {
        return std::unexpected(wrong_type(key, "array", context));
    }
    return &*it;
}

[[nodiscard]] const json* optional_array(const json& obj, std::string_view key)
{
    auto it = obj.find(std::string(key));
    return (it != obj.end() && it->is_array()) ? &*it : nullptr;
}

[[nodiscard]] std::optional<SourceLoc> parse_loc(const json& obj)
{
    auto it = obj.find("loc");
    if (it == obj.end() || !it->is_object()) {
        return std::nullopt;
    }
    SourceLoc loc;
    loc.file = it->value("file", std::string{});
    loc.line = it->value("line", 0);
    loc.col = it->value("col", 0);
    return loc;
}

void put_loc(json& j, const std::optional<SourceLoc>& loc)
{
    if (loc) {
        j["loc"] = json{
            {"file", loc->file},
            {"line", loc->line},
            { "col",  loc->col}
        };
    }
}

[[nodiscard]] ecv::Result<ExprPtr> parse_expr(const json& j, std::string_view context);

[[nodiscard]] ecv::Result<ExprPtr> parse_child(const json& j,
                                               std::string_view key,
                                               std::string_view context)
{
    auto it = j.find(std::string(key));
    if (it == j.end()) {
        return std::unexpected(missing_field(key, context));
    }
    return parse_expr(*it, context);
}

[[nodiscard]] ecv::Result<std::vector<ExprPtr>> parse_expr_list(const json& arr,
                                                                std::string_view context)
{
    std::vector<ExprPtr> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        auto expr = parse_expr(item, context);
        if (!expr) {
            return std::unexpected(expr.error());
        }
        out.push_back(std::move(*expr));
    }
    return out;
}

[[nodiscard]] ecv::Result<ExprPtr> parse_expr(const json& j, std::string_view context)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidExpression", "Expression must be an object in " + std::string(context)));
    }
    auto kind = require_string(j, "kind", context);
    if (!kind) {
        return std::unexpected(kind.error());
    }

    Expr expr;
    expr.loc = parse_loc(j);

    if (*kind == "int") {
        if (!j.contains("value") || !j.at("value").is_number_integer()) {
            return std::unexpected(wrong_type("value", "integer", context));
        }
        expr.kind = ExprKind::kIntLit;
        expr.int_value = j.at("value").get<std::int64_t>();
    } else if (*kind == "bool") {
        if (!j.contains("value") || !j.at("value").is_boolean()) {
            return std::unexpected(wrong_type("value", "boolean", context));
        }
        expr.kind = ExprKind::kBoolLit;
        expr.bool_value = j.at("value").get<bool>();
    } else if (*kind == "float") {
        if (!j.contains("value") || !j.at("value").is_number()) {
            return std::unexpected(wrong_type("value", "number", context));
        }
        expr.kind = ExprKind::kFloatLit;
        expr.float_value = j.at("value").get<double>();
    } else if (*kind == "string") {
        auto value = require_string(j, "value", context);
        if (!value) {
            return std::unexpected(value.error());
        }
        expr.kind = ExprKind::kStringLit;
        expr.name = std::move(*value);
    } else if (*kind == "var") {
        auto name = require_string(j, "name", context);
        if (!name) {
            return std::unexpected(name.error());
        }
        expr.kind = ExprKind::kVar;
        expr.name = std::move(*name);
    } else if (*kind == "unary") {
        auto op = require_string(j, "op", context);
        if (!op) {
            return std::unexpected(op.error());
        }
        if (*op != "-" && *op != "!") {
            return std::unexpected(
                Error::make("InvalidOperator", "Unknown unary operator '" + *op + "' in " + std::string(context)));
        }
        auto operand = parse_child(j, "operand", context);
        if (!operand) {
            return std::unexpected(operand.error());
        }
        expr.kind = ExprKind::kUnary;
        expr.unary_op = *op == "-" ? UnaryOp::kNeg : UnaryOp::kNot;
        expr.operands = {std::move(*operand)};
    } else if (*kind == "binary") {
        auto op = require_string(j, "op", context);
        if (!op) {
            return std::unexpected(op.error());
        }
        auto op_it = kBinaryOps.find(*op);
        if (op_it == kBinaryOps.end()) {
            return std::unexpected(
                Error::make("InvalidOperator", "Unknown binary operator '" + *op + "' in " + std::string(context)));
        }
        auto lhs = parse_child(j, "lhs", context);
        if (!lhs) {
            return std::unexpected(lhs.error());
        }
        auto rhs = parse_child(j, "rhs", context);
        if (!rhs) {
            return std::unexpected(rhs.error());
        }
        expr.kind = ExprKind::kBinary;
        expr.binary_op = op_it->second;
        expr.operands = {std::move(*lhs), std::move(*rhs)};
    } else if (*kind == "cond") {
        auto c = parse_child(j, "cond", context);
        if (!c) {
            return std::unexpected(c.error());
        }
        auto t = parse_child(j, "then", context);
        if (!t) {
            return std::unexpected(t.error());
        }
        auto e = parse_child(j, "else", context);
        if (!e) {
            return std::unexpected(e.error());
        }
        expr.kind = ExprKind::kCond;
        expr.operands = {std::move(*c), std::move(*t), std::move(*e)};
    } else if (*kind == "call" || *kind == "primitive") {
        const bool is_call = *kind == "call";
        auto name = require_string(j, is_call ? "callee" : "op", context);
        if (!name) {
            return std::unexpected(name.error());
        }
        std::vector<ExprPtr> args;
        if (const json* arr = optional_array(j, "args")) {
            auto parsed = parse_expr_list(*arr, context);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            args = std::move(*parsed);
        }
        expr.kind = is_call ? ExprKind::kCall : ExprKind::kPrimitive;
        expr.name = std::move(*name);
        expr.operands = std::move(args);
    } else if (*kind == "forall" || *kind == "exists") {
        auto bound = require_string(j, "var", context);
        if (!bound) {
            return std::unexpected(bound.error());
        }
        auto lo = parse_child(j, "lo", context);
        if (!lo) {
            return std::unexpected(lo.error());
        }
        auto hi = parse_child(j, "hi", context);
        if (!hi) {
            return std::unexpected(hi.error());
        }
        auto body = parse_child(j, "body", context);
        if (!body) {
            return std::unexpected(body.error());
        }
        expr.kind = *kind == "forall" ? ExprKind::kForall : ExprKind::kExists;
        expr.name = std::move(*bound);
        expr.var_type = j.value("var_type", std::string("int"));
        expr.operands = {std::move(*lo), std::move(*hi), std::move(*body)};
    } else {
        return std::unexpected(Error::make(
            "InvalidExpression", "Unknown expression kind '" + *kind + "' in " + std::string(context)));
    }
    return std::make_shared<const Expr>(std::move(expr));
}

[[nodiscard]] ecv::Result<std::vector<StmtPtr>> parse_block(const json& arr, std::string_view context);

[[nodiscard]] ecv::Result<std::vector<StmtPtr>> parse_optional_block(const json& j,
                                                                     std::string_view key,
                                                                     std::string_view context)
{
    if (const json* arr = optional_array(j, key)) {
        return parse_block(*arr, context);
    }
    return std::vector<StmtPtr>{};
}

[[nodiscard]] ecv::Result<ExprPtr> parse_optional_expr(const json& j,
                                                       std::string_view key,
                                                       std::string_view context)
{
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) {
        return ExprPtr{};
    }
    return parse_expr(*it, context);
}

[[nodiscard]] ecv::Result<StmtPtr> parse_stmt(const json& j, std::string_view context)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidStatement", "Statement must be an object in " + std::string(context)));
    }
    auto kind = require_string(j, "kind", context);
    if (!kind) {
        return std::unexpected(kind.error());
    }

    Stmt stmt;
    stmt.loc = parse_loc(j);

    if (*kind == "let" || *kind == "assign") {
        auto name = require_string(j, "name", context);
        if (!name) {
            return std::unexpected(name.error());
        }
        auto value = parse_child(j, "value", context);
        if (!value) {
            return std::unexpected(value.error());
        }
        stmt.kind = *kind == "let" ? StmtKind::kLet : StmtKind::kAssign;
        stmt.name = std::move(*name);
        stmt.value = std::move(*value);
    } else if (*kind == "if") {
        auto c = parse_child(j, "cond", context);
        if (!c) {
            return std::unexpected(c.error());
        }
        auto then_arr = require_array(j, "then", context);
        if (!then_arr) {
            return std::unexpected(then_arr.error());
        }
        auto then_body = parse_block(**then_arr, context);
        if (!then_body) {
            return std::unexpected(then_body.error());
        }
        auto else_body = parse_optional_block(j, "else", context);
        if (!else_body) {
            return std::unexpected(else_body.error());
        }
        stmt.kind = StmtKind::kIf;
        stmt.cond = std::move(*c);
        stmt.then_body = std::move(*then_body);
        stmt.else_body = std::move(*else_body);
    } else if (*kind == "return" || *kind == "throw" || *kind == "expr") {
        auto value = *kind == "expr" ? parse_child(j, "value", context)
                                     : parse_optional_expr(j, "value", context);
        if (!value) {
            return std::unexpected(value.error());
        }
        stmt.kind = *kind == "return" ? StmtKind::kReturn
                    : *kind == "throw" ? StmtKind::kThrow
                                       : StmtKind::kExpr;
        stmt.value = std::move(*value);
    } else if (*kind == "while" || *kind == "for") {
        const bool is_while = *kind == "while";
        auto c = is_while ? parse_child(j, "cond", context) : parse_optional_expr(j, "cond", context);
        if (!c) {
            return std::unexpected(c.error());
        }
        auto body = parse_optional_block(j, "body", context);
        if (!body) {
            return std::unexpected(body.error());
        }
        stmt.kind = is_while ? StmtKind::kWhile : StmtKind::kFor;
        stmt.cond = std::move(*c);
        stmt.then_body = std::move(*body);
    } else {
        return std::unexpected(Error::make(
            "InvalidStatement", "Unknown statement kind '" + *kind + "' in " + std::string(context)));
    }
    return std::make_shared<const Stmt>(std::move(stmt));
}

ecv::Result<std::vector<StmtPtr>> parse_block(const json& arr, std::string_view context)
{
    std::vector<StmtPtr> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        auto stmt = parse_stmt(item, context);
        if (!stmt) {
            return std::unexpected(stmt.error());
        }
        out.push_back(std::move(*stmt));
    }
    return out;
}

[[nodiscard]] ecv::Result<Function> parse_function(const json& j, std::size_t index)
{
    const std::string context = "functions[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidFunction", "Function entry must be an object: " + context));
    }

    Function fn;
    auto id = require_string(j, "id", context);
    if (!id) {
        return std::unexpected(id.error());
    }
    fn.id = std::move(*id);
    fn.name = j.value("name", fn.id);
    fn.return_type = j.value("return_type", std::string("void"));
    fn.loc = parse_loc(j);

    const std::string fn_context = "function '" + fn.id + "'";
    if (const json* params = optional_array(j, "params")) {
        for (const auto& param : *params) {
            auto name = require_string(param, "name", fn_context + " params");
            if (!name) {
                return std::unexpected(name.error());
            }
            auto type = require_string(param, "type", fn_context + " params");
            if (!type) {
                return std::unexpected(type.error());
            }
            fn.params.push_back(Param{.name = std::move(*name), .type = std::move(*type)});
        }
    }
    if (const json* effects = optional_array(j, "effects")) {
        for (const auto& code : *effects) {
            if (!code.is_string()) {
                return std::unexpected(wrong_type("effects", "string array", fn_context));
            }
            fn.effects.push_back(code.get<std::string>());
        }
    }
    if (const json* pre = optional_array(j, "requires")) {
        auto parsed = parse_expr_list(*pre, fn_context + " requires");
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        fn.preconditions = std::move(*parsed);
    }
    if (const json* post = optional_array(j, "ensures")) {
        auto parsed = parse_expr_list(*post, fn_context + " ensures");
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        fn.postconditions = std::move(*parsed);
    }
    auto body = parse_optional_block(j, "body", fn_context + " body");
    if (!body) {
        return std::unexpected(body.error());
    }
    fn.body = std::move(*body);
    return fn;
}

[[nodiscard]] json to_json_list(const std::vector<ExprPtr>& exprs)
{
    json arr = json::array();
    for (const auto& expr : exprs) {
        arr.push_back(to_json(*expr));
    }
    return arr;
}

[[nodiscard]] json to_json_block(const std::vector<StmtPtr>& stmts)
{
    json arr = json::array();
    for (const auto& stmt : stmts) {
        arr.push_back(to_json(*stmt));
    }
    return arr;
}

}  // namespace

ecv::Result<Program> program_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidProgram", "Program document must be an object"));
    }
    Program program;
    program.schema_version = j.value("schema_version", std::string(kProgramSchemaVersion));
    if (program.schema_version != kProgramSchemaVersion) {
        return std::unexpected(Error::make(
            "UnsupportedSchemaVersion", "Unsupported program schema_version: " + program.schema_version));
    }
    program.module = j.value("module", std::string{});

    auto functions = require_array(j, "functions", "program");
    if (!functions) {
        return std::unexpected(functions.error());
    }
    program.functions.reserve((*functions)->size());
    for (std::size_t i = 0; i < (*functions)->size(); ++i) {
        auto fn = parse_function((**functions)[i], i);
        if (!fn) {
            return std::unexpected(fn.error());
        }
        program.functions.push_back(std::move(*fn));
    }
    return program;
}

nlohmann::json to_json(const Expr& expr)
{
    json j;
    switch (expr.kind) {
        case ExprKind::kIntLit:
            j = json{
                { "kind",       "int"},
                {"value", expr.int_value}
            };
            break;
        case ExprKind::kBoolLit:
            j = json{
                { "kind",        "bool"},
                {"value", expr.bool_value}
            };
            break;
        case ExprKind::kFloatLit:
            j = json{
                { "kind",         "float"},
                {"value", expr.float_value}
            };
            break;
        case ExprKind::kStringLit:
            j = json{
                { "kind", "string"},
                {"value", expr.name}
            };
            break;
        case ExprKind::kVar:
            j = json{
                {"kind",     "var"},
                {"name", expr.name}
            };
            break;
        case ExprKind::kUnary:
            j = json{
                {   "kind",                                       "unary"},
                {     "op", expr.unary_op == UnaryOp::kNeg ? "-" : "!"},
                {"operand",                   to_json(*expr.operands[0])}
            };
            break;
        case ExprKind::kBinary:
            j = json{
                {"kind",                                  "binary"},
                {  "op", std::string(binary_op_symbol(expr.binary_op))},
                { "lhs",                 to_json(*expr.operands[0])},
                { "rhs",                 to_json(*expr.operands[1])}
            };
            break;
        case ExprKind::kCond:
            j = json{
                {"kind",                     "cond"},
                {"cond", to_json(*expr.operands[0])},
                {"then", to_json(*expr.operands[1])},
                {"else", to_json(*expr.operands[2])}
            };
            break;
        case ExprKind::kCall:
            j = json{
                {  "kind",                       "call"},
                {"callee",                    expr.name},
                {  "args", to_json_list(expr.operands)}
            };
            break;
        case ExprKind::kPrimitive:
            j = json{
                {"kind",                  "primitive"},
                {  "op",                    expr.name},
                {"args", to_json_list(expr.operands)}
            };
            break;
        case ExprKind::kForall:
        case ExprKind::kExists:
            j = json{
                {    "kind", expr.kind == ExprKind::kForall ? "forall" : "exists"},
                {     "var",                                           expr.name},
                {"var_type",                                       expr.var_type},
                {      "lo",                          to_json(*expr.operands[0])},
                {      "hi",                          to_json(*expr.operands[1])},
                {    "body",                          to_json(*expr.operands[2])}
            };
            break;
    }
    put_loc(j, expr.loc);
    return j;
}

nlohmann::json to_json(const Stmt& stmt)
{
    json j;
    switch (stmt.kind) {
        case StmtKind::kLet:
        case StmtKind::kAssign:
            j = json{
                { "kind", stmt.kind == StmtKind::kLet ? "let" : "assign"},
                { "name",                                      stmt.name},
                {"value",                            to_json(*stmt.value)}
            };
            break;
        case StmtKind::kIf:
            j = json{
                {"kind",                           "if"},
                {"cond",             to_json(*stmt.cond)},
                {"then", to_json_block(stmt.then_body)},
                {"else", to_json_block(stmt.else_body)}
            };
            break;
        case StmtKind::kReturn:
        case StmtKind::kThrow:
            j = json{
                {"kind", stmt.kind == StmtKind::kReturn ? "return" : "throw"}
            };
            if (stmt.value) {
                j["value"] = to_json(*stmt.value);
            }
            break;
        case StmtKind::kExpr:
            j = json{
                { "kind",               "expr"},
                {"value", to_json(*stmt.value)}
            };
            break;
        case StmtKind::kWhile:
        case StmtKind::kFor:
            j = json{
                {"kind", stmt.kind == StmtKind::kWhile ? "while" : "for"},
                {"body",               to_json_block(stmt.then_body)}
            };
            if (stmt.cond) {
                j["cond"] = to_json(*stmt.cond);
            }
            break;
    }
    put_loc(j, stmt.loc);
    return j;
}

nlohmann::json to_json(const Function& function)
{
    json params = json::array();
    for (const auto& param : function.params) {
        params.push_back(json{
            {"name", param.name},
            {"type", param.type}
        });
    }
    json j{
        {         "id",                        function.id},
        {       "name",                      function.name},
        {     "params",                             params},
        {"return_type",               function.return_type},
        {    "effects",                   function.effects},
        {   "requires", to_json_list(function.preconditions)},
        {    "ensures", to_json_list(function.postconditions)},
        {       "body",           to_json_block(function.body)}
    };
    put_loc(j, function.loc);
    return j;
}

nlohmann::json to_json(const Program& program)
{
    json functions = json::array();
    for (const auto& fn : program.functions) {
        functions.push_back(to_json(fn));
    }
    return json{
        {"schema_version", program.schema_version},
        {        "module",         program.module},
        {     "functions",              functions}
    };
}

ecv::Result<Program> load_program_file(const std::string& path, const std::string& schema_dir)
{
    auto payload = common::read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (auto validation = common::validate_document(*payload, schema_dir, "program.v1");
        !validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid", "program schema validation failed: " + validation.error().message));
    }
    return program_from_json(*payload);
}

}  // namespace ecv::ast
