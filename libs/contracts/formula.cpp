/**
 * @file formula.cpp
 * @brief Formula construction and integer type table
 */

#include "ecv/formula.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ecv::contracts {

namespace {

struct IntegerType
{
    std::string_view name;
    IntType type;
};

constexpr std::array<IntegerType, 16> kIntegerTypes = {
    {{"int", {32, true}},
     {"long", {64, true}},
     {"short", {16, true}},
     {"byte", {8, false}},
     {"sbyte", {8, true}},
     {"uint", {32, false}},
     {"ulong", {64, false}},
     {"ushort", {16, false}},
     {"i8", {8, true}},
     {"i16", {16, true}},
     {"i32", {32, true}},
     {"i64", {64, true}},
     {"u8", {8, false}},
     {"u16", {16, false}},
     {"u32", {32, false}},
     {"u64", {64, false}}}
};

[[nodiscard]] const IntegerType* find_integer_type(std::string_view type)
{
    for (const auto& entry : kIntegerTypes) {
        if (entry.name == type) {
            return &entry;
        }
    }
    return nullptr;
}

[[nodiscard]] FormulaPtr make(Formula formula)
{
    return std::make_shared<const Formula>(std::move(formula));
}

[[nodiscard]] Sort result_sort_of(FormulaOp op)
{
    switch (op) {
        case FormulaOp::kIntConst:
        case FormulaOp::kConvert:
        case FormulaOp::kNeg:
        case FormulaOp::kAdd:
        case FormulaOp::kSub:
        case FormulaOp::kMul:
        case FormulaOp::kDiv:
        case FormulaOp::kMod:
            return Sort::kInt;
        default:
            return Sort::kBool;
    }
}

/// SMT-LIB name; signedness picks between the bvs* and bvu* forms.
[[nodiscard]] std::string_view op_name(FormulaOp op, bool is_signed)
{
    switch (op) {
        case FormulaOp::kIntConst:
        case FormulaOp::kBoolConst:
        case FormulaOp::kVar:
        case FormulaOp::kConvert:
            return "";
        case FormulaOp::kNeg:
            return "bvneg";
        case FormulaOp::kAdd:
            return "bvadd";
        case FormulaOp::kSub:
            return "bvsub";
        case FormulaOp::kMul:
            return "bvmul";
        case FormulaOp::kDiv:
            return is_signed ? "bvsdiv" : "bvudiv";
        case FormulaOp::kMod:
            return is_signed ? "bvsrem" : "bvurem";
        case FormulaOp::kNot:
            return "not";
        case FormulaOp::kAnd:
            return "and";
        case FormulaOp::kOr:
            return "or";
        case FormulaOp::kImplies:
            return "=>";
        case FormulaOp::kIte:
            return "ite";
        case FormulaOp::kEq:
            return "=";
        case FormulaOp::kNe:
            return "distinct";
        case FormulaOp::kLt:
            return is_signed ? "bvslt" : "bvult";
        case FormulaOp::kLe:
            return is_signed ? "bvsle" : "bvule";
        case FormulaOp::kGt:
            return is_signed ? "bvsgt" : "bvugt";
        case FormulaOp::kGe:
            return is_signed ? "bvsge" : "bvuge";
    }
    return "?";
}

[[nodiscard]] std::string convert_name(IntType from, IntType to)
{
    if (to.width > from.width) {
        return "(_ " + std::string(from.is_signed ? "sign_extend " : "zero_extend ")
               + std::to_string(to.width - from.width) + ")";
    }
    // Same width reinterprets the bits.
    return "(_ extract " + std::to_string(to.width - 1) + " 0)";
}

}  // namespace

FormulaPtr int_const(std::int64_t value, IntType type)
{
    return make(Formula{.op = FormulaOp::kIntConst, .sort = Sort::kInt, .int_type = type, .int_value = value});
}

FormulaPtr bool_const(bool value)
{
    return make(Formula{.op = FormulaOp::kBoolConst, .sort = Sort::kBool, .bool_value = value});
}

FormulaPtr variable(std::string name, Sort sort, IntType type)
{
    return make(Formula{.op = FormulaOp::kVar, .sort = sort, .int_type = type, .name = std::move(name)});
}

FormulaPtr convert(FormulaPtr value, IntType type)
{
    if (value->int_type == type) {
        return value;
    }
    if (value->op == FormulaOp::kIntConst && fits(value->int_value, type)) {
        return int_const(value->int_value, type);
    }
    return make(Formula{.op = FormulaOp::kConvert, .sort = Sort::kInt, .int_type = type, .args = {std::move(value)}});
}

FormulaPtr apply(FormulaOp op, std::vector<FormulaPtr> args)
{
    Sort sort = result_sort_of(op);
    IntType type;
    if (op == FormulaOp::kIte && args.size() == 3) {
        sort = args[1]->sort;
        type = args[1]->int_type;
    } else if (sort == Sort::kInt && !args.empty()) {
        type = args[0]->int_type;
    }
    return make(Formula{.op = op, .sort = sort, .int_type = type, .args = std::move(args)});
}

std::string to_string(const Formula& formula)
{
    switch (formula.op) {
        case FormulaOp::kIntConst:
            return formula.int_value < 0 ? "(- " + std::to_string(formula.int_value).substr(1) + ")"
                                         : std::to_string(formula.int_value);
        case FormulaOp::kBoolConst:
            return formula.bool_value ? "true" : "false";
        case FormulaOp::kVar:
            return formula.name;
        case FormulaOp::kConvert:
            return "(" + convert_name(formula.args[0]->int_type, formula.int_type) + " "
                   + to_string(*formula.args[0]) + ")";
        default:
            break;
    }
    // Comparisons take their signedness from the operands.
    const bool is_signed = formula.args.empty() ? true : formula.args[0]->int_type.is_signed;
    std::string out = "(" + std::string(op_name(formula.op, is_signed));
    for (const auto& arg : formula.args) {
        out += " " + to_string(*arg);
    }
    return out + ")";
}

bool is_integer_type(std::string_view type)
{
    return find_integer_type(type) != nullptr;
}

std::optional<IntType> int_type_of(std::string_view type)
{
    const auto* entry = find_integer_type(type);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->type;
}

std::optional<Sort> sort_of_type(std::string_view type)
{
    if (is_integer_type(type)) {
        return Sort::kInt;
    }
    if (type == "bool") {
        return Sort::kBool;
    }
    return std::nullopt;
}

bool fits(std::int64_t value, IntType type)
{
    if (type.width >= 64) {
        return type.is_signed || value >= 0;
    }
    if (type.is_signed) {
        const std::int64_t bound = std::int64_t{1} << (type.width - 1);
        return value >= -bound && value < bound;
    }
    return value >= 0 && value < (std::int64_t{1} << type.width);
}

}  // namespace ecv::contracts
