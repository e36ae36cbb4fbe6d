/**
 * @file paths.cpp
 * @brief Symbolic path enumeration with local-binding substitution
 */

#include "ecv/paths.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ecv::contracts {

namespace {

using ast::StmtKind;

struct Cursor
{
    const std::vector<ast::StmtPtr>* block;
    std::size_t index;
};

struct PathState
{
    std::map<std::string, ast::ExprPtr> env;
    std::vector<ast::ExprPtr> conditions;
    std::vector<Cursor> stack;
};

[[nodiscard]] bool contains_loop(const std::vector<ast::StmtPtr>& block)
{
    return std::ranges::any_of(block, [](const ast::StmtPtr& stmt) {
        return stmt->kind == StmtKind::kWhile || stmt->kind == StmtKind::kFor
               || contains_loop(stmt->then_body) || contains_loop(stmt->else_body);
    });
}

[[nodiscard]] bool is_literal(const ast::ExprPtr& expr, bool value)
{
    return expr->kind == ast::ExprKind::kBoolLit && expr->bool_value == value;
}

[[nodiscard]] bool on_path(const std::vector<ast::ExprPtr>& conditions, const ast::ExprPtr& expr)
{
    return std::ranges::any_of(conditions, [&expr](const ast::ExprPtr& c) {
        return ast::structurally_equal(*c, *expr);
    });
}

/// Add `predicate` to `state`; false if the branch is infeasible.
[[nodiscard]] bool assume(PathState& state, const ast::ExprPtr& predicate)
{
    if (is_literal(predicate, false) || on_path(state.conditions, ast::negate(predicate))) {
        return false;
    }
    if (!is_literal(predicate, true) && !on_path(state.conditions, predicate)) {
        state.conditions.push_back(predicate);
    }
    return true;
}

}  // namespace

Translation<PathSet> enumerate_paths(const ast::Function& function, std::size_t max_paths)
{
    if (contains_loop(function.body)) {
        return std::unexpected(TranslationFailure::unsupported("loop"));
    }

    PathSet result;
    std::vector<PathState> worklist;
    worklist.push_back(PathState{.env = {}, .conditions = {}, .stack = {Cursor{&function.body, 0}}});

    const auto emit = [&](PathState& state, ast::ExprPtr returned) -> bool {
        result.paths.push_back(Path{.conditions = std::move(state.conditions),
                                    .returned = std::move(returned)});
        return result.paths.size() <= max_paths;
    };

    while (!worklist.empty()) {
        PathState state = std::move(worklist.back());
        worklist.pop_back();

        bool finished = false;
        while (!finished) {
            if (state.stack.empty()) {
                if (!emit(state, nullptr)) {
                    return std::unexpected(TranslationFailure::too_complex(
                        "more than " + std::to_string(max_paths) + " paths"));
                }
                break;
            }
            Cursor& top = state.stack.back();
            if (top.index >= top.block->size()) {
                state.stack.pop_back();
                continue;
            }
            const ast::Stmt& stmt = *(*top.block)[top.index++];

            switch (stmt.kind) {
                case StmtKind::kLet:
                case StmtKind::kAssign:
                    state.env.insert_or_assign(stmt.name, ast::substitute(stmt.value, state.env));
                    break;
                case StmtKind::kExpr:
                    break;
                case StmtKind::kReturn:
                    if (!emit(state, ast::substitute(stmt.value, state.env))) {
                        return std::unexpected(TranslationFailure::too_complex(
                            "more than " + std::to_string(max_paths) + " paths"));
                    }
                    finished = true;
                    break;
                case StmtKind::kThrow:
                    ++result.thrown;
                    finished = true;
                    break;
                case StmtKind::kIf: {
                    const auto predicate = ast::substitute(stmt.cond, state.env);
                    PathState else_state = state;
                    const bool else_feasible = assume(else_state, ast::negate(predicate));
                    if (else_feasible) {
                        else_state.stack.push_back(Cursor{&stmt.else_body, 0});
                        worklist.push_back(std::move(else_state));
                    }
                    if (assume(state, predicate)) {
                        state.stack.push_back(Cursor{&stmt.then_body, 0});
                    } else {
                        finished = true;
                    }
                    break;
                }
                case StmtKind::kWhile:
                case StmtKind::kFor:
                    return std::unexpected(TranslationFailure::unsupported("loop"));
            }
        }
    }
    return result;
}

}  // namespace ecv::contracts
