#pragma once

/**
 * @file paths.hpp
 * @brief Path enumeration over branching, loop-free function bodies
 */

#include "ecv/ast.hpp"
#include "ecv/formula.hpp"

#include <cstddef>
#include <vector>

namespace ecv::contracts {

/**
 * @brief One entry-to-exit path
 *
 * Conditions and the returned expression are expressed over parameters
 * only; local bindings have been substituted. An empty condition list means
 * true. `returned` is null for `return;` and for falling off the end.
 */
struct Path
{
    std::vector<ast::ExprPtr> conditions;
    ast::ExprPtr returned;
};

struct PathSet
{
    std::vector<Path> paths;
    /// Paths that end in `throw`; postconditions do not apply to them.
    std::size_t thrown = 0;
};

/**
 * Enumerate the returning paths of a function body, then-branch first.
 *
 * Literal-false branches and branches whose structural negation is already
 * on the path are pruned; literal-true predicates are not recorded.
 *
 * @return kUnsupported for loops, kTooComplex beyond `max_paths` paths
 */
[[nodiscard]] Translation<PathSet> enumerate_paths(const ast::Function& function,
                                                   std::size_t max_paths);

}  // namespace ecv::contracts
