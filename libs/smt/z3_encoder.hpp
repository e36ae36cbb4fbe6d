#pragma once

/**
 * @file z3_encoder.hpp
 * @brief Formula -> z3::expr encoding (internal to the smt library)
 */

#include "ecv/formula.hpp"

#include <map>
#include <string>

#include <z3++.h>

namespace ecv::smt {

/// Encodes formulas into one z3::context over bitvectors and Booleans.
/// Variables are shared by name.
class Z3Encoder
{
public:
    explicit Z3Encoder(z3::context& ctx)
        : m_ctx(ctx)
    {}

    /// Throws z3::exception on solver-side failures.
    [[nodiscard]] z3::expr encode(const contracts::Formula& formula);

    [[nodiscard]] z3::expr variable(const contracts::Variable& var);

private:
    z3::context& m_ctx;
    std::map<std::string, z3::expr> m_vars;
};

}  // namespace ecv::smt
