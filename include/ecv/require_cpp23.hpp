#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for ECV
 *
 * Pulled in by ecv/common.hpp, so every translation unit fails early with a
 * readable message on an insufficient toolchain.
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus <= 202'002L
    #error "ECV requires C++23 (compile with -std=c++23 or -std=c++2b)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Error handling (ecv::Result)

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "ECV requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// =============================================================================
// std::jthread / std::stop_token (__cpp_lib_jthread)
// =============================================================================
// Required for: worker pools and cooperative cancellation of solver queries

#if !defined(__cpp_lib_jthread) || __cpp_lib_jthread < 201'911L
    #error "ECV requires std::jthread and std::stop_token (__cpp_lib_jthread >= 201911L)."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================
// Required for: Range algorithms

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 201'911L
    #error "ECV requires std::ranges (__cpp_lib_ranges >= 201911L)."
#endif

// =============================================================================
// std::to_underlying (__cpp_lib_to_underlying)
// =============================================================================
// Required for: enum to underlying type conversion in the effect lattice

#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "ECV requires std::to_underlying (__cpp_lib_to_underlying >= 202102L)."
#endif

#define ECV_CPP23_FEATURES_VERIFIED 1
