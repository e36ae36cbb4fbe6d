#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types and content hashing
 */

#include "ecv/require_cpp23.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ecv {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success
 */
using VoidResult = std::expected<void, Error>;

}  // namespace ecv

namespace ecv::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Incremental SHA-256 hasher.
 *
 * Used for content addressing (proof cache keys, report digests), so the
 * output must be bit-exact with FIPS 180-4.
 */
class Sha256
{
public:
    Sha256();

    void update(std::string_view data);

    /// Finalizes and returns the lowercase hex digest. The hasher is reset.
    [[nodiscard]] std::string finish_hex();

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> m_state{};
    std::array<std::uint8_t, 64> m_buffer{};
    std::size_t m_buffered = 0;
    std::uint64_t m_total_bytes = 0;
};

/**
 * Compute SHA-256 hash of data
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

}  // namespace ecv::common
