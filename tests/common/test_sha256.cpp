/**
 * @file test_sha256.cpp
 * @brief SHA-256 determinism tests
 */

#include "ecv/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace ecv::common;

TEST(SHA256, EmptyString)
{
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, KnownVectors)
{
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, MillionA)
{
    EXPECT_EQ(sha256(std::string(1000000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256, IncrementalMatchesOneShot)
{
    Sha256 hasher;
    hasher.update("ab");
    hasher.update("");
    hasher.update("c");
    EXPECT_EQ(hasher.finish_hex(), sha256("abc"));

    // Finishing resets the hasher.
    hasher.update("abc");
    EXPECT_EQ(hasher.finish_hex(), sha256("abc"));
}

TEST(SHA256, BlockBoundaries)
{
    for (std::size_t len : {55U, 56U, 63U, 64U, 65U, 127U, 128U}) {
        SCOPED_TRACE(len);
        const std::string input(len, 'x');
        Sha256 hasher;
        hasher.update(input.substr(0, len / 2));
        hasher.update(input.substr(len / 2));
        EXPECT_EQ(hasher.finish_hex(), sha256(input));
    }
}

TEST(SHA256, Prefixed)
{
    const std::string hash = sha256_prefixed("test");
    EXPECT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.length(), 7 + 64);
}

TEST(SHA256, DifferentInputs)
{
    EXPECT_NE(sha256("a"), sha256("b"));
    EXPECT_NE(sha256("abc"), sha256("ABC"));
}
