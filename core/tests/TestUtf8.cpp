/**
 * @file TestUtf8.cpp
 * @brief Unit tests for core::findInvalidUtf8.
 */

#include <catch2/catch_test_macros.hpp>

#include <zyppy/core/Utf8.hpp>

#include <string>

namespace zyppy::core {

TEST_CASE("Utf8 accepts ASCII and multi-byte text", "[core][utf8]")
{
    REQUIRE(isValidUtf8(""));
    REQUIRE(isValidUtf8("open the mailbox"));
    REQUIRE(isValidUtf8("caf\xC3\xA9"));                 // é
    REQUIRE(isValidUtf8("\xE2\x82\xAC 5"));              // €
    REQUIRE(isValidUtf8("\xF0\x9F\x97\xBA north"));      // 🗺
}

TEST_CASE("Utf8 reports the offset of the first bad byte", "[core][utf8]")
{
    const std::string text = "take \xFF lamp";
    auto bad = findInvalidUtf8(text);
    REQUIRE(bad.has_value());
    REQUIRE(*bad == 5);
}

TEST_CASE("Utf8 rejects truncated sequences", "[core][utf8]")
{
    REQUIRE_FALSE(isValidUtf8("\xC3"));
    REQUIRE_FALSE(isValidUtf8("\xE2\x82"));
    REQUIRE_FALSE(isValidUtf8("\xF0\x9F\x97"));
    REQUIRE_FALSE(isValidUtf8("\xE2\x28\xA1"));
}

TEST_CASE("Utf8 rejects overlongs, surrogates and out-of-range code points", "[core][utf8]")
{
    REQUIRE_FALSE(isValidUtf8("\xC0\xAF"));              // overlong '/'
    REQUIRE_FALSE(isValidUtf8("\xE0\x80\xAF"));
    REQUIRE_FALSE(isValidUtf8("\xED\xA0\x80"));          // U+D800
    REQUIRE_FALSE(isValidUtf8("\xF4\x90\x80\x80"));      // U+110000
    REQUIRE_FALSE(isValidUtf8("\x80"));                  // lone continuation
}

} // namespace zyppy::core
