#include <string>
#include <gtest/gtest.h>
#include "core/text/utf8.hpp"

namespace {

using knife::core::text::decode_output;
using knife::core::text::is_valid_utf8;
using knife::core::text::latin1_to_utf8;
using knife::core::text::truncate_code_points;

TEST(Utf8Test, AcceptsAsciiAndMultibyte) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
}

TEST(Utf8Test, RejectsMalformedSequences) {
    EXPECT_FALSE(is_valid_utf8("\xC3"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));
    EXPECT_FALSE(is_valid_utf8("\xFF"));
}

TEST(Utf8Test, FallsBackToLatin1) {
    const auto decoded = decode_output("caf\xE9");
    EXPECT_EQ(decoded.encoding, "latin-1");
    EXPECT_EQ(decoded.text, "caf\xC3\xA9");
    EXPECT_EQ(latin1_to_utf8("\xFF"), "\xC3\xBF");
}

TEST(Utf8Test, KeepsValidUtf8Untouched) {
    const auto decoded = decode_output("caf\xC3\xA9");
    EXPECT_EQ(decoded.encoding, "utf-8");
    EXPECT_EQ(decoded.text, "caf\xC3\xA9");
}

TEST(Utf8Test, TruncatesOnCharacterBoundaries) {
    EXPECT_EQ(truncate_code_points("caf\xC3\xA9!", 4), "caf\xC3\xA9");
    EXPECT_EQ(truncate_code_points("abc", 10), "abc");
    EXPECT_EQ(truncate_code_points("abc", 0), "");
}

}  // namespace
