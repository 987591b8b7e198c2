#include "util/utf8.hpp"

#include <gtest/gtest.h>

#include <string>

using daemon_runner::util::is_valid_utf8;

TEST(Utf8Test, AcceptsAsciiAndEmpty) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("2019-01-01 UpdateTip: new best=00ab height=1"));
}

TEST(Utf8Test, AcceptsMultiByteSequences) {
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));            // e acute
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC 10"));        // euro sign
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));       // U+1F600
    EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF"));       // U+10FFFF
}

TEST(Utf8Test, RejectsInvalidBytes) {
    EXPECT_FALSE(is_valid_utf8("\xFF"));
    EXPECT_FALSE(is_valid_utf8("abc\x80"));  // Stray continuation byte
}

TEST(Utf8Test, RejectsOverlongEncodings) {
    EXPECT_FALSE(is_valid_utf8("\xC0\x80"));
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF"));
    EXPECT_FALSE(is_valid_utf8("\xF0\x80\x80\xAF"));
}

TEST(Utf8Test, RejectsSurrogatesAndOutOfRange) {
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // U+D800
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));  // U+110000
}

TEST(Utf8Test, RejectsTruncatedSequences) {
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));
    EXPECT_FALSE(is_valid_utf8("\xF0\x9F\x98"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));
}
