#include "cxfer/transfer/checksum.hpp"

#include <gtest/gtest.h>

#include <string>

using cxfer::transfer::Md5Digest;
using cxfer::transfer::fnv1a_hex;

TEST(ChecksumTest, Fnv1aKnownValues) {
    EXPECT_EQ(fnv1a_hex(""), "cbf29ce484222325");
    EXPECT_EQ(fnv1a_hex("a"), "af63dc4c8601ec8c");
    EXPECT_EQ(fnv1a_hex("abc").size(), 16u);
    EXPECT_NE(fnv1a_hex("chunk-a"), fnv1a_hex("chunk-b"));
}

TEST(ChecksumTest, Md5OfEmptyInput) {
    Md5Digest digest;
    auto md5 = digest.finish();
    ASSERT_TRUE(md5.is_ok());
    EXPECT_EQ(md5.value(), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ChecksumTest, Md5IsIncremental) {
    Md5Digest whole;
    const std::string text = "The quick brown fox jumps over the lazy dog";
    ASSERT_TRUE(whole.update(text.data(), text.size()).is_ok());

    Md5Digest pieces;
    ASSERT_TRUE(pieces.update(text.data(), 10).is_ok());
    ASSERT_TRUE(pieces.update(text.data() + 10, text.size() - 10).is_ok());

    const auto expected = whole.finish();
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(expected.value(), "9e107d9d372bb6826bd81d3542a419d6");
    EXPECT_EQ(pieces.finish().value(), expected.value());
}

TEST(ChecksumTest, FinishedDigestRejectsUpdates) {
    Md5Digest digest;
    ASSERT_TRUE(digest.finish().is_ok());
    EXPECT_TRUE(digest.update("x", 1).is_error());
    EXPECT_TRUE(digest.finish().is_error());
}
