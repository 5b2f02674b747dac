#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "base32.h"
#include <string>

using namespace kaddht;

class Base32Test : public ::testing::Test {
};

TEST_F(Base32Test, EncodesRfc4648VectorsWithoutPadding) {
    EXPECT_EQ(base32_encode(""), "");
    EXPECT_EQ(base32_encode("f"), "MY");
    EXPECT_EQ(base32_encode("fo"), "MZXQ");
    EXPECT_EQ(base32_encode("foo"), "MZXW6");
    EXPECT_EQ(base32_encode("foob"), "MZXW6YQ");
    EXPECT_EQ(base32_encode("fooba"), "MZXW6YTB");
    EXPECT_EQ(base32_encode("foobar"), "MZXW6YTBOI");
}

TEST_F(Base32Test, DecodesRfc4648Vectors) {
    auto decoded = base32_decode("MZXW6YTBOI");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "foobar");

    decoded = base32_decode("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST_F(Base32Test, BinaryRoundTrip) {
    std::string bytes;
    for (int i = 0; i < 256; ++i) {
        bytes += static_cast<char>(i);
    }
    auto decoded = base32_decode(base32_encode(bytes));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST_F(Base32Test, RejectsInvalidInput) {
    EXPECT_FALSE(base32_decode("M").has_value());
    EXPECT_FALSE(base32_decode("MZX").has_value());
    EXPECT_FALSE(base32_decode("MZXW6Y").has_value());
    EXPECT_FALSE(base32_decode("mzxw6").has_value());
    EXPECT_FALSE(base32_decode("MZXW6===").has_value());
    EXPECT_FALSE(base32_decode("MZ").has_value());  // non-zero trailing bits
}
