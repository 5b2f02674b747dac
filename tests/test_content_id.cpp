#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "content_id.h"
#include <string>

using namespace kaddht;

class ContentIdTest : public ::testing::Test {
protected:
    std::string digest_ = std::string(32, '\x42');

    std::string make_v0() const {
        return std::string("\x12\x20", 2) + digest_;
    }

    std::string make_v1(uint64_t codec) const {
        std::string bytes;
        append_uvarint(bytes, 1);
        append_uvarint(bytes, codec);
        append_uvarint(bytes, ContentId::MULTIHASH_SHA2_256);
        append_uvarint(bytes, digest_.size());
        return bytes + digest_;
    }
};

TEST_F(ContentIdTest, ParsesCidV0) {
    auto cid = ContentId::parse(make_v0());
    ASSERT_TRUE(cid.has_value());
    EXPECT_EQ(cid->version(), 0u);
    EXPECT_EQ(cid->codec(), ContentId::CODEC_DAG_PB);
    EXPECT_EQ(cid->hash_code(), ContentId::MULTIHASH_SHA2_256);
    EXPECT_EQ(cid->digest(), digest_);
    EXPECT_EQ(cid->bytes(), make_v0());
}

TEST_F(ContentIdTest, ParsesCidV1WithMultiByteCodec) {
    // 0x0129 (dag-json) needs a two byte varint
    auto cid = ContentId::parse(make_v1(0x0129));
    ASSERT_TRUE(cid.has_value());
    EXPECT_EQ(cid->version(), 1u);
    EXPECT_EQ(cid->codec(), 0x0129u);
    EXPECT_EQ(cid->digest(), digest_);
}

TEST_F(ContentIdTest, RejectsMalformedIds) {
    EXPECT_FALSE(ContentId::parse("").has_value());
    EXPECT_FALSE(ContentId::parse("hello").has_value());

    std::string truncated = make_v1(0x70);
    truncated.pop_back();
    EXPECT_FALSE(ContentId::parse(truncated).has_value());

    EXPECT_FALSE(ContentId::parse(make_v1(0x70) + "x").has_value());

    std::string v2 = make_v1(0x70);
    v2[0] = '\x02';
    EXPECT_FALSE(ContentId::parse(v2).has_value());
}

TEST_F(ContentIdTest, EqualityIsByBytes) {
    auto a = ContentId::parse(make_v1(0x70));
    auto b = ContentId::parse(make_v1(0x70));
    auto c = ContentId::parse(make_v0());
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
}

TEST_F(ContentIdTest, VarintEncoding) {
    std::string out;
    append_uvarint(out, 300);
    EXPECT_EQ(out, std::string("\xac\x02", 2));

    size_t pos = 0;
    uint64_t value = 0;
    ASSERT_TRUE(read_uvarint(out, pos, value));
    EXPECT_EQ(value, 300u);
    EXPECT_EQ(pos, 2u);

    // Non-minimal and truncated encodings
    pos = 0;
    EXPECT_FALSE(read_uvarint(std::string("\x81\x00", 2), pos, value));
    pos = 0;
    EXPECT_FALSE(read_uvarint(std::string("\x80", 1), pos, value));
}
