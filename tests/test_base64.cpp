#include <gtest/gtest.h>

#include "utils/base64.hpp"

using namespace phxgw;

TEST(Base64Test, EncodesRfc4648Vectors) {
    EXPECT_EQ(Base64::encode(std::string("")), "");
    EXPECT_EQ(Base64::encode(std::string("f")), "Zg==");
    EXPECT_EQ(Base64::encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(Base64::encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(Base64::encode(std::string("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, EncodesHBaseColumnName) {
    EXPECT_EQ(Base64::encode(std::string("metadata:type")), "bWV0YWRhdGE6dHlwZQ==");
}

TEST(Base64Test, DecodeSkipsWhitespace) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(Base64::decode("Zm9v\nYmFy", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "foobar");
}

TEST(Base64Test, DecodeRejectsInvalidInput) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(Base64::decode("Zm9v!", out));
    EXPECT_FALSE(Base64::decode("Zg==Zg", out));
}

TEST(Base64Test, DecodesBinary) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(Base64::decode("AP8=", out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], 0x00);
    EXPECT_EQ(out[1], 0xFF);
}
