#include <gtest/gtest.h>
#include "utilities/hash_utils.hpp"

#include <stdexcept>

using namespace mailcas::utils;

TEST(HashUtils, HexRoundTripKeepsLowercase) {
    const std::string hex = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";
    EXPECT_EQ(digest_to_hex(hex_to_digest(hex)), hex);
}

TEST(HashUtils, UppercaseInputIsNormalized) {
    const std::string upper = "9F86D081884C7D659A2FEAA0C55AD015A3BF4F1B2B0B822CD15D6C15B0F00A08";
    EXPECT_EQ(digest_to_hex(hex_to_digest(upper)),
              "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
    EXPECT_FALSE(is_content_hash(upper));
}

TEST(HashUtils, RejectsMalformedHex) {
    EXPECT_THROW(hex_to_digest("abc"), std::invalid_argument);
    EXPECT_THROW(hex_to_digest(std::string(64, 'g')), std::invalid_argument);
}

TEST(HashUtils, IsContentHash) {
    EXPECT_TRUE(is_content_hash(std::string(64, 'a')));
    EXPECT_FALSE(is_content_hash(std::string(63, 'a')));
    EXPECT_FALSE(is_content_hash(std::string(65, 'a')));
    EXPECT_FALSE(is_content_hash(".tmp-" + std::string(59, 'a')));
    EXPECT_FALSE(is_content_hash("../" + std::string(61, 'a')));
}
