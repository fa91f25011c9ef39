#include <gtest/gtest.h>
#include "crypto/Obscure.hpp"

#include <stdexcept>

using cs::crypto::Obscure;

TEST(ObscureTest, RevealKnownRcloneToken) {
    // 16 * 'a' IV, as produced by `rclone obscure` with a fixed IV
    EXPECT_EQ(Obscure::reveal("YWFhYWFhYWFhYWFhYWFhYXMaGgIlEQ"), "potato");
    EXPECT_EQ(Obscure::reveal("YWFhYWFhYWFhYWFhYWFhYQ"), "");
}

TEST(ObscureTest, RoundTripsAndIsNonDeterministic) {
    const auto a = Obscure::obscure("hunter2");
    const auto b = Obscure::obscure("hunter2");
    EXPECT_NE(a, b);
    EXPECT_EQ(Obscure::reveal(a), "hunter2");
    EXPECT_EQ(Obscure::reveal(b), "hunter2");
}

TEST(ObscureTest, OutputIsUnpaddedBase64Url) {
    const auto token = Obscure::obscure("potato");
    // 16 byte IV + 6 byte payload = 22 bytes -> 30 chars without padding
    EXPECT_EQ(token.size(), 30u);
    EXPECT_EQ(token.find('='), std::string::npos);
    EXPECT_EQ(token.find('+'), std::string::npos);
    EXPECT_EQ(token.find('/'), std::string::npos);
}

TEST(ObscureTest, RevealRejectsShortInput) {
    EXPECT_THROW((void)Obscure::reveal("YWFh"), std::invalid_argument);
}
