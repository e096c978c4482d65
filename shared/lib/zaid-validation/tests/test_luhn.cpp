/**
 * @file test_luhn.cpp
 * @brief Unit tests for the Luhn checksum and check-digit computation
 */

#include <gtest/gtest.h>
#include <zaid/validation/luhn.h>
#include "exceptions.h"
#include "test_helpers.h"

using namespace zaid::validation;
using namespace test_helpers;

class LuhnTest : public ::testing::Test {};

// ============================================================================
// Standard vectors
// ============================================================================

TEST_F(LuhnTest, StandardVectors_Valid) {
    EXPECT_TRUE(isValidLuhnChecksum("79927398713"));
    EXPECT_TRUE(isValidLuhnChecksum("4111111111111111"));
    EXPECT_TRUE(isValidLuhnChecksum("5425233430109903"));
    EXPECT_TRUE(isValidLuhnChecksum("350009218041876"));  // IMEI
}

TEST_F(LuhnTest, StandardVectors_Invalid) {
    EXPECT_FALSE(isValidLuhnChecksum("79927398710"));
    EXPECT_FALSE(isValidLuhnChecksum("4111111111111112"));
    EXPECT_FALSE(isValidLuhnChecksum("5427625793410839"));
}

TEST_F(LuhnTest, IdNumbers) {
    EXPECT_TRUE(isValidLuhnChecksum(VALID_MODERN_ID));
    EXPECT_TRUE(isValidLuhnChecksum(VALID_LEGACY_ID));
    EXPECT_FALSE(isValidLuhnChecksum("8001015009088"));
}

TEST_F(LuhnTest, DoubledDigitAboveNine_SubtractsNine) {
    // 1 8: 1 doubled = 2, 2 + 8 = 10
    EXPECT_TRUE(isValidLuhnChecksum("18"));
    // 5 9: 5 doubled = 10 -> 1, 1 + 9 = 10
    EXPECT_TRUE(isValidLuhnChecksum("59"));
    // Without the subtraction 10 + 9 = 19 would be rejected
    EXPECT_FALSE(isValidLuhnChecksum("58"));
}

TEST_F(LuhnTest, SingleDigits) {
    EXPECT_TRUE(isValidLuhnChecksum("0"));
    EXPECT_FALSE(isValidLuhnChecksum("5"));
}

// ============================================================================
// Fail closed
// ============================================================================

TEST_F(LuhnTest, EmptyString_Invalid) {
    EXPECT_FALSE(isValidLuhnChecksum(""));
}

TEST_F(LuhnTest, NonDigit_Invalid) {
    EXPECT_FALSE(isValidLuhnChecksum("7992739871a"));
    EXPECT_FALSE(isValidLuhnChecksum("7992 7398 713"));
    EXPECT_FALSE(isValidLuhnChecksum("-79927398713"));
}

// ============================================================================
// Positional behavior
// ============================================================================

TEST_F(LuhnTest, LeadingZeroPadding_DoesNotChangeResult) {
    for (const std::string& number : {"79927398713", "79927398710", "18", "4111111111111111"}) {
        bool expected = isValidLuhnChecksum(number);
        EXPECT_EQ(isValidLuhnChecksum("0" + number), expected) << number;
        EXPECT_EQ(isValidLuhnChecksum("00" + number), expected) << number;
    }
}

TEST_F(LuhnTest, SingleDigitChange_Detected) {
    std::string id = VALID_MODERN_ID;
    for (size_t i = 0; i < id.size(); i++) {
        std::string altered = id;
        altered[i] = static_cast<char>('0' + (altered[i] - '0' + 1) % 10);
        EXPECT_FALSE(isValidLuhnChecksum(altered)) << "position " << i;
    }
}

// ============================================================================
// Check digit computation
// ============================================================================

TEST_F(LuhnTest, CheckDigit_KnownValues) {
    EXPECT_EQ(computeLuhnCheckDigit("7992739871"), '3');
    EXPECT_EQ(computeLuhnCheckDigit("411111111111111"), '1');
    EXPECT_EQ(computeLuhnCheckDigit("800101500908"), '7');
    EXPECT_EQ(computeLuhnCheckDigit("800101500909"), '5');
    EXPECT_EQ(computeLuhnCheckDigit("0"), '0');
    EXPECT_EQ(computeLuhnCheckDigit("9"), '1');
}

TEST_F(LuhnTest, CheckDigit_MatchesIndependentHelper) {
    for (const std::string& base : {"800101499910", "000229502908", "991231000011", "123456789012"}) {
        EXPECT_EQ(computeLuhnCheckDigit(base), checkDigitFor(base)) << base;
        EXPECT_TRUE(isValidLuhnChecksum(base + computeLuhnCheckDigit(base))) << base;
    }
}

TEST_F(LuhnTest, CheckDigit_EmptyPayload_Throws) {
    EXPECT_THROW(computeLuhnCheckDigit(""), common::ValidationException);
}

TEST_F(LuhnTest, CheckDigit_NonDigitPayload_Throws) {
    EXPECT_THROW(computeLuhnCheckDigit("80010150090X"), common::ValidationException);
    EXPECT_THROW(computeLuhnCheckDigit("800101 500908"), common::ValidationException);
}

TEST_F(LuhnTest, CheckDigit_ExceptionIsZaidException) {
    try {
        computeLuhnCheckDigit("");
        FAIL() << "expected exception";
    } catch (const common::ZaidException& e) {
        EXPECT_NE(std::string(e.what()).find("Validation error"), std::string::npos);
    }
}
