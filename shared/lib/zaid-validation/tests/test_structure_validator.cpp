/**
 * @file test_structure_validator.cpp
 * @brief Unit tests for length and citizenship-digit checks
 */

#include <gtest/gtest.h>
#include <zaid/validation/structure_validator.h>

using namespace zaid::validation;

class StructureValidatorTest : public ::testing::Test {};

// ============================================================================
// Citizenship digit
// ============================================================================

TEST_F(StructureValidatorTest, CitizenshipDigit_AllowedValues) {
    EXPECT_TRUE(isValidCitizenshipDigit("8001015009087"));
    EXPECT_TRUE(isValidCitizenshipDigit("8001015009186"));
    EXPECT_TRUE(isValidCitizenshipDigit("8001015009285"));
}

TEST_F(StructureValidatorTest, CitizenshipDigit_ThreeToNineRejected) {
    std::string id = "8001015009087";
    for (char c = '3'; c <= '9'; c++) {
        id[10] = c;
        EXPECT_FALSE(isValidCitizenshipDigit(id)) << "digit " << c;
    }
}

TEST_F(StructureValidatorTest, CitizenshipDigit_ShortStringsSafe) {
    EXPECT_FALSE(isValidCitizenshipDigit(""));
    EXPECT_FALSE(isValidCitizenshipDigit("8001015009"));
    // Exactly 11 characters is enough to read position 10
    EXPECT_TRUE(isValidCitizenshipDigit("80010150090"));
}

// ============================================================================
// validateStructure gate order
// ============================================================================

TEST_F(StructureValidatorTest, WellFormed_Ok) {
    auto result = validateStructure("8001015009087");
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.error, StructuralError::NONE);
    EXPECT_EQ(result.digits, "8001015009087");
}

TEST_F(StructureValidatorTest, WrongLength_Reported) {
    for (const std::string& digits : {"", "800101500908", "80010150090877", "80010"}) {
        auto result = validateStructure(digits);
        EXPECT_FALSE(result.ok());
        EXPECT_EQ(result.error, StructuralError::WRONG_LENGTH) << digits;
        EXPECT_TRUE(result.digits.empty());
    }
}

TEST_F(StructureValidatorTest, LengthCheckedBeforeCitizenship) {
    // 12 digits with a bad citizenship digit still reports the length
    auto result = validateStructure("800101500938");
    EXPECT_EQ(result.error, StructuralError::WRONG_LENGTH);
}

TEST_F(StructureValidatorTest, BadCitizenship_Reported) {
    auto result = validateStructure("8001015009387");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, StructuralError::INVALID_CITIZENSHIP_DIGIT);
    EXPECT_TRUE(result.digits.empty());
}

TEST_F(StructureValidatorTest, ErrorStrings) {
    EXPECT_EQ(structuralErrorToString(StructuralError::NONE), "NONE");
    EXPECT_EQ(structuralErrorToString(StructuralError::WRONG_LENGTH), "WRONG_LENGTH");
    EXPECT_EQ(structuralErrorToString(StructuralError::INVALID_CITIZENSHIP_DIGIT),
              "INVALID_CITIZENSHIP_DIGIT");
}
