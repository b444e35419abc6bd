#include "validation.hpp"
#include <gtest/gtest.h>

TEST(ValidationTest, Trim) {
    ASSERT_EQ(trim("  squat \t"), "squat");
    ASSERT_EQ(trim("   "), "");
    ASSERT_EQ(trim("  \xC3\x89lan  "), "\xC3\x89lan");
    ASSERT_EQ(trim("\xE2\x82\xAC"), "\xE2\x82\xAC");
}

TEST(ValidationTest, WeightLimitsAndStep) {
    std::string err;
    ASSERT_TRUE(validate_weight(0.5, err));
    ASSERT_TRUE(validate_weight(102.5, err));
    ASSERT_TRUE(validate_weight(500.0, err));

    ASSERT_FALSE(validate_weight(0.0, err));
    ASSERT_EQ(err, "Weight must be greater than 0 kg.");
    ASSERT_FALSE(validate_weight(-5.0, err));
    ASSERT_FALSE(validate_weight(500.5, err));
    ASSERT_EQ(err, "Weight must be at most 500 kg.");
    ASSERT_FALSE(validate_weight(100.25, err));
    ASSERT_EQ(err, "Weight must be in 0.5 kg steps.");
}

TEST(ValidationTest, RepsLimits) {
    std::string err;
    ASSERT_TRUE(validate_reps(1, err));
    ASSERT_TRUE(validate_reps(50, err));
    ASSERT_FALSE(validate_reps(0, err));
    ASSERT_FALSE(validate_reps(51, err));
}

TEST(ValidationTest, SetChecksWeightFirst) {
    std::string err;
    ASSERT_FALSE(validate_set(0.0, 0, err));
    ASSERT_EQ(err, "Weight must be greater than 0 kg.");
    ASSERT_TRUE(validate_set(60.0, 8, err));
}

TEST(ValidationTest, DatesMonthsAndNames) {
    ASSERT_TRUE(is_valid_date("2024-05-31"));
    ASSERT_FALSE(is_valid_date("2024-06-31"));
    ASSERT_TRUE(is_valid_month("2024-12"));
    ASSERT_FALSE(is_valid_month("2024-13"));
    ASSERT_TRUE(is_valid_exercise_name("Hip Thrust"));
    ASSERT_FALSE(is_valid_exercise_name("X"));
    ASSERT_FALSE(is_valid_exercise_name("Squat;DROP"));
    ASSERT_TRUE(is_valid_category("Legs"));
    ASSERT_FALSE(is_valid_category("Core"));
}

TEST(ValidationTest, NumberParsingRejectsTrailingText) {
    double d = 0.0;
    int n = 0;
    ASSERT_TRUE(parse_double("82.5", d));
    ASSERT_DOUBLE_EQ(d, 82.5);
    ASSERT_FALSE(parse_double("82.5kg", d));
    ASSERT_FALSE(parse_double("abc", d));
    ASSERT_TRUE(parse_int("12", n));
    ASSERT_FALSE(parse_int("12.5", n));
    ASSERT_FALSE(parse_int("99999999999999", n));
}

TEST(ValidationTest, BodyMetricRanges) {
    std::string err;
    ASSERT_TRUE(validate_body_weight(75.0, err));
    ASSERT_FALSE(validate_body_weight(10.0, err));
    ASSERT_TRUE(validate_body_fat(18.0, err));
    ASSERT_FALSE(validate_body_fat(80.0, err));
    ASSERT_TRUE(validate_muscle_mass(35.0, err));
    ASSERT_FALSE(validate_muscle_mass(200.0, err));
    ASSERT_TRUE(validate_bmi(22.0, err));
    ASSERT_FALSE(validate_bmi(5.0, err));
    ASSERT_TRUE(validate_height(175.0, err));
    ASSERT_FALSE(validate_height(90.0, err));
    ASSERT_EQ(err, "Height must be between 100 and 250 cm.");
}
