#include "calculations.hpp"
#include <gtest/gtest.h>

TEST(OneRepMaxTest, SingleRepIsTheWeight) {
    ASSERT_DOUBLE_EQ(one_rep_max(140.0, 1), 140.0);
}

TEST(OneRepMaxTest, EpleyForMultipleReps) {
    ASSERT_NEAR(one_rep_max(100.0, 5), 116.6667, 1e-3);
    ASSERT_NEAR(one_rep_max(60.0, 10), 80.0, 1e-9);
}

TEST(OneRepMaxTest, IncreasesWithWeightAndReps) {
    ASSERT_LT(one_rep_max(100.0, 5), one_rep_max(102.5, 5));
    ASSERT_LT(one_rep_max(100.0, 5), one_rep_max(100.0, 6));
    ASSERT_LT(one_rep_max(100.0, 1), one_rep_max(100.0, 2));
}

TEST(WeightGoalProgressTest, Bounds) {
    ASSERT_EQ(weight_goal_progress(100.0, 100.0), 100);
    ASSERT_EQ(weight_goal_progress(0.0, 100.0), 0);
    ASSERT_EQ(weight_goal_progress(50.0, 0.0), 0);
    ASSERT_EQ(weight_goal_progress(150.0, 100.0), 100);
}

TEST(WeightGoalProgressTest, Truncates) {
    ASSERT_EQ(weight_goal_progress(99.9, 100.0), 99);
    ASSERT_EQ(weight_goal_progress(80.0, 120.0), 66);
}

TEST(SetGoalProgressTest, ClampsAtHundred) {
    ASSERT_EQ(set_goal_progress(0, 3), 0);
    ASSERT_EQ(set_goal_progress(1, 3), 33);
    ASSERT_EQ(set_goal_progress(2, 3), 66);
    ASSERT_EQ(set_goal_progress(3, 3), 100);
    ASSERT_EQ(set_goal_progress(5, 3), 100);
    ASSERT_EQ(set_goal_progress(2, 0), 0);
}

TEST(RemainingSetsTest, NeverNegative) {
    ASSERT_EQ(remaining_sets(1, 3), 2);
    ASSERT_EQ(remaining_sets(3, 3), 0);
    ASSERT_EQ(remaining_sets(4, 3), 0);
}

TEST(GrowthRateTest, PercentChange) {
    ASSERT_DOUBLE_EQ(growth_rate(110.0, 100.0), 10.0);
    ASSERT_DOUBLE_EQ(growth_rate(90.0, 100.0), -10.0);
    ASSERT_DOUBLE_EQ(growth_rate(90.0, 0.0), 0.0);
}

TEST(AggregateTest, VolumeAverageAndBest) {
    std::vector<Lift> lifts{ { 100.0, 5 }, { 80.0, 10 }, { 120.0, 1 } };
    ASSERT_DOUBLE_EQ(total_volume(lifts), 500.0 + 800.0 + 120.0);
    ASSERT_DOUBLE_EQ(average_weight(lifts), 100.0);
    ASSERT_NEAR(max_one_rep_max(lifts), 120.0, 1e-9);
}

TEST(AggregateTest, EmptyListsAreZero) {
    std::vector<Lift> none;
    ASSERT_DOUBLE_EQ(total_volume(none), 0.0);
    ASSERT_DOUBLE_EQ(average_weight(none), 0.0);
    ASSERT_DOUBLE_EQ(max_one_rep_max(none), 0.0);
}

TEST(BodyMassIndexTest, RoundsToOneDecimal) {
    ASSERT_DOUBLE_EQ(body_mass_index(70.0, 175.0), 22.9);
    ASSERT_DOUBLE_EQ(body_mass_index(0.0, 175.0), 0.0);
    ASSERT_DOUBLE_EQ(body_mass_index(70.0, 0.0), 0.0);
}

TEST(BodyMassIndexTest, Classes) {
    ASSERT_STREQ(bmi_class(17.0), "Underweight");
    ASSERT_STREQ(bmi_class(18.5), "Normal");
    ASSERT_STREQ(bmi_class(24.9), "Normal");
    ASSERT_STREQ(bmi_class(25.0), "Overweight");
}
