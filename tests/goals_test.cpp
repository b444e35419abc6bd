#include "goals.hpp"
#include <gtest/gtest.h>

namespace {

HistoryRow lift(std::int64_t workout, std::int64_t exercise, double weight, int reps) {
    HistoryRow r;
    r.workout_id = workout;
    r.exercise_id = exercise;
    r.weight = weight;
    r.reps = reps;
    r.one_rm = one_rep_max(weight, reps);
    return r;
}

SetGoal squat_goal() {
    SetGoal g;
    g.id = 1;
    g.exercise_id = 7;
    g.target_weight = 100.0;
    g.target_reps = 5;
    g.target_sets = 3;
    g.target_month = "2024-06";
    return g;
}

} // namespace

TEST(WeightGoalTest, ProgressAndAchievable) {
    WeightGoal g;
    g.target_weight = 120.0;
    g.current_weight = 90.0;
    ASSERT_EQ(g.progress_percentage(), 75);
    ASSERT_FALSE(g.achievable());
    g.current_weight = 121.0;
    ASSERT_TRUE(g.achievable());
    g.achieved = true;
    ASSERT_FALSE(g.achievable());
}

TEST(WeightGoalTest, BestOneRepMaxOnlyImproves) {
    WeightGoal g;
    g.target_weight = 120.0;
    g.current_weight = 110.0;
    ASSERT_FALSE(apply_best_one_rm(g, std::nullopt));
    ASSERT_FALSE(apply_best_one_rm(g, 105.0));
    ASSERT_DOUBLE_EQ(g.current_weight, 110.0);
    ASSERT_TRUE(apply_best_one_rm(g, 116.5));
    ASSERT_DOUBLE_EQ(g.current_weight, 116.5);
}

TEST(WeightGoalTest, MarkAchievedOverridesCurrent) {
    WeightGoal g;
    g.target_weight = 150.0;
    g.current_weight = 20.0;
    mark_achieved(g);
    ASSERT_TRUE(g.achieved);
    ASSERT_DOUBLE_EQ(g.current_weight, 150.0);
    ASSERT_EQ(g.progress_percentage(), 100);
}

TEST(SetGoalTest, DisplayText) {
    SetGoal g = squat_goal();
    ASSERT_EQ(g.target_description(), "100kg x 5 reps x 3 sets");
    ASSERT_EQ(g.achievement_text(), "In progress");
    g.current_achieved_sets = 2;
    ASSERT_EQ(g.achievement_text(), "2/3 sets achieved");
    g.current_achieved_sets = 3;
    ASSERT_EQ(g.achievement_text(), "Goal achieved");
}

TEST(SetGoalTest, EitherPathReachesAchieved) {
    SetGoal g = squat_goal();
    ASSERT_FALSE(g.is_achieved());
    g.achieved = true;
    ASSERT_TRUE(g.is_achieved());
    g.achieved = false;
    g.current_achieved_sets = 3;
    ASSERT_TRUE(g.is_achieved());
    ASSERT_EQ(g.remaining(), 0);
}

TEST(SetGoalTest, QualifyingSetsCountPerSession) {
    SetGoal g = squat_goal();
    std::vector<HistoryRow> rows{
        lift(1, 7, 100.0, 5), lift(1, 7, 100.0, 5),   // session 1: 2 qualifying
        lift(2, 7, 100.0, 5), lift(2, 7, 100.0, 4),   // session 2: 1 (reps short)
        lift(2, 7, 95.0, 8),                          // too light
        lift(3, 9, 200.0, 5),                         // other exercise
    };
    SetGoalEvaluation eval = evaluate_set_goal(g, rows);
    ASSERT_EQ(eval.best_session_sets, 2);
    ASSERT_DOUBLE_EQ(eval.max_weight, 100.0);
}

TEST(SetGoalTest, ThreeQualifyingSetsCompleteTheGoal) {
    SetGoal g = squat_goal();
    std::vector<HistoryRow> rows{ lift(1, 7, 100.0, 5), lift(1, 7, 100.0, 5), lift(1, 7, 100.0, 5) };
    ASSERT_TRUE(apply_evaluation(g, evaluate_set_goal(g, rows)));
    ASSERT_EQ(g.current_achieved_sets, 3);
    ASSERT_EQ(g.progress_percentage(), 100);
    ASSERT_TRUE(g.is_achieved());
}

TEST(SetGoalTest, EvaluationNeverLowersOrExceedsTarget) {
    SetGoal g = squat_goal();
    g.current_achieved_sets = 2;
    g.current_max_weight = 110.0;

    SetGoalEvaluation worse{ 1, 100.0 };
    ASSERT_FALSE(apply_evaluation(g, worse));
    ASSERT_EQ(g.current_achieved_sets, 2);
    ASSERT_DOUBLE_EQ(g.current_max_weight, 110.0);

    SetGoalEvaluation better{ 6, 120.0 };
    ASSERT_TRUE(apply_evaluation(g, better));
    ASSERT_EQ(g.current_achieved_sets, 3);
    ASSERT_DOUBLE_EQ(g.current_max_weight, 120.0);
}

TEST(SetGoalTest, MarkAchievedFillsSets) {
    AnyGoal g = squat_goal();
    mark_achieved(g);
    const SetGoal& s = std::get<SetGoal>(g);
    ASSERT_TRUE(s.achieved);
    ASSERT_EQ(s.current_achieved_sets, 3);
}

TEST(SetGoalTest, AlmostThere) {
    SetGoal g = squat_goal();
    ASSERT_FALSE(is_almost_there(g, 1));          // nothing done yet
    g.current_achieved_sets = 1;
    ASSERT_FALSE(is_almost_there(g, 1));          // 2 left
    ASSERT_TRUE(is_almost_there(g, 2));
    g.current_achieved_sets = 2;
    ASSERT_TRUE(is_almost_there(g, 1));
    g.current_achieved_sets = 3;
    ASSERT_FALSE(is_almost_there(g, 1));          // done
    g.current_achieved_sets = 2;
    g.achieved = true;
    ASSERT_FALSE(is_almost_there(g, 1));          // marked done
}

TEST(GoalStatisticsTest, CountsAndRate) {
    WeightGoal done;
    done.achieved = true;
    WeightGoal open;
    SetGoal full = squat_goal();
    full.current_achieved_sets = 3;

    std::vector<GoalRow> rows{ { done, "", "" }, { open, "", "" }, { full, "", "" } };
    GoalStatistics st = goal_statistics(rows);
    ASSERT_EQ(st.total, 3);
    ASSERT_EQ(st.achieved, 2);
    ASSERT_EQ(st.active, 1);
    ASSERT_EQ(st.achievement_rate, 66);
}

TEST(GoalStatisticsTest, EmptyListHasZeroRate) {
    GoalStatistics st = goal_statistics({});
    ASSERT_EQ(st.total, 0);
    ASSERT_EQ(st.achievement_rate, 0);
}

TEST(AnyGoalTest, Accessors) {
    AnyGoal w = WeightGoal{ 4, 9, 100.0, 50.0, "2024-07", false };
    ASSERT_EQ(goal_id(w), 4);
    ASSERT_EQ(goal_exercise_id(w), 9);
    ASSERT_STREQ(goal_kind_name(w), "weight");
    ASSERT_EQ(goal_progress(w), 50);
    ASSERT_STREQ(goal_kind_name(AnyGoal{ squat_goal() }), "sets");
}

TEST(GoalEditTest, TargetChangesAreDetected) {
    AnyGoal before = squat_goal();
    SetGoal notes_only = squat_goal();
    notes_only.notes = "pause reps";
    notes_only.target_month = "2024-07";
    ASSERT_FALSE(goal_targets_changed(before, notes_only));

    SetGoal heavier = squat_goal();
    heavier.target_weight = 140.0;
    ASSERT_TRUE(goal_targets_changed(before, heavier));
    SetGoal more_reps = squat_goal();
    more_reps.target_reps = 8;
    ASSERT_TRUE(goal_targets_changed(before, more_reps));
    SetGoal more_sets = squat_goal();
    more_sets.target_sets = 5;
    ASSERT_TRUE(goal_targets_changed(before, more_sets));

    AnyGoal w = WeightGoal{ 1, 7, 100.0, 90.0, "2024-06", false };
    ASSERT_TRUE(goal_targets_changed(before, w));
    ASSERT_FALSE(goal_targets_changed(w, WeightGoal{ 1, 7, 100.0, 95.0, "2024-08", false }));
    ASSERT_TRUE(goal_targets_changed(w, WeightGoal{ 1, 7, 110.0, 90.0, "2024-06", false }));
}

TEST(GoalEditTest, ResetClearsProgress) {
    SetGoal s = squat_goal();
    s.current_achieved_sets = 3;
    s.current_max_weight = 120.0;
    s.achieved = true;
    AnyGoal g = s;
    reset_progress(g);
    const SetGoal& r = std::get<SetGoal>(g);
    ASSERT_EQ(r.current_achieved_sets, 0);
    ASSERT_DOUBLE_EQ(r.current_max_weight, 0.0);
    ASSERT_FALSE(goal_is_achieved(g));
    ASSERT_EQ(r.target_sets, 3);

    AnyGoal w = WeightGoal{ 1, 7, 100.0, 105.0, "2024-06", true };
    reset_progress(w);
    ASSERT_DOUBLE_EQ(std::get<WeightGoal>(w).current_weight, 0.0);
    ASSERT_FALSE(goal_is_achieved(w));
}
