#include "stats.hpp"
#include <gtest/gtest.h>
#include <numeric>

namespace {

const Date kToday{ 2024, 5, 15 };   // a Wednesday

std::string day(int offset) {
    return format_date(add_days(kToday, offset));
}

HistoryRow row(std::int64_t workout, std::int64_t exercise, const std::string& name,
    const std::string& category, const std::string& date, double weight, int reps) {
    HistoryRow r;
    r.workout_id = workout;
    r.exercise_id = exercise;
    r.exercise_name = name;
    r.category = category;
    r.date = date;
    r.weight = weight;
    r.reps = reps;
    r.one_rm = one_rep_max(weight, reps);
    return r;
}

} // namespace

TEST(StreakTest, ThreeConsecutiveDaysEndingToday) {
    ASSERT_EQ(current_streak({ day(0), day(-1), day(-2) }, kToday), 3);
}

TEST(StreakTest, GapBeforeTodayStopsTheStreak) {
    ASSERT_EQ(current_streak({ day(0), day(-2) }, kToday), 1);
}

TEST(StreakTest, StreakEndingYesterdayStillCounts) {
    ASSERT_EQ(current_streak({ day(-1), day(-2), day(-4) }, kToday), 2);
}

TEST(StreakTest, NoWorkoutsOrOldWorkouts) {
    ASSERT_EQ(current_streak({}, kToday), 0);
    ASSERT_EQ(current_streak({ day(-3), day(-4) }, kToday), 0);
}

TEST(StreakTest, DuplicatesAndFutureDatesAreIgnored) {
    ASSERT_EQ(current_streak({ day(1), day(0), day(0), day(-1) }, kToday), 2);
}

TEST(StreakTest, MalformedDatesAreSkipped) {
    ASSERT_EQ(current_streak({ day(0), "2024-02-30", "garbage", day(-1) }, kToday), 2);
}

TEST(MaxStreakTest, LongestOfTwoRuns) {
    std::vector<std::string> dates;
    for (int i = 0; i < 3; ++i) dates.push_back(day(-20 + i));
    for (int i = 0; i < 5; ++i) dates.push_back(day(-10 + i));
    ASSERT_EQ(max_streak(dates), 5);
}

TEST(MaxStreakTest, EmptyAndSingle) {
    ASSERT_EQ(max_streak({}), 0);
    ASSERT_EQ(max_streak({ day(0) }), 1);
}

TEST(FrequencyTest, AlwaysSevenBucketsSummingToDistinctDays) {
    // Wed, Thu, and Wed a week later; the duplicate Thursday counts once.
    auto buckets = weekday_frequency({ day(0), day(1), day(1), day(7) });
    ASSERT_EQ(buckets.size(), 7u);
    ASSERT_EQ(buckets[2], 2);
    ASSERT_EQ(buckets[3], 1);
    ASSERT_EQ(std::accumulate(buckets.begin(), buckets.end(), 0), 3);
}

TEST(FrequencyTest, EmptyHistoryGivesZeroBuckets) {
    auto buckets = weekday_frequency({});
    ASSERT_EQ(std::accumulate(buckets.begin(), buckets.end(), 0), 0);
}

TEST(BestRecordsTest, MaximaAreIndependentAndRankedByOneRepMax) {
    std::vector<HistoryRow> rows{
        row(1, 1, "Squat (Barbell)", "Legs", day(-2), 100.0, 5),
        row(1, 1, "Squat (Barbell)", "Legs", day(-2), 60.0, 15),
        row(2, 2, "Bench Press (Barbell)", "Chest", day(-1), 80.0, 5),
    };
    auto best = best_records(rows);
    ASSERT_EQ(best.size(), 2u);
    ASSERT_EQ(best[0].exercise_name, "Squat (Barbell)");
    ASSERT_DOUBLE_EQ(best[0].max_weight, 100.0);
    ASSERT_EQ(best[0].max_reps, 15);
    ASSERT_NEAR(best[0].max_one_rm, 116.67, 0.01);
    ASSERT_EQ(best[1].exercise_id, 2);
}

TEST(BestRecordsTest, KeepsTopLimit) {
    std::vector<HistoryRow> rows;
    for (int i = 1; i <= 12; ++i)
        rows.push_back(row(i, i, "Ex" + std::to_string(i), "Arms", day(-i), 10.0 * i, 5));
    auto best = best_records(rows);
    ASSERT_EQ(best.size(), 10u);
    ASSERT_EQ(best.front().exercise_id, 12);
}

TEST(ProgressTest, GroupsByDate) {
    std::vector<HistoryRow> rows{
        row(1, 1, "Squat (Barbell)", "Legs", day(-7), 100.0, 5),
        row(1, 1, "Squat (Barbell)", "Legs", day(-7), 90.0, 5),
        row(2, 1, "Squat (Barbell)", "Legs", day(0), 105.0, 3),
    };
    auto orm = one_rm_progress(rows);
    ASSERT_EQ(orm.size(), 2u);
    ASSERT_EQ(orm[0].date, day(-7));
    ASSERT_NEAR(orm[0].value, 116.67, 0.01);

    auto w = weight_progress(rows);
    ASSERT_DOUBLE_EQ(w[0].value, 100.0);
    ASSERT_DOUBLE_EQ(w[0].average, 95.0);

    auto v = volume_progress(rows);
    ASSERT_DOUBLE_EQ(v[0].value, 950.0);
    ASSERT_DOUBLE_EQ(v[1].value, 315.0);
}

TEST(CategoryTest, DescendingBySetCount) {
    std::vector<HistoryRow> rows{
        row(1, 2, "Bench", "Chest", day(0), 80.0, 5),
        row(1, 1, "Squat", "Legs", day(0), 100.0, 5),
        row(1, 1, "Squat", "Legs", day(0), 100.0, 5),
    };
    auto cats = category_breakdown(rows);
    ASSERT_EQ(cats.size(), 2u);
    ASSERT_EQ(cats[0].category, "Legs");
    ASSERT_EQ(cats[0].sets, 2);
}

TEST(SummaryTest, WorkoutSummary) {
    std::vector<HistoryRow> rows{
        row(1, 1, "Squat", "Legs", "2024-04-30", 100.0, 5),
        row(2, 1, "Squat", "Legs", "2024-05-02", 100.0, 5),
        row(2, 8, "Push-up", "Chest", "2024-05-02", 0.0, 20),
        row(3, 1, "Squat", "Legs", "2024-05-10", 110.0, 3),
    };
    WorkoutSummary s = workout_summary(rows, kToday);
    ASSERT_EQ(s.total_workouts, 3);
    ASSERT_EQ(s.total_sets, 4);
    ASSERT_NEAR(s.avg_sets_per_workout, 4.0 / 3.0, 1e-9);
    ASSERT_EQ(s.this_month_workouts, 2);
    ASSERT_NEAR(s.average_weight, 310.0 / 3.0, 1e-9);   // zero-weight set excluded
    ASSERT_DOUBLE_EQ(s.total_volume, 500.0 + 500.0 + 330.0);
}

TEST(SummaryTest, ExerciseSummary) {
    std::vector<HistoryRow> rows{
        row(1, 1, "Squat", "Legs", day(-1), 100.0, 5),
        row(1, 1, "Squat", "Legs", day(-1), 80.0, 10),
    };
    ExerciseSummary s = exercise_summary(rows);
    ASSERT_EQ(s.total_sets, 2);
    ASSERT_DOUBLE_EQ(s.max_weight, 100.0);
    ASSERT_DOUBLE_EQ(s.average_weight, 90.0);
    ASSERT_DOUBLE_EQ(s.total_volume, 1300.0);
    ASSERT_DOUBLE_EQ(s.average_volume, 650.0);
    ASSERT_NEAR(s.max_one_rm, 116.67, 0.01);
}

TEST(PeriodTest, StartDate) {
    ASSERT_EQ(period_start(kToday, 30), std::optional<std::string>("2024-04-15"));
    ASSERT_FALSE(period_start(kToday, 0).has_value());
}

TEST(ReportTest, BuildsEverySection) {
    std::vector<HistoryRow> rows{
        row(1, 1, "Squat", "Legs", day(0), 100.0, 5),
        row(2, 1, "Squat", "Legs", day(-1), 100.0, 5),
    };
    StatsReport rep = build_stats_report(rows, { day(0), day(-1) }, kToday, 30);
    ASSERT_EQ(rep.period_days, 30);
    ASSERT_EQ(rep.summary.total_workouts, 2);
    ASSERT_EQ(rep.current_streak, 2);
    ASSERT_EQ(rep.max_streak, 2);
    ASSERT_EQ(rep.best.size(), 1u);
    ASSERT_EQ(rep.categories.size(), 1u);
}
