#include "report_worker.hpp"
#include "test_util.hpp"
#include <stdexcept>

class ReportWorkerTest : public TempDbTest {};

TEST_F(ReportWorkerTest, BuildsReportOnOwnConnection) {
    std::int64_t squat = exercise_id("Squat", "Barbell");
    std::int64_t bench = exercise_id("Bench Press", "Barbell");
    int n = 0;
    ASSERT_TRUE(db_log_sets(db_, "2024-05-13", squat, { { 100.0, 5 }, { 100.0, 5 } }, n));
    ASSERT_TRUE(db_log_sets(db_, "2024-05-14", bench, { { 80.0, 5 } }, n));
    ASSERT_TRUE(db_log_sets(db_, "2024-05-15", squat, { { 105.0, 3 } }, n));
    ASSERT_TRUE(db_log_sets(db_, "2023-01-01", bench, { { 60.0, 5 } }, n));

    std::future<StatsReport> fut = load_report_async(path_, 30, Date{ 2024, 5, 15 });
    StatsReport rep = fut.get();
    ASSERT_EQ(rep.period_days, 30);
    ASSERT_EQ(rep.summary.total_workouts, 3);
    ASSERT_EQ(rep.summary.total_sets, 4);
    ASSERT_EQ(rep.current_streak, 3);
    ASSERT_EQ(rep.max_streak, 3);
    ASSERT_EQ(rep.best.size(), 2u);
    ASSERT_EQ(rep.best[0].exercise_name, "Squat (Barbell)");
}

TEST_F(ReportWorkerTest, AllTimeIncludesOldWorkouts) {
    std::int64_t bench = exercise_id("Bench Press", "Barbell");
    int n = 0;
    ASSERT_TRUE(db_log_sets(db_, "2023-01-01", bench, { { 60.0, 5 } }, n));

    StatsReport rep;
    ASSERT_TRUE(load_stats_report(db_, 0, Date{ 2024, 5, 15 }, rep));
    ASSERT_EQ(rep.summary.total_workouts, 1);
    ASSERT_EQ(rep.current_streak, 0);
}

TEST_F(ReportWorkerTest, EmptiedWorkoutIsNotAWorkoutDay) {
    std::int64_t squat = exercise_id("Squat", "Barbell");
    int n = 0;
    ASSERT_TRUE(db_log_sets(db_, "2024-05-13", squat, { { 100.0, 5 } }, n));   // Monday
    ASSERT_TRUE(db_log_sets(db_, "2024-05-14", squat, { { 100.0, 5 }, { 95.0, 5 } }, n));

    HistoryFilter day;
    day.start_date = "2024-05-14";
    day.end_date = "2024-05-14";
    std::vector<HistoryRow> rows;
    ASSERT_TRUE(db_load_history(db_, day, rows));
    ASSERT_EQ(rows.size(), 2u);
    for (const HistoryRow& r : rows) ASSERT_TRUE(db_delete_set(db_, r.set_id));

    std::vector<std::string> dates;
    ASSERT_TRUE(db_workout_dates(db_, HistoryFilter{}, dates));
    ASSERT_EQ(dates, (std::vector<std::string>{ "2024-05-13" }));

    StatsReport rep;
    ASSERT_TRUE(load_stats_report(db_, 0, Date{ 2024, 5, 15 }, rep));
    ASSERT_EQ(rep.summary.total_workouts, 1);
    int by_weekday = 0;
    for (int c : rep.weekdays) by_weekday += c;
    ASSERT_EQ(by_weekday, rep.summary.total_workouts);
    ASSERT_EQ(rep.weekdays[0], 1);
    ASSERT_EQ(rep.weekdays[1], 0);
    ASSERT_EQ(rep.max_streak, 1);
}

TEST(ReportWorkerErrorTest, UnopenablePathThrows) {
    std::string path = (unique_temp_path("gymtracker_nodir") / "sub" / "gym.db").string();
    std::future<StatsReport> fut = load_report_async(path, 30, Date{ 2024, 5, 15 });
    ASSERT_THROW(fut.get(), std::runtime_error);
}
