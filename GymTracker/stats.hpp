#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"
#include "date.hpp"

/*
-------------------------------------------------------------------------------
 stats.hpp - Aggregate statistics over the set log
-------------------------------------------------------------------------------
All functions are pure: they take rows already read from the store
(db_load_history / db_workout_dates) and return derived values.

Rows whose date is not a valid YYYY-MM-DD are skipped and reported on
std::cerr; the aggregate continues over the remaining rows.
-------------------------------------------------------------------------------
*/

// Per-exercise bests. The three maxima are independent of each other.
struct BestRecord {
    std::int64_t exercise_id{ 0 };
    std::string exercise_name;
    double max_weight{ 0.0 };
    int max_reps{ 0 };
    double max_one_rm{ 0.0 };
};

/// Bests per exercise, ranked by max_one_rm descending, first `limit` kept.
std::vector<BestRecord> best_records(const std::vector<HistoryRow>& rows, size_t limit = 10);

/// Consecutive days ending today (or yesterday) with a workout.
/// Looks at the 30 most recent distinct dates only.
int current_streak(const std::vector<std::string>& workout_dates, const Date& today);

/// Longest run of calendar-consecutive workout dates.
int max_streak(const std::vector<std::string>& workout_dates);

// One point of a per-date progress series.
struct ProgressPoint {
    std::string date;
    double value{ 0.0 };     // max 1RM, max weight, or summed volume
    double average{ 0.0 };   // mean weight (weight series only)
};

std::vector<ProgressPoint> one_rm_progress(const std::vector<HistoryRow>& rows);
std::vector<ProgressPoint> weight_progress(const std::vector<HistoryRow>& rows);
std::vector<ProgressPoint> volume_progress(const std::vector<HistoryRow>& rows);

/// Distinct workout dates per weekday, index 0 = Monday ... 6 = Sunday.
std::array<int, 7> weekday_frequency(const std::vector<std::string>& workout_dates);

struct CategoryCount {
    std::string category;
    int sets{ 0 };
};

/// Set count per category, descending by count.
std::vector<CategoryCount> category_breakdown(const std::vector<HistoryRow>& rows);

struct WorkoutSummary {
    int total_workouts{ 0 };         // distinct dates
    int total_sets{ 0 };
    double avg_sets_per_workout{ 0.0 };
    int this_month_workouts{ 0 };    // distinct dates in today's month
    double average_weight{ 0.0 };    // sets with weight > 0
    double total_volume{ 0.0 };
};

WorkoutSummary workout_summary(const std::vector<HistoryRow>& rows, const Date& today);

// Summary for the rows of one exercise.
struct ExerciseSummary {
    int total_sets{ 0 };
    double max_weight{ 0.0 };
    double average_weight{ 0.0 };
    double max_one_rm{ 0.0 };
    double total_volume{ 0.0 };
    double average_volume{ 0.0 };   // per set
};

ExerciseSummary exercise_summary(const std::vector<HistoryRow>& rows);

/// First date of a "last N days" window; nullopt when period_days <= 0.
std::optional<std::string> period_start(const Date& today, int period_days);

// Everything the statistics screen shows, built in one go so it can be
// produced on a worker thread.
struct StatsReport {
    int period_days{ 0 };
    WorkoutSummary summary;
    std::vector<BestRecord> best;
    int current_streak{ 0 };
    int max_streak{ 0 };
    std::array<int, 7> weekdays{};
    std::vector<CategoryCount> categories;
};

StatsReport build_stats_report(const std::vector<HistoryRow>& rows,
    const std::vector<std::string>& workout_dates,
    const Date& today, int period_days);
