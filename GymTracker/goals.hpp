#pragma once
#include <optional>
#include <vector>
#include "models.hpp"
#include "date.hpp"

/*
-------------------------------------------------------------------------------
 goals.hpp - Goal rules (no database access)
-------------------------------------------------------------------------------
The store reads rows, these functions decide what the new goal values are,
and the store writes them back. Nothing here touches SQLite.

Refresh rule (both goal kinds, single and bulk refresh alike): a recomputed
value only replaces the stored one when it is an improvement. A bad session
never lowers a recorded best. Editing a target is the exception: progress is
reset and recounted against the new target.

Set goals count qualifying sets (weight >= target weight and reps >= target
reps) per workout session; the best session is the achieved count.
-------------------------------------------------------------------------------
*/

// Result of scanning the history of one exercise for a set goal.
struct SetGoalEvaluation {
    int best_session_sets{ 0 };   // most qualifying sets in one workout
    double max_weight{ 0.0 };     // heaviest set of the exercise, any reps
};

/// Qualifying-set count for `goal`, using only rows of the goal's exercise.
SetGoalEvaluation evaluate_set_goal(const SetGoal& goal, const std::vector<HistoryRow>& rows);

/// Improvement-only update; returns true if a stored value changed.
bool apply_evaluation(SetGoal& goal, const SetGoalEvaluation& eval);

/// Improvement-only update of current_weight from the best logged 1RM.
bool apply_best_one_rm(WeightGoal& goal, std::optional<double> best_one_rm);

// Manual override: the user says it is done.
void mark_achieved(WeightGoal& goal);
void mark_achieved(SetGoal& goal);
void mark_achieved(AnyGoal& goal);

/// True when an edit moved the bar: target weight, reps or sets differ
/// (or the kind does). Progress counted against the old target is void then.
bool goal_targets_changed(const AnyGoal& before, const AnyGoal& after);

// Clear recorded progress and the achieved flag so the next refresh counts
// from scratch against the current target.
void reset_progress(WeightGoal& goal);
void reset_progress(SetGoal& goal);
void reset_progress(AnyGoal& goal);

/// Unachieved set goal with some qualifying sets and 0 < remaining <= threshold.
bool is_almost_there(const SetGoal& goal, int threshold);

// Counts for the goal overview.
struct GoalStatistics {
    int total{ 0 };
    int achieved{ 0 };
    int active{ 0 };
    int achievement_rate{ 0 };   // integer percent
};

GoalStatistics goal_statistics(const std::vector<GoalRow>& goals);

// ---------------------------------------------------------------------------
// Body composition
// ---------------------------------------------------------------------------

/// Progress toward a target whose direction comes from the baseline
/// (weight, BMI). nullopt when the dimension has no target or no baseline.
std::optional<int> directional_progress(std::optional<double> target,
    std::optional<double> current,
    std::optional<double> baseline);

/// Progress toward a higher value (muscle mass).
std::optional<int> increase_progress(std::optional<double> target,
    std::optional<double> current,
    std::optional<double> baseline);

/// Progress toward a lower value (body fat).
std::optional<int> decrease_progress(std::optional<double> target,
    std::optional<double> current,
    std::optional<double> baseline);

struct BodyCompositionProgress {
    std::optional<int> weight;
    std::optional<int> muscle_mass;
    std::optional<int> body_fat;
    std::optional<int> bmi;
    std::optional<int> overall;   // mean of the dimensions that have a value
    bool missing_baseline{ false };  // some targeted dimension had no baseline
};

BodyCompositionProgress body_composition_progress(const BodyCompositionGoal& goal);

/// Fill current_* from a body-stats snapshot; BMI needs a height.
/// Returns true if anything changed.
bool apply_body_stats(BodyCompositionGoal& goal, const BodyStats& latest,
    std::optional<double> height_cm);

enum class DeadlineState { Achieved, Overdue, DueToday, Pending };

DeadlineState deadline_state(const BodyCompositionGoal& goal, const Date& today);

/// Days until target_date, never negative; 0 for an unparsable date.
int days_remaining(const BodyCompositionGoal& goal, const Date& today);

struct BodyGoalSummary {
    int total{ 0 };
    int achieved{ 0 };
    int active{ 0 };
    int overdue{ 0 };
    double achievement_rate{ 0.0 };  // percent, one decimal when printed
};

BodyGoalSummary body_goal_summary(const std::vector<BodyCompositionGoal>& goals, const Date& today);
