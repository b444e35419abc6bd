#pragma once
#include <vector>

/*
-------------------------------------------------------------------------------
 calculations.hpp - Training math shared by the store, stats and goals
-------------------------------------------------------------------------------
What this file provides:
  - one_rep_max:           Epley estimate used for every stored set.
  - weight_goal_progress:  percent of a weight target reached (legacy goals).
  - set_goal_progress:     percent of required sets achieved (set goals).
  - remaining_sets:        sets still missing for a set goal.
  - growth_rate, total_volume, average_weight, max_one_rep_max: small
    aggregates over a list of (weight, reps) pairs.

Conventions:
  - Weights are kilograms, reps are whole repetitions.
  - Percentages are integers in [0, 100] (truncated, never rounded up).
  - Inputs are assumed validated (weight > 0, reps >= 1); see validation.hpp.
-------------------------------------------------------------------------------
*/

// Plain (weight, reps) pair used by the aggregate helpers.
struct Lift {
    double weight{ 0.0 };
    int reps{ 0 };
};

/// Epley estimate: weight * (1 + reps/30), or the weight itself for a single.
/// Computed once when a set is stored; stored values are never recomputed.
double one_rep_max(double weight, int reps);

/// min(current / target * 100, 100) truncated; 0 when target <= 0.
int weight_goal_progress(double current_weight, double target_weight);

/// min(achieved / target * 100, 100) truncated; 0 when target <= 0.
int set_goal_progress(int achieved_sets, int target_sets);

/// max(0, target - achieved)
int remaining_sets(int achieved_sets, int target_sets);

/// (current - previous) / previous * 100; 0 when previous is 0.
double growth_rate(double current, double previous);

// Sum of weight * reps.
double total_volume(const std::vector<Lift>& lifts);

// Mean weight, 0 for an empty list.
double average_weight(const std::vector<Lift>& lifts);

// Largest one_rep_max over the list, 0 for an empty list.
double max_one_rep_max(const std::vector<Lift>& lifts);

/// weight / height_m^2 rounded to one decimal; 0 for non-positive input.
double body_mass_index(double weight_kg, double height_cm);

// "Underweight", "Normal" or "Overweight" for a BMI value.
const char* bmi_class(double bmi);
