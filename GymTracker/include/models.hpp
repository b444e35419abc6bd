#pragma once
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "calculations.hpp"

/*
-------------------------------------------------------------------------------
 models.hpp - Core domain structs
-------------------------------------------------------------------------------
Defines plain data structures for the entities kept in the SQLite store:
  - Exercise, Workout, SetRecord (the training log)
  - WeightGoal (legacy one-value target) and SetGoal (weight x reps x sets)
  - BodyStats and BodyCompositionGoal

Ids are SQLite rowids; 0 means "not stored yet". Dates are "YYYY-MM-DD" text,
goal months are "YYYY-MM".

Both goal models live in the same table, told apart by `kind`. At the domain
level they are a tagged variant (AnyGoal) so callers always know which rules
apply to the row in hand.
-------------------------------------------------------------------------------
*/

// Fixed set of body-part categories used by the seeded exercises.
inline const std::vector<std::string> kExerciseCategories = {
    "Chest", "Back", "Legs", "Shoulders", "Arms"
};

// An exercise (reference data, seeded on first run)
struct Exercise {
    std::int64_t id{ 0 };
    std::string name;
    std::string variation;   // equipment, e.g. Barbell / Dumbbell / Machine
    std::string category;    // one of kExerciseCategories

    std::string display_name() const { return name + " (" + variation + ")"; }
};

// One training session, keyed by date
struct Workout {
    std::int64_t id{ 0 };
    std::string date;
    std::string notes;
};

// One performed set. one_rm is filled by the store at insert time.
struct SetRecord {
    std::int64_t id{ 0 };
    std::int64_t workout_id{ 0 };   // foreign key -> Workout
    std::int64_t exercise_id{ 0 };  // foreign key -> Exercise
    int set_number{ 0 };            // 1-based within the workout
    double weight{ 0.0 };
    int reps{ 0 };
    double one_rm{ 0.0 };
};

// A set joined with its workout date and exercise, as read for history
// listings and statistics.
struct HistoryRow {
    std::int64_t set_id{ 0 };
    std::int64_t workout_id{ 0 };
    std::int64_t exercise_id{ 0 };
    std::string date;
    std::string exercise_name;   // display name
    std::string category;
    int set_number{ 0 };
    double weight{ 0.0 };
    int reps{ 0 };
    double one_rm{ 0.0 };
};

// Legacy goal: reach a single weight by a target month.
struct WeightGoal {
    std::int64_t id{ 0 };
    std::int64_t exercise_id{ 0 };
    double target_weight{ 0.0 };
    double current_weight{ 0.0 };
    std::string target_month;
    bool achieved{ false };

    int progress_percentage() const {
        return weight_goal_progress(current_weight, target_weight);
    }

    // Crossed the threshold but not confirmed by the user yet.
    bool achievable() const {
        return !achieved && target_weight > 0.0 && current_weight >= target_weight;
    }
};

// Set goal: perform target_sets sets of target_weight x target_reps.
struct SetGoal {
    std::int64_t id{ 0 };
    std::int64_t exercise_id{ 0 };
    double target_weight{ 0.0 };
    int target_reps{ 0 };
    int target_sets{ 0 };
    int current_achieved_sets{ 0 };
    double current_max_weight{ 0.0 };  // reference value, best weight seen
    std::string target_month;
    bool achieved{ false };
    std::string notes;
    std::string created_at;
    std::string updated_at;

    int progress_percentage() const {
        return set_goal_progress(current_achieved_sets, target_sets);
    }

    // Either the sets are in or the user marked it done.
    bool is_achieved() const {
        return current_achieved_sets >= target_sets || achieved;
    }

    int remaining() const {
        return remaining_sets(current_achieved_sets, target_sets);
    }

    std::string target_description() const {
        std::ostringstream os;
        os << target_weight << "kg x " << target_reps << " reps x " << target_sets << " sets";
        return os.str();
    }

    std::string achievement_text() const {
        if (is_achieved()) return "Goal achieved";
        if (current_achieved_sets > 0) {
            return std::to_string(current_achieved_sets) + "/" +
                std::to_string(target_sets) + " sets achieved";
        }
        return "In progress";
    }
};

using AnyGoal = std::variant<WeightGoal, SetGoal>;

// Accessors that work for either goal kind.
inline std::int64_t goal_id(const AnyGoal& g) {
    return std::visit([](const auto& x) { return x.id; }, g);
}
inline std::int64_t goal_exercise_id(const AnyGoal& g) {
    return std::visit([](const auto& x) { return x.exercise_id; }, g);
}
// Terminal state: the flag for weight goals, flag or full sets for set goals.
inline bool goal_is_achieved(const AnyGoal& g) {
    if (const auto* s = std::get_if<SetGoal>(&g)) return s->is_achieved();
    return std::get<WeightGoal>(g).achieved;
}
inline int goal_progress(const AnyGoal& g) {
    return std::visit([](const auto& x) { return x.progress_percentage(); }, g);
}
inline const char* goal_kind_name(const AnyGoal& g) {
    return std::holds_alternative<WeightGoal>(g) ? "weight" : "sets";
}

// Goal joined with its exercise for listings.
struct GoalRow {
    AnyGoal goal;
    std::string exercise_name;   // display name, e.g. "Squat (Barbell)"
    std::string category;
};

// Body measurements for one date; every metric is optional.
struct BodyStats {
    std::int64_t id{ 0 };
    std::string date;
    std::optional<double> weight;
    std::optional<double> body_fat_percentage;
    std::optional<double> muscle_mass;
};

// Target body composition by a date. initial_* is the baseline recorded when
// the goal was created; a dimension without a baseline has no progress value.
struct BodyCompositionGoal {
    std::int64_t id{ 0 };
    std::string goal_name;
    std::optional<double> target_weight;
    std::optional<double> target_muscle_mass;
    std::optional<double> target_body_fat;
    std::optional<double> target_bmi;
    std::string target_date;
    std::optional<double> current_weight;
    std::optional<double> current_muscle_mass;
    std::optional<double> current_body_fat;
    std::optional<double> current_bmi;
    std::optional<double> initial_weight;
    std::optional<double> initial_muscle_mass;
    std::optional<double> initial_body_fat;
    std::optional<double> initial_bmi;
    bool achieved{ false };
    std::string notes;
    std::string created_at;
    std::string updated_at;

    std::string target_summary() const {
        std::ostringstream os;
        const char* sep = "";
        if (target_weight) { os << sep << "Weight " << *target_weight << "kg"; sep = " / "; }
        if (target_muscle_mass) { os << sep << "Muscle " << *target_muscle_mass << "kg"; sep = " / "; }
        if (target_body_fat) { os << sep << "Body fat " << *target_body_fat << "%"; sep = " / "; }
        if (target_bmi) { os << sep << "BMI " << *target_bmi; sep = " / "; }
        std::string s = os.str();
        return s.empty() ? "No targets" : s;
    }
};
