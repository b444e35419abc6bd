#pragma once
#include <vector>
#include <algorithm>
#include <iostream>
#include <iomanip>
#include "models.hpp"
#include "goals.hpp"
#include "stats.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - In-memory "service" helpers and simple store
-------------------------------------------------------------------------------
This header defines:
  - DataStore: a simple in-memory cache of exercises, lift goals and body
    composition goals.
  - Small helper functions that operate on DataStore, plus the printers the
    menu uses for history, statistics and body stats.

Design notes
  - DataStore mirrors the SQLite database. DB remains the source of truth.
    Callers should first perform the DB write; only if that succeeds should
    they call the matching in-memory helper to keep the cache consistent.
  - The set log and body stats are not cached; they are read per screen.
  - All output is written to std::cout to keep the UI minimal for the console.
-------------------------------------------------------------------------------
*/

// Our simple "database" / in-memory cache
struct DataStore {
    std::vector<Exercise> all_exercises;
    std::vector<GoalRow> all_goals;
    std::vector<BodyCompositionGoal> all_body_goals;
};

// Fixed 1-decimal formatting for kg and percentages.
struct Fixed1 { double v; };
inline std::ostream& operator<<(std::ostream& os, Fixed1 f) {
    auto flags = os.flags();
    auto prec = os.precision();
    os << std::fixed << std::setprecision(1) << f.v;
    os.flags(flags);
    os.precision(prec);
    return os;
}

// ==========================
// EXERCISES
// ==========================

// Add an exercise if (name, variation) is unique. Returns true on success.
inline bool add_exercise(DataStore& data, const Exercise& e) {
    auto it = std::find_if(data.all_exercises.begin(), data.all_exercises.end(),
        [&](const Exercise& x) { return x.name == e.name && x.variation == e.variation; });
    if (it != data.all_exercises.end()) return false; // already exists
    data.all_exercises.push_back(e);
    return true;
}

// Print exercises grouped by category, in the fixed category order.
inline void show_exercises(const DataStore& data) {
    if (data.all_exercises.empty()) {
        std::cout << "No exercises.\n";
        return;
    }
    std::cout << "--- ********************** ---\n";
    std::cout << "          Exercises           \n";
    std::cout << "--- ********************** ---\n";
    for (const auto& cat : kExerciseCategories) {
        bool header = false;
        for (const auto& e : data.all_exercises) {
            if (e.category != cat) continue;
            if (!header) { std::cout << "[" << cat << "]\n"; header = true; }
            std::cout << "  " << std::setw(3) << e.id << " - " << e.display_name() << "\n";
        }
    }
}

// ==========================
// TRAINING LOG
// ==========================

inline void show_history(const std::vector<HistoryRow>& rows) {
    if (rows.empty()) { std::cout << "No sets recorded.\n"; return; }
    std::string last_date;
    for (const auto& r : rows) {
        if (r.date != last_date) {
            std::cout << r.date << "\n";
            last_date = r.date;
        }
        std::cout << "  #" << r.set_id << "  " << r.exercise_name
            << "  set " << r.set_number
            << ": " << Fixed1{ r.weight } << "kg x " << r.reps
            << "  (1RM " << Fixed1{ r.one_rm } << ")\n";
    }
}

inline void show_last_record(const std::vector<SetRecord>& sets) {
    if (sets.empty()) { std::cout << "Not performed yet.\n"; return; }
    std::cout << "Last time:";
    for (const auto& s : sets)
        std::cout << "  " << Fixed1{ s.weight } << "x" << s.reps;
    std::cout << "\n";
}

inline void show_best_records(const std::vector<BestRecord>& best) {
    if (best.empty()) { std::cout << "No records yet.\n"; return; }
    std::cout << "Personal bests (by estimated 1RM)\n";
    int rank = 1;
    for (const auto& b : best) {
        std::cout << std::setw(3) << rank++ << ". " << b.exercise_name
            << " | max " << Fixed1{ b.max_weight } << "kg"
            << " | max reps " << b.max_reps
            << " | 1RM " << Fixed1{ b.max_one_rm } << "kg\n";
    }
}

inline void show_progress(const std::string& title, const std::vector<ProgressPoint>& points, bool with_average) {
    std::cout << title << "\n";
    if (points.empty()) { std::cout << "  No data in this period.\n"; return; }
    for (const auto& p : points) {
        std::cout << "  " << p.date << "  " << Fixed1{ p.value };
        if (with_average) std::cout << "  (avg " << Fixed1{ p.average } << ")";
        std::cout << "\n";
    }
}

inline void show_exercise_summary(const ExerciseSummary& s) {
    std::cout << "Sets: " << s.total_sets
        << " | max " << Fixed1{ s.max_weight } << "kg"
        << " | avg " << Fixed1{ s.average_weight } << "kg"
        << " | best 1RM " << Fixed1{ s.max_one_rm } << "kg"
        << " | volume " << Fixed1{ s.total_volume } << "kg"
        << " (" << Fixed1{ s.average_volume } << "/set)\n";
}

inline void show_stats_report(const StatsReport& rep) {
    static const char* kDays[] = { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
    const auto& s = rep.summary;

    std::cout << "--- ********************** ---\n";
    if (rep.period_days > 0) std::cout << "     Statistics (last " << rep.period_days << " days)\n";
    else std::cout << "     Statistics (all time)\n";
    std::cout << "--- ********************** ---\n";
    std::cout << "Workouts: " << s.total_workouts
        << " | sets: " << s.total_sets
        << " | avg sets/workout: " << Fixed1{ s.avg_sets_per_workout } << "\n";
    std::cout << "This month: " << s.this_month_workouts << " workout day(s)\n";
    std::cout << "Average weight: " << Fixed1{ s.average_weight } << "kg"
        << " | total volume: " << Fixed1{ s.total_volume } << "kg\n";
    std::cout << "Current streak: " << rep.current_streak
        << " | longest streak: " << rep.max_streak << "\n";

    std::cout << "By weekday:";
    for (int i = 0; i < 7; ++i) std::cout << " " << kDays[i] << "=" << rep.weekdays[i];
    std::cout << "\n";

    if (!rep.categories.empty()) {
        std::cout << "By category:";
        for (const auto& c : rep.categories) std::cout << " " << c.category << "=" << c.sets;
        std::cout << "\n";
    }
    show_best_records(rep.best);
}

// ==========================
// LIFT GOALS
// ==========================

// Add a goal unless the same exercise/month/kind is already there.
inline bool add_goal(DataStore& data, const GoalRow& row) {
    auto it = std::find_if(data.all_goals.begin(), data.all_goals.end(), [&](const GoalRow& g) {
        return goal_exercise_id(g.goal) == goal_exercise_id(row.goal)
            && goal_kind_name(g.goal) == std::string(goal_kind_name(row.goal))
            && std::visit([](const auto& x) { return x.target_month; }, g.goal)
               == std::visit([](const auto& x) { return x.target_month; }, row.goal);
    });
    if (it != data.all_goals.end()) return false;
    data.all_goals.push_back(row);
    return true;
}

inline void show_goal_line(const GoalRow& row) {
    std::cout << "  " << std::setw(3) << goal_id(row.goal) << " - " << row.exercise_name << " | ";
    if (const auto* w = std::get_if<WeightGoal>(&row.goal)) {
        std::cout << "reach " << Fixed1{ w->target_weight } << "kg by " << w->target_month
            << " | now " << Fixed1{ w->current_weight } << "kg"
            << " | " << w->progress_percentage() << "%"
            << (w->achieved ? " | achieved" : (w->achievable() ? " | ready to confirm" : ""));
    }
    else {
        const SetGoal& s = std::get<SetGoal>(row.goal);
        std::cout << s.target_description() << " by " << s.target_month
            << " | " << s.progress_percentage() << "%"
            << " | " << s.achievement_text();
        if (!s.notes.empty()) std::cout << " | " << s.notes;
    }
    std::cout << "\n";
}

// Goals grouped by body part, legs first.
inline void show_goals(const DataStore& data) {
    static const char* kGoalCategoryOrder[] = { "Legs", "Chest", "Back", "Shoulders", "Arms" };
    if (data.all_goals.empty()) { std::cout << "No goals.\n"; return; }
    for (const char* cat : kGoalCategoryOrder) {
        bool header = false;
        for (const auto& g : data.all_goals) {
            if (g.category != cat) continue;
            if (!header) { std::cout << "[" << cat << "]\n"; header = true; }
            show_goal_line(g);
        }
    }
}

inline void show_goal_statistics(const GoalStatistics& st) {
    std::cout << "Goals: " << st.total
        << " | achieved: " << st.achieved
        << " | active: " << st.active
        << " | rate: " << st.achievement_rate << "%\n";
}

// ==========================
// BODY STATS
// ==========================

inline void show_body_stats(const std::vector<BodyStats>& list, std::optional<double> height_cm) {
    if (list.empty()) { std::cout << "No body stats.\n"; return; }
    for (const auto& b : list) {
        std::cout << "  " << std::setw(3) << b.id << " - " << b.date;
        if (b.weight) std::cout << " | " << Fixed1{ *b.weight } << "kg";
        if (b.body_fat_percentage) std::cout << " | fat " << Fixed1{ *b.body_fat_percentage } << "%";
        if (b.muscle_mass) std::cout << " | muscle " << Fixed1{ *b.muscle_mass } << "kg";
        if (b.weight && height_cm) {
            double bmi = body_mass_index(*b.weight, *height_cm);
            std::cout << " | BMI " << Fixed1{ bmi } << " (" << bmi_class(bmi) << ")";
        }
        std::cout << "\n";
    }
}

// "vs <date>" deltas between the latest snapshot and an earlier one.
inline void show_body_change(const BodyStats& latest, const BodyStats& since) {
    std::cout << "Change since " << since.date << ":";
    bool any = false;
    auto delta = [&](const char* label, const std::optional<double>& now,
        const std::optional<double>& then, const char* unit) {
        if (!now || !then) return;
        double d = *now - *then;
        std::cout << " " << label << " " << (d >= 0 ? "+" : "") << Fixed1{ d } << unit;
        any = true;
    };
    delta("weight", latest.weight, since.weight, "kg");
    delta("fat", latest.body_fat_percentage, since.body_fat_percentage, "%");
    delta("muscle", latest.muscle_mass, since.muscle_mass, "kg");
    if (!any) std::cout << " nothing to compare";
    std::cout << "\n";
}

// ==========================
// BODY COMPOSITION GOALS
// ==========================

inline bool add_body_goal(DataStore& data, const BodyCompositionGoal& g) {
    auto it = std::find_if(data.all_body_goals.begin(), data.all_body_goals.end(),
        [&](const BodyCompositionGoal& x) { return x.id == g.id; });
    if (it != data.all_body_goals.end()) return false;
    data.all_body_goals.push_back(g);
    return true;
}

inline void show_body_goals(const DataStore& data, const Date& today) {
    if (data.all_body_goals.empty()) { std::cout << "No body composition goals.\n"; return; }
    for (const auto& g : data.all_body_goals) {
        BodyCompositionProgress p = body_composition_progress(g);
        std::cout << "  " << std::setw(3) << g.id << " - " << g.goal_name
            << " | " << g.target_summary() << " by " << g.target_date << " | ";
        if (p.overall) std::cout << *p.overall << "%";
        else std::cout << "no baseline";
        if (p.overall && p.missing_baseline) std::cout << " (some metrics have no baseline)";

        switch (deadline_state(g, today)) {
        case DeadlineState::Achieved: std::cout << " | achieved"; break;
        case DeadlineState::Overdue: std::cout << " | overdue"; break;
        case DeadlineState::DueToday: std::cout << " | due today"; break;
        case DeadlineState::Pending: std::cout << " | " << days_remaining(g, today) << " days left"; break;
        }
        std::cout << "\n";
    }
}

inline void show_body_goal_summary(const BodyGoalSummary& s) {
    std::cout << "Body goals: " << s.total
        << " | achieved: " << s.achieved
        << " | active: " << s.active
        << " | overdue: " << s.overdue
        << " | rate: " << Fixed1{ s.achievement_rate } << "%\n";
}
