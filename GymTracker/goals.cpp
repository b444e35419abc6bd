#include "goals.hpp"
#include <algorithm>
#include <map>

SetGoalEvaluation evaluate_set_goal(const SetGoal& goal, const std::vector<HistoryRow>& rows) {
    SetGoalEvaluation eval;
    std::map<std::int64_t, int> per_session;   // workout_id -> qualifying sets
    for (const auto& r : rows) {
        if (r.exercise_id != goal.exercise_id) continue;
        eval.max_weight = std::max(eval.max_weight, r.weight);
        if (r.weight >= goal.target_weight && r.reps >= goal.target_reps)
            ++per_session[r.workout_id];
    }
    for (const auto& kv : per_session)
        eval.best_session_sets = std::max(eval.best_session_sets, kv.second);
    return eval;
}

bool apply_evaluation(SetGoal& goal, const SetGoalEvaluation& eval) {
    bool changed = false;
    int sets = std::min(eval.best_session_sets, goal.target_sets);
    if (sets > goal.current_achieved_sets) {
        goal.current_achieved_sets = sets;
        changed = true;
    }
    if (eval.max_weight > goal.current_max_weight) {
        goal.current_max_weight = eval.max_weight;
        changed = true;
    }
    return changed;
}

bool apply_best_one_rm(WeightGoal& goal, std::optional<double> best_one_rm) {
    if (!best_one_rm || *best_one_rm <= goal.current_weight) return false;
    goal.current_weight = *best_one_rm;
    return true;
}

void mark_achieved(WeightGoal& goal) {
    goal.current_weight = goal.target_weight;
    goal.achieved = true;
}

void mark_achieved(SetGoal& goal) {
    goal.current_achieved_sets = goal.target_sets;
    goal.achieved = true;
}

void mark_achieved(AnyGoal& goal) {
    std::visit([](auto& g) { mark_achieved(g); }, goal);
}

bool goal_targets_changed(const AnyGoal& before, const AnyGoal& after) {
    if (before.index() != after.index()) return true;
    if (const auto* w = std::get_if<WeightGoal>(&before))
        return w->target_weight != std::get<WeightGoal>(after).target_weight;
    const SetGoal& a = std::get<SetGoal>(before);
    const SetGoal& b = std::get<SetGoal>(after);
    return a.target_weight != b.target_weight || a.target_reps != b.target_reps
        || a.target_sets != b.target_sets;
}

void reset_progress(WeightGoal& goal) {
    goal.current_weight = 0.0;
    goal.achieved = false;
}

void reset_progress(SetGoal& goal) {
    goal.current_achieved_sets = 0;
    goal.current_max_weight = 0.0;
    goal.achieved = false;
}

void reset_progress(AnyGoal& goal) {
    std::visit([](auto& g) { reset_progress(g); }, goal);
}

bool is_almost_there(const SetGoal& goal, int threshold) {
    if (goal.is_achieved() || goal.current_achieved_sets <= 0) return false;
    int left = goal.remaining();
    return left > 0 && left <= threshold;
}

GoalStatistics goal_statistics(const std::vector<GoalRow>& goals) {
    GoalStatistics st;
    st.total = static_cast<int>(goals.size());
    for (const auto& g : goals)
        if (goal_is_achieved(g.goal)) ++st.achieved;
    st.active = st.total - st.achieved;
    st.achievement_rate = st.total > 0 ? st.achieved * 100 / st.total : 0;
    return st;
}

// ---------------------------------------------------------------------------
// Body composition
// ---------------------------------------------------------------------------

static int clamp_percent(double change, double total) {
    if (total <= 0.0) return 100;
    int pct = static_cast<int>(change / total * 100.0);
    return std::max(0, std::min(pct, 100));
}

std::optional<int> directional_progress(std::optional<double> target,
    std::optional<double> current,
    std::optional<double> baseline) {
    if (!target || !baseline) return std::nullopt;
    if (!current) return 0;
    if (*target > *baseline)
        return clamp_percent(*current - *baseline, *target - *baseline);
    return clamp_percent(*baseline - *current, *baseline - *target);
}

std::optional<int> increase_progress(std::optional<double> target,
    std::optional<double> current,
    std::optional<double> baseline) {
    if (!target) return std::nullopt;
    if (current && *current >= *target) return 100;
    if (!baseline) return std::nullopt;
    if (!current) return 0;
    return clamp_percent(*current - *baseline, *target - *baseline);
}

std::optional<int> decrease_progress(std::optional<double> target,
    std::optional<double> current,
    std::optional<double> baseline) {
    if (!target) return std::nullopt;
    if (current && *current <= *target) return 100;
    if (!baseline) return std::nullopt;
    if (!current) return 0;
    return clamp_percent(*baseline - *current, *baseline - *target);
}

BodyCompositionProgress body_composition_progress(const BodyCompositionGoal& goal) {
    BodyCompositionProgress p;
    p.weight = directional_progress(goal.target_weight, goal.current_weight, goal.initial_weight);
    p.muscle_mass = increase_progress(goal.target_muscle_mass, goal.current_muscle_mass, goal.initial_muscle_mass);
    p.body_fat = decrease_progress(goal.target_body_fat, goal.current_body_fat, goal.initial_body_fat);
    p.bmi = directional_progress(goal.target_bmi, goal.current_bmi, goal.initial_bmi);

    const std::optional<double>* targets[] = {
        &goal.target_weight, &goal.target_muscle_mass, &goal.target_body_fat, &goal.target_bmi
    };
    const std::optional<int>* values[] = { &p.weight, &p.muscle_mass, &p.body_fat, &p.bmi };

    int sum = 0, n = 0;
    for (int i = 0; i < 4; ++i) {
        if (!targets[i]->has_value()) continue;
        if (!values[i]->has_value()) { p.missing_baseline = true; continue; }
        sum += **values[i];
        ++n;
    }
    if (n > 0) p.overall = sum / n;
    return p;
}

static bool assign_if_changed(std::optional<double>& slot, double value) {
    if (slot && *slot == value) return false;
    slot = value;
    return true;
}

bool apply_body_stats(BodyCompositionGoal& goal, const BodyStats& latest,
    std::optional<double> height_cm) {
    bool changed = false;
    if (latest.weight) changed |= assign_if_changed(goal.current_weight, *latest.weight);
    if (latest.body_fat_percentage) changed |= assign_if_changed(goal.current_body_fat, *latest.body_fat_percentage);
    if (latest.muscle_mass) changed |= assign_if_changed(goal.current_muscle_mass, *latest.muscle_mass);
    if (latest.weight && height_cm && *height_cm > 0.0)
        changed |= assign_if_changed(goal.current_bmi, body_mass_index(*latest.weight, *height_cm));
    return changed;
}

DeadlineState deadline_state(const BodyCompositionGoal& goal, const Date& today) {
    if (goal.achieved) return DeadlineState::Achieved;
    Date target;
    if (!parse_date_yyyy_mm_dd(goal.target_date, target)) return DeadlineState::Pending;
    if (target < today) return DeadlineState::Overdue;
    if (target == today) return DeadlineState::DueToday;
    return DeadlineState::Pending;
}

int days_remaining(const BodyCompositionGoal& goal, const Date& today) {
    Date target;
    if (!parse_date_yyyy_mm_dd(goal.target_date, target)) return 0;
    return std::max(0, days_between(today, target));
}

BodyGoalSummary body_goal_summary(const std::vector<BodyCompositionGoal>& goals, const Date& today) {
    BodyGoalSummary s;
    s.total = static_cast<int>(goals.size());
    for (const auto& g : goals) {
        if (g.achieved) ++s.achieved;
        else if (deadline_state(g, today) == DeadlineState::Overdue) ++s.overdue;
    }
    s.active = s.total - s.achieved;
    s.achievement_rate = s.total > 0 ? s.achieved * 100.0 / s.total : 0.0;
    return s;
}
