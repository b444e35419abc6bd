#include "calculations.hpp"
#include <algorithm>
#include <cmath>

double one_rep_max(double weight, int reps) {
    if (reps == 1) return weight;
    return weight * (1.0 + reps / 30.0);
}

int weight_goal_progress(double current_weight, double target_weight) {
    if (target_weight <= 0.0) return 0;
    double pct = current_weight / target_weight * 100.0;
    if (pct <= 0.0) return 0;
    return std::min(static_cast<int>(pct), 100);
}

int set_goal_progress(int achieved_sets, int target_sets) {
    if (target_sets <= 0) return 0;
    if (achieved_sets <= 0) return 0;
    if (achieved_sets >= target_sets) return 100;
    return achieved_sets * 100 / target_sets;
}

int remaining_sets(int achieved_sets, int target_sets) {
    return std::max(0, target_sets - achieved_sets);
}

double growth_rate(double current, double previous) {
    if (previous == 0.0) return 0.0;
    return (current - previous) / previous * 100.0;
}

double total_volume(const std::vector<Lift>& lifts) {
    double sum = 0.0;
    for (const auto& l : lifts) sum += l.weight * l.reps;
    return sum;
}

double average_weight(const std::vector<Lift>& lifts) {
    if (lifts.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& l : lifts) sum += l.weight;
    return sum / static_cast<double>(lifts.size());
}

double max_one_rep_max(const std::vector<Lift>& lifts) {
    double best = 0.0;
    for (const auto& l : lifts) best = std::max(best, one_rep_max(l.weight, l.reps));
    return best;
}

double body_mass_index(double weight_kg, double height_cm) {
    if (weight_kg <= 0.0 || height_cm <= 0.0) return 0.0;
    double h = height_cm / 100.0;
    return std::round(weight_kg / (h * h) * 10.0) / 10.0;
}

const char* bmi_class(double bmi) {
    if (bmi < 18.5) return "Underweight";
    if (bmi < 25.0) return "Normal";
    return "Overweight";
}
