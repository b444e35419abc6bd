#include "stats.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>

// Parse a row date, logging and rejecting malformed text.
static bool row_date(const std::string& text, Date& out) {
    if (parse_date_yyyy_mm_dd(text, out)) return true;
    std::cerr << "Skipping row with malformed date: '" << text << "'\n";
    return false;
}

// Distinct valid dates, ascending.
static std::vector<Date> distinct_dates(const std::vector<std::string>& dates) {
    std::set<std::int64_t> days;
    for (const auto& s : dates) {
        Date d;
        if (row_date(s, d)) days.insert(to_day_number(d));
    }
    std::vector<Date> out;
    out.reserve(days.size());
    for (auto n : days) out.push_back(from_day_number(n));
    return out;
}

std::vector<BestRecord> best_records(const std::vector<HistoryRow>& rows, size_t limit) {
    std::map<std::int64_t, BestRecord> by_exercise;
    for (const auto& r : rows) {
        auto& b = by_exercise[r.exercise_id];
        b.exercise_id = r.exercise_id;
        b.exercise_name = r.exercise_name;
        b.max_weight = std::max(b.max_weight, r.weight);
        b.max_reps = std::max(b.max_reps, r.reps);
        b.max_one_rm = std::max(b.max_one_rm, r.one_rm);
    }

    std::vector<BestRecord> out;
    for (auto& kv : by_exercise) out.push_back(kv.second);
    std::stable_sort(out.begin(), out.end(),
        [](const BestRecord& a, const BestRecord& b) { return a.max_one_rm > b.max_one_rm; });
    if (out.size() > limit) out.resize(limit);
    return out;
}

int current_streak(const std::vector<std::string>& workout_dates, const Date& today) {
    std::vector<Date> dates = distinct_dates(workout_dates);
    std::reverse(dates.begin(), dates.end());   // most recent first
    if (dates.size() > 30) dates.resize(30);

    int streak = 0;
    Date cursor = today;
    for (const auto& d : dates) {
        int gap = days_between(d, cursor);
        if (gap < 0) continue;          // future-dated entry
        if (gap > 1) break;
        ++streak;
        cursor = d;
    }
    return streak;
}

int max_streak(const std::vector<std::string>& workout_dates) {
    std::vector<Date> dates = distinct_dates(workout_dates);
    int best = 0, run = 0;
    for (size_t i = 0; i < dates.size(); ++i) {
        if (i > 0 && days_between(dates[i - 1], dates[i]) == 1) ++run;
        else run = 1;
        best = std::max(best, run);
    }
    return best;
}

// Group rows by valid date, keyed by the normalized date text.
static std::map<std::string, std::vector<const HistoryRow*>> group_by_date(const std::vector<HistoryRow>& rows) {
    std::map<std::string, std::vector<const HistoryRow*>> groups;
    for (const auto& r : rows) {
        Date d;
        if (!row_date(r.date, d)) continue;
        groups[format_date(d)].push_back(&r);
    }
    return groups;
}

std::vector<ProgressPoint> one_rm_progress(const std::vector<HistoryRow>& rows) {
    std::vector<ProgressPoint> out;
    for (const auto& kv : group_by_date(rows)) {
        ProgressPoint p;
        p.date = kv.first;
        for (const auto* r : kv.second) p.value = std::max(p.value, r->one_rm);
        out.push_back(p);
    }
    return out;
}

std::vector<ProgressPoint> weight_progress(const std::vector<HistoryRow>& rows) {
    std::vector<ProgressPoint> out;
    for (const auto& kv : group_by_date(rows)) {
        ProgressPoint p;
        p.date = kv.first;
        double sum = 0.0;
        for (const auto* r : kv.second) {
            p.value = std::max(p.value, r->weight);
            sum += r->weight;
        }
        p.average = sum / static_cast<double>(kv.second.size());
        out.push_back(p);
    }
    return out;
}

std::vector<ProgressPoint> volume_progress(const std::vector<HistoryRow>& rows) {
    std::vector<ProgressPoint> out;
    for (const auto& kv : group_by_date(rows)) {
        ProgressPoint p;
        p.date = kv.first;
        for (const auto* r : kv.second) p.value += r->weight * r->reps;
        out.push_back(p);
    }
    return out;
}

std::array<int, 7> weekday_frequency(const std::vector<std::string>& workout_dates) {
    std::array<int, 7> buckets{};
    for (const auto& d : distinct_dates(workout_dates))
        ++buckets[weekday_monday_first(d)];
    return buckets;
}

std::vector<CategoryCount> category_breakdown(const std::vector<HistoryRow>& rows) {
    std::map<std::string, int> counts;
    for (const auto& r : rows) ++counts[r.category];

    std::vector<CategoryCount> out;
    for (const auto& kv : counts) out.push_back(CategoryCount{ kv.first, kv.second });
    std::stable_sort(out.begin(), out.end(),
        [](const CategoryCount& a, const CategoryCount& b) { return a.sets > b.sets; });
    return out;
}

WorkoutSummary workout_summary(const std::vector<HistoryRow>& rows, const Date& today) {
    WorkoutSummary s;
    std::set<std::int64_t> days, month_days;
    double weight_sum = 0.0;
    int weighted = 0;

    for (const auto& r : rows) {
        ++s.total_sets;
        s.total_volume += r.weight * r.reps;
        if (r.weight > 0.0) { weight_sum += r.weight; ++weighted; }

        Date d;
        if (!row_date(r.date, d)) continue;
        days.insert(to_day_number(d));
        if (d.y == today.y && d.m == today.m) month_days.insert(to_day_number(d));
    }

    s.total_workouts = static_cast<int>(days.size());
    s.this_month_workouts = static_cast<int>(month_days.size());
    if (s.total_workouts > 0)
        s.avg_sets_per_workout = static_cast<double>(s.total_sets) / s.total_workouts;
    if (weighted > 0) s.average_weight = weight_sum / weighted;
    return s;
}

ExerciseSummary exercise_summary(const std::vector<HistoryRow>& rows) {
    ExerciseSummary s;
    std::vector<Lift> lifts;
    lifts.reserve(rows.size());
    for (const auto& r : rows) {
        lifts.push_back(Lift{ r.weight, r.reps });
        s.max_weight = std::max(s.max_weight, r.weight);
        s.max_one_rm = std::max(s.max_one_rm, r.one_rm);
    }
    s.total_sets = static_cast<int>(rows.size());
    s.average_weight = average_weight(lifts);
    s.total_volume = total_volume(lifts);
    if (s.total_sets > 0) s.average_volume = s.total_volume / s.total_sets;
    return s;
}

std::optional<std::string> period_start(const Date& today, int period_days) {
    if (period_days <= 0) return std::nullopt;
    return format_date(add_days(today, -period_days));
}

StatsReport build_stats_report(const std::vector<HistoryRow>& rows,
    const std::vector<std::string>& workout_dates,
    const Date& today, int period_days) {
    StatsReport rep;
    rep.period_days = period_days;
    rep.summary = workout_summary(rows, today);
    rep.best = best_records(rows);
    rep.current_streak = current_streak(workout_dates, today);
    rep.max_streak = max_streak(workout_dates);
    rep.weekdays = weekday_frequency(workout_dates);
    rep.categories = category_breakdown(rows);
    return rep;
}
