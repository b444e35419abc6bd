#include "helpers.hpp"
#include <algorithm>

/*
-------------------------------------------------------------------------------
 helpers.cpp - In-memory helpers for DataStore
-------------------------------------------------------------------------------
These functions operate on the in-memory cache (DataStore) and are used by the
menu to look up, apply edits to, and remove entities without touching SQLite
directly. The DB remains the source of truth; writes happen in the DB first,
then these helpers mirror those changes locally.

All operations here are linear in the size of the corresponding vectors.
-------------------------------------------------------------------------------
*/

const Exercise* find_exercise(const DataStore& d, std::int64_t id) {
    for (const auto& e : d.all_exercises)
        if (e.id == id) return &e;
    return nullptr;
}

const Exercise* find_exercise_by_name(const DataStore& d, const std::string& name, const std::string& variation) {
    for (const auto& e : d.all_exercises)
        if (e.name == name && e.variation == variation) return &e;
    return nullptr;
}

GoalRow* find_goal(DataStore& d, std::int64_t id) {
    for (auto& g : d.all_goals)
        if (goal_id(g.goal) == id) return &g;
    return nullptr;
}

BodyCompositionGoal* find_body_goal(DataStore& d, std::int64_t id) {
    for (auto& g : d.all_body_goals)
        if (g.id == id) return &g;
    return nullptr;
}

// Keeps the cached exercise name and category; only the goal itself changes.
bool apply_goal_update(DataStore& d, const AnyGoal& g) {
    GoalRow* row = find_goal(d, goal_id(g));
    if (!row) return false;
    row->goal = g;
    return true;
}

bool apply_body_goal_update(DataStore& d, const BodyCompositionGoal& g) {
    for (auto& it : d.all_body_goals)
        if (it.id == g.id) { it = g; return true; }
    return false;
}

bool remove_goal(DataStore& d, std::int64_t id) {
    auto g0 = d.all_goals.size();
    d.all_goals.erase(std::remove_if(d.all_goals.begin(), d.all_goals.end(),
        [&](const GoalRow& g) { return goal_id(g.goal) == id; }),
        d.all_goals.end());
    return d.all_goals.size() != g0;
}

bool remove_body_goal(DataStore& d, std::int64_t id) {
    auto g0 = d.all_body_goals.size();
    d.all_body_goals.erase(std::remove_if(d.all_body_goals.begin(), d.all_body_goals.end(),
        [&](const BodyCompositionGoal& g) { return g.id == id; }),
        d.all_body_goals.end());
    return d.all_body_goals.size() != g0;
}
