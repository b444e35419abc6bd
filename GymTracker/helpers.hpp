#pragma once
#include <cstdint>
#include <string>
#include "services.hpp"   // brings in DataStore, Exercise, GoalRow, BodyCompositionGoal
#include "db.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp - In-memory cache helpers
-------------------------------------------------------------------------------
These functions operate on the DataStore vectors (exercises, goals, body
composition goals) without touching the SQLite database. They are always
called *after* the DB operation has succeeded to keep the cache consistent
with the DB.

Naming convention:
  - find_*            -> read-only lookup.
  - apply_*            -> update in place (by id).
  - remove_*           -> erase entity.

Return values:
  - find_* return nullptr when absent.
  - For apply_* and remove_* helpers, true if at least one element was updated
    or erased.

Usage reminder:
  - Call DB functions (db_add_*, db_update_*, db_delete_*) first.
  - Only if DB call returns true, call the corresponding helper here.
-------------------------------------------------------------------------------
*/

// ==========================
// Lookups
// ==========================

const Exercise* find_exercise(const DataStore& d, std::int64_t id);

/// Exact (name, variation) match, or nullptr.
const Exercise* find_exercise_by_name(const DataStore& d, const std::string& name, const std::string& variation);

GoalRow* find_goal(DataStore& d, std::int64_t id);

BodyCompositionGoal* find_body_goal(DataStore& d, std::int64_t id);

// ==========================
// Updates
// ==========================

/// Replace the cached goal with the same id. Returns true if updated.
bool apply_goal_update(DataStore& d, const AnyGoal& g);

/// Replace the cached body goal with the same id. Returns true if updated.
bool apply_body_goal_update(DataStore& d, const BodyCompositionGoal& g);

// ==========================
// Removals
// ==========================

bool remove_goal(DataStore& d, std::int64_t id);

bool remove_body_goal(DataStore& d, std::int64_t id);
