#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "models.hpp"
#include "services.hpp"   // for DataStore (cached exercises and goals)

/*
-------------------------------------------------------------------------------
 db.hpp - Public interface to SQLite persistence layer
-------------------------------------------------------------------------------

This header declares all functions that interact with the SQLite database.
They provide a clean, minimal API so higher-level code (menu, stats, goals)
doesn't need to deal with raw sqlite3_* calls.

Design:
  - Each function returns `bool` to indicate success/failure (inserts return
    the new rowid, 0 on failure). Errors are written to std::cerr with the
    sqlite3_errmsg text; nothing is thrown.
  - Multi-statement writes run inside a Transaction guard: if the function
    returns early, the guard rolls back, so no partial state is left.
  - The connection is passed in explicitly. One connection per thread; the
    report worker opens its own.
  - Callers should update the in-memory `DataStore` only when DB ops succeed.

Usage convention:
  - Call `db_open` once at startup, then `db_init_and_seed`.
  - Use `db_load_all` to populate `DataStore` cache after opening.
  - Always call `db_close` before exiting.

Implementation is split across db.cpp (schema, training log, body stats,
backup), db_goals.cpp (both goal tables) and db_history.cpp (history reads).
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr). Call once at shutdown.
void db_close(sqlite3* db);

/// Create tables if missing, seed the default exercises (only if empty) and
/// bring the goals table to the current layout. Safe to call on every startup.
bool db_init_and_seed(sqlite3* db);

/// Convert an older goals table (legacy 5-column layout, or a set-goal table
/// without the `kind` column) to the current layout. No-op when current.
bool db_migrate_goals(sqlite3* db);

/// Load exercises and goals into the in-memory DataStore vectors.
/// Clears the vectors first to avoid duplicates.
bool db_load_all(sqlite3* db, DataStore& store);

// ==========================
// Transactions
// ==========================

/// BEGIN on construction, ROLLBACK on destruction unless commit() succeeded.
/// Transactions do not nest: open one at a time per connection.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool ok() const { return active_; }
    bool commit();

private:
    sqlite3* db_;
    bool active_ = false;
};

// ==========================
// Exercises
// ==========================

bool db_list_exercises(sqlite3* db, std::vector<Exercise>& out);
bool db_list_exercises_by_category(sqlite3* db, const std::string& category, std::vector<Exercise>& out);
bool db_get_exercise(sqlite3* db, std::int64_t id, Exercise& out);

/// Admin insert of a new exercise. Returns the new id or 0.
std::int64_t db_add_exercise(sqlite3* db, const Exercise& e);

// ==========================
// Workouts and sets
// ==========================

/// Returns the new workout id or 0.
std::int64_t db_add_workout(sqlite3* db, const std::string& date, const std::string& notes);

/// `found` is false when no workout exists for the date.
bool db_find_workout_by_date(sqlite3* db, const std::string& date, Workout& out, bool& found);

/// Existing workout id for the date, or a newly created one. 0 on failure.
std::int64_t db_get_or_create_workout(sqlite3* db, const std::string& date);

/// Insert one set; one_rm is computed here from (weight, reps), any value in
/// `s.one_rm` is ignored. Returns the new set id or 0.
std::int64_t db_add_set(sqlite3* db, const SetRecord& s);

/// Log a whole exercise block for a date: get-or-create the workout, then
/// insert the (weight, reps) pairs as sets numbered after any existing sets
/// of that workout. All or nothing. `inserted` receives the count.
bool db_log_sets(sqlite3* db, const std::string& date, std::int64_t exercise_id,
    const std::vector<Lift>& lifts, int& inserted);

bool db_delete_set(sqlite3* db, std::int64_t set_id);

/// Latest sets logged for an exercise (up to 10), newest date first, then
/// by set number. Empty when never performed.
bool db_last_exercise_record(sqlite3* db, std::int64_t exercise_id, std::vector<SetRecord>& out);

/// Best stored one_rm for an exercise; nullopt when it was never performed.
bool db_max_one_rm(sqlite3* db, std::int64_t exercise_id, std::optional<double>& out);

// ==========================
// History (db_history.cpp)
// ==========================

struct HistoryFilter {
    std::optional<std::string> start_date;     // inclusive, YYYY-MM-DD
    std::optional<std::string> end_date;       // inclusive, YYYY-MM-DD
    std::optional<std::int64_t> exercise_id;
};

/// All matching rows, oldest first (date, set_number).
bool db_load_history(sqlite3* db, const HistoryFilter& f, std::vector<HistoryRow>& out);

/// One page of matching rows, newest date first.
bool db_history_page(sqlite3* db, const HistoryFilter& f, int page_size, int offset,
    std::vector<HistoryRow>& out);

/// Number of matching set rows.
bool db_count_history(sqlite3* db, const HistoryFilter& f, int& out);

/// Distinct dates with at least one logged set (newest first). With an
/// exercise filter only dates with a set of that exercise are returned.
bool db_workout_dates(sqlite3* db, const HistoryFilter& f, std::vector<std::string>& out);

// ==========================
// Body stats
// ==========================

std::int64_t db_add_body_stats(sqlite3* db, const BodyStats& b);
bool db_update_body_stats(sqlite3* db, const BodyStats& b);
bool db_delete_body_stats(sqlite3* db, std::int64_t id);

/// Newest first.
bool db_list_body_stats(sqlite3* db, std::vector<BodyStats>& out);

/// `found` is false when there is no snapshot at all.
bool db_latest_body_stats(sqlite3* db, BodyStats& out, bool& found);

/// Earliest snapshot dated on or after `date` (baseline for "change since").
bool db_body_stats_since(sqlite3* db, const std::string& date, BodyStats& out, bool& found);

// ==========================
// Lift goals (db_goals.cpp)
// ==========================

/// Insert either goal kind. Returns the new id or 0 (e.g. duplicate
/// exercise + month + kind).
std::int64_t db_add_goal(sqlite3* db, const AnyGoal& g);
bool db_update_goal(sqlite3* db, const AnyGoal& g);
bool db_delete_goal(sqlite3* db, std::int64_t id);
bool db_get_goal(sqlite3* db, std::int64_t id, AnyGoal& out);

/// All goals joined with their exercise, ordered by category then name.
bool db_list_goals(sqlite3* db, std::vector<GoalRow>& out);

/// Manual override (see mark_achieved in goals.hpp) persisted.
bool db_mark_goal_achieved(sqlite3* db, std::int64_t id);

/// Recompute one goal from the set log; `changed` reports an improvement.
bool db_refresh_goal(sqlite3* db, std::int64_t id, bool& changed);

/// Recompute every unachieved goal in one transaction; `updated` counts
/// goals that improved.
bool db_refresh_all_goals(sqlite3* db, int& updated);

/// User edit of a goal. When the target weight, reps or sets changed, the
/// stored progress is discarded and recounted from the whole set log;
/// otherwise this is db_update_goal. One transaction.
bool db_edit_goal(sqlite3* db, const AnyGoal& g);

/// Weight goals whose current weight already crossed the target but that
/// are not marked achieved yet.
bool db_achievable_weight_goals(sqlite3* db, std::vector<GoalRow>& out);

/// Set goals close to completion (see is_almost_there).
bool db_almost_there_goals(sqlite3* db, int threshold, std::vector<GoalRow>& out);

// ==========================
// Body composition goals (db_goals.cpp)
// ==========================

/// Insert; baselines left empty are taken from the latest body stats.
std::int64_t db_add_body_goal(sqlite3* db, const BodyCompositionGoal& g,
    std::optional<double> height_cm);
bool db_update_body_goal(sqlite3* db, const BodyCompositionGoal& g);
bool db_delete_body_goal(sqlite3* db, std::int64_t id);
bool db_get_body_goal(sqlite3* db, std::int64_t id, BodyCompositionGoal& out);
bool db_list_body_goals(sqlite3* db, std::vector<BodyCompositionGoal>& out);
bool db_list_active_body_goals(sqlite3* db, std::vector<BodyCompositionGoal>& out);
bool db_mark_body_goal_achieved(sqlite3* db, std::int64_t id);

/// Copy the latest body stats into every active goal's current values.
bool db_refresh_body_goals(sqlite3* db, std::optional<double> height_cm, int& updated);

// ==========================
// Backup
// ==========================

/// Copy the database file to <backup_dir>/gym_tracker_backup_YYYYMMDD_HHMMSS.db.
/// A missing database file is not an error. `written` receives the path
/// (empty when nothing was copied).
bool db_backup(const std::string& db_path, const std::string& backup_dir, std::string& written);

// ==========================
// Counts (for dashboards/menus)
// ==========================

/// Simple struct with live counts from DB.
struct DbCounts {
    int workouts = 0;
    int sets = 0;
    int goals = 0;
    int body_stats = 0;
};

/// Populate `out` with counts of workouts, sets, goals, and body stats rows.
/// Returns true on success.
bool db_get_counts(sqlite3* db, DbCounts& out);
