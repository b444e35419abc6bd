/*
-------------------------------------------------------------------------------
 db_goals.cpp - Goal tables (lift goals and body-composition goals)
-------------------------------------------------------------------------------
Lift goals of both kinds share the `goals` table:
  kind='weight' : target_weight, current_max_weight (= current weight),
                  target_reps = target_sets = 1
  kind='sets'   : all columns used

Refresh paths read the set log, hand the rows to the rules in goals.cpp and
write back only what improved. The bulk paths run in one Transaction.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "db_internal.hpp"
#include "goals.hpp"
#include <iostream>

static const char* kGoalColumns =
    "g.id,g.exercise_id,g.kind,g.target_weight,g.target_reps,g.target_sets,"
    "g.current_achieved_sets,g.current_max_weight,g.target_month,g.achieved,"
    "g.notes,g.created_at,g.updated_at";

// Build the domain goal from one row selected with kGoalColumns.
static AnyGoal read_goal(sqlite3_stmt* st) {
    std::string kind = column_text(st, 2);
    if (kind == "weight") {
        WeightGoal w;
        w.id = sqlite3_column_int64(st, 0);
        w.exercise_id = sqlite3_column_int64(st, 1);
        w.target_weight = sqlite3_column_double(st, 3);
        w.current_weight = sqlite3_column_double(st, 7);
        w.target_month = column_text(st, 8);
        w.achieved = sqlite3_column_int(st, 9) != 0;
        return w;
    }
    SetGoal s;
    s.id = sqlite3_column_int64(st, 0);
    s.exercise_id = sqlite3_column_int64(st, 1);
    s.target_weight = sqlite3_column_double(st, 3);
    s.target_reps = sqlite3_column_int(st, 4);
    s.target_sets = sqlite3_column_int(st, 5);
    s.current_achieved_sets = sqlite3_column_int(st, 6);
    s.current_max_weight = sqlite3_column_double(st, 7);
    s.target_month = column_text(st, 8);
    s.achieved = sqlite3_column_int(st, 9) != 0;
    s.notes = column_text(st, 10);
    s.created_at = column_text(st, 11);
    s.updated_at = column_text(st, 12);
    return s;
}

// Column values shared by INSERT and UPDATE, in this order:
// exercise_id, kind, target_weight, target_reps, target_sets,
// current_achieved_sets, current_max_weight, target_month, achieved, notes
static void bind_goal_values(sqlite3_stmt* st, const AnyGoal& g) {
    if (const auto* w = std::get_if<WeightGoal>(&g)) {
        bool reached = w->achieved || (w->target_weight > 0.0 && w->current_weight >= w->target_weight);
        sqlite3_bind_int64(st, 1, w->exercise_id);
        sqlite3_bind_text(st, 2, "weight", -1, SQLITE_STATIC);
        sqlite3_bind_double(st, 3, w->target_weight);
        sqlite3_bind_int(st, 4, 1);
        sqlite3_bind_int(st, 5, 1);
        sqlite3_bind_int(st, 6, reached ? 1 : 0);
        sqlite3_bind_double(st, 7, w->current_weight);
        bind_text(st, 8, w->target_month);
        sqlite3_bind_int(st, 9, w->achieved ? 1 : 0);
        sqlite3_bind_null(st, 10);
        return;
    }
    const SetGoal& s = std::get<SetGoal>(g);
    sqlite3_bind_int64(st, 1, s.exercise_id);
    sqlite3_bind_text(st, 2, "sets", -1, SQLITE_STATIC);
    sqlite3_bind_double(st, 3, s.target_weight);
    sqlite3_bind_int(st, 4, s.target_reps);
    sqlite3_bind_int(st, 5, s.target_sets);
    sqlite3_bind_int(st, 6, s.current_achieved_sets);
    sqlite3_bind_double(st, 7, s.current_max_weight);
    bind_text(st, 8, s.target_month);
    sqlite3_bind_int(st, 9, s.achieved ? 1 : 0);
    if (s.notes.empty()) sqlite3_bind_null(st, 10);
    else bind_text(st, 10, s.notes);
}

/* =========================
   Lift goals: CRUD
   ========================= */

std::int64_t db_add_goal(sqlite3* db, const AnyGoal& g) {
    Statement st(db,
        "INSERT INTO goals(exercise_id,kind,target_weight,target_reps,target_sets,"
        " current_achieved_sets,current_max_weight,target_month,achieved,notes)"
        " VALUES(?,?,?,?,?,?,?,?,?,?);");
    if (!st.ok()) return 0;
    bind_goal_values(st.get(), g);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        log_sql_error(db, "Failed to add goal");
        return 0;
    }
    return sqlite3_last_insert_rowid(db);
}

bool db_update_goal(sqlite3* db, const AnyGoal& g) {
    Statement st(db,
        "UPDATE goals SET exercise_id=?, kind=?, target_weight=?, target_reps=?, target_sets=?,"
        " current_achieved_sets=?, current_max_weight=?, target_month=?, achieved=?, notes=?,"
        " updated_at=CURRENT_TIMESTAMP"
        " WHERE id=?;");
    if (!st.ok()) return false;
    bind_goal_values(st.get(), g);
    sqlite3_bind_int64(st.get(), 11, goal_id(g));
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to update goal"); return false; }
    return sqlite3_changes(db) > 0;
}

bool db_delete_goal(sqlite3* db, std::int64_t id) {
    Statement st(db, "DELETE FROM goals WHERE id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

bool db_get_goal(sqlite3* db, std::int64_t id, AnyGoal& out) {
    std::string q = std::string("SELECT ") + kGoalColumns + " FROM goals g WHERE g.id=?;";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return false;
    out = read_goal(st.get());
    return true;
}

bool db_list_goals(sqlite3* db, std::vector<GoalRow>& out) {
    out.clear();
    std::string q = std::string("SELECT ") + kGoalColumns + ",e.name,e.variation,e.category"
        " FROM goals g JOIN exercises e ON g.exercise_id = e.id"
        " ORDER BY e.category, e.name, e.variation, g.target_month;";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        GoalRow row{ read_goal(st.get()), "", "" };
        row.exercise_name = column_text(st.get(), 13) + " (" + column_text(st.get(), 14) + ")";
        row.category = column_text(st.get(), 15);
        out.push_back(row);
    }
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to list goals"); return false; }
    return true;
}

bool db_mark_goal_achieved(sqlite3* db, std::int64_t id) {
    AnyGoal g;
    if (!db_get_goal(db, id, g)) return false;
    mark_achieved(g);
    return db_update_goal(db, g);
}

/* =========================
   Lift goals: refresh
   ========================= */

// Recompute `g` in memory from the set log. Goals already in a terminal
// state are left untouched.
static bool recompute_goal(sqlite3* db, AnyGoal& g, bool& changed) {
    changed = false;
    if (goal_is_achieved(g)) return true;

    if (auto* w = std::get_if<WeightGoal>(&g)) {
        std::optional<double> best;
        if (!db_max_one_rm(db, w->exercise_id, best)) return false;
        changed = apply_best_one_rm(*w, best);
        return true;
    }

    SetGoal& s = std::get<SetGoal>(g);
    HistoryFilter f;
    f.exercise_id = s.exercise_id;
    std::vector<HistoryRow> rows;
    if (!db_load_history(db, f, rows)) return false;
    changed = apply_evaluation(s, evaluate_set_goal(s, rows));
    return true;
}

bool db_refresh_goal(sqlite3* db, std::int64_t id, bool& changed) {
    changed = false;
    AnyGoal g;
    if (!db_get_goal(db, id, g)) return false;
    bool improved = false;
    if (!recompute_goal(db, g, improved)) return false;
    if (improved && !db_update_goal(db, g)) return false;
    changed = improved;
    return true;
}

bool db_refresh_all_goals(sqlite3* db, int& updated) {
    updated = 0;
    std::vector<GoalRow> rows;
    if (!db_list_goals(db, rows)) return false;

    Transaction tx(db);
    if (!tx.ok()) return false;

    int count = 0;
    for (auto& row : rows) {
        bool improved = false;
        if (!recompute_goal(db, row.goal, improved)) return false;
        if (!improved) continue;
        if (!db_update_goal(db, row.goal)) return false;
        ++count;
    }
    if (!tx.commit()) return false;
    updated = count;
    return true;
}

bool db_edit_goal(sqlite3* db, const AnyGoal& g) {
    Transaction tx(db);
    if (!tx.ok()) return false;

    AnyGoal stored;
    if (!db_get_goal(db, goal_id(g), stored)) return false;

    AnyGoal upd = g;
    if (goal_targets_changed(stored, upd)) {
        reset_progress(upd);
        bool improved = false;
        if (!recompute_goal(db, upd, improved)) return false;
    }
    if (!db_update_goal(db, upd)) return false;
    return tx.commit();
}

bool db_achievable_weight_goals(sqlite3* db, std::vector<GoalRow>& out) {
    out.clear();
    std::vector<GoalRow> rows;
    if (!db_list_goals(db, rows)) return false;
    for (const auto& row : rows) {
        const auto* w = std::get_if<WeightGoal>(&row.goal);
        if (w && w->achievable()) out.push_back(row);
    }
    return true;
}

bool db_almost_there_goals(sqlite3* db, int threshold, std::vector<GoalRow>& out) {
    out.clear();
    std::vector<GoalRow> rows;
    if (!db_list_goals(db, rows)) return false;
    for (const auto& row : rows) {
        const auto* s = std::get_if<SetGoal>(&row.goal);
        if (s && is_almost_there(*s, threshold)) out.push_back(row);
    }
    return true;
}

/* =========================
   Body composition goals
   ========================= */

static const char* kBodyGoalColumns =
    "id,goal_name,target_weight,target_muscle_mass,target_body_fat,target_bmi,target_date,"
    "current_weight,current_muscle_mass,current_body_fat,current_bmi,"
    "initial_weight,initial_muscle_mass,initial_body_fat,initial_bmi,"
    "achieved,notes,created_at,updated_at";

static BodyCompositionGoal read_body_goal(sqlite3_stmt* st) {
    BodyCompositionGoal g;
    g.id = sqlite3_column_int64(st, 0);
    g.goal_name = column_text(st, 1);
    g.target_weight = column_opt_double(st, 2);
    g.target_muscle_mass = column_opt_double(st, 3);
    g.target_body_fat = column_opt_double(st, 4);
    g.target_bmi = column_opt_double(st, 5);
    g.target_date = column_text(st, 6);
    g.current_weight = column_opt_double(st, 7);
    g.current_muscle_mass = column_opt_double(st, 8);
    g.current_body_fat = column_opt_double(st, 9);
    g.current_bmi = column_opt_double(st, 10);
    g.initial_weight = column_opt_double(st, 11);
    g.initial_muscle_mass = column_opt_double(st, 12);
    g.initial_body_fat = column_opt_double(st, 13);
    g.initial_bmi = column_opt_double(st, 14);
    g.achieved = sqlite3_column_int(st, 15) != 0;
    g.notes = column_text(st, 16);
    g.created_at = column_text(st, 17);
    g.updated_at = column_text(st, 18);
    return g;
}

// Binds parameters 1..17 (every column except id and timestamps).
static void bind_body_goal_values(sqlite3_stmt* st, const BodyCompositionGoal& g) {
    bind_text(st, 1, g.goal_name);
    bind_opt_double(st, 2, g.target_weight);
    bind_opt_double(st, 3, g.target_muscle_mass);
    bind_opt_double(st, 4, g.target_body_fat);
    bind_opt_double(st, 5, g.target_bmi);
    bind_text(st, 6, g.target_date);
    bind_opt_double(st, 7, g.current_weight);
    bind_opt_double(st, 8, g.current_muscle_mass);
    bind_opt_double(st, 9, g.current_body_fat);
    bind_opt_double(st, 10, g.current_bmi);
    bind_opt_double(st, 11, g.initial_weight);
    bind_opt_double(st, 12, g.initial_muscle_mass);
    bind_opt_double(st, 13, g.initial_body_fat);
    bind_opt_double(st, 14, g.initial_bmi);
    sqlite3_bind_int(st, 15, g.achieved ? 1 : 0);
    if (g.notes.empty()) sqlite3_bind_null(st, 16);
    else bind_text(st, 16, g.notes);
}

static void fill_missing(std::optional<double>& slot, const std::optional<double>& value) {
    if (!slot && value) slot = value;
}

std::int64_t db_add_body_goal(sqlite3* db, const BodyCompositionGoal& g,
    std::optional<double> height_cm) {
    BodyCompositionGoal row = g;

    BodyStats latest;
    bool found = false;
    if (!db_latest_body_stats(db, latest, found)) return 0;
    if (found) {
        apply_body_stats(row, latest, height_cm);
        fill_missing(row.initial_weight, row.current_weight);
        fill_missing(row.initial_muscle_mass, row.current_muscle_mass);
        fill_missing(row.initial_body_fat, row.current_body_fat);
        fill_missing(row.initial_bmi, row.current_bmi);
    }

    Statement st(db,
        "INSERT INTO body_composition_goals(goal_name,target_weight,target_muscle_mass,"
        " target_body_fat,target_bmi,target_date,current_weight,current_muscle_mass,"
        " current_body_fat,current_bmi,initial_weight,initial_muscle_mass,initial_body_fat,"
        " initial_bmi,achieved,notes)"
        " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!st.ok()) return 0;
    bind_body_goal_values(st.get(), row);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        log_sql_error(db, "Failed to add body composition goal");
        return 0;
    }
    return sqlite3_last_insert_rowid(db);
}

bool db_update_body_goal(sqlite3* db, const BodyCompositionGoal& g) {
    Statement st(db,
        "UPDATE body_composition_goals SET goal_name=?, target_weight=?, target_muscle_mass=?,"
        " target_body_fat=?, target_bmi=?, target_date=?, current_weight=?, current_muscle_mass=?,"
        " current_body_fat=?, current_bmi=?, initial_weight=?, initial_muscle_mass=?,"
        " initial_body_fat=?, initial_bmi=?, achieved=?, notes=?, updated_at=CURRENT_TIMESTAMP"
        " WHERE id=?;");
    if (!st.ok()) return false;
    bind_body_goal_values(st.get(), g);
    sqlite3_bind_int64(st.get(), 17, g.id);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to update body composition goal"); return false; }
    return sqlite3_changes(db) > 0;
}

bool db_delete_body_goal(sqlite3* db, std::int64_t id) {
    Statement st(db, "DELETE FROM body_composition_goals WHERE id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

bool db_get_body_goal(sqlite3* db, std::int64_t id, BodyCompositionGoal& out) {
    std::string q = std::string("SELECT ") + kBodyGoalColumns + " FROM body_composition_goals WHERE id=?;";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return false;
    out = read_body_goal(st.get());
    return true;
}

static bool list_body_goals(sqlite3* db, const char* where, std::vector<BodyCompositionGoal>& out) {
    out.clear();
    std::string q = std::string("SELECT ") + kBodyGoalColumns + " FROM body_composition_goals"
        + where + " ORDER BY target_date, id;";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(read_body_goal(st.get()));
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to list body composition goals"); return false; }
    return true;
}

bool db_list_body_goals(sqlite3* db, std::vector<BodyCompositionGoal>& out) {
    return list_body_goals(db, "", out);
}

bool db_list_active_body_goals(sqlite3* db, std::vector<BodyCompositionGoal>& out) {
    return list_body_goals(db, " WHERE achieved = 0", out);
}

bool db_mark_body_goal_achieved(sqlite3* db, std::int64_t id) {
    Statement st(db, "UPDATE body_composition_goals SET achieved=1, updated_at=CURRENT_TIMESTAMP WHERE id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

bool db_refresh_body_goals(sqlite3* db, std::optional<double> height_cm, int& updated) {
    updated = 0;
    BodyStats latest;
    bool found = false;
    if (!db_latest_body_stats(db, latest, found)) return false;
    if (!found) return true;   // nothing measured yet

    std::vector<BodyCompositionGoal> goals;
    if (!db_list_active_body_goals(db, goals)) return false;

    Transaction tx(db);
    if (!tx.ok()) return false;

    int count = 0;
    for (auto& g : goals) {
        if (!apply_body_stats(g, latest, height_cm)) continue;
        if (!db_update_body_goal(db, g)) return false;
        ++count;
    }
    if (!tx.commit()) return false;
    updated = count;
    return true;
}
