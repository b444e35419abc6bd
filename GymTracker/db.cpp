/*
-------------------------------------------------------------------------------
 db.cpp - SQLite persistence layer for GymTracker
-------------------------------------------------------------------------------
Purpose
  - Implements schema creation, seeding, goal-table migration and the raw
    CRUD for exercises, workouts, sets and body stats.
  - Goal tables live in db_goals.cpp, history reads in db_history.cpp.

Design notes
  - Each function returns a bool (or a rowid, 0 on failure). Callers print
    messages and keep the in-memory DataStore in sync only when DB writes
    succeed.
  - Foreign key cascades are enabled per-connection (PRAGMA foreign_keys=ON).
  - Write ops use prepared statements with bound parameters to avoid SQL
    injection and handle quoting safely.
  - A set's one_rm is computed in db_add_set and nowhere else, so stored
    history does not move if the formula ever changes.
  - Multi-step writes (seeding, migration, logging a block of sets) run in a
    Transaction; returning early rolls the whole block back.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "db_internal.hpp"
#include <ctime>
#include <filesystem>
#include <iostream>
#include <set>

// Small helper to run a raw SQL string with sqlite3_exec and report errors.
bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) { std::cerr << "SQL error: " << err << "\n"; sqlite3_free(err); }
        return false;
    }
    return true;
}

void log_sql_error(sqlite3* db, const char* what) {
    std::cerr << what << ": " << (db ? sqlite3_errmsg(db) : "no connection") << "\n";
}

Statement::Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
        log_sql_error(db, "SQL prepare failed");
        sqlite3_finalize(st_);
        st_ = nullptr;
    }
}

Statement::~Statement() {
    if (st_) sqlite3_finalize(st_);
}

std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

std::optional<double> column_opt_double(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(st, col);
}

void bind_opt_double(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) sqlite3_bind_double(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void bind_text(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Open (or create) the SQLite database file at `path` and enable FK constraints
// for this connection. Returns false if the DB cannot be opened.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::cerr << "Failed to open DB: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    // Enforce FK constraints for this connection
    if (!exec_sql(db, "PRAGMA foreign_keys = ON;")) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null. Safe to call multiple times.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

/* =========================
   Transactions
   ========================= */

Transaction::Transaction(sqlite3* db) : db_(db) {
    active_ = exec_sql(db_, "BEGIN;");
}

Transaction::~Transaction() {
    if (active_ && !exec_sql(db_, "ROLLBACK;"))
        std::cerr << "Rollback failed; connection may hold an open transaction\n";
}

bool Transaction::commit() {
    if (!active_) return false;
    if (!exec_sql(db_, "COMMIT;")) return false;   // destructor rolls back
    active_ = false;
    return true;
}

/* =========================
   Schema
   ========================= */

static const char* kCanonicalGoalsDdl =
    "CREATE TABLE IF NOT EXISTS goals ("
    "  id                    INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  exercise_id           INTEGER NOT NULL,"
    "  kind                  TEXT NOT NULL DEFAULT 'sets',"
    "  target_weight         REAL NOT NULL,"
    "  target_reps           INTEGER NOT NULL DEFAULT 1,"
    "  target_sets           INTEGER NOT NULL DEFAULT 1,"
    "  current_achieved_sets INTEGER NOT NULL DEFAULT 0,"
    "  current_max_weight    REAL NOT NULL DEFAULT 0,"
    "  target_month          TEXT NOT NULL,"
    "  achieved              INTEGER NOT NULL DEFAULT 0,"
    "  notes                 TEXT,"
    "  created_at            TEXT DEFAULT CURRENT_TIMESTAMP,"
    "  updated_at            TEXT DEFAULT CURRENT_TIMESTAMP,"
    "  UNIQUE (exercise_id, target_month, kind),"
    "  FOREIGN KEY (exercise_id) REFERENCES exercises(id)"
    ");";

// Column names of `table`, empty if the table does not exist.
static bool table_columns(sqlite3* db, const std::string& table, std::set<std::string>& out) {
    out.clear();
    std::string q = "PRAGMA table_info(" + table + ");";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW)
        out.insert(column_text(st.get(), 1));
    return rc == SQLITE_DONE;
}

// Insert the default exercise list when the table is empty.
static bool seed_exercises(sqlite3* db) {
    Statement count(db, "SELECT COUNT(*) FROM exercises;");
    if (!count.ok() || sqlite3_step(count.get()) != SQLITE_ROW) return false;
    if (sqlite3_column_int(count.get(), 0) > 0) return true;

    struct Seed { const char* name; const char* variation; const char* category; };
    static const Seed kSeeds[] = {
        { "Bench Press", "Barbell", "Chest" },
        { "Bench Press", "Dumbbell", "Chest" },
        { "Bench Press", "Machine", "Chest" },
        { "Chest Press", "Machine", "Chest" },
        { "Dumbbell Fly", "Dumbbell", "Chest" },
        { "Pec Fly", "Machine", "Chest" },
        { "Cable Fly", "Cable", "Chest" },
        { "Push-up", "Bodyweight", "Chest" },
        { "Deadlift", "Barbell", "Back" },
        { "Bent-over Row", "Barbell", "Back" },
        { "Lat Pulldown", "Machine", "Back" },
        { "Seated Row", "Machine", "Back" },
        { "Pull-up", "Bodyweight", "Back" },
        { "Chin-up", "Bodyweight", "Back" },
        { "Squat", "Barbell", "Legs" },
        { "Squat", "Bodyweight", "Legs" },
        { "Leg Press", "Machine", "Legs" },
        { "Leg Curl", "Machine", "Legs" },
        { "Leg Extension", "Machine", "Legs" },
        { "Shoulder Press", "Barbell", "Shoulders" },
        { "Shoulder Press", "Dumbbell", "Shoulders" },
        { "Shoulder Press", "Machine", "Shoulders" },
        { "Lateral Raise", "Dumbbell", "Shoulders" },
        { "Incline Lateral Raise", "Dumbbell", "Shoulders" },
        { "Rear Delt", "Machine", "Shoulders" },
        { "Face Pull", "Cable", "Shoulders" },
        { "Barbell Curl", "Barbell", "Arms" },
        { "Dumbbell Curl", "Dumbbell", "Arms" },
        { "Incline Curl", "Dumbbell", "Arms" },
        { "Incline Hammer Curl", "Dumbbell", "Arms" },
        { "Cable Curl", "Cable", "Arms" },
        { "Triceps Extension", "Dumbbell", "Arms" },
        { "French Press", "Dumbbell", "Arms" },
        { "Pushdown", "Cable", "Arms" },
        { "Dips", "Bodyweight", "Arms" },
    };

    Statement ins(db, "INSERT INTO exercises(name,variation,category) VALUES(?,?,?);");
    if (!ins.ok()) return false;
    for (const auto& s : kSeeds) {
        sqlite3_reset(ins.get());
        sqlite3_bind_text(ins.get(), 1, s.name, -1, SQLITE_STATIC);
        sqlite3_bind_text(ins.get(), 2, s.variation, -1, SQLITE_STATIC);
        sqlite3_bind_text(ins.get(), 3, s.category, -1, SQLITE_STATIC);
        if (sqlite3_step(ins.get()) != SQLITE_DONE) {
            log_sql_error(db, "Failed to seed exercises");
            return false;
        }
    }
    return true;
}

// Create tables if they don't exist yet and seed the exercise list the first
// time the app runs. Safe to call on every startup.
bool db_init_and_seed(sqlite3* db) {
    // 1) Create tables (idempotent). Deleting a workout deletes its sets.
    const char* ddl =
        "CREATE TABLE IF NOT EXISTS exercises ("
        "  id        INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  name      TEXT NOT NULL,"
        "  variation TEXT NOT NULL,"
        "  category  TEXT NOT NULL"
        ");"

        "CREATE TABLE IF NOT EXISTS workouts ("
        "  id    INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  date  TEXT NOT NULL,"
        "  notes TEXT"
        ");"

        "CREATE TABLE IF NOT EXISTS sets ("
        "  id          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  workout_id  INTEGER NOT NULL,"
        "  exercise_id INTEGER NOT NULL,"
        "  set_number  INTEGER NOT NULL,"
        "  weight      REAL NOT NULL,"
        "  reps        INTEGER NOT NULL,"
        "  one_rm      REAL NOT NULL,"
        "  FOREIGN KEY (workout_id) REFERENCES workouts(id) ON DELETE CASCADE,"
        "  FOREIGN KEY (exercise_id) REFERENCES exercises(id)"
        ");"

        "CREATE TABLE IF NOT EXISTS body_stats ("
        "  id                  INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  date                TEXT NOT NULL,"
        "  weight              REAL,"
        "  body_fat_percentage REAL,"
        "  muscle_mass         REAL"
        ");"

        "CREATE TABLE IF NOT EXISTS body_composition_goals ("
        "  id                  INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  goal_name           TEXT NOT NULL,"
        "  target_weight       REAL,"
        "  target_muscle_mass  REAL,"
        "  target_body_fat     REAL,"
        "  target_bmi          REAL,"
        "  target_date         TEXT NOT NULL,"
        "  current_weight      REAL,"
        "  current_muscle_mass REAL,"
        "  current_body_fat    REAL,"
        "  current_bmi         REAL,"
        "  initial_weight      REAL,"
        "  initial_muscle_mass REAL,"
        "  initial_body_fat    REAL,"
        "  initial_bmi         REAL,"
        "  achieved            INTEGER NOT NULL DEFAULT 0,"
        "  notes               TEXT,"
        "  created_at          TEXT DEFAULT CURRENT_TIMESTAMP,"
        "  updated_at          TEXT DEFAULT CURRENT_TIMESTAMP"
        ");"

        "CREATE INDEX IF NOT EXISTS idx_sets_workout_id ON sets(workout_id);"
        "CREATE INDEX IF NOT EXISTS idx_sets_exercise_id ON sets(exercise_id);"
        "CREATE INDEX IF NOT EXISTS idx_workouts_date ON workouts(date);"
        "CREATE INDEX IF NOT EXISTS idx_body_stats_date ON body_stats(date);";

    {
        Transaction tx(db);
        if (!tx.ok()) return false;
        if (!exec_sql(db, ddl)) return false;
        // 2) Seed only when the exercise table is empty.
        if (!seed_exercises(db)) return false;
        if (!tx.commit()) return false;
    }

    // 3) Goals: create or convert to the current layout.
    return db_migrate_goals(db);
}

// Bring the goals table to the layout in kCanonicalGoalsDdl.
//  - no table:          create it
//  - legacy 5 columns:  copy rows over as kind='weight' goals
//  - sets table w/o kind: add the column (existing rows are set goals)
bool db_migrate_goals(sqlite3* db) {
    std::set<std::string> cols;
    if (!table_columns(db, "goals", cols)) return false;

    if (cols.empty()) return exec_sql(db, kCanonicalGoalsDdl);
    if (cols.count("kind")) return true;

    Transaction tx(db);
    if (!tx.ok()) return false;

    if (cols.count("target_reps")) {
        if (!exec_sql(db, "ALTER TABLE goals ADD COLUMN kind TEXT NOT NULL DEFAULT 'sets';"))
            return false;
        std::cerr << "Goals table: added kind column to set goals\n";
        return tx.commit();
    }

    // Legacy threshold goals: current_weight becomes current_max_weight, and
    // a goal counts as one target set that is done once the weight was hit.
    // The old table had no uniqueness and no enforced foreign key. Per
    // (exercise, month) the newest row is kept; rows that cannot be carried
    // over are logged and moved to goals_legacy_skipped.
    if (!exec_sql(db, "ALTER TABLE goals RENAME TO goals_legacy;")) return false;
    if (!exec_sql(db, kCanonicalGoalsDdl)) return false;

    // 1 for a row that is carried over, 0 otherwise (never NULL).
    const std::string kept =
        "COALESCE(l.exercise_id IN (SELECT id FROM exercises)"
        " AND l.rowid = (SELECT MAX(l2.rowid) FROM goals_legacy l2"
        "                WHERE l2.exercise_id = l.exercise_id"
        "                  AND COALESCE(l2.target_month,'') = COALESCE(l.target_month,'')), 0)";

    int skipped = 0;
    {
        std::string q =
            "SELECT l.rowid, l.exercise_id, l.target_weight, l.target_month,"
            " CASE WHEN l.exercise_id IN (SELECT id FROM exercises) THEN 'newer goal for the same month'"
            "      ELSE 'unknown exercise' END"
            " FROM goals_legacy l WHERE NOT (" + kept + ") ORDER BY l.rowid;";
        Statement st(db, q.c_str());
        if (!st.ok()) return false;
        int rc;
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            std::cerr << "Goals table: legacy goal " << sqlite3_column_int64(st.get(), 0)
                << " (exercise " << column_text(st.get(), 1)
                << ", " << column_text(st.get(), 2) << "kg"
                << ", month " << column_text(st.get(), 3)
                << ") not migrated: " << column_text(st.get(), 4) << "\n";
            ++skipped;
        }
        if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to inspect legacy goals"); return false; }
    }

    std::string copy =
        "INSERT INTO goals(id,exercise_id,kind,target_weight,target_reps,target_sets,"
        "  current_achieved_sets,current_max_weight,target_month,achieved)"
        " SELECT l.rowid,l.exercise_id,'weight',COALESCE(l.target_weight,0),1,1,"
        "  CASE WHEN COALESCE(l.achieved,0) <> 0 OR COALESCE(l.current_weight,0) >= COALESCE(l.target_weight,0)"
        "       THEN 1 ELSE 0 END,"
        "  COALESCE(l.current_weight,0),COALESCE(l.target_month,''),COALESCE(l.achieved,0)"
        " FROM goals_legacy l WHERE " + kept + ";";
    if (!exec_sql(db, copy.c_str())) return false;
    int copied = sqlite3_changes(db);

    if (skipped > 0) {
        std::string keep_rest =
            "CREATE TABLE IF NOT EXISTS goals_legacy_skipped AS SELECT * FROM goals_legacy WHERE 0;"
            "INSERT INTO goals_legacy_skipped SELECT * FROM goals_legacy l WHERE NOT (" + kept + ");";
        if (!exec_sql(db, keep_rest.c_str())) return false;
    }
    if (!exec_sql(db, "DROP TABLE goals_legacy;")) return false;
    if (!tx.commit()) return false;

    std::cerr << "Goals table: migrated " << copied << " legacy goal(s)";
    if (skipped > 0) std::cerr << ", " << skipped << " kept in goals_legacy_skipped";
    std::cerr << "\n";
    return true;
}

// Load exercises and goals into the in-memory DataStore (used by the menu).
// Clears the vectors first to avoid duplicates.
bool db_load_all(sqlite3* db, DataStore& store) {
    store.all_exercises.clear();
    store.all_goals.clear();
    store.all_body_goals.clear();

    if (!db_list_exercises(db, store.all_exercises)) return false;
    if (!db_list_goals(db, store.all_goals)) return false;
    return db_list_body_goals(db, store.all_body_goals);
}

/* =========================
   Exercises
   ========================= */

static Exercise read_exercise(sqlite3_stmt* st) {
    Exercise e;
    e.id = sqlite3_column_int64(st, 0);
    e.name = column_text(st, 1);
    e.variation = column_text(st, 2);
    e.category = column_text(st, 3);
    return e;
}

bool db_list_exercises(sqlite3* db, std::vector<Exercise>& out) {
    out.clear();
    Statement st(db, "SELECT id,name,variation,category FROM exercises"
                     " ORDER BY category, name, variation;");
    if (!st.ok()) return false;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(read_exercise(st.get()));
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to list exercises"); return false; }
    return true;
}

bool db_list_exercises_by_category(sqlite3* db, const std::string& category, std::vector<Exercise>& out) {
    out.clear();
    Statement st(db, "SELECT id,name,variation,category FROM exercises"
                     " WHERE category=? ORDER BY name, variation;");
    if (!st.ok()) return false;
    bind_text(st.get(), 1, category);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(read_exercise(st.get()));
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to list exercises by category"); return false; }
    return true;
}

bool db_get_exercise(sqlite3* db, std::int64_t id, Exercise& out) {
    Statement st(db, "SELECT id,name,variation,category FROM exercises WHERE id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return false;
    out = read_exercise(st.get());
    return true;
}

// INSERT exercise row.
std::int64_t db_add_exercise(sqlite3* db, const Exercise& e) {
    Statement st(db, "INSERT INTO exercises(name,variation,category) VALUES(?,?,?);");
    if (!st.ok()) return 0;
    bind_text(st.get(), 1, e.name);
    bind_text(st.get(), 2, e.variation);
    bind_text(st.get(), 3, e.category);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        log_sql_error(db, "Failed to add exercise");
        return 0;
    }
    return sqlite3_last_insert_rowid(db);
}

/* =========================
   Workouts and sets
   ========================= */

// INSERT workout row.
std::int64_t db_add_workout(sqlite3* db, const std::string& date, const std::string& notes) {
    Statement st(db, "INSERT INTO workouts(date,notes) VALUES(?,?);");
    if (!st.ok()) return 0;
    bind_text(st.get(), 1, date);
    if (notes.empty()) sqlite3_bind_null(st.get(), 2);
    else bind_text(st.get(), 2, notes);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        log_sql_error(db, "Failed to add workout");
        return 0;
    }
    return sqlite3_last_insert_rowid(db);
}

// First workout on the date (one per date is the norm, not a constraint).
bool db_find_workout_by_date(sqlite3* db, const std::string& date, Workout& out, bool& found) {
    found = false;
    Statement st(db, "SELECT id,date,notes FROM workouts WHERE date=? ORDER BY id LIMIT 1;");
    if (!st.ok()) return false;
    bind_text(st.get(), 1, date);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
        out.id = sqlite3_column_int64(st.get(), 0);
        out.date = column_text(st.get(), 1);
        out.notes = column_text(st.get(), 2);
        found = true;
        return true;
    }
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to find workout"); return false; }
    return true;
}

std::int64_t db_get_or_create_workout(sqlite3* db, const std::string& date) {
    Workout w;
    bool found = false;
    if (!db_find_workout_by_date(db, date, w, found)) return 0;
    if (found) return w.id;
    return db_add_workout(db, date, "");
}

// INSERT set row with its one-rep-max computed now.
std::int64_t db_add_set(sqlite3* db, const SetRecord& s) {
    Statement st(db,
        "INSERT INTO sets(workout_id,exercise_id,set_number,weight,reps,one_rm)"
        " VALUES(?,?,?,?,?,?);");
    if (!st.ok()) return 0;
    sqlite3_bind_int64(st.get(), 1, s.workout_id);
    sqlite3_bind_int64(st.get(), 2, s.exercise_id);
    sqlite3_bind_int(st.get(), 3, s.set_number);
    sqlite3_bind_double(st.get(), 4, s.weight);
    sqlite3_bind_int(st.get(), 5, s.reps);
    sqlite3_bind_double(st.get(), 6, one_rep_max(s.weight, s.reps));
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        log_sql_error(db, "Failed to add set");
        return 0;
    }
    return sqlite3_last_insert_rowid(db);
}

bool db_log_sets(sqlite3* db, const std::string& date, std::int64_t exercise_id,
    const std::vector<Lift>& lifts, int& inserted) {
    inserted = 0;
    if (lifts.empty()) return true;

    Transaction tx(db);
    if (!tx.ok()) return false;

    std::int64_t workout_id = db_get_or_create_workout(db, date);
    if (workout_id == 0) return false;

    int next_number = 1;
    {
        Statement st(db, "SELECT COALESCE(MAX(set_number),0) FROM sets WHERE workout_id=?;");
        if (!st.ok()) return false;
        sqlite3_bind_int64(st.get(), 1, workout_id);
        if (sqlite3_step(st.get()) != SQLITE_ROW) return false;
        next_number = sqlite3_column_int(st.get(), 0) + 1;
    }

    int count = 0;
    for (const auto& l : lifts) {
        SetRecord s;
        s.workout_id = workout_id;
        s.exercise_id = exercise_id;
        s.set_number = next_number++;
        s.weight = l.weight;
        s.reps = l.reps;
        if (db_add_set(db, s) == 0) return false;
        ++count;
    }
    if (!tx.commit()) return false;
    inserted = count;
    return true;
}

// Delete a single set by id.
bool db_delete_set(sqlite3* db, std::int64_t set_id) {
    Statement st(db, "DELETE FROM sets WHERE id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, set_id);
    int rc = sqlite3_step(st.get());
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

bool db_last_exercise_record(sqlite3* db, std::int64_t exercise_id, std::vector<SetRecord>& out) {
    out.clear();
    Statement st(db,
        "SELECT s.id,s.workout_id,s.exercise_id,s.set_number,s.weight,s.reps,s.one_rm"
        " FROM sets s JOIN workouts w ON s.workout_id = w.id"
        " WHERE s.exercise_id=?"
        " ORDER BY w.date DESC, s.set_number"
        " LIMIT 10;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, exercise_id);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        SetRecord s;
        s.id = sqlite3_column_int64(st.get(), 0);
        s.workout_id = sqlite3_column_int64(st.get(), 1);
        s.exercise_id = sqlite3_column_int64(st.get(), 2);
        s.set_number = sqlite3_column_int(st.get(), 3);
        s.weight = sqlite3_column_double(st.get(), 4);
        s.reps = sqlite3_column_int(st.get(), 5);
        s.one_rm = sqlite3_column_double(st.get(), 6);
        out.push_back(s);
    }
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to get last exercise record"); return false; }
    return true;
}

bool db_max_one_rm(sqlite3* db, std::int64_t exercise_id, std::optional<double>& out) {
    out.reset();
    Statement st(db, "SELECT MAX(one_rm) FROM sets WHERE exercise_id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, exercise_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) { log_sql_error(db, "Failed to read best 1RM"); return false; }
    out = column_opt_double(st.get(), 0);
    return true;
}

/* =========================
   Body stats
   ========================= */

static BodyStats read_body_stats(sqlite3_stmt* st) {
    BodyStats b;
    b.id = sqlite3_column_int64(st, 0);
    b.date = column_text(st, 1);
    b.weight = column_opt_double(st, 2);
    b.body_fat_percentage = column_opt_double(st, 3);
    b.muscle_mass = column_opt_double(st, 4);
    return b;
}

std::int64_t db_add_body_stats(sqlite3* db, const BodyStats& b) {
    Statement st(db, "INSERT INTO body_stats(date,weight,body_fat_percentage,muscle_mass) VALUES(?,?,?,?);");
    if (!st.ok()) return 0;
    bind_text(st.get(), 1, b.date);
    bind_opt_double(st.get(), 2, b.weight);
    bind_opt_double(st.get(), 3, b.body_fat_percentage);
    bind_opt_double(st.get(), 4, b.muscle_mass);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        log_sql_error(db, "Failed to add body stats");
        return 0;
    }
    return sqlite3_last_insert_rowid(db);
}

bool db_update_body_stats(sqlite3* db, const BodyStats& b) {
    Statement st(db, "UPDATE body_stats SET date=?, weight=?, body_fat_percentage=?, muscle_mass=? WHERE id=?;");
    if (!st.ok()) return false;
    bind_text(st.get(), 1, b.date);
    bind_opt_double(st.get(), 2, b.weight);
    bind_opt_double(st.get(), 3, b.body_fat_percentage);
    bind_opt_double(st.get(), 4, b.muscle_mass);
    sqlite3_bind_int64(st.get(), 5, b.id);
    int rc = sqlite3_step(st.get());
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

bool db_delete_body_stats(sqlite3* db, std::int64_t id) {
    Statement st(db, "DELETE FROM body_stats WHERE id=?;");
    if (!st.ok()) return false;
    sqlite3_bind_int64(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

bool db_list_body_stats(sqlite3* db, std::vector<BodyStats>& out) {
    out.clear();
    Statement st(db, "SELECT id,date,weight,body_fat_percentage,muscle_mass FROM body_stats"
                     " ORDER BY date DESC, id DESC;");
    if (!st.ok()) return false;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(read_body_stats(st.get()));
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to list body stats"); return false; }
    return true;
}

// Single-row read helper for the two lookups below.
static bool read_one_body_stats(sqlite3* db, Statement& st, BodyStats& out, bool& found) {
    found = false;
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) { out = read_body_stats(st.get()); found = true; return true; }
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to read body stats"); return false; }
    return true;
}

bool db_latest_body_stats(sqlite3* db, BodyStats& out, bool& found) {
    Statement st(db, "SELECT id,date,weight,body_fat_percentage,muscle_mass FROM body_stats"
                     " ORDER BY date DESC, id DESC LIMIT 1;");
    if (!st.ok()) { found = false; return false; }
    return read_one_body_stats(db, st, out, found);
}

bool db_body_stats_since(sqlite3* db, const std::string& date, BodyStats& out, bool& found) {
    Statement st(db, "SELECT id,date,weight,body_fat_percentage,muscle_mass FROM body_stats"
                     " WHERE date >= ? ORDER BY date ASC, id ASC LIMIT 1;");
    if (!st.ok()) { found = false; return false; }
    bind_text(st.get(), 1, date);
    return read_one_body_stats(db, st, out, found);
}

/* =========================
   Backup
   ========================= */

bool db_backup(const std::string& db_path, const std::string& backup_dir, std::string& written) {
    namespace fs = std::filesystem;
    written.clear();
    std::error_code ec;
    if (!fs::exists(db_path, ec)) return true;   // nothing to back up yet

    fs::create_directories(backup_dir, ec);
    if (ec) {
        std::cerr << "Backup failed: cannot create " << backup_dir << ": " << ec.message() << "\n";
        return false;
    }

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    fs::path target = fs::path(backup_dir) / ("gym_tracker_backup_" + std::string(stamp) + ".db");
    fs::copy_file(db_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::cerr << "Backup failed: " << ec.message() << "\n";
        return false;
    }
    written = target.string();
    return true;
}

// Quick counts for live dashboard/menu. One round-trip using scalar subqueries.
bool db_get_counts(sqlite3* db, DbCounts& out) {
    static const char* SQL =
        "SELECT "
        " (SELECT COUNT(*) FROM workouts)   AS w, "
        " (SELECT COUNT(*) FROM sets)       AS s, "
        " (SELECT COUNT(*) FROM goals)      AS g, "
        " (SELECT COUNT(*) FROM body_stats) AS b;";

    Statement st(db, SQL);
    if (!st.ok()) return false;

    if (sqlite3_step(st.get()) != SQLITE_ROW) return false;
    out.workouts = sqlite3_column_int(st.get(), 0);
    out.sets = sqlite3_column_int(st.get(), 1);
    out.goals = sqlite3_column_int(st.get(), 2);
    out.body_stats = sqlite3_column_int(st.get(), 3);
    return true;
}
