/*
-------------------------------------------------------------------------------
 db_history.cpp - Read-only queries over the set log
-------------------------------------------------------------------------------
Every query here shares one filter (date range and/or exercise). The WHERE
clause is assembled from the filter fields that are present, and values are
bound in the same order, so no user text is ever spliced into SQL.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "db_internal.hpp"

static const char* kHistorySelect =
    "SELECT s.id,s.workout_id,s.exercise_id,w.date,e.name,e.variation,e.category,"
    "s.set_number,s.weight,s.reps,s.one_rm"
    " FROM sets s"
    " JOIN workouts w ON s.workout_id = w.id"
    " JOIN exercises e ON s.exercise_id = e.id";

// " WHERE ..." for the fields present in `f`, or empty.
static std::string where_clause(const HistoryFilter& f) {
    std::string w;
    auto add = [&w](const char* cond) {
        w += w.empty() ? " WHERE " : " AND ";
        w += cond;
    };
    if (f.start_date) add("w.date >= ?");
    if (f.end_date) add("w.date <= ?");
    if (f.exercise_id) add("s.exercise_id = ?");
    return w;
}

// Bind the filter values in where_clause order; returns the next free index.
static int bind_filter(sqlite3_stmt* st, const HistoryFilter& f) {
    int idx = 1;
    if (f.start_date) bind_text(st, idx++, *f.start_date);
    if (f.end_date) bind_text(st, idx++, *f.end_date);
    if (f.exercise_id) sqlite3_bind_int64(st, idx++, *f.exercise_id);
    return idx;
}

static HistoryRow read_history_row(sqlite3_stmt* st) {
    HistoryRow r;
    r.set_id = sqlite3_column_int64(st, 0);
    r.workout_id = sqlite3_column_int64(st, 1);
    r.exercise_id = sqlite3_column_int64(st, 2);
    r.date = column_text(st, 3);
    r.exercise_name = column_text(st, 4) + " (" + column_text(st, 5) + ")";
    r.category = column_text(st, 6);
    r.set_number = sqlite3_column_int(st, 7);
    r.weight = sqlite3_column_double(st, 8);
    r.reps = sqlite3_column_int(st, 9);
    r.one_rm = sqlite3_column_double(st, 10);
    return r;
}

static bool collect_rows(sqlite3* db, Statement& st, std::vector<HistoryRow>& out) {
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(read_history_row(st.get()));
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to read history"); return false; }
    return true;
}

bool db_load_history(sqlite3* db, const HistoryFilter& f, std::vector<HistoryRow>& out) {
    out.clear();
    std::string q = kHistorySelect + where_clause(f) + " ORDER BY w.date, s.workout_id, s.set_number;";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    bind_filter(st.get(), f);
    return collect_rows(db, st, out);
}

bool db_history_page(sqlite3* db, const HistoryFilter& f, int page_size, int offset,
    std::vector<HistoryRow>& out) {
    out.clear();
    if (page_size <= 0 || offset < 0) return false;
    std::string q = kHistorySelect + where_clause(f)
        + " ORDER BY w.date DESC, s.workout_id DESC, s.set_number LIMIT ? OFFSET ?;";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    int idx = bind_filter(st.get(), f);
    sqlite3_bind_int(st.get(), idx++, page_size);
    sqlite3_bind_int(st.get(), idx, offset);
    return collect_rows(db, st, out);
}

bool db_count_history(sqlite3* db, const HistoryFilter& f, int& out) {
    out = 0;
    std::string q = "SELECT COUNT(*) FROM sets s JOIN workouts w ON s.workout_id = w.id"
        + where_clause(f) + ";";
    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    bind_filter(st.get(), f);
    if (sqlite3_step(st.get()) != SQLITE_ROW) { log_sql_error(db, "Failed to count history"); return false; }
    out = sqlite3_column_int(st.get(), 0);
    return true;
}

bool db_workout_dates(sqlite3* db, const HistoryFilter& f, std::vector<std::string>& out) {
    out.clear();
    // A workout day is a date with at least one set, the same rule the
    // summary counts by. Workouts left empty by set deletion do not count.
    std::string q = "SELECT DISTINCT w.date FROM workouts w JOIN sets s ON s.workout_id = w.id"
        + where_clause(f) + " ORDER BY w.date DESC;";

    Statement st(db, q.c_str());
    if (!st.ok()) return false;
    bind_filter(st.get(), f);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(column_text(st.get(), 0));
    if (rc != SQLITE_DONE) { log_sql_error(db, "Failed to read workout dates"); return false; }
    return true;
}
