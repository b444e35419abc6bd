/*
-------------------------------------------------------------------------------
 GymTracker.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console strength-training tracker. This is the main entry point (contains
   main()), driving a menu workflow that reads/writes to an SQLite database
   and mirrors exercises and goals in-memory.

 Data flow (very important):
   - Persistent store: SQLite (via db.hpp functions)
   - In-memory cache: DataStore (services.hpp)
   - Pattern on writes: Attempt DB change first; if success, apply the same
     change to the in-memory DataStore (keeps both in sync). If either side
     fails, we print a message and abort that operation.
   - The set log and body stats are read from the DB per screen.
   - The statistics report is built on a worker thread with its own
     connection (report_worker.hpp); only this thread prints.

 User input model:
   - All text fields are validated with helpers in validation.hpp
   - Numeric entry uses prompt_number_or_back / prompt_int_or_back
   - Most prompts support special control responses from InputCtl:
       * Back  -> cancel current action and return to the menu
       * Exit  -> exit the app immediately (we set choice = 0 and break)

 Conventions & Notes for contributors:
   - Keep the DB and DataStore changes paired and ordered: DB first, then
     in-memory. This ensures DB remains source of truth.
   - If you add new menu items, maintain the ASCII banner width.
   - Validation rules live in validation.hpp; please reuse them to maintain
     consistent constraints across the app.

 Build:
   - Requires SQLite3 dev headers/libs and a C++17 (or later) compiler.
-------------------------------------------------------------------------------
*/

#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include "services.hpp"       // DataStore, printers
#include "db.hpp"             // SQLite bridge: open/init/CRUD functions
#include "validation.hpp"     // Input validation helpers and InputCtl enum
#include "helpers.hpp"        // DataStore lookups and cache updates
#include "config.hpp"
#include "report_worker.hpp"

// Prints the ASCII welcome banner once at startup.
static void showWelcome() {
    std::cout << "=====================================================\n";
    std::cout << "                        WELCOME                      \n";
    std::cout << "=====================================================\n";
    std::cout << "                     Gym Tracker                     \n";
    std::cout << "-----------------------------------------------------\n";
    std::cout << "        Log sets, track bests, reach your goals      \n";
    std::cout << "=====================================================\n\n";
}

// Validators for numbers typed into prompt_edit_string.
static bool is_weight_text(const std::string& s) {
    double w = 0.0;
    std::string err;
    return parse_double(s, w) && validate_weight(w, err);
}

static bool is_reps_text(const std::string& s) {
    int n = 0;
    std::string err;
    return parse_int(s, n) && validate_reps(n, err);
}

static bool is_sets_text(const std::string& s) {
    int n = 0;
    return parse_int(s, n) && n >= 1 && n <= 10;
}

static bool is_optional_note(const std::string& s) {
    return s.size() <= 60;
}

static std::string fmt1(double v) {
    std::ostringstream os;
    os << Fixed1{ v };
    return os.str();
}

// Show the exercise list and ask for an id until it names a known exercise.
static InputCtl pick_exercise(const DataStore& data, const Exercise*& out) {
    show_exercises(data);
    for (;;) {
        int id = 0;
        auto r = prompt_int_or_back("Exercise id", id, 1, std::numeric_limits<int>::max());
        if (r != InputCtl::Ok) return r;
        out = find_exercise(data, id);
        if (out) return InputCtl::Ok;
        std::cout << "  -> No exercise with that id.\n";
    }
}

// Period menu shared by history, progress and statistics screens.
static InputCtl pick_period(int& days) {
    std::cout << "Period: 1) 30 days  2) 90 days  3) 180 days  4) 365 days  5) all\n";
    int n = 0;
    auto r = prompt_int_or_back("Period", n, 1, 5);
    static const int kDays[] = { 30, 90, 180, 365, 0 };
    if (r == InputCtl::Ok) days = kDays[n - 1];
    return r;
}

// Date prompt that offers today's date as the default.
static InputCtl prompt_date(const std::string& label, std::string& out) {
    return prompt_edit_string(label + " (YYYY-MM-DD)", format_date(today_local()), out,
        is_valid_date, "Use YYYY-MM-DD with a real calendar day.");
}

// Startup/refresh notices: weight goals ready to confirm (top 3) and set
// goals within `threshold` sets of completion.
static void show_goal_notifications(sqlite3* db, int threshold) {
    std::vector<GoalRow> achievable, almost;
    if (db_achievable_weight_goals(db, achievable) && !achievable.empty()) {
        std::cout << "Goals ready to mark achieved:\n";
        for (size_t i = 0; i < achievable.size() && i < 3; ++i) show_goal_line(achievable[i]);
    }
    if (db_almost_there_goals(db, threshold, almost) && !almost.empty()) {
        std::cout << "Almost there:\n";
        for (const auto& g : almost) show_goal_line(g);
    }
}

//-----------------------------------------
int main(int argc, char** argv) {
    // --- Configuration: defaults <- config file <- command line -------------
    CliOptions cli;
    try {
        cli = parse_args(argc, argv);
    }
    catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage_text(argv[0]);
        return 2;
    }
    if (cli.help) {
        std::cout << usage_text(argv[0]);
        return 0;
    }
    AppConfig file_cfg = load_config_file(cli.config_path.value_or(default_config_path()));
    AppConfig cfg = merge_config(merge_config(default_config(), file_cfg), cli.overrides);
    if (cfg.height_cm) {
        std::string err;
        if (!validate_height(*cfg.height_cm, err)) {
            std::cerr << err << " BMI is disabled.\n";
            cfg.height_cm.reset();
        }
    }
    const std::string db_path = *cfg.db_path;
    const int almost_threshold = *cfg.almost_there_sets;

    showWelcome();

    // In-memory mirror of the database. "data" must be kept in sync with DB
    // changes; we always write to DB first, then update this cache.
    DataStore data;

    // --- Database bootstrap -------------------------------------------------
    sqlite3* db = nullptr;

    // Open or create the SQLite file. If this fails, we cannot continue.
    if (!db_open(db, db_path)) {
        std::cout << "Could not open database " << db_path << ".\n";
        return 1;
    }

    // Create schema, seed exercises on first run and migrate old goal tables.
    // If this fails, bail out to avoid running with a partial/unknown schema.
    if (!db_init_and_seed(db)) {
        std::cout << "Could not initialize database.\n";
        db_close(db);
        return 1;
    }

    if (!db_load_all(db, data)) {
        std::cout << "Could not load data.\n";
        db_close(db);
        return 1;
    }

    show_goal_notifications(db, almost_threshold);

    // --- Menu loop ----------------------------------------------------------
    int choice = -1;

    // Utility to reset the cin state and discard the rest of the current line.
    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    // Main interaction loop. Each branch is documented below.
    while (choice != 0) {
        DbCounts counts;
        if (!db_get_counts(db, counts)) counts = DbCounts{};

        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "  Workouts: " << std::setw(4) << counts.workouts
            << "   Sets: " << std::setw(5) << counts.sets
            << "   Goals: " << std::setw(3) << counts.goals << "\n"
            << "-----------------------------------------------------\n"
            << " TRAINING:                                           \n"
            << "  [1]  Log workout        [2]  View history          \n"
            << "  [3]  Delete set         [4]  View exercises        \n"
            << "  [5]  Add exercise       [6]  Personal bests        \n"
            << "  [7]  Exercise progress  [8]  Statistics report     \n"
            << "-----------------------------------------------------\n"
            << " BODY:                                               \n"
            << "  [9]  Add body stats     [10] View body stats       \n"
            << "  [11] Edit body stats    [12] Delete body stats     \n"
            << "-----------------------------------------------------\n"
            << " LIFT GOALS:                                         \n"
            << "  [13] Add goal           [14] View goals            \n"
            << "  [15] Edit goal          [16] Delete goal           \n"
            << "  [17] Mark achieved      [18] Refresh from log      \n"
            << "-----------------------------------------------------\n"
            << " BODY GOALS:                                         \n"
            << "  [19] Add body goal      [20] View body goals       \n"
            << "  [21] Refresh body goals [22] Mark achieved         \n"
            << "  [23] Delete body goal                              \n"
            << "-----------------------------------------------------\n"
            << "  [24] Backup database    [0]  EXIT                  \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        // End of input ends the session like [0].
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }

        // Always clear the trailing newline before using getline()-style prompts.
        clear_input();

        // ---- 1) Log workout ------------------------------------------------
        if (choice == 1) {
            std::string date;
            auto d = prompt_date("Date", date);
            if (d == InputCtl::Back) continue;
            if (d == InputCtl::Exit) { choice = 0; break; }

            const Exercise* ex = nullptr;
            auto e = pick_exercise(data, ex);
            if (e == InputCtl::Back) continue;
            if (e == InputCtl::Exit) { choice = 0; break; }

            std::vector<SetRecord> last;
            if (db_last_exercise_record(db, ex->id, last)) show_last_record(last);

            int nsets = 0;
            auto n = prompt_int_or_back("Number of sets", nsets, 1, 10);
            if (n == InputCtl::Back) continue;
            if (n == InputCtl::Exit) { choice = 0; break; }

            // Each set: weight then reps, both validated before anything is saved.
            std::vector<Lift> lifts;
            InputCtl ctl = InputCtl::Ok;
            for (int i = 1; i <= nsets && ctl == InputCtl::Ok; ++i) {
                Lift l{ 0.0, 0 };
                std::string err;
                for (;;) {
                    ctl = prompt_number_or_back("Set " + std::to_string(i) + " weight kg", l.weight, kWeightStep, kWeightMax);
                    if (ctl != InputCtl::Ok || validate_weight(l.weight, err)) break;
                    std::cout << "  -> " << err << "\n";
                }
                if (ctl != InputCtl::Ok) break;
                ctl = prompt_int_or_back("Set " + std::to_string(i) + " reps", l.reps, kRepsMin, kRepsMax);
                if (ctl == InputCtl::Ok) lifts.push_back(l);
            }
            if (ctl == InputCtl::Back) continue;
            if (ctl == InputCtl::Exit) { choice = 0; break; }

            int inserted = 0;
            if (!db_log_sets(db, date, ex->id, lifts, inserted)) {
                std::cout << "Could not save the workout (nothing was stored).\n";
                continue;
            }
            std::cout << inserted << " set(s) of " << ex->display_name() << " saved for " << date << ".\n";
            for (const auto& l : lifts)
                std::cout << "  " << fmt1(l.weight) << "kg x " << l.reps
                    << "  -> 1RM " << fmt1(one_rep_max(l.weight, l.reps)) << "kg\n";

            // Goals track the log automatically.
            int updated = 0;
            if (db_refresh_all_goals(db, updated) && db_list_goals(db, data.all_goals)) {
                if (updated > 0) std::cout << updated << " goal(s) updated.\n";
                show_goal_notifications(db, almost_threshold);
            }
            else {
                std::cout << "Goals could not be refreshed.\n";
            }
        }

        // ---- 2) View history ----------------------------------------------
        else if (choice == 2) {
            HistoryFilter f;
            int days = 0;
            auto p = pick_period(days);
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }
            f.start_date = period_start(today_local(), days);

            auto one = confirm_or_back("Only one exercise?");
            if (one == InputCtl::Exit) { choice = 0; break; }
            if (one == InputCtl::Ok) {
                const Exercise* ex = nullptr;
                auto e = pick_exercise(data, ex);
                if (e == InputCtl::Back) continue;
                if (e == InputCtl::Exit) { choice = 0; break; }
                f.exercise_id = ex->id;
            }

            int total = 0;
            if (!db_count_history(db, f, total)) { std::cout << "Could not read history.\n"; continue; }
            std::cout << total << " set(s) found.\n";

            const int page_size = 20;
            bool exit_app = false;
            for (int offset = 0; offset < total; offset += page_size) {
                std::vector<HistoryRow> rows;
                if (!db_history_page(db, f, page_size, offset, rows)) {
                    std::cout << "Could not read history.\n";
                    break;
                }
                show_history(rows);
                if (offset + page_size >= total) break;
                auto more = confirm_or_back("Show more?");
                if (more == InputCtl::Exit) { exit_app = true; break; }
                if (more == InputCtl::Back) break;
            }
            if (exit_app) { choice = 0; break; }
        }

        // ---- 3) Delete set -------------------------------------------------
        else if (choice == 3) {
            int id = 0;
            auto p = prompt_int_or_back("Set id to delete (see history)", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            auto c = confirm_or_back("Delete this set?");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            if (db_delete_set(db, id))
                std::cout << "Set deleted.\n";
            else
                std::cout << "Delete failed (DB error or not found).\n";
        }

        // ---- 4) View exercises ---------------------------------------------
        else if (choice == 4) {
            show_exercises(data);
        }

        // ---- 5) Add exercise -----------------------------------------------
        else if (choice == 5) {
            Exercise ex;
            auto a = prompt_until_valid_or_back("Name", ex.name, is_valid_exercise_name,
                "Letters, digits, spaces, - and ' only (2-40).");
            if (a == InputCtl::Back) continue;
            if (a == InputCtl::Exit) { choice = 0; break; }

            auto b = prompt_until_valid_or_back("Variation (e.g. Barbell)", ex.variation, is_non_empty_short,
                "Variation required (max 60).");
            if (b == InputCtl::Back) continue;
            if (b == InputCtl::Exit) { choice = 0; break; }

            auto c = prompt_until_valid_or_back("Category (Chest/Back/Legs/Shoulders/Arms)", ex.category,
                is_valid_category, "Pick one of Chest, Back, Legs, Shoulders, Arms.");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            if (find_exercise_by_name(data, ex.name, ex.variation)) {
                std::cout << "That exercise already exists.\n"; continue;
            }

            ex.id = db_add_exercise(db, ex);
            if (ex.id != 0 && add_exercise(data, ex))
                std::cout << "Exercise added (id " << ex.id << ").\n";
            else
                std::cout << "Could not add exercise.\n";
        }

        // ---- 6) Personal bests --------------------------------------------
        else if (choice == 6) {
            std::vector<HistoryRow> rows;
            if (!db_load_history(db, HistoryFilter{}, rows)) { std::cout << "Could not read history.\n"; continue; }
            show_best_records(best_records(rows));
        }

        // ---- 7) Exercise progress -----------------------------------------
        else if (choice == 7) {
            const Exercise* ex = nullptr;
            auto e = pick_exercise(data, ex);
            if (e == InputCtl::Back) continue;
            if (e == InputCtl::Exit) { choice = 0; break; }

            int days = 0;
            auto p = pick_period(days);
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            HistoryFilter f;
            f.exercise_id = ex->id;
            f.start_date = period_start(today_local(), days);
            std::vector<HistoryRow> rows;
            if (!db_load_history(db, f, rows)) { std::cout << "Could not read history.\n"; continue; }

            std::cout << ex->display_name() << "\n";
            show_exercise_summary(exercise_summary(rows));
            std::vector<ProgressPoint> orm = one_rm_progress(rows);
            show_progress("Estimated 1RM per day:", orm, false);
            if (orm.size() >= 2)
                std::cout << "1RM change over the period: "
                    << fmt1(growth_rate(orm.back().value, orm.front().value)) << "%\n";
            show_progress("Top weight per day:", weight_progress(rows), true);
            show_progress("Volume per day:", volume_progress(rows), false);
        }

        // ---- 8) Statistics report (worker thread) --------------------------
        else if (choice == 8) {
            int days = 0;
            auto p = pick_period(days);
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            auto pending = load_report_async(db_path, days, today_local());
            std::cout << "Loading statistics...\n";
            try {
                show_stats_report(pending.get());
            }
            catch (const std::runtime_error& ex) {
                std::cerr << "Statistics failed: " << ex.what() << "\n";
            }
        }

        // ---- 9) Add body stats --------------------------------------------
        else if (choice == 9) {
            BodyStats b;
            auto d = prompt_date("Date", b.date);
            if (d == InputCtl::Back) continue;
            if (d == InputCtl::Exit) { choice = 0; break; }

            auto w = prompt_optional_number("Body weight kg", b.weight, validate_body_weight);
            if (w == InputCtl::Back) continue;
            if (w == InputCtl::Exit) { choice = 0; break; }

            auto f = prompt_optional_number("Body fat %", b.body_fat_percentage, validate_body_fat);
            if (f == InputCtl::Back) continue;
            if (f == InputCtl::Exit) { choice = 0; break; }

            auto m = prompt_optional_number("Muscle mass kg", b.muscle_mass, validate_muscle_mass);
            if (m == InputCtl::Back) continue;
            if (m == InputCtl::Exit) { choice = 0; break; }

            if (!b.weight && !b.body_fat_percentage && !b.muscle_mass) {
                std::cout << "Enter at least one measurement.\n"; continue;
            }

            b.id = db_add_body_stats(db, b);
            if (b.id == 0) { std::cout << "Could not save body stats.\n"; continue; }
            std::cout << "Body stats saved.\n";
            if (b.weight && cfg.height_cm) {
                double bmi = body_mass_index(*b.weight, *cfg.height_cm);
                std::cout << "BMI " << fmt1(bmi) << " (" << bmi_class(bmi) << ")\n";
            }
        }

        // ---- 10) View body stats ------------------------------------------
        else if (choice == 10) {
            std::vector<BodyStats> list;
            if (!db_list_body_stats(db, list)) { std::cout << "Could not read body stats.\n"; continue; }
            show_body_stats(list, cfg.height_cm);

            // Change against the first snapshot of the last 30 days.
            BodyStats latest, since;
            bool has_latest = false, has_since = false;
            std::string from = format_date(add_days(today_local(), -30));
            if (db_latest_body_stats(db, latest, has_latest) && has_latest
                && db_body_stats_since(db, from, since, has_since) && has_since
                && since.id != latest.id)
                show_body_change(latest, since);
        }

        // ---- 11) Edit body stats ------------------------------------------
        else if (choice == 11) {
            int id = 0;
            auto p = prompt_int_or_back("Body stats id to edit", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            std::vector<BodyStats> list;
            if (!db_list_body_stats(db, list)) { std::cout << "Could not read body stats.\n"; continue; }
            auto it = std::find_if(list.begin(), list.end(), [&](const BodyStats& b) { return b.id == id; });
            if (it == list.end()) { std::cout << "Body stats not found.\n"; continue; }

            BodyStats upd = *it;
            auto d = prompt_edit_string("Date", it->date, upd.date, is_valid_date, "Use YYYY-MM-DD.");
            if (d == InputCtl::Back) continue;
            if (d == InputCtl::Exit) { choice = 0; break; }

            // Metrics are entered again; Enter leaves one empty.
            auto w = prompt_optional_number("Body weight kg", upd.weight, validate_body_weight);
            if (w == InputCtl::Back) continue;
            if (w == InputCtl::Exit) { choice = 0; break; }

            auto f = prompt_optional_number("Body fat %", upd.body_fat_percentage, validate_body_fat);
            if (f == InputCtl::Back) continue;
            if (f == InputCtl::Exit) { choice = 0; break; }

            auto m = prompt_optional_number("Muscle mass kg", upd.muscle_mass, validate_muscle_mass);
            if (m == InputCtl::Back) continue;
            if (m == InputCtl::Exit) { choice = 0; break; }

            if (db_update_body_stats(db, upd))
                std::cout << "Body stats updated.\n";
            else
                std::cout << "Update failed (DB error or not found).\n";
        }

        // ---- 12) Delete body stats ----------------------------------------
        else if (choice == 12) {
            int id = 0;
            auto p = prompt_int_or_back("Body stats id to delete", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            auto c = confirm_or_back("Delete these body stats?");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            if (db_delete_body_stats(db, id))
                std::cout << "Body stats deleted.\n";
            else
                std::cout << "Delete failed (DB error or not found).\n";
        }

        // ---- 13) Add goal -------------------------------------------------
        else if (choice == 13) {
            int kind = 0;
            std::cout << "Goal type: 1) reach a weight  2) weight x reps x sets\n";
            auto k = prompt_int_or_back("Type", kind, 1, 2);
            if (k == InputCtl::Back) continue;
            if (k == InputCtl::Exit) { choice = 0; break; }

            const Exercise* ex = nullptr;
            auto e = pick_exercise(data, ex);
            if (e == InputCtl::Back) continue;
            if (e == InputCtl::Exit) { choice = 0; break; }

            std::string month;
            auto mo = prompt_edit_string("Target month (YYYY-MM)", format_month(today_local()), month,
                is_valid_month, "Use YYYY-MM.");
            if (mo == InputCtl::Back) continue;
            if (mo == InputCtl::Exit) { choice = 0; break; }

            AnyGoal goal;
            if (kind == 1) {
                WeightGoal w;
                w.exercise_id = ex->id;
                w.target_month = month;
                auto t = prompt_number_or_back("Target weight kg", w.target_weight, kWeightStep, kWeightMax);
                if (t == InputCtl::Back) continue;
                if (t == InputCtl::Exit) { choice = 0; break; }
                goal = w;
            }
            else {
                SetGoal s;
                s.exercise_id = ex->id;
                s.target_month = month;
                auto t = prompt_number_or_back("Target weight kg", s.target_weight, kWeightStep, kWeightMax);
                if (t == InputCtl::Back) continue;
                if (t == InputCtl::Exit) { choice = 0; break; }

                auto r = prompt_int_or_back("Target reps", s.target_reps, kRepsMin, kRepsMax);
                if (r == InputCtl::Back) continue;
                if (r == InputCtl::Exit) { choice = 0; break; }

                auto n = prompt_int_or_back("Target sets", s.target_sets, 1, 10);
                if (n == InputCtl::Back) continue;
                if (n == InputCtl::Exit) { choice = 0; break; }

                auto nt = prompt_edit_string("Notes", "", s.notes, is_optional_note, "Max 60 chars.");
                if (nt == InputCtl::Back) continue;
                if (nt == InputCtl::Exit) { choice = 0; break; }
                goal = s;
            }

            std::string err;
            double target = std::visit([](const auto& g) { return g.target_weight; }, goal);
            if (!validate_weight(target, err)) { std::cout << err << "\n"; continue; }

            // Save, then pick up what the log already shows for this exercise.
            std::int64_t id = db_add_goal(db, goal);
            if (id == 0) { std::cout << "Could not add goal (same exercise, month and type already exists?).\n"; continue; }
            bool changed = false;
            AnyGoal saved;
            if (!db_refresh_goal(db, id, changed) || !db_get_goal(db, id, saved)) {
                std::cout << "Goal saved but could not be read back.\n"; continue;
            }
            if (add_goal(data, GoalRow{ saved, ex->display_name(), ex->category })) {
                std::cout << "Goal added.\n";
                show_goal_line(data.all_goals.back());
            }
        }

        // ---- 14) View goals -----------------------------------------------
        else if (choice == 14) {
            show_goals(data);
            show_goal_statistics(goal_statistics(data.all_goals));
            show_goal_notifications(db, almost_threshold);
        }

        // ---- 15) Edit goal ------------------------------------------------
        else if (choice == 15) {
            int id = 0;
            auto p = prompt_int_or_back("Goal id to edit", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }

            GoalRow* row = find_goal(data, id);
            if (!row) { std::cout << "Goal not found.\n"; continue; }
            AnyGoal upd = row->goal;

            // Numbers are edited as text; the validator guarantees they parse.
            auto edit_weight = [](const char* label, double& v) {
                std::string t;
                auto r = prompt_edit_string(label, fmt1(v), t, is_weight_text, "0.5-500 kg in 0.5 steps.");
                if (r == InputCtl::Ok && !parse_double(t, v)) r = InputCtl::Back;
                return r;
            };
            auto edit_int = [](const char* label, int& v, bool (*valid)(const std::string&), const char* msg) {
                std::string t;
                auto r = prompt_edit_string(label, std::to_string(v), t, valid, msg);
                if (r == InputCtl::Ok && !parse_int(t, v)) r = InputCtl::Back;
                return r;
            };

            InputCtl ctl = InputCtl::Ok;
            if (auto* w = std::get_if<WeightGoal>(&upd)) {
                ctl = edit_weight("Target weight kg", w->target_weight);
                if (ctl == InputCtl::Ok)
                    ctl = prompt_edit_string("Target month", w->target_month, w->target_month, is_valid_month, "Use YYYY-MM.");
            }
            else {
                SetGoal& s = std::get<SetGoal>(upd);
                ctl = edit_weight("Target weight kg", s.target_weight);
                if (ctl == InputCtl::Ok) ctl = edit_int("Target reps", s.target_reps, is_reps_text, "1-50.");
                if (ctl == InputCtl::Ok) ctl = edit_int("Target sets", s.target_sets, is_sets_text, "1-10.");
                if (ctl == InputCtl::Ok)
                    ctl = prompt_edit_string("Target month", s.target_month, s.target_month, is_valid_month, "Use YYYY-MM.");
                if (ctl == InputCtl::Ok)
                    ctl = prompt_edit_string("Notes", s.notes, s.notes, is_optional_note, "Max 60 chars.");
            }
            if (ctl == InputCtl::Back) continue;
            if (ctl == InputCtl::Exit) { choice = 0; break; }

            // A new target recounts progress, so read the row back.
            AnyGoal saved;
            if (db_edit_goal(db, upd) && db_get_goal(db, id, saved) && apply_goal_update(data, saved))
                std::cout << "Goal updated.\n";
            else
                std::cout << "Update failed (DB error or duplicate month).\n";
        }

        // ---- 16) Delete goal ----------------------------------------------
        else if (choice == 16) {
            int id = 0;
            auto p = prompt_int_or_back("Goal id to delete", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }
            if (!find_goal(data, id)) { std::cout << "Goal not found.\n"; continue; }

            auto c = confirm_or_back("Delete this goal?");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            if (db_delete_goal(db, id) && remove_goal(data, id))
                std::cout << "Goal deleted.\n";
            else
                std::cout << "Delete failed (DB error or not found).\n";
        }

        // ---- 17) Mark goal achieved ---------------------------------------
        else if (choice == 17) {
            int id = 0;
            auto p = prompt_int_or_back("Goal id", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }
            if (!find_goal(data, id)) { std::cout << "Goal not found.\n"; continue; }

            auto c = confirm_or_back("Mark this goal as achieved?");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            AnyGoal g;
            if (db_mark_goal_achieved(db, id) && db_get_goal(db, id, g) && apply_goal_update(data, g))
                std::cout << "Goal marked achieved.\n";
            else
                std::cout << "Could not update goal.\n";
        }

        // ---- 18) Refresh goals from the log --------------------------------
        else if (choice == 18) {
            int updated = 0;
            if (db_refresh_all_goals(db, updated) && db_list_goals(db, data.all_goals))
                std::cout << updated << " goal(s) improved.\n";
            else
                std::cout << "Refresh failed.\n";
        }

        // ---- 19) Add body composition goal --------------------------------
        else if (choice == 19) {
            BodyCompositionGoal g;
            auto a = prompt_until_valid_or_back("Goal name", g.goal_name, is_non_empty_short, "Name required (max 60).");
            if (a == InputCtl::Back) continue;
            if (a == InputCtl::Exit) { choice = 0; break; }

            auto d = prompt_until_valid_or_back("Target date (YYYY-MM-DD)", g.target_date, is_valid_date,
                "Use YYYY-MM-DD with a real calendar day.");
            if (d == InputCtl::Back) continue;
            if (d == InputCtl::Exit) { choice = 0; break; }

            std::cout << "Targets (Enter skips a metric):\n";
            auto t1 = prompt_optional_number("Target weight kg", g.target_weight, validate_body_weight);
            if (t1 == InputCtl::Back) continue;
            if (t1 == InputCtl::Exit) { choice = 0; break; }
            auto t2 = prompt_optional_number("Target muscle mass kg", g.target_muscle_mass, validate_muscle_mass);
            if (t2 == InputCtl::Back) continue;
            if (t2 == InputCtl::Exit) { choice = 0; break; }
            auto t3 = prompt_optional_number("Target body fat %", g.target_body_fat, validate_body_fat);
            if (t3 == InputCtl::Back) continue;
            if (t3 == InputCtl::Exit) { choice = 0; break; }
            auto t4 = prompt_optional_number("Target BMI", g.target_bmi, validate_bmi);
            if (t4 == InputCtl::Back) continue;
            if (t4 == InputCtl::Exit) { choice = 0; break; }

            if (!g.target_weight && !g.target_muscle_mass && !g.target_body_fat && !g.target_bmi) {
                std::cout << "Set at least one target.\n"; continue;
            }

            std::cout << "Starting values (Enter = take them from your latest body stats):\n";
            auto s1 = prompt_optional_number("Starting weight kg", g.initial_weight, validate_body_weight);
            if (s1 == InputCtl::Back) continue;
            if (s1 == InputCtl::Exit) { choice = 0; break; }
            auto s2 = prompt_optional_number("Starting muscle mass kg", g.initial_muscle_mass, validate_muscle_mass);
            if (s2 == InputCtl::Back) continue;
            if (s2 == InputCtl::Exit) { choice = 0; break; }
            auto s3 = prompt_optional_number("Starting body fat %", g.initial_body_fat, validate_body_fat);
            if (s3 == InputCtl::Back) continue;
            if (s3 == InputCtl::Exit) { choice = 0; break; }
            if (g.initial_weight && cfg.height_cm)
                g.initial_bmi = body_mass_index(*g.initial_weight, *cfg.height_cm);

            std::int64_t id = db_add_body_goal(db, g, cfg.height_cm);
            BodyCompositionGoal saved;
            if (id != 0 && db_get_body_goal(db, id, saved) && add_body_goal(data, saved))
                std::cout << "Body composition goal added.\n";
            else
                std::cout << "Could not add body composition goal.\n";
        }

        // ---- 20) View body composition goals ------------------------------
        else if (choice == 20) {
            Date today = today_local();
            show_body_goals(data, today);
            show_body_goal_summary(body_goal_summary(data.all_body_goals, today));
        }

        // ---- 21) Refresh body goals from latest body stats -----------------
        else if (choice == 21) {
            int updated = 0;
            if (db_refresh_body_goals(db, cfg.height_cm, updated) && db_list_body_goals(db, data.all_body_goals))
                std::cout << updated << " body goal(s) updated.\n";
            else
                std::cout << "Refresh failed.\n";
        }

        // ---- 22) Mark body goal achieved ----------------------------------
        else if (choice == 22) {
            int id = 0;
            auto p = prompt_int_or_back("Body goal id", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }
            if (!find_body_goal(data, id)) { std::cout << "Body goal not found.\n"; continue; }

            BodyCompositionGoal g;
            if (db_mark_body_goal_achieved(db, id) && db_get_body_goal(db, id, g) && apply_body_goal_update(data, g))
                std::cout << "Body goal marked achieved.\n";
            else
                std::cout << "Could not update body goal.\n";
        }

        // ---- 23) Delete body goal -----------------------------------------
        else if (choice == 23) {
            int id = 0;
            auto p = prompt_int_or_back("Body goal id to delete", id, 1, std::numeric_limits<int>::max());
            if (p == InputCtl::Back) continue;
            if (p == InputCtl::Exit) { choice = 0; break; }
            if (!find_body_goal(data, id)) { std::cout << "Body goal not found.\n"; continue; }

            auto c = confirm_or_back("Delete this body goal?");
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) { choice = 0; break; }

            if (db_delete_body_goal(db, id) && remove_body_goal(data, id))
                std::cout << "Body goal deleted.\n";
            else
                std::cout << "Delete failed (DB error or not found).\n";
        }

        // ---- 24) Backup ---------------------------------------------------
        else if (choice == 24) {
            std::string written;
            if (!db_backup(db_path, *cfg.backup_dir, written))
                std::cout << "Backup failed.\n";
            else if (written.empty())
                std::cout << "Nothing to back up yet.\n";
            else
                std::cout << "Backup written to " << written << "\n";
        }

        // ---- Unknown option guard -----------------------------------------
        else if (choice != 0) {
            std::cout << "Unknown option.\n";
        }
    }

    // --- Shutdown -----------------------------------------------------------
    db_close(db);   // Always close the DB before exiting the program.
    return 0;
}
