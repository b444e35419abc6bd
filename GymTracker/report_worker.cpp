#include "report_worker.hpp"
#include "db.hpp"
#include <memory>
#include <stdexcept>

bool load_stats_report(sqlite3* db, int period_days, const Date& today, StatsReport& out) {
    HistoryFilter f;
    f.start_date = period_start(today, period_days);

    std::vector<HistoryRow> rows;
    std::vector<std::string> dates;
    if (!db_load_history(db, f, rows)) return false;
    if (!db_workout_dates(db, f, dates)) return false;

    out = build_stats_report(rows, dates, today, period_days);
    return true;
}

std::future<StatsReport> load_report_async(std::string db_path, int period_days, Date today) {
    return std::async(std::launch::async, [path = std::move(db_path), period_days, today]() {
        sqlite3* raw = nullptr;
        if (!db_open(raw, path))
            throw std::runtime_error("Cannot open SQLite DB at " + path);
        std::unique_ptr<sqlite3, decltype(&db_close)> db(raw, &db_close);

        StatsReport report;
        if (!load_stats_report(db.get(), period_days, today, report))
            throw std::runtime_error("Failed to read statistics from " + path);
        return report;
    });
}
