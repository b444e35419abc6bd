#pragma once
#include <future>
#include <string>
#include <sqlite3.h>
#include "stats.hpp"

/*
-------------------------------------------------------------------------------
 report_worker.hpp - Statistics report, built on the calling thread or on a
 background thread
-------------------------------------------------------------------------------
The background variant opens its own SQLite connection (a connection is never
shared between threads) and hands the finished report back through a
std::future. The menu thread calls get() and does all the printing.
-------------------------------------------------------------------------------
*/

/// Read the rows for the last `period_days` days (all history when <= 0)
/// and build the report. Returns false on a database error.
bool load_stats_report(sqlite3* db, int period_days, const Date& today, StatsReport& out);

/// Same, on a worker thread. get() rethrows std::runtime_error when the
/// database cannot be opened or read.
std::future<StatsReport> load_report_async(std::string db_path, int period_days, Date today);
