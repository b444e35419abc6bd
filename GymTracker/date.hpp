#pragma once
#include <string>
#include <cstdint>

/*
-------------------------------------------------------------------------------
 date.hpp - Calendar dates stored as "YYYY-MM-DD" text
-------------------------------------------------------------------------------
SQLite keeps workout and body-stat dates as ISO text, which sorts correctly as
a string. Arithmetic (streaks, periods, weekdays) converts to a day number
counted from 1970-01-01 so no time zone or DST handling is involved.
-------------------------------------------------------------------------------
*/

struct Date {
    int y = 0, m = 0, d = 0;
};

/// Strict YYYY-MM-DD, rejects impossible days (e.g. 2023-02-29).
bool parse_date_yyyy_mm_dd(const std::string& s, Date& out);

/// Strict YYYY-MM (goal target months).
bool parse_month_yyyy_mm(const std::string& s, int& year, int& month);

std::string format_date(const Date& dt);

// "YYYY-MM" of a date.
std::string format_month(const Date& dt);

int days_in_month(int year, int month);

/// Days since 1970-01-01 (negative before).
std::int64_t to_day_number(const Date& dt);
Date from_day_number(std::int64_t days);

Date add_days(const Date& dt, int delta);

/// b - a in days.
int days_between(const Date& a, const Date& b);

/// 0 = Monday ... 6 = Sunday
int weekday_monday_first(const Date& dt);

/// Local calendar date of the machine clock.
Date today_local();

bool operator<(const Date& a, const Date& b);
bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
