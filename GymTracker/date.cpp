#include "date.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

static bool all_digits(const std::string& s, size_t from, size_t len) {
    for (size_t i = from; i < from + len; ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[12] = { 31,28,31,30,31,30,31,31,30,31,30,31 };
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap(year)) return 29;
    return kDays[month - 1];
}

bool parse_date_yyyy_mm_dd(const std::string& s, Date& out) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    if (!all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2)) return false;
    Date dt;
    dt.y = std::stoi(s.substr(0, 4));
    dt.m = std::stoi(s.substr(5, 2));
    dt.d = std::stoi(s.substr(8, 2));
    if (dt.m < 1 || dt.m > 12) return false;
    if (dt.d < 1 || dt.d > days_in_month(dt.y, dt.m)) return false;
    out = dt;
    return true;
}

bool parse_month_yyyy_mm(const std::string& s, int& year, int& month) {
    if (s.size() != 7 || s[4] != '-') return false;
    if (!all_digits(s, 0, 4) || !all_digits(s, 5, 2)) return false;
    int y = std::stoi(s.substr(0, 4));
    int m = std::stoi(s.substr(5, 2));
    if (m < 1 || m > 12) return false;
    year = y;
    month = m;
    return true;
}

std::string format_date(const Date& dt) {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << dt.y << "-"
        << std::setw(2) << std::setfill('0') << dt.m << "-"
        << std::setw(2) << std::setfill('0') << dt.d;
    return oss.str();
}

std::string format_month(const Date& dt) {
    return format_date(dt).substr(0, 7);
}

// Civil-from-days / days-from-civil over the proleptic Gregorian calendar.
std::int64_t to_day_number(const Date& dt) {
    std::int64_t y = dt.y - (dt.m <= 2 ? 1 : 0);
    std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    std::int64_t yoe = y - era * 400;
    std::int64_t mp = (dt.m + 9) % 12;
    std::int64_t doy = (153 * mp + 2) / 5 + dt.d - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date from_day_number(std::int64_t days) {
    days += 719468;
    std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    std::int64_t doe = days - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    Date out;
    out.d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    out.m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    out.y = static_cast<int>(yoe + era * 400 + (out.m <= 2 ? 1 : 0));
    return out;
}

Date add_days(const Date& dt, int delta) {
    return from_day_number(to_day_number(dt) + delta);
}

int days_between(const Date& a, const Date& b) {
    return static_cast<int>(to_day_number(b) - to_day_number(a));
}

int weekday_monday_first(const Date& dt) {
    // 1970-01-01 was a Thursday (3 when Monday is 0).
    std::int64_t w = (to_day_number(dt) + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w);
}

Date today_local() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return Date{ local.tm_year + 1900, local.tm_mon + 1, local.tm_mday };
}

bool operator<(const Date& a, const Date& b) {
    if (a.y != b.y) return a.y < b.y;
    if (a.m != b.m) return a.m < b.m;
    return a.d < b.d;
}

bool operator==(const Date& a, const Date& b) {
    return a.y == b.y && a.m == b.m && a.d == b.d;
}

bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}
