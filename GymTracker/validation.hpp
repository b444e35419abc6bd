#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <cmath>
#include <cctype>   // for std::isspace
#include "date.hpp"
#include "models.hpp"   // kExerciseCategories

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - Validators: dates, goal months, exercise names, short text, and the
    training/body metrics (weight, reps, body fat, muscle mass, height).
  - Prompt helpers for interactive console:
      * prompt_until_valid_or_back    -> text with Back/Exit
      * prompt_number_or_back         -> numeric with range and Back/Exit
      * prompt_int_or_back            -> whole number with range and Back/Exit
      * prompt_optional_number        -> numeric, Enter = leave empty
      * prompt_edit_string            -> edit in-place with default value
      * confirm_or_back               -> yes/no confirmation (Back on no)

Conventions:
  - Special inputs:
      Back: "0", "b", "B"
      Exit: "x", "X", "q", "Q"
  - End of input (Ctrl-D / closed stdin) is treated as Exit.
  - All characters are plain ASCII (no Unicode dashes).
-------------------------------------------------------------------------------
*/

// Limits for a logged set.
constexpr double kWeightMax = 500.0;
constexpr double kWeightStep = 0.5;
constexpr int kRepsMin = 1;
constexpr int kRepsMax = 50;

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// YYYY-MM-DD naming a real calendar day
inline bool is_valid_date(const std::string& x) {
    Date d;
    return parse_date_yyyy_mm_dd(x, d);
}

// YYYY-MM, month 01..12
inline bool is_valid_month(const std::string& x) {
    int y = 0, m = 0;
    return parse_month_yyyy_mm(x, y, m);
}

// non-empty, max 60
inline bool is_non_empty_short(const std::string& x) {
    return !trim(x).empty() && x.size() <= 60;
}

// letters, digits, spaces, hyphen, apostrophe; 2..40 chars
inline bool is_valid_exercise_name(const std::string& x) {
    if (x.size() < 2 || x.size() > 40) return false;
    static const std::regex re("^[A-Za-z0-9 '\\-]+$");
    return std::regex_match(x, re);
}

inline bool is_valid_category(const std::string& x) {
    return std::find(kExerciseCategories.begin(), kExerciseCategories.end(), x) != kExerciseCategories.end();
}

/// Weight of a set: > 0, at most 500 kg, in 0.5 kg steps.
inline bool validate_weight(double w, std::string& error) {
    if (!(w > 0.0)) { error = "Weight must be greater than 0 kg."; return false; }
    if (w > kWeightMax) { error = "Weight must be at most 500 kg."; return false; }
    if (std::round(w / kWeightStep) != w / kWeightStep) { error = "Weight must be in 0.5 kg steps."; return false; }
    return true;
}

/// Reps of a set: whole number 1..50.
inline bool validate_reps(int reps, std::string& error) {
    if (reps < kRepsMin) { error = "Reps must be at least 1."; return false; }
    if (reps > kRepsMax) { error = "Reps must be at most 50."; return false; }
    return true;
}

inline bool validate_set(double w, int reps, std::string& error) {
    return validate_weight(w, error) && validate_reps(reps, error);
}

// Body metrics. Each one is optional at the prompt; these check a given value.
inline bool validate_body_weight(double kg, std::string& error) {
    if (kg < 20.0 || kg > 300.0) { error = "Body weight must be between 20 and 300 kg."; return false; }
    return true;
}

inline bool validate_body_fat(double pct, std::string& error) {
    if (pct < 1.0 || pct > 70.0) { error = "Body fat must be between 1 and 70 %."; return false; }
    return true;
}

inline bool validate_muscle_mass(double kg, std::string& error) {
    if (kg < 5.0 || kg > 150.0) { error = "Muscle mass must be between 5 and 150 kg."; return false; }
    return true;
}

inline bool validate_bmi(double bmi, std::string& error) {
    if (bmi < 10.0 || bmi > 60.0) { error = "BMI must be between 10 and 60."; return false; }
    return true;
}

inline bool validate_height(double cm, std::string& error) {
    if (cm < 100.0 || cm > 250.0) { error = "Height must be between 100 and 250 cm."; return false; }
    return true;
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

// Read one trimmed line. False at end of input.
inline bool read_line(std::string& v) {
    if (!std::getline(std::cin, v)) return false;
    v = trim(v);
    return true;
}

inline bool is_back(const std::string& v) { return v == "0" || v == "b" || v == "B"; }
inline bool is_exit(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

// String prompt that accepts Back/Exit keywords.
// Back: "0", "b", "B"   Exit: "x","X","q","Q"
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    for (;;) {
        std::string v;
        std::cout << label << " (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        if (v.empty()) continue;
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Parse a whole decimal number; rejects trailing junk like "12kg".
inline bool parse_double(const std::string& v, double& out) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) return false;
        out = d;
        return true;
    }
    catch (const std::logic_error&) {   // invalid_argument, out_of_range
        return false;
    }
}

inline bool parse_int(const std::string& v, int& out) {
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size()) return false;
        out = n;
        return true;
    }
    catch (const std::logic_error&) {
        return false;
    }
}

// Number prompt with range + Back/Exit. "0" means Back, so lo must be > 0
// for a zero never to be a valid answer.
inline InputCtl prompt_number_or_back(
    const std::string& label,
    double& out,
    double lo, double hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        if (v.empty()) continue;
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        double d = 0.0;
        if (!parse_double(v, d)) { std::cout << "  -> Please enter a number.\n"; continue; }
        if (d < lo || d > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
        out = d; return InputCtl::Ok;
    }
}

// Whole-number variant of prompt_number_or_back.
inline InputCtl prompt_int_or_back(
    const std::string& label,
    int& out,
    int lo, int hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        if (v.empty()) continue;
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        int n = 0;
        if (!parse_int(v, n)) { std::cout << "  -> Please enter a whole number.\n"; continue; }
        if (n < lo || n > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
        out = n; return InputCtl::Ok;
    }
}

// Optional metric: Enter leaves it empty, otherwise the value must pass
// `check` (one of the validate_* functions above).
inline InputCtl prompt_optional_number(
    const std::string& label,
    std::optional<double>& out,
    bool (*check)(double, std::string&))
{
    for (;;) {
        std::string v;
        std::cout << label << " (Enter=skip, 0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        if (v.empty()) { out.reset(); return InputCtl::Ok; }
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        double d = 0.0;
        if (!parse_double(v, d)) { std::cout << "  -> Please enter a number.\n"; continue; }
        std::string err;
        if (!check(d, err)) { std::cout << "  -> " << err << "\n"; continue; }
        out = d; return InputCtl::Ok;
    }
}

// Edit-friendly prompt: show current value, Enter = keep,
// 0/b = Back, x/q = Exit, otherwise validate new value.
inline InputCtl prompt_edit_string(
    const std::string& label,
    const std::string& current,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    for (;;) {
        std::cout << label << " [" << current << "] (Enter=keep, 0=Back, x=Exit): ";
        std::string v;
        if (!read_line(v)) return InputCtl::Exit;
        if (v.empty()) { out = current; return InputCtl::Ok; }
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Yes/No confirmation. Empty or "n" is treated as cancel (Back).
inline InputCtl confirm_or_back(const std::string& msg) {
    for (;;) {
        std::string v;
        std::cout << msg << " [y/N] (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back; // treat as cancel
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (v == "y" || v == "Y") return InputCtl::Ok;
        std::cout << "  -> Please enter y or n.\n";
    }
}
