#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

// Whole-string numeric parses; nullopt on junk or out of range.
static std::optional<double> as_double(const string& s) {
    try {
        size_t used = 0;
        double d = std::stod(s, &used);
        if (used != s.size()) return std::nullopt;
        return d;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

static std::optional<int> as_int(const string& s) {
    try {
        size_t used = 0;
        int n = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return n;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

AppConfig default_config() {
    AppConfig cfg;
    cfg.db_path = "gym_tracker.db";
    cfg.backup_dir = "backup";
    cfg.almost_there_sets = 1;
    return cfg;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/gymtracker/gymtracker.conf";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/gymtracker/gymtracker.conf";
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        size_t sep = line.find('=');
        if (sep == string::npos) {
            std::cerr << path << ":" << lineno << ": expected key = value\n";
            continue;
        }

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;
        val = unquote(val);

        if (ieq(key, "db_path") || ieq(key, "db")) cfg.db_path = expand_path(val);
        else if (ieq(key, "backup_dir")) cfg.backup_dir = expand_path(val);
        else if (ieq(key, "height_cm") || ieq(key, "height")) {
            auto h = as_double(val);
            if (h && *h > 0.0) cfg.height_cm = h;
            else std::cerr << path << ":" << lineno << ": bad height '" << val << "'\n";
        }
        else if (ieq(key, "almost_there_sets")) {
            auto n = as_int(val);
            if (n && *n > 0) cfg.almost_there_sets = n;
            else std::cerr << path << ":" << lineno << ": bad almost_there_sets '" << val << "'\n";
        }
        else std::cerr << path << ":" << lineno << ": unknown key '" << key << "'\n";
    }
    return cfg;
}

AppConfig merge_config(const AppConfig& base, const AppConfig& over) {
    AppConfig out = base;
    if (over.db_path) out.db_path = over.db_path;
    if (over.backup_dir) out.backup_dir = over.backup_dir;
    if (over.height_cm) out.height_cm = over.height_cm;
    if (over.almost_there_sets) out.almost_there_sets = over.almost_there_sets;
    return out;
}

CliOptions parse_args(int argc, const char* const* argv) {
    CliOptions opts;
    auto need_value = [&](int& i, const string& flag) -> string {
        if (i + 1 >= argc) throw std::runtime_error("missing value for " + flag);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "-h" || a == "--help") opts.help = true;
        else if (a == "--db") opts.overrides.db_path = expand_path(need_value(i, a));
        else if (a == "--backup-dir") opts.overrides.backup_dir = expand_path(need_value(i, a));
        else if (a == "--config") opts.config_path = expand_path(need_value(i, a));
        else if (a == "--height") {
            string v = need_value(i, a);
            auto h = as_double(v);
            if (!h || *h <= 0.0) throw std::runtime_error("invalid height: " + v);
            opts.overrides.height_cm = h;
        }
        else throw std::runtime_error("unknown option: " + a);
    }
    return opts;
}

std::string usage_text(const std::string& prog) {
    std::ostringstream os;
    os << "Usage: " << prog << " [options]\n"
       << "  --db <path>          database file (default gym_tracker.db)\n"
       << "  --backup-dir <dir>   backup directory (default backup)\n"
       << "  --height <cm>        body height, enables BMI\n"
       << "  --config <file>      config file (default " << default_config_path() << ")\n"
       << "  -h, --help           show this help\n";
    return os.str();
}
