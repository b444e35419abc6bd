#pragma once
#include <optional>
#include <string>

/*
-------------------------------------------------------------------------------
 config.hpp - Startup settings (defaults, config file, command line)
-------------------------------------------------------------------------------
Later sources override earlier ones:
  1. built-in defaults (default_config)
  2. config file (default_config_path or --config <file>)
  3. command line flags
-------------------------------------------------------------------------------
*/

struct AppConfig {
    std::optional<std::string> db_path;      // --db
    std::optional<std::string> backup_dir;   // --backup-dir
    std::optional<double> height_cm;         // --height, needed for BMI
    std::optional<int> almost_there_sets;    // remaining-sets threshold for notifications
};

// Result of parsing argv.
struct CliOptions {
    AppConfig overrides;
    std::optional<std::string> config_path;  // --config
    bool help = false;                       // -h / --help
};

/// gym_tracker.db, backup/, no height, threshold 1.
AppConfig default_config();

// Returns $XDG_CONFIG_HOME/gymtracker/gymtracker.conf or
// ~/.config/gymtracker/gymtracker.conf
std::string default_config_path();

// Load config file if it exists. Simple INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
// Unknown keys and unparsable values are reported on std::cerr and skipped.
AppConfig load_config_file(const std::string& path);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

/// Every engaged field of `over` replaces the one in `base`.
AppConfig merge_config(const AppConfig& base, const AppConfig& over);

/// Throws std::runtime_error on an unknown flag, a missing value or a bad number.
CliOptions parse_args(int argc, const char* const* argv);

std::string usage_text(const std::string& prog);
