#include "config.hpp"
#include "test_util.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

// Writes `text` to a fresh temp file and removes it on destruction.
class ConfigFile {
public:
    explicit ConfigFile(const std::string& text)
        : path_(unique_temp_path("gymtracker_conf").string() + ".conf") {
        std::ofstream out(path_);
        out << text;
    }
    ~ConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Restores an environment variable after the test changes it.
class EnvGuard {
public:
    explicit EnvGuard(const char* name) : name_(name) {
        const char* v = std::getenv(name);
        if (v) saved_ = v;
    }
    ~EnvGuard() {
        if (saved_) setenv(name_, saved_->c_str(), 1);
        else unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> saved_;
};

} // namespace

TEST(ConfigTest, Defaults) {
    AppConfig cfg = default_config();
    ASSERT_EQ(cfg.db_path, "gym_tracker.db");
    ASSERT_EQ(cfg.backup_dir, "backup");
    ASSERT_FALSE(cfg.height_cm.has_value());
    ASSERT_EQ(cfg.almost_there_sets, 1);
}

TEST(ConfigTest, MissingFileIsEmpty) {
    AppConfig cfg = load_config_file(unique_temp_path("gymtracker_none").string());
    ASSERT_FALSE(cfg.db_path.has_value());
    ASSERT_FALSE(cfg.backup_dir.has_value());
    ASSERT_FALSE(cfg.height_cm.has_value());
    ASSERT_FALSE(cfg.almost_there_sets.has_value());
}

TEST(ConfigTest, ParsesKeysCommentsAndQuotes) {
    ConfigFile file(
        "# gym tracker\n"
        "db_path = \"/data/gym.db\"\n"
        "backup_dir = '/data/backups'   ; trailing comment\n"
        "HEIGHT = 180.5\n"
        "almost_there_sets = 2\n"
        "\n");
    AppConfig cfg = load_config_file(file.path());
    ASSERT_EQ(cfg.db_path, "/data/gym.db");
    ASSERT_EQ(cfg.backup_dir, "/data/backups");
    ASSERT_EQ(cfg.height_cm, 180.5);
    ASSERT_EQ(cfg.almost_there_sets, 2);
}

TEST(ConfigTest, SkipsBadValuesAndUnknownKeys) {
    ConfigFile file(
        "height_cm = tall\n"
        "almost_there_sets = 0\n"
        "colour = blue\n"
        "no separator here\n"
        "db = other.db\n");
    AppConfig cfg = load_config_file(file.path());
    ASSERT_FALSE(cfg.height_cm.has_value());
    ASSERT_FALSE(cfg.almost_there_sets.has_value());
    ASSERT_EQ(cfg.db_path, "other.db");
}

TEST(ConfigTest, ExpandsHomeDirectory) {
    EnvGuard guard("HOME");
    setenv("HOME", "/home/lifter", 1);
    ASSERT_EQ(expand_path("~/gym.db"), "/home/lifter/gym.db");
    ASSERT_EQ(expand_path("/abs/gym.db"), "/abs/gym.db");
    ASSERT_EQ(expand_path("~user/gym.db"), "~user/gym.db");
}

TEST(ConfigTest, DefaultPathHonoursXdg) {
    EnvGuard xdg("XDG_CONFIG_HOME");
    EnvGuard home("HOME");
    setenv("XDG_CONFIG_HOME", "/xdg", 1);
    ASSERT_EQ(default_config_path(), "/xdg/gymtracker/gymtracker.conf");
    unsetenv("XDG_CONFIG_HOME");
    setenv("HOME", "/home/lifter", 1);
    ASSERT_EQ(default_config_path(), "/home/lifter/.config/gymtracker/gymtracker.conf");
}

TEST(ConfigTest, LaterLayersWin) {
    AppConfig file;
    file.db_path = "file.db";
    file.height_cm = 170.0;
    AppConfig cli;
    cli.db_path = "cli.db";

    AppConfig cfg = merge_config(merge_config(default_config(), file), cli);
    ASSERT_EQ(cfg.db_path, "cli.db");
    ASSERT_EQ(cfg.height_cm, 170.0);
    ASSERT_EQ(cfg.backup_dir, "backup");
    ASSERT_EQ(cfg.almost_there_sets, 1);
}

TEST(ParseArgsTest, ReadsFlags) {
    const char* argv[] = { "gymtracker", "--db", "x.db", "--backup-dir", "bk",
                           "--height", "175", "--config", "my.conf" };
    CliOptions opts = parse_args(9, argv);
    ASSERT_FALSE(opts.help);
    ASSERT_EQ(opts.overrides.db_path, "x.db");
    ASSERT_EQ(opts.overrides.backup_dir, "bk");
    ASSERT_EQ(opts.overrides.height_cm, 175.0);
    ASSERT_EQ(opts.config_path, "my.conf");
}

TEST(ParseArgsTest, Help) {
    const char* argv[] = { "gymtracker", "-h" };
    ASSERT_TRUE(parse_args(2, argv).help);
}

TEST(ParseArgsTest, Errors) {
    const char* missing[] = { "gymtracker", "--db" };
    ASSERT_THROW(parse_args(2, missing), std::runtime_error);
    const char* bad_height[] = { "gymtracker", "--height", "-3" };
    ASSERT_THROW(parse_args(3, bad_height), std::runtime_error);
    const char* unknown[] = { "gymtracker", "--verbose" };
    ASSERT_THROW(parse_args(2, unknown), std::runtime_error);
}

TEST(ParseArgsTest, UsageMentionsFlags) {
    std::string u = usage_text("gymtracker");
    ASSERT_NE(u.find("--db"), std::string::npos);
    ASSERT_NE(u.find("--height"), std::string::npos);
}
