#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "db.hpp"

// Unique path under the system temp directory; nothing is created.
inline std::filesystem::path unique_temp_path(const std::string& stem) {
    static std::atomic<int> counter{ 0 };
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
        (stem + "_" + std::to_string(ticks) + "_" + std::to_string(counter++));
}

// Fresh, initialised database file per test, removed afterwards.
class TempDbTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = unique_temp_path("gymtracker_test").string() + ".db";
        ASSERT_TRUE(db_open(db_, path_));
        ASSERT_TRUE(db_init_and_seed(db_));
    }

    void TearDown() override {
        db_close(db_);
        db_ = nullptr;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::int64_t exercise_id(const std::string& name, const std::string& variation) {
        std::vector<Exercise> all;
        if (!db_list_exercises(db_, all)) return 0;
        for (const auto& e : all)
            if (e.name == name && e.variation == variation) return e.id;
        return 0;
    }

    sqlite3* db_ = nullptr;
    std::string path_;
};
