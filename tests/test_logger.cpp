/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/simulation.hpp"
#include "core/logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace pss;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Back to the suite-wide console setup before the file goes away
        core::Logger::get().init(core::LogLevel::Warn);
        std::error_code ec;
        std::filesystem::remove(log_path, ec);
    }

    void startFileLog(const core::LogLevel level) {
        core::Logger::get().init(level, log_path.string());
    }

    std::string readLog() {
        core::Logger::get().flush();
        std::ifstream file(log_path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path log_path = std::filesystem::temp_directory_path() /
                                     ("pss_logger_" + std::string(::testing::UnitTest::GetInstance()
                                                                      ->current_test_info()
                                                                      ->name()) +
                                      ".log");
};

TEST_F(LoggerTest, PerfLevelShowsOnlyPerfLines) {
    startFileLog(core::LogLevel::Performance);
    LOG_PERF("frame budget {}ms", 16);
    LOG_INFO("regular info");
    LOG_WARN("regular warning");

    const auto text = readLog();
    EXPECT_NE(text.find("[PERF] frame budget 16ms"), std::string::npos);
    EXPECT_EQ(text.find("regular info"), std::string::npos);
    EXPECT_EQ(text.find("regular warning"), std::string::npos);
}

TEST_F(LoggerTest, OtherLevelsHidePerfLines) {
    startFileLog(core::LogLevel::Info);
    LOG_PERF("hidden timing");
    LOG_DEBUG("hidden debug");
    LOG_INFO("visible info");

    const auto text = readLog();
    EXPECT_EQ(text.find("hidden timing"), std::string::npos);
    EXPECT_EQ(text.find("hidden debug"), std::string::npos);
    EXPECT_NE(text.find("visible info"), std::string::npos);
}

TEST_F(LoggerTest, SimulationReportsTimingsAtPerfLevel) {
    startFileLog(core::LogLevel::Performance);

    config::SceneSettings settings;
    settings.layout.photo_count = 20;
    settings.camera_animation.enabled = true;
    settings.camera_animation.type = camera::CinematicType::SHOWCASE;
    app::Simulation simulation(settings, {});
    ASSERT_TRUE(simulation.run(4, 0.125f).has_value());

    const auto text = readLog();
    EXPECT_NE(text.find("[PERF] Runtime tick:"), std::string::npos);
    EXPECT_NE(text.find("average over 4 frames"), std::string::npos);
    EXPECT_NE(text.find("[PERF] Camera path build took"), std::string::npos);
    EXPECT_NE(text.find("[PERF] Simulation took"), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(core::parse_log_level("perf"), core::LogLevel::Performance);
    EXPECT_EQ(core::parse_log_level("warn"), core::LogLevel::Warn);
    EXPECT_FALSE(core::parse_log_level("verbose").has_value());
}
