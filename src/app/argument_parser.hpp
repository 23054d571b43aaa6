/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace pss::app::args {

    inline constexpr int DEFAULT_FRAMES = 600;
    inline constexpr float DEFAULT_DT = 1.0f / 60.0f;

    struct SimulationOptions {
        std::filesystem::path config_path;
        std::filesystem::path photos_path;
        std::optional<std::filesystem::path> input_script_path;
        std::optional<std::filesystem::path> output_path;
        int frames = DEFAULT_FRAMES;
        float dt = DEFAULT_DT;
        std::optional<core::LogLevel> log_level;
        bool help = false;
    };

    [[nodiscard]] std::string usage(std::string_view program);

    // Does not touch the logger; see init_logging()
    [[nodiscard]] std::expected<SimulationOptions, std::string> parse_args(int argc, const char* const argv[]);

    // Command-line level wins over the settings file level
    void init_logging(const SimulationOptions& options, core::LogLevel settings_level, const std::string& log_file);

} // namespace pss::app::args
