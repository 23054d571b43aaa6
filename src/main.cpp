/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/argument_parser.hpp"
#include "app/simulation.hpp"
#include "config/scene_settings.hpp"
#include "core/logger.hpp"

#include <print>

int main(int argc, char* argv[]) {
    auto options_result = pss::app::args::parse_args(argc, argv);
    if (!options_result) {
        std::println(stderr, "Error: {}\n\n{}", options_result.error(), pss::app::args::usage(argv[0]));
        return -1;
    }
    const auto options = std::move(*options_result);
    if (options.help) {
        std::println("{}", pss::app::args::usage(argv[0]));
        return 0;
    }

    // Console only until the settings file names a log file
    pss::app::args::init_logging(options, pss::core::LogLevel::Info, "");

    auto settings = pss::config::load_scene_settings(options.config_path);
    if (!settings) {
        LOG_ERROR("{}", settings.error());
        std::println(stderr, "Error: {}", settings.error());
        return -1;
    }
    if (!options.log_level || !settings->logging.file.empty()) {
        pss::app::args::init_logging(options, settings->logging.level, settings->logging.file);
    }

    LOG_INFO("========================================");
    LOG_INFO("PhotoSphere Studio simulator");
    LOG_INFO("========================================");

    auto photos = pss::app::load_photos(options.photos_path);
    if (!photos) {
        LOG_ERROR("{}", photos.error());
        std::println(stderr, "Error: {}", photos.error());
        return -1;
    }

    std::vector<pss::app::ScriptAction> script;
    if (options.input_script_path) {
        auto loaded = pss::app::load_input_script(*options.input_script_path);
        if (!loaded) {
            LOG_ERROR("{}", loaded.error());
            std::println(stderr, "Error: {}", loaded.error());
            return -1;
        }
        script = std::move(*loaded);
    }

    pss::app::Simulation simulation(std::move(*settings), std::move(*photos), std::move(script));
    if (auto result = simulation.run(options.frames, options.dt); !result) {
        LOG_ERROR("Simulation failed: {}", result.error());
        std::println(stderr, "Error: {}", result.error());
        return -1;
    }

    if (options.output_path) {
        if (auto written = pss::app::write_json(simulation.toJson(), *options.output_path); !written) {
            LOG_ERROR("{}", written.error());
            std::println(stderr, "Error: {}", written.error());
            return -1;
        }
        LOG_INFO("Wrote frame log to {}", options.output_path->string());
    }

    pss::core::Logger::get().flush();
    return 0;
}
