/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/argument_parser.hpp"
#include <args.hxx>
#include <format>
#include <sstream>
#include <string_view>

namespace pss::app::args {

    namespace {
        constexpr int MAX_FRAMES = 1'000'000;
        constexpr float MAX_DT = 1.0f;

        // The flag set shared by parsing and usage text
        struct SimulatorFlags {
            explicit SimulatorFlags(const std::string_view program)
                : parser("PhotoSphere Studio headless simulator",
                         "Drives the scene runtime from JSON inputs and records camera poses per frame.") {
                parser.Prog(std::string(program));
            }

            ::args::ArgumentParser parser;
            ::args::HelpFlag help{parser, "help", "Show this message", {'h', "help"}};

            ::args::Group required{parser, "Required:", ::args::Group::Validators::DontCare};
            ::args::ValueFlag<std::string> config{required, "settings.json", "Scene settings file",
                                                  {"config"}, ::args::Options::Required};
            ::args::ValueFlag<std::string> photos{required, "photos.json", "Photo list",
                                                  {"photos"}, ::args::Options::Required};

            ::args::Group optional{parser, "Options:", ::args::Group::Validators::DontCare};
            ::args::ValueFlag<int> frames{optional, "N", std::format("Frames to simulate (default {})", DEFAULT_FRAMES),
                                          {"frames"}, DEFAULT_FRAMES};
            ::args::ValueFlag<float> dt{optional, "seconds", std::format("Frame delta (default {:.4f})", DEFAULT_DT),
                                        {"dt"}, DEFAULT_DT};
            ::args::ValueFlag<std::string> input_script{optional, "json",
                                                        "Timed input events and settings changes",
                                                        {"input-script"}};
            ::args::ValueFlag<std::string> output{optional, "json", "Write per-frame camera and layout summary",
                                                  {"output"}};
            ::args::ValueFlag<std::string> log_level{optional, "level", "trace|debug|info|perf|warn|error",
                                                     {"log-level"}};
        };
    } // namespace

    std::string usage(const std::string_view program) {
        SimulatorFlags flags(program);
        std::ostringstream out;
        out << flags.parser;
        return out.str();
    }

    std::expected<SimulationOptions, std::string> parse_args(const int argc, const char* const argv[]) {
        SimulatorFlags flags(argc > 0 ? argv[0] : "pss_sim");
        SimulationOptions options;

        try {
            flags.parser.ParseCLI(argc, argv);
        } catch (const ::args::Help&) {
            options.help = true;
            return options;
        } catch (const ::args::Error& e) {
            return std::unexpected(std::string(e.what()));
        }

        options.config_path = ::args::get(flags.config);
        options.photos_path = ::args::get(flags.photos);
        if (flags.input_script) {
            options.input_script_path = std::filesystem::path(::args::get(flags.input_script));
        }
        if (flags.output) {
            options.output_path = std::filesystem::path(::args::get(flags.output));
        }

        options.frames = ::args::get(flags.frames);
        if (options.frames < 1 || options.frames > MAX_FRAMES) {
            return std::unexpected(std::format("--frames must be in [1, {}]", MAX_FRAMES));
        }

        options.dt = ::args::get(flags.dt);
        if (!(options.dt > 0.0f) || options.dt > MAX_DT) {
            return std::unexpected(std::format("--dt must be in (0, {}]", MAX_DT));
        }

        if (flags.log_level) {
            const auto& name = ::args::get(flags.log_level);
            const auto level = core::parse_log_level(name);
            if (!level) {
                return std::unexpected(std::format("Unknown log level '{}'", name));
            }
            options.log_level = level;
        }
        return options;
    }

    void init_logging(const SimulationOptions& options, const core::LogLevel settings_level,
                      const std::string& log_file) {
        core::Logger::get().init(options.log_level.value_or(settings_level), log_file);
    }

} // namespace pss::app::args
