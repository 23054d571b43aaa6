/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/waypoint_generator.hpp"
#include "core/logger.hpp"
#include "interaction/auto_rotate_camera.hpp"
#include "interaction/cinematic_controller.hpp"
#include "layout/layout_engine.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace pss::config {

    enum class GridAspectPreset : uint8_t {
        SQUARE,    // 1:1
        STANDARD,  // 4:3
        WIDE,      // 16:9
        ULTRAWIDE, // 21:9
        CUSTOM
    };

    [[nodiscard]] std::string_view to_string(GridAspectPreset preset);
    [[nodiscard]] std::optional<GridAspectPreset> parse_grid_aspect_preset(std::string_view name);
    [[nodiscard]] float resolve_grid_aspect(GridAspectPreset preset, float custom_ratio);

    struct LayoutSection {
        layout::PatternKind pattern = layout::PatternKind::GRID;
        int photo_count = 50;
        float photo_size = layout::DEFAULT_PHOTO_SIZE;
        float floor_height = layout::DEFAULT_FLOOR_HEIGHT;
        float animation_speed = 1.0f;
        bool animation_enabled = true;
        bool rotation_enabled = false;
    };

    struct GridSection {
        float spacing = 0.0f;
        GridAspectPreset aspect_preset = GridAspectPreset::WIDE;
        float custom_aspect_ratio = 16.0f / 9.0f;
        float center_height = 0.0f;
    };

    struct CameraAnimationSection {
        bool enabled = false;
        camera::CinematicType type = camera::CinematicType::NONE;
        float speed = 1.0f;
        float focus_distance = camera::DEFAULT_FOCUS_DISTANCE;
        float pause_time = interaction::DEFAULT_PAUSE_TIME;
        float blend_duration = interaction::DEFAULT_BLEND_DURATION;
        float transition_duration = interaction::DEFAULT_TRANSITION_DURATION;
        interaction::InteractionSensitivity sensitivity = interaction::InteractionSensitivity::MEDIUM;
        std::optional<float> base_height;
        std::optional<float> base_distance;
        std::optional<float> height_variation;
        std::optional<float> distance_variation;
    };

    struct LoggingSection {
        core::LogLevel level = core::LogLevel::Info;
        std::string file;
    };

    struct SceneSettings {
        LayoutSection layout;
        GridSection grid;
        layout::WaveParams wave;
        layout::SpiralParams spiral;
        CameraAnimationSection camera_animation;
        interaction::AutoRotateSettings auto_rotate;
        LoggingSection logging;

        [[nodiscard]] layout::LayoutConfig toLayoutConfig() const;
        [[nodiscard]] interaction::CinematicSettings toCinematicSettings() const;
        [[nodiscard]] camera::CameraPathSettings toCameraPathSettings() const;
    };

    // Missing keys keep their defaults; out-of-range values are clamped with a warning.
    // Wrong JSON types fail.
    [[nodiscard]] std::expected<SceneSettings, std::string> parse_scene_settings(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json scene_settings_to_json(const SceneSettings& settings);

    [[nodiscard]] std::expected<SceneSettings, std::string> load_scene_settings(const std::filesystem::path& path);
    [[nodiscard]] std::expected<void, std::string> save_scene_settings(const SceneSettings& settings,
                                                                       const std::filesystem::path& path);

} // namespace pss::config
