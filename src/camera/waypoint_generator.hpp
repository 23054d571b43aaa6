/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_defaults.hpp"
#include "camera/camera_types.hpp"
#include <optional>
#include <span>
#include <vector>

namespace pss::camera {

    struct CameraPathSettings {
        layout::PatternKind pattern = layout::PatternKind::GRID;
        float photo_size = layout::DEFAULT_PHOTO_SIZE;
        float floor_height = layout::DEFAULT_FLOOR_HEIGHT;
        float focus_distance = DEFAULT_FOCUS_DISTANCE;
        float wave_frequency = 0.1f;

        // Unset = per-pattern default from camera_defaults.hpp
        std::optional<float> base_height;
        std::optional<float> base_distance;
        std::optional<float> height_variation;
        std::optional<float> distance_variation;

        bool operator==(const CameraPathSettings&) const = default;
    };

    // Layout measurements plus resolved framing values
    struct SceneFrame {
        glm::vec3 centroid{0.0f};
        glm::vec3 min{0.0f};
        glm::vec3 max{0.0f};
        float radius = 0.0f; // furthest horizontal distance from centroid
        bool is_wall = false;
        float base_height = 0.0f;
        float base_distance = 0.0f;
        float height_variation = 0.0f;
        float distance_variation = 0.0f;
        float min_camera_height = 0.0f;
    };

    [[nodiscard]] SceneFrame resolve_scene_frame(std::span<const glm::vec3> positions,
                                                 const CameraPathSettings& settings);

    // Empty for NONE or an empty layout. Positions are clamped to the camera floor.
    [[nodiscard]] std::vector<Waypoint> generate_waypoints(CinematicType type,
                                                           std::span<const glm::vec3> positions,
                                                           const CameraPathSettings& settings);

} // namespace pss::camera
