/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera/camera_path_builder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <format>

namespace pss::camera {

    namespace {
        struct TypeName {
            CinematicType type;
            std::string_view name;
        };

        constexpr TypeName TYPE_NAMES[] = {
            {CinematicType::NONE, "none"},
            {CinematicType::SHOWCASE, "showcase"},
            {CinematicType::GALLERY_WALK, "gallery_walk"},
            {CinematicType::SPIRAL_TOUR, "spiral_tour"},
            {CinematicType::WAVE_FOLLOW, "wave_follow"},
            {CinematicType::GRID_SWEEP, "grid_sweep"},
            {CinematicType::PHOTO_FOCUS, "photo_focus"},
        };
    } // namespace

    std::string_view to_string(const CinematicType type) {
        for (const auto& [t, name] : TYPE_NAMES) {
            if (t == type) return name;
        }
        return "none";
    }

    std::optional<CinematicType> parse_cinematic_type(const std::string_view name) {
        for (const auto& [t, n] : TYPE_NAMES) {
            if (n == name) return t;
        }
        return std::nullopt;
    }

    PathOptions CameraPathBuilder::optionsFor(const CinematicType type, const CameraPathSettings& settings) {
        PathOptions options;
        if (type == CinematicType::SHOWCASE || type == CinematicType::GRID_SWEEP) {
            options.look_mode = LookMode::TRAVEL_DIRECTION;
            options.look_ahead = std::max(settings.focus_distance, settings.photo_size);
        }
        return options;
    }

    std::expected<CameraPath, std::string> CameraPathBuilder::build(const CinematicType type,
                                                                    const layout::PatternState& state,
                                                                    const CameraPathSettings& settings) {
        if (type == CinematicType::NONE) {
            return std::unexpected(std::string("Animation type 'none' has no camera path"));
        }

        const auto waypoints = generate_waypoints(type, state.positions, settings);
        auto path = build_path(waypoints, optionsFor(type, settings));
        if (!path) {
            return std::unexpected(std::format("{} path for {} slots: {}", to_string(type), state.size(), path.error()));
        }
        LOG_DEBUG("Built {} path over {} slots ({} waypoints, length {:.1f})",
                  to_string(type), state.size(), path->waypointCount(), path->length());
        return path;
    }

} // namespace pss::camera
