/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pss::camera {

    enum class CinematicType : uint8_t {
        NONE,
        SHOWCASE,
        GALLERY_WALK,
        SPIRAL_TOUR,
        WAVE_FOLLOW,
        GRID_SWEEP,
        PHOTO_FOCUS
    };

    inline constexpr CinematicType ALL_CINEMATIC_TYPES[] = {
        CinematicType::SHOWCASE,
        CinematicType::GALLERY_WALK,
        CinematicType::SPIRAL_TOUR,
        CinematicType::WAVE_FOLLOW,
        CinematicType::GRID_SWEEP,
        CinematicType::PHOTO_FOCUS};

    [[nodiscard]] std::string_view to_string(CinematicType type);
    [[nodiscard]] std::optional<CinematicType> parse_cinematic_type(std::string_view name);

    struct Waypoint {
        glm::vec3 position{0.0f};
        glm::vec3 look_at{0.0f};
    };

    struct CameraPose {
        glm::vec3 position{0.0f};
        glm::vec3 look_at{0.0f};
    };

} // namespace pss::camera
