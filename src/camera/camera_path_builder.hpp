/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_path.hpp"
#include "camera/waypoint_generator.hpp"
#include "layout/pattern_types.hpp"
#include <expected>
#include <string>

namespace pss::camera {

    // Turns a frame's slot positions into a closed camera loop for one animation type
    class CameraPathBuilder {
    public:
        [[nodiscard]] static std::expected<CameraPath, std::string> build(CinematicType type,
                                                                          const layout::PatternState& state,
                                                                          const CameraPathSettings& settings);

        [[nodiscard]] static PathOptions optionsFor(CinematicType type, const CameraPathSettings& settings);
    };

} // namespace pss::camera
