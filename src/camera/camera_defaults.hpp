/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "layout/pattern_types.hpp"

namespace pss::camera {

    /**
     * @brief Framing defaults used when the user leaves a camera setting unset
     *
     * All values scale with the layout so that one table serves any photo size:
     *   base_height        = content centroid y + eye_offset
     *   base_distance      = max(min_distance_photos * photo_size,
     *                            content radius * extent_factor)
     *   height_variation   = photo_size * height_variation_photos
     *   distance_variation = base_distance * distance_variation_fraction
     */
    struct CameraDefaults {
        float eye_offset;
        float min_distance_photos;
        float extent_factor;
        float height_variation_photos;
        float distance_variation_fraction;
    };

    // Wall: eye level with the middle of the wall
    inline constexpr CameraDefaults GRID_CAMERA_DEFAULTS{0.0f, 6.0f, 1.2f, 0.4f, 0.3f};
    // Field: above the hovering photos, looking across
    inline constexpr CameraDefaults WAVE_CAMERA_DEFAULTS{8.0f, 6.0f, 0.9f, 0.6f, 0.3f};
    // Funnel: tall and wide, so vertical variation is larger
    inline constexpr CameraDefaults SPIRAL_CAMERA_DEFAULTS{6.0f, 6.0f, 1.2f, 0.8f, 0.3f};
    inline constexpr CameraDefaults FLOAT_CAMERA_DEFAULTS{4.0f, 6.0f, 1.0f, 0.5f, 0.3f};

    // Camera never goes below floor + photo_size + this
    inline constexpr float CAMERA_FLOOR_CLEARANCE = 2.0f;

    inline constexpr float DEFAULT_FOCUS_DISTANCE = 10.0f;

    [[nodiscard]] constexpr const CameraDefaults& camera_defaults(const layout::PatternKind pattern) {
        switch (pattern) {
        case layout::PatternKind::GRID: return GRID_CAMERA_DEFAULTS;
        case layout::PatternKind::WAVE: return WAVE_CAMERA_DEFAULTS;
        case layout::PatternKind::SPIRAL: return SPIRAL_CAMERA_DEFAULTS;
        case layout::PatternKind::FLOAT: return FLOAT_CAMERA_DEFAULTS;
        }
        return GRID_CAMERA_DEFAULTS;
    }

} // namespace pss::camera
