/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_types.hpp"

namespace pss::camera {

    // Cubic ease-in-out shared by every camera blend. Input is clamped to [0,1].
    [[nodiscard]] float blendEasing(float t);

    // Centripetal (alpha = 0.5) Catmull-Rom between p1 and p2
    [[nodiscard]] glm::vec3 centripetalCatmullRom(
        const glm::vec3& p0, const glm::vec3& p1,
        const glm::vec3& p2, const glm::vec3& p3,
        float t);

    [[nodiscard]] CameraPose blendPoses(const CameraPose& from, const CameraPose& to, float factor);

} // namespace pss::camera
