/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera/interpolation.hpp"
#include <algorithm>
#include <cmath>

namespace pss::camera {

    namespace {
        constexpr float MIN_KNOT_INTERVAL = 1e-4f;

        // Cubic Hermite with tangents m1, m2 on a unit interval
        [[nodiscard]] glm::vec3 hermite(const glm::vec3& p1, const glm::vec3& p2,
                                        const glm::vec3& m1, const glm::vec3& m2, const float t) {
            const float t2 = t * t;
            const float t3 = t2 * t;
            const glm::vec3 c2 = -3.0f * p1 + 3.0f * p2 - 2.0f * m1 - m2;
            const glm::vec3 c3 = 2.0f * p1 - 2.0f * p2 + m1 + m2;
            return p1 + m1 * t + c2 * t2 + c3 * t3;
        }
    } // namespace

    float blendEasing(const float t) {
        const float clamped = std::clamp(t, 0.0f, 1.0f);
        if (clamped < 0.5f) {
            return 4.0f * clamped * clamped * clamped;
        }
        const float u = -2.0f * clamped + 2.0f;
        return 1.0f - 0.5f * u * u * u;
    }

    glm::vec3 centripetalCatmullRom(
        const glm::vec3& p0, const glm::vec3& p1,
        const glm::vec3& p2, const glm::vec3& p3,
        const float t) {
        // Knot intervals |pi+1 - pi|^0.5
        float dt0 = std::sqrt(glm::length(p1 - p0));
        float dt1 = std::sqrt(glm::length(p2 - p1));
        float dt2 = std::sqrt(glm::length(p3 - p2));

        // Coincident points would divide by zero
        if (dt1 < MIN_KNOT_INTERVAL) dt1 = 1.0f;
        if (dt0 < MIN_KNOT_INTERVAL) dt0 = dt1;
        if (dt2 < MIN_KNOT_INTERVAL) dt2 = dt1;

        const glm::vec3 m1 = ((p1 - p0) / dt0 - (p2 - p0) / (dt0 + dt1) + (p2 - p1) / dt1) * dt1;
        const glm::vec3 m2 = ((p2 - p1) / dt1 - (p3 - p1) / (dt1 + dt2) + (p3 - p2) / dt2) * dt1;
        return hermite(p1, p2, m1, m2, t);
    }

    CameraPose blendPoses(const CameraPose& from, const CameraPose& to, const float factor) {
        const float f = std::clamp(factor, 0.0f, 1.0f);
        return {glm::mix(from.position, to.position, f), glm::mix(from.look_at, to.look_at, f)};
    }

} // namespace pss::camera
