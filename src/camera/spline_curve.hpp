/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <vector>

namespace pss::camera {

    /**
     * @brief Closed centripetal Catmull-Rom curve through a fixed set of control points
     *
     * Raw parameter u in [0,1) maps linearly onto segments. arcLengthToRaw()
     * converts a length fraction into u so samples advance at constant speed.
     */
    class ClosedSpline {
    public:
        ClosedSpline() = default;
        explicit ClosedSpline(std::vector<glm::vec3> points);

        [[nodiscard]] glm::vec3 evaluateRaw(float u) const;
        [[nodiscard]] float arcLengthToRaw(float fraction) const;

        [[nodiscard]] float length() const { return lengths_.empty() ? 0.0f : lengths_.back(); }
        [[nodiscard]] const std::vector<glm::vec3>& points() const { return points_; }
        [[nodiscard]] bool empty() const { return points_.empty(); }

    private:
        void buildArcLengthTable();

        std::vector<glm::vec3> points_;
        std::vector<float> lengths_; // cumulative, lengths_[0] == 0
    };

} // namespace pss::camera
