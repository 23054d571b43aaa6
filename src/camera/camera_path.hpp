/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_types.hpp"
#include "camera/spline_curve.hpp"
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace pss::camera {

    // Look-at never drops further than this below the camera
    inline constexpr float MAX_LOOK_DROP = 0.5f;

    enum class LookMode : uint8_t {
        SPLINE,          // follow the look-at curve
        TRAVEL_DIRECTION // horizontal, ahead along the path
    };

    struct PathOptions {
        LookMode look_mode = LookMode::SPLINE;
        float look_ahead = 10.0f;
    };

    class CameraPath;

    // Fails on fewer than 2 waypoints or non-finite coordinates
    [[nodiscard]] std::expected<CameraPath, std::string> build_path(std::span<const Waypoint> waypoints,
                                                                    const PathOptions& options = {});

    /**
     * @brief Closed camera loop built from waypoints
     *
     * Position and look-at are separate splines with the same number of
     * control points, sampled with one arc-length parameter so they stay in
     * step. t is wrapped into [0,1), so t and t+1 give the same pose.
     */
    class CameraPath {
    public:
        [[nodiscard]] glm::vec3 getPositionAt(float t) const;
        [[nodiscard]] glm::vec3 getLookAtTarget(float t) const;
        [[nodiscard]] CameraPose sample(float t) const;

        // Debug display
        [[nodiscard]] std::vector<glm::vec3> polyline(int samples) const;

        [[nodiscard]] float length() const { return position_.length(); }
        [[nodiscard]] size_t controlPointCount() const { return position_.points().size(); }
        [[nodiscard]] size_t waypointCount() const { return waypoint_count_; }
        [[nodiscard]] const PathOptions& options() const { return options_; }

        [[nodiscard]] static float wrap(float t);

    private:
        friend std::expected<CameraPath, std::string> build_path(std::span<const Waypoint>, const PathOptions&);

        CameraPath(ClosedSpline position, ClosedSpline look_at, size_t waypoint_count, const PathOptions& options);

        [[nodiscard]] glm::vec3 travelLookAt(float raw, const glm::vec3& position) const;

        ClosedSpline position_;
        ClosedSpline look_at_;
        size_t waypoint_count_ = 0;
        PathOptions options_;
    };

} // namespace pss::camera
