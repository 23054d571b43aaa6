/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera/camera_path.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <numbers>

namespace pss::camera {

    namespace {
        constexpr float INSERT_PARAMS[] = {0.4f, 0.7f};
        constexpr float JITTER_AMPLITUDE = 0.6f;
        constexpr float JITTER_FREQUENCY = 0.5f;
        constexpr float TRAVEL_PROBE = 1e-3f;
        constexpr float MIN_TRAVEL = 1e-4f;

        [[nodiscard]] bool isFinite(const glm::vec3& v) {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        [[nodiscard]] glm::vec3 clampLook(glm::vec3 look_at, const glm::vec3& position) {
            look_at.y = std::max(look_at.y, position.y - MAX_LOOK_DROP);
            return look_at;
        }
    } // namespace

    CameraPath::CameraPath(ClosedSpline position, ClosedSpline look_at, const size_t waypoint_count,
                           const PathOptions& options)
        : position_(std::move(position)),
          look_at_(std::move(look_at)),
          waypoint_count_(waypoint_count),
          options_(options) {}

    float CameraPath::wrap(const float t) {
        const float w = std::fmod(std::fmod(t, 1.0f) + 1.0f, 1.0f);
        // fmod(-tiny) + 1 rounds to exactly 1 in float
        return w >= 1.0f ? 0.0f : w;
    }

    glm::vec3 CameraPath::getPositionAt(const float t) const {
        return position_.evaluateRaw(position_.arcLengthToRaw(wrap(t)));
    }

    glm::vec3 CameraPath::getLookAtTarget(const float t) const {
        return sample(t).look_at;
    }

    CameraPose CameraPath::sample(const float t) const {
        const float raw = position_.arcLengthToRaw(wrap(t));
        const glm::vec3 position = position_.evaluateRaw(raw);

        if (options_.look_mode == LookMode::TRAVEL_DIRECTION) {
            return {position, travelLookAt(raw, position)};
        }
        return {position, clampLook(look_at_.evaluateRaw(raw), position)};
    }

    glm::vec3 CameraPath::travelLookAt(const float raw, const glm::vec3& position) const {
        glm::vec3 direction = position_.evaluateRaw(raw + TRAVEL_PROBE) - position_.evaluateRaw(raw - TRAVEL_PROBE);
        direction.y = 0.0f;
        if (glm::length(direction) < MIN_TRAVEL) {
            // Vertical segment: face the spline target at eye height instead
            direction = look_at_.evaluateRaw(raw) - position;
            direction.y = 0.0f;
            if (glm::length(direction) < MIN_TRAVEL) {
                direction = glm::vec3(0.0f, 0.0f, -1.0f);
            }
        }
        return position + glm::normalize(direction) * options_.look_ahead;
    }

    std::vector<glm::vec3> CameraPath::polyline(const int samples) const {
        std::vector<glm::vec3> points;
        if (samples <= 0) return points;
        points.reserve(static_cast<size_t>(samples) + 1);
        for (int i = 0; i <= samples; ++i) {
            points.push_back(getPositionAt(static_cast<float>(i) / static_cast<float>(samples)));
        }
        return points;
    }

    std::expected<CameraPath, std::string> build_path(const std::span<const Waypoint> waypoints,
                                                      const PathOptions& options) {
        if (waypoints.size() < 2) {
            return std::unexpected(std::format("Camera path needs at least 2 waypoints, got {}", waypoints.size()));
        }
        for (size_t i = 0; i < waypoints.size(); ++i) {
            if (!isFinite(waypoints[i].position) || !isFinite(waypoints[i].look_at)) {
                return std::unexpected(std::format("Waypoint {} has non-finite coordinates", i));
            }
        }

        const size_t count = waypoints.size();
        const size_t per_segment = 1 + std::size(INSERT_PARAMS);
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> look_ats;
        positions.reserve(count * per_segment);
        look_ats.reserve(count * per_segment);

        for (size_t i = 0; i < count; ++i) {
            const auto& a = waypoints[i];
            const auto& b = waypoints[(i + 1) % count];

            positions.push_back(a.position);
            look_ats.push_back(clampLook(a.look_at, a.position));

            for (const float k : INSERT_PARAMS) {
                const float jitter = std::sin(static_cast<float>(i) * JITTER_FREQUENCY +
                                              k * 2.0f * std::numbers::pi_v<float>) *
                                     JITTER_AMPLITUDE;
                glm::vec3 position = glm::mix(a.position, b.position, k);
                glm::vec3 look_at = glm::mix(a.look_at, b.look_at, k);
                position.y += jitter;
                look_at.y += jitter;
                positions.push_back(position);
                look_ats.push_back(clampLook(look_at, position));
            }
        }

        ClosedSpline position_curve(std::move(positions));
        ClosedSpline look_curve(std::move(look_ats));
        if (position_curve.length() <= 0.0f) {
            return std::unexpected(std::string("Camera path has zero length"));
        }

        LOG_DEBUG("Camera path: {} waypoints, {} control points, length {:.1f}",
                  count, position_curve.points().size(), position_curve.length());
        return CameraPath(std::move(position_curve), std::move(look_curve), count, options);
    }

} // namespace pss::camera
