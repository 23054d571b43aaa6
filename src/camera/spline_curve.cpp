/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera/spline_curve.hpp"
#include "camera/interpolation.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace pss::camera {

    namespace {
        constexpr int SAMPLES_PER_SEGMENT = 24;
    } // namespace

    ClosedSpline::ClosedSpline(std::vector<glm::vec3> points)
        : points_(std::move(points)) {
        buildArcLengthTable();
    }

    glm::vec3 ClosedSpline::evaluateRaw(const float u) const {
        if (points_.empty()) return glm::vec3(0.0f);
        if (points_.size() == 1) return points_.front();

        const auto n = static_cast<int>(points_.size());
        const float wrapped = u - std::floor(u);
        const float p = wrapped * static_cast<float>(n);
        int segment = static_cast<int>(std::floor(p));
        float weight = p - static_cast<float>(segment);
        if (segment >= n) {
            segment = n - 1;
            weight = 1.0f;
        }

        const auto at = [&](const int i) -> const glm::vec3& {
            return points_[static_cast<size_t>(((i % n) + n) % n)];
        };
        const auto& p0 = at(segment - 1);
        const auto& p1 = at(segment);
        const auto& p2 = at(segment + 1);
        const auto& p3 = at(segment + 2);

        return centripetalCatmullRom(p0, p1, p2, p3, weight);
    }

    void ClosedSpline::buildArcLengthTable() {
        lengths_.clear();
        if (points_.size() < 2) return;

        const int divisions = static_cast<int>(points_.size()) * SAMPLES_PER_SEGMENT;
        lengths_.reserve(static_cast<size_t>(divisions) + 1);
        lengths_.push_back(0.0f);

        glm::vec3 prev = evaluateRaw(0.0f);
        for (int i = 1; i <= divisions; ++i) {
            // Last sample lands exactly on the start point
            const glm::vec3 cur = i == divisions ? points_.front()
                                                 : evaluateRaw(static_cast<float>(i) / static_cast<float>(divisions));
            lengths_.push_back(lengths_.back() + glm::length(cur - prev));
            prev = cur;
        }
    }

    float ClosedSpline::arcLengthToRaw(const float fraction) const {
        const float f = std::clamp(fraction, 0.0f, 1.0f);
        const float total = length();
        if (lengths_.size() < 2 || total <= 0.0f) return f;

        const float target = f * total;
        const auto it = std::lower_bound(lengths_.begin(), lengths_.end(), target);
        if (it == lengths_.begin()) return 0.0f;
        if (it == lengths_.end()) return 1.0f;

        const auto hi = static_cast<size_t>(it - lengths_.begin());
        const size_t lo = hi - 1;
        const float span = lengths_[hi] - lengths_[lo];
        const float local = span > 0.0f ? (target - lengths_[lo]) / span : 0.0f;
        const auto divisions = static_cast<float>(lengths_.size() - 1);
        return (static_cast<float>(lo) + local) / divisions;
    }

} // namespace pss::camera
