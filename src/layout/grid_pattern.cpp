/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/pattern.hpp"
#include <cmath>

namespace pss::layout {

    namespace {
        constexpr float MIN_ASPECT = 0.1f;
        constexpr float MAX_ASPECT = 10.0f;
        constexpr float GAP_FACTOR = 2.0f;
        constexpr float MAX_BOB_FRACTION = 0.1f; // of photo size
        constexpr float MAX_TILT = 0.03f;        // radians
    } // namespace

    GridPattern::Dimensions GridPattern::dimensions(const int total_slots, const PatternParams& params) {
        const int n = clamp_slot_count(total_slots);
        const float aspect = std::clamp(params.grid.aspect_ratio, MIN_ASPECT, MAX_ASPECT);
        const float photo_aspect = std::clamp(params.grid.photo_aspect, MIN_ASPECT, MAX_ASPECT);

        Dimensions dims;
        dims.columns = std::max(1, static_cast<int>(std::ceil(std::sqrt(static_cast<float>(n) * aspect))));
        dims.rows = (n + dims.columns - 1) / dims.columns;

        // spacing == 0 tiles photos exactly edge to edge
        const float gap = params.grid.spacing > 0.0f ? params.grid.spacing * params.photo_size * GAP_FACTOR : 0.0f;
        dims.step = {params.photo_size * photo_aspect + gap, params.photo_size + gap};
        return dims;
    }

    PatternState GridPattern::generate(const int total_slots, const float time, const PatternParams& params) const {
        const int n = clamp_slot_count(total_slots);
        const auto dims = dimensions(n, params);

        const float half_width = static_cast<float>(dims.columns - 1) * 0.5f;
        const float half_height = static_cast<float>(dims.rows - 1) * 0.5f;
        const bool animate = params.animation_enabled && params.grid.spacing > 0.0f;
        const float phase = time * params.speed;
        const float gap = dims.step.y - params.photo_size;
        const float bob = std::min(gap * 0.25f, params.photo_size * MAX_BOB_FRACTION);

        PatternState state;
        state.positions.reserve(static_cast<size_t>(n));
        state.rotations.reserve(static_cast<size_t>(n));

        for (int i = 0; i < n; ++i) {
            const int col = i % dims.columns;
            const int row = i / dims.columns;
            const auto fi = static_cast<float>(i);

            glm::vec3 position{
                (static_cast<float>(col) - half_width) * dims.step.x,
                params.grid.center_height + (half_height - static_cast<float>(row)) * dims.step.y,
                0.0f};
            glm::vec3 rotation{0.0f};

            if (animate) {
                position.y += std::sin(phase * 0.8f + fi * 0.37f) * bob;
                position.z += std::cos(phase * 0.6f + fi * 0.53f) * bob;
                rotation.x = std::sin(phase * 0.5f + fi * 0.21f) * MAX_TILT;
                rotation.y = std::cos(phase * 0.4f + fi * 0.17f) * MAX_TILT;
            }

            state.positions.push_back(position);
            state.rotations.push_back(rotation);
        }
        return state;
    }

} // namespace pss::layout
