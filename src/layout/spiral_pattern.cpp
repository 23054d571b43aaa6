/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/pattern.hpp"
#include <cmath>
#include <numbers>

namespace pss::layout {

    namespace {
        constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
        constexpr float HOVER_HEIGHT = 5.0f;
        constexpr float ROTATION_SPEED = 0.6f;
        constexpr float ORBITAL_WOBBLE = 4.0f;
        constexpr float MAX_TILT = 0.02f;
    } // namespace

    SpiralPattern::SlotSeeds SpiralPattern::seeds(const int index) {
        const auto i = static_cast<float>(index);
        return {
            std::sin(i * 0.73f) * 0.5f + 0.5f,
            std::cos(i * 1.37f) * 0.5f + 0.5f,
            std::sin(i * 2.11f) * 0.5f + 0.5f,
            std::sin(i * 3.17f) * 0.5f + 0.5f};
    }

    float SpiralPattern::normalized_height(const int index, const PatternParams& params) {
        const auto s = seeds(index);
        float height = std::pow(s.height, params.spiral.vertical_bias);
        if (s.scatter > 0.7f) {
            height = std::min(1.0f, height + (s.scatter - 0.7f) * 1.5f);
        }
        return height;
    }

    PatternState SpiralPattern::generate(const int total_slots, const float time, const PatternParams& params) const {
        const int n = clamp_slot_count(total_slots);
        const float photo_size = params.photo_size;
        const float animation_time = time * params.speed * 2.0f;

        const float base_radius = std::max(8.0f, photo_size * 1.5f);
        const float max_radius = std::max(50.0f, photo_size * 10.0f);
        const float max_height = std::max(60.0f, photo_size * 12.0f);
        const float base_height = params.floor_height + photo_size + HOVER_HEIGHT;

        PatternState state;
        state.positions.reserve(static_cast<size_t>(n));
        state.rotations.reserve(static_cast<size_t>(n));

        for (int i = 0; i < n; ++i) {
            const auto s = seeds(i);
            const auto fi = static_cast<float>(i);
            const bool orbital = s.orbit < params.spiral.orbital_chance;
            const float height = normalized_height(i, params);

            const float y = base_height + height * max_height * params.spiral.height_step;
            const float funnel_radius = base_radius + (max_radius - base_radius) * height;

            float radius = 0.0f;
            float angle_offset = 0.0f;
            float wobble = 0.0f;

            if (orbital) {
                radius = funnel_radius * (1.3f + s.radius);
                angle_offset = (s.radius - 0.5f) * TWO_PI;
                if (s.scatter > 0.6f) {
                    radius *= 1.0f + (s.scatter - 0.6f) * 1.5f;
                }
                if (params.animation_enabled) {
                    wobble = std::sin(animation_time * 2.0f + fi) * ORBITAL_WOBBLE;
                }
            } else {
                radius = funnel_radius * (0.7f + s.radius * 0.6f);
                angle_offset = (s.scatter - 0.5f) * 0.5f;
                if (s.scatter > 0.8f) {
                    radius *= 1.0f + (s.scatter - 0.8f) * 2.0f;
                }
            }

            // Lower layers turn slower
            const float layer_speed = 0.3f + height * 0.7f;
            const float angle = params.animation_enabled
                                    ? animation_time * ROTATION_SPEED * layer_speed + angle_offset + fi * 0.05f
                                    : angle_offset + fi * 0.1f;

            state.positions.emplace_back(std::cos(angle) * radius, y + wobble, std::sin(angle) * radius);

            if (params.rotation_enabled) {
                state.rotations.emplace_back(std::sin(animation_time * 0.4f + fi * 0.1f) * MAX_TILT,
                                             0.0f,
                                             std::cos(animation_time * 0.4f + fi * 0.1f) * MAX_TILT);
            } else {
                state.rotations.emplace_back(0.0f);
            }
        }
        return state;
    }

} // namespace pss::layout
