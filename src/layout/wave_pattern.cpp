/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/pattern.hpp"
#include <cmath>

namespace pss::layout {

    namespace {
        constexpr float MIN_BASE_SPACING = 12.0f;
        constexpr float SPACING_PER_PHOTO = 2.5f;
        constexpr float MAX_TILT = 0.12f;    // radians
        constexpr float TILT_GAIN = 0.5f;
        constexpr float GOLDEN_PHASE = 0.618f;

        struct WaveSample {
            float height;
            glm::vec2 gradient; // d/dx, d/dz
        };

        // Sum of the five wave terms and its analytic gradient
        [[nodiscard]] WaveSample sample_wave(const float x, const float z, const int index,
                                             const float phase, const float amplitude, const float frequency) {
            const float dist = std::sqrt(x * x + z * z);

            const float main_arg = x * frequency - phase;
            const float cross_arg = z * frequency * 0.7f + phase * 0.6f;
            const float radial_arg = dist * frequency * 0.2f - phase * 0.4f;

            const float main_wave = std::sin(main_arg) * amplitude;
            const float cross_wave = std::sin(cross_arg) * amplitude * 0.5f;
            const float radial_wave = std::sin(radial_arg) * amplitude * 0.3f;
            const float breathing = std::sin(phase * 0.25f) * amplitude * 0.4f;
            const float slot_phase = std::sin(phase * 0.9f + static_cast<float>(index) * GOLDEN_PHASE) * amplitude * 0.1f;

            const float radial_slope = std::cos(radial_arg) * amplitude * 0.3f * frequency * 0.2f;
            const float inv_dist = dist > 1e-4f ? 1.0f / dist : 0.0f;

            WaveSample sample;
            sample.height = main_wave + cross_wave + radial_wave + breathing + slot_phase;
            sample.gradient.x = std::cos(main_arg) * amplitude * frequency + radial_slope * x * inv_dist;
            sample.gradient.y = std::cos(cross_arg) * amplitude * 0.5f * frequency * 0.7f + radial_slope * z * inv_dist;
            return sample;
        }
    } // namespace

    glm::vec2 WavePattern::height_band(const PatternParams& params) {
        const float base = params.floor_height + params.photo_size;
        const float low = base + params.wave.min_hover_height;
        const float high = base + std::max(params.wave.max_hover_height, params.wave.min_hover_height);
        return {low, high};
    }

    PatternState WavePattern::generate(const int total_slots, const float time, const PatternParams& params) const {
        const int n = clamp_slot_count(total_slots);

        const int columns = std::max(1, static_cast<int>(std::ceil(std::sqrt(static_cast<float>(n)))));
        const int rows = (n + columns - 1) / columns;
        const float spacing = std::max(MIN_BASE_SPACING, params.photo_size * SPACING_PER_PHOTO) *
                              (1.0f + std::max(params.wave.spacing, 0.0f));

        const float amplitude = std::clamp(params.wave.amplitude, 0.0f, params.photo_size);
        const float frequency = params.wave.frequency;
        const float phase = time * params.speed;

        const auto band = height_band(params);
        const float rest = std::min(band.x + amplitude, band.y);

        PatternState state;
        state.positions.reserve(static_cast<size_t>(n));
        state.rotations.reserve(static_cast<size_t>(n));

        for (int i = 0; i < n; ++i) {
            const float x = (static_cast<float>(i % columns) - static_cast<float>(columns - 1) * 0.5f) * spacing;
            const float z = (static_cast<float>(i / columns) - static_cast<float>(rows - 1) * 0.5f) * spacing;

            float y = rest;
            glm::vec3 rotation{0.0f};

            if (params.animation_enabled) {
                const auto wave = sample_wave(x, z, i, phase, amplitude, frequency);
                y = std::clamp(rest + wave.height, band.x, band.y);

                if (params.rotation_enabled) {
                    rotation.x = std::clamp(std::atan(wave.gradient.y) * TILT_GAIN, -MAX_TILT, MAX_TILT);
                    rotation.z = std::clamp(-std::atan(wave.gradient.x) * TILT_GAIN, -MAX_TILT, MAX_TILT);
                }
            }

            state.positions.emplace_back(x, y, z);
            state.rotations.push_back(rotation);
        }
        return state;
    }

} // namespace pss::layout
