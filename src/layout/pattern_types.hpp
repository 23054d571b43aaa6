/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace pss::layout {

    inline constexpr int MIN_SLOTS = 1;
    inline constexpr int MAX_SLOTS = 500;

    inline constexpr float DEFAULT_PHOTO_SIZE = 4.0f;
    inline constexpr float DEFAULT_FLOOR_HEIGHT = -12.0f;
    inline constexpr float DEFAULT_PHOTO_ASPECT = 9.0f / 16.0f;

    [[nodiscard]] inline int clamp_slot_count(const int n) {
        return std::clamp(n, MIN_SLOTS, MAX_SLOTS);
    }

    enum class PatternKind : uint8_t {
        GRID,
        WAVE,
        SPIRAL,
        FLOAT
    };

    [[nodiscard]] std::string_view to_string(PatternKind kind);
    [[nodiscard]] std::optional<PatternKind> parse_pattern_kind(std::string_view name);

    // Per-slot poses for one frame. Rotations are XYZ euler angles in radians.
    struct PatternState {
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> rotations;

        [[nodiscard]] size_t size() const { return positions.size(); }
        [[nodiscard]] bool empty() const { return positions.empty(); }
    };

    struct GridParams {
        float spacing = 0.0f;               // 0 = edge-to-edge wall
        float aspect_ratio = 16.0f / 9.0f;  // wall columns:rows
        float photo_aspect = DEFAULT_PHOTO_ASPECT;
        float center_height = 0.0f;

        bool operator==(const GridParams&) const = default;
    };

    struct WaveParams {
        float spacing = 0.15f;
        float amplitude = 4.0f;
        float frequency = 0.1f;
        float min_hover_height = 8.0f;
        float max_hover_height = 16.0f;

        bool operator==(const WaveParams&) const = default;
    };

    struct SpiralParams {
        float orbital_chance = 0.15f;
        float height_step = 0.8f;
        float vertical_bias = 0.4f;

        bool operator==(const SpiralParams&) const = default;
    };

    struct PatternParams {
        float photo_size = DEFAULT_PHOTO_SIZE;
        float floor_height = DEFAULT_FLOOR_HEIGHT;
        float speed = 1.0f;
        bool animation_enabled = true;
        bool rotation_enabled = false;
        GridParams grid;
        WaveParams wave;
        SpiralParams spiral;

        bool operator==(const PatternParams&) const = default;
    };

} // namespace pss::layout
