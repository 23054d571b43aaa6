/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "layout/pattern_types.hpp"

namespace pss::layout {

    // Pure slot layout generator. Implementations hold no mutable state, so a
    // single instance is constructed once and reused every frame.
    class IPattern {
    public:
        virtual ~IPattern() = default;

        [[nodiscard]] virtual PatternKind kind() const = 0;

        // Must return exactly total_slots positions and rotations.
        // Same inputs -> bit-identical output.
        [[nodiscard]] virtual PatternState generate(int total_slots, float time,
                                                    const PatternParams& params) const = 0;
    };

    class GridPattern final : public IPattern {
    public:
        struct Dimensions {
            int columns = 1;
            int rows = 1;
            glm::vec2 step{0.0f};
        };

        [[nodiscard]] PatternKind kind() const override { return PatternKind::GRID; }
        [[nodiscard]] PatternState generate(int total_slots, float time,
                                            const PatternParams& params) const override;

        [[nodiscard]] static Dimensions dimensions(int total_slots, const PatternParams& params);
    };

    class WavePattern final : public IPattern {
    public:
        [[nodiscard]] PatternKind kind() const override { return PatternKind::WAVE; }
        [[nodiscard]] PatternState generate(int total_slots, float time,
                                            const PatternParams& params) const override;

        // Height band [low, high] all wave slots stay within
        [[nodiscard]] static glm::vec2 height_band(const PatternParams& params);
    };

    class SpiralPattern final : public IPattern {
    public:
        struct SlotSeeds {
            float orbit;
            float height;
            float radius;
            float scatter;
        };

        [[nodiscard]] PatternKind kind() const override { return PatternKind::SPIRAL; }
        [[nodiscard]] PatternState generate(int total_slots, float time,
                                            const PatternParams& params) const override;

        [[nodiscard]] static SlotSeeds seeds(int index);
        [[nodiscard]] static float normalized_height(int index, const PatternParams& params);
    };

    // Uniform 10-column grid with zero rotation, used when a pattern fails
    [[nodiscard]] PatternState fallback_grid(int total_slots, const PatternParams& params);

} // namespace pss::layout
