/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/pattern.hpp"
#include <cmath>

namespace pss::layout {

    namespace {
        constexpr int FALLBACK_COLUMNS = 10;
        constexpr float FALLBACK_MIN_SPACING = 6.0f;
        constexpr float FALLBACK_HEIGHT = -6.0f;
    } // namespace

    std::string_view to_string(const PatternKind kind) {
        switch (kind) {
        case PatternKind::GRID: return "grid";
        case PatternKind::WAVE: return "wave";
        case PatternKind::SPIRAL: return "spiral";
        case PatternKind::FLOAT: return "float";
        }
        return "grid";
    }

    std::optional<PatternKind> parse_pattern_kind(const std::string_view name) {
        if (name == "grid") return PatternKind::GRID;
        if (name == "wave") return PatternKind::WAVE;
        if (name == "spiral") return PatternKind::SPIRAL;
        if (name == "float") return PatternKind::FLOAT;
        return std::nullopt;
    }

    PatternState fallback_grid(const int total_slots, const PatternParams& params) {
        const int n = clamp_slot_count(total_slots);
        const float spacing = std::max(FALLBACK_MIN_SPACING, params.photo_size * 1.5f);
        const float offset = spacing * (FALLBACK_COLUMNS / 2);

        PatternState state;
        state.positions.reserve(static_cast<size_t>(n));
        state.rotations.assign(static_cast<size_t>(n), glm::vec3{0.0f});

        for (int i = 0; i < n; ++i) {
            const auto col = static_cast<float>(i % FALLBACK_COLUMNS);
            const auto row = static_cast<float>(i / FALLBACK_COLUMNS);
            state.positions.emplace_back(col * spacing - offset, FALLBACK_HEIGHT, row * spacing - offset);
        }
        return state;
    }

} // namespace pss::layout
