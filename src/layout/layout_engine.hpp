/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/photo.hpp"
#include "layout/pattern_registry.hpp"
#include "layout/slot_manager.hpp"
#include <span>
#include <string>
#include <vector>

namespace pss::layout {

    struct LayoutConfig {
        PatternKind pattern = PatternKind::GRID;
        int slot_count = 50;
        PatternParams params;
    };

    struct SlotPlacement {
        std::string id;
        int slot = 0;
        bool is_placeholder = true;
        glm::vec3 position{0.0f};
        glm::vec3 rotation{0.0f};
        glm::vec2 size{0.0f}; // width, height
    };

    // Everything the rendering layer needs to place meshes for one frame
    struct LayoutFrame {
        std::vector<SlotPlacement> placements; // one per slot, ascending
        PatternState state;
        PatternKind pattern = PatternKind::GRID;
        bool used_fallback = false;
        SlotStats stats;
    };

    class LayoutEngine {
    public:
        explicit LayoutEngine(const LayoutConfig& config = {});

        void setConfig(const LayoutConfig& config);
        [[nodiscard]] const LayoutConfig& config() const { return config_; }

        [[nodiscard]] PatternRegistry& patterns() { return patterns_; }
        [[nodiscard]] SlotManager& slots() { return slots_; }
        [[nodiscard]] const SlotManager& slots() const { return slots_; }

        // Slot assignment -> pattern evaluation -> floor clamp -> placements
        [[nodiscard]] LayoutFrame update(std::span<const core::Photo> photos, float time);

        [[nodiscard]] static glm::vec2 photoSize(std::optional<float> aspect_ratio, float base_size);

    private:
        void applyFloorClamp(PatternState& state) const;

        LayoutConfig config_;
        PatternRegistry patterns_;
        SlotManager slots_;
        bool in_fallback_ = false;
    };

} // namespace pss::layout
