/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/layout_engine.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace pss::layout {

    namespace {
        constexpr float SPIRAL_HOVER_HEIGHT = 5.0f;
    } // namespace

    LayoutEngine::LayoutEngine(const LayoutConfig& config)
        : config_(config),
          slots_(config.slot_count) {
        config_.slot_count = clamp_slot_count(config.slot_count);
    }

    void LayoutEngine::setConfig(const LayoutConfig& config) {
        const int clamped = clamp_slot_count(config.slot_count);
        if (clamped != config_.slot_count) {
            LOG_INFO("Slot count changed {} -> {}", config_.slot_count, clamped);
        }
        if (config.pattern != config_.pattern) {
            LOG_INFO("Layout pattern '{}' -> '{}'", to_string(config_.pattern), to_string(config.pattern));
        }
        config_ = config;
        config_.slot_count = clamped;
        slots_.updateSlotCount(clamped);
    }

    glm::vec2 LayoutEngine::photoSize(const std::optional<float> aspect_ratio, const float base_size) {
        if (!aspect_ratio || *aspect_ratio <= 0.0f) {
            return {base_size * DEFAULT_PHOTO_ASPECT, base_size};
        }
        const float ar = *aspect_ratio;
        return ar > 1.0f ? glm::vec2{base_size * ar, base_size} : glm::vec2{base_size, base_size / ar};
    }

    void LayoutEngine::applyFloorClamp(PatternState& state) const {
        const auto& params = config_.params;
        float hover = 0.0f;
        switch (config_.pattern) {
        case PatternKind::WAVE: hover = params.wave.min_hover_height; break;
        case PatternKind::SPIRAL: hover = SPIRAL_HOVER_HEIGHT; break;
        default: return;
        }
        const float min_height = params.floor_height + params.photo_size + hover;
        for (auto& p : state.positions) {
            p.y = std::max(p.y, min_height);
        }
    }

    LayoutFrame LayoutEngine::update(const std::span<const core::Photo> photos, const float time) {
        const auto assignments = slots_.assignSlots(photos);
        const int total = config_.slot_count;

        auto evaluation = patterns_.evaluate(config_.pattern, total, time, config_.params);
        if (evaluation.used_fallback != in_fallback_) {
            if (evaluation.used_fallback) {
                LOG_WARN("Pattern '{}' failed: {}. Rendering fallback grid", to_string(config_.pattern), evaluation.error);
            } else {
                LOG_INFO("Pattern '{}' recovered", to_string(config_.pattern));
            }
            in_fallback_ = evaluation.used_fallback;
        }
        if (!evaluation.used_fallback) {
            applyFloorClamp(evaluation.state);
        }

        LayoutFrame frame;
        frame.pattern = config_.pattern;
        frame.used_fallback = evaluation.used_fallback;
        frame.placements.resize(static_cast<size_t>(total));

        const float base_size = config_.params.photo_size;
        for (int slot = 0; slot < total; ++slot) {
            auto& placement = frame.placements[static_cast<size_t>(slot)];
            placement.slot = slot;
            placement.position = evaluation.state.positions[static_cast<size_t>(slot)];
            placement.rotation = evaluation.state.rotations[static_cast<size_t>(slot)];

            if (const auto* owner = slots_.photoAtSlot(slot)) {
                placement.id = *owner;
                placement.is_placeholder = false;
                placement.size = photoSize(slots_.getAspectRatio(*owner), base_size);
            } else {
                placement.id = core::placeholder_id(slot);
                placement.is_placeholder = true;
                placement.size = photoSize(std::nullopt, base_size);
            }
        }

        frame.stats = slots_.stats();
        frame.state = std::move(evaluation.state);
        LOG_TRACE("Layout: {} photos assigned over {} slots", assignments.size(), total);
        return frame;
    }

} // namespace pss::layout
