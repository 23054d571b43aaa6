/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/pattern_registry.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace pss::layout {

    namespace {
        [[nodiscard]] bool all_finite(const std::vector<glm::vec3>& values) {
            return std::ranges::all_of(values, [](const glm::vec3& v) {
                return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
            });
        }

        [[nodiscard]] std::string validate(const PatternState& state, const size_t expected) {
            if (state.positions.size() < expected) {
                return std::format("returned {} positions for {} slots", state.positions.size(), expected);
            }
            if (state.rotations.size() < expected) {
                return std::format("returned {} rotations for {} slots", state.rotations.size(), expected);
            }
            if (!all_finite(state.positions) || !all_finite(state.rotations)) {
                return "produced non-finite values";
            }
            return {};
        }
    } // namespace

    PatternRegistry::PatternRegistry() {
        set_pattern(std::make_unique<GridPattern>());
        set_pattern(std::make_unique<WavePattern>());
        set_pattern(std::make_unique<SpiralPattern>());
    }

    void PatternRegistry::set_pattern(std::unique_ptr<IPattern> pattern) {
        if (!pattern) return;
        const auto idx = static_cast<size_t>(pattern->kind());
        patterns_[idx] = std::move(pattern);
    }

    void PatternRegistry::remove_pattern(const PatternKind kind) {
        patterns_[static_cast<size_t>(kind)].reset();
    }

    const IPattern* PatternRegistry::find(const PatternKind kind) const {
        return patterns_[static_cast<size_t>(kind)].get();
    }

    PatternEvaluation PatternRegistry::evaluate(const PatternKind kind, const int total_slots, const float time,
                                                const PatternParams& params) const {
        const int n = clamp_slot_count(total_slots);
        const auto expected = static_cast<size_t>(n);

        PatternEvaluation result;
        if (const auto* pattern = find(kind); !pattern) {
            result.error = std::format("no generator registered for '{}'", to_string(kind));
        } else {
            try {
                result.state = pattern->generate(n, time, params);
                result.error = validate(result.state, expected);
            } catch (const std::exception& e) {
                result.error = std::format("threw: {}", e.what());
            }
        }

        if (!result.error.empty()) {
            LOG_DEBUG("Pattern '{}' failed ({}), using fallback grid", to_string(kind), result.error);
            result.state = fallback_grid(n, params);
            result.used_fallback = true;
            return result;
        }

        // Extra entries are harmless but placements index by slot only
        result.state.positions.resize(expected);
        result.state.rotations.resize(expected);
        return result;
    }

} // namespace pss::layout
