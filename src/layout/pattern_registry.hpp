/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "layout/pattern.hpp"
#include <array>
#include <memory>
#include <string>

namespace pss::layout {

    struct PatternEvaluation {
        PatternState state;
        bool used_fallback = false;
        std::string error;
    };

    // Owns one generator per PatternKind. Grid, wave and spiral are built in;
    // float is provided by the rendering layer through set_pattern().
    class PatternRegistry {
    public:
        PatternRegistry();

        // Replaces the generator for pattern->kind(). nullptr is ignored.
        void set_pattern(std::unique_ptr<IPattern> pattern);
        void remove_pattern(PatternKind kind);

        [[nodiscard]] const IPattern* find(PatternKind kind) const;

        // Never throws. Missing generators, exceptions, short or non-finite
        // output all resolve to fallback_grid().
        [[nodiscard]] PatternEvaluation evaluate(PatternKind kind, int total_slots, float time,
                                                 const PatternParams& params) const;

    private:
        static constexpr size_t KIND_COUNT = 4;
        std::array<std::unique_ptr<IPattern>, KIND_COUNT> patterns_;
    };

} // namespace pss::layout
