/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pss::core {

    // Photo as provided by the hosting application. Read-only to the core.
    struct Photo {
        std::string id;
        std::string url;
        std::optional<float> aspect_ratio;
        std::optional<int> width;
        std::optional<int> height;
        std::optional<int64_t> created_at; // epoch milliseconds
    };

    inline constexpr std::string_view PLACEHOLDER_PREFIX = "placeholder-";

    [[nodiscard]] inline std::string placeholder_id(const int slot) {
        return std::string(PLACEHOLDER_PREFIX) + std::to_string(slot);
    }

    [[nodiscard]] inline bool is_placeholder_id(const std::string_view id) {
        return id.starts_with(PLACEHOLDER_PREFIX);
    }

} // namespace pss::core
