/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pss::interaction {

    enum class InputEventType : uint8_t {
        POINTER_DOWN,
        POINTER_UP,
        POINTER_MOVE,
        TOUCH_START,
        TOUCH_END,
        WHEEL,
        KEY_DOWN
    };

    // Host-agnostic input sample. Only events on the render surface count as interaction.
    struct InputEvent {
        InputEventType type = InputEventType::POINTER_DOWN;
        bool targets_surface = true;
        float wheel_delta = 0.0f;
    };

    [[nodiscard]] std::string_view to_string(InputEventType type);
    [[nodiscard]] std::optional<InputEventType> parse_input_event_type(std::string_view name);

} // namespace pss::interaction
