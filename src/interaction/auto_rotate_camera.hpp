/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_types.hpp"
#include "interaction/input_event_bus.hpp"
#include <numbers>
#include <optional>

namespace pss::interaction {

    struct AutoRotateSettings {
        bool enabled = false;
        float speed = 0.5f;               // orbit rad/s
        float radius = 25.0f;
        float height = 8.0f;
        float elevation_min = std::numbers::pi_v<float> / 6.0f;
        float elevation_max = std::numbers::pi_v<float> / 3.0f;
        float elevation_speed = 0.3f;
        float distance_variation = 0.0f;
        float distance_speed = 0.2f;
        float vertical_drift = 0.0f;
        float vertical_drift_speed = 0.1f;
        glm::vec3 focus_offset{0.0f};
        float pause_on_interaction = 1.5f; // seconds
    };

    // Idle orbit used when the cinematic camera is off
    class AutoRotateCamera {
    public:
        explicit AutoRotateCamera(InputEventBus& bus);

        AutoRotateCamera(const AutoRotateCamera&) = delete;
        AutoRotateCamera& operator=(const AutoRotateCamera&) = delete;

        void setSettings(const AutoRotateSettings& settings);
        [[nodiscard]] const AutoRotateSettings& settings() const { return settings_; }

        void handleInput(const InputEvent& event);

        // nullopt while disabled or paused after input
        [[nodiscard]] std::optional<camera::CameraPose> update(float delta_seconds);

        [[nodiscard]] camera::CameraPose currentPose() const;
        [[nodiscard]] bool isPaused() const { return contact_held_ || pause_remaining_ > 0.0f; }
        [[nodiscard]] bool isSubscribed() const { return subscription_.active(); }

    private:
        InputEventBus& bus_;
        InputEventBus::Subscription subscription_;
        AutoRotateSettings settings_;

        float orbit_time_ = 0.0f;
        float elevation_time_ = 0.0f;
        float distance_time_ = 0.0f;
        float drift_time_ = 0.0f;
        float pause_remaining_ = 0.0f;
        bool contact_held_ = false;
    };

} // namespace pss::interaction
