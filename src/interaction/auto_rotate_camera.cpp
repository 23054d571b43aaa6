/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/auto_rotate_camera.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace pss::interaction {

    namespace {
        constexpr float HEIGHT_FROM_ELEVATION = 0.2f;
    } // namespace

    AutoRotateCamera::AutoRotateCamera(InputEventBus& bus)
        : bus_(bus) {}

    void AutoRotateCamera::setSettings(const AutoRotateSettings& settings) {
        settings_ = settings;
        settings_.radius = std::max(settings.radius, 0.0f);
        settings_.pause_on_interaction = std::max(settings.pause_on_interaction, 0.0f);
        if (settings_.elevation_min > settings_.elevation_max) {
            std::swap(settings_.elevation_min, settings_.elevation_max);
        }

        if (!settings_.enabled) {
            subscription_.reset();
            contact_held_ = false;
            pause_remaining_ = 0.0f;
            return;
        }
        if (!subscription_.active()) {
            subscription_ = bus_.subscribe([this](const InputEvent& event) { handleInput(event); });
            LOG_DEBUG("Auto-rotate enabled: radius {:.1f}, height {:.1f}", settings_.radius, settings_.height);
        }
    }

    void AutoRotateCamera::handleInput(const InputEvent& event) {
        if (!settings_.enabled || !event.targets_surface) return;

        switch (event.type) {
        case InputEventType::POINTER_DOWN:
        case InputEventType::TOUCH_START:
            contact_held_ = true;
            pause_remaining_ = settings_.pause_on_interaction;
            break;
        case InputEventType::POINTER_UP:
        case InputEventType::TOUCH_END:
            contact_held_ = false;
            pause_remaining_ = settings_.pause_on_interaction;
            break;
        case InputEventType::WHEEL:
        case InputEventType::KEY_DOWN:
            pause_remaining_ = settings_.pause_on_interaction;
            break;
        case InputEventType::POINTER_MOVE:
            break;
        }
    }

    camera::CameraPose AutoRotateCamera::currentPose() const {
        const auto& s = settings_;
        const float radius = s.radius + std::sin(distance_time_) * s.distance_variation;

        // Elevation oscillates over [min, max]
        const float oscillation = (std::sin(elevation_time_) + 1.0f) * 0.5f;
        const float phi = s.elevation_min + oscillation * (s.elevation_max - s.elevation_min);

        const glm::vec3 offset{radius * std::sin(phi) * std::cos(orbit_time_),
                               s.height + std::cos(phi) * radius * HEIGHT_FROM_ELEVATION,
                               radius * std::sin(phi) * std::sin(orbit_time_)};
        const glm::vec3 focus = s.focus_offset + glm::vec3(0.0f, std::sin(drift_time_) * s.vertical_drift, 0.0f);
        return {focus + offset, focus};
    }

    std::optional<camera::CameraPose> AutoRotateCamera::update(const float delta_seconds) {
        if (!settings_.enabled) return std::nullopt;

        const float dt = std::max(delta_seconds, 0.0f);
        if (contact_held_) return std::nullopt;
        if (pause_remaining_ > 0.0f) {
            pause_remaining_ = std::max(pause_remaining_ - dt, 0.0f);
            return std::nullopt;
        }

        orbit_time_ += dt * settings_.speed;
        elevation_time_ += dt * settings_.elevation_speed;
        distance_time_ += dt * settings_.distance_speed;
        drift_time_ += dt * settings_.vertical_drift_speed;
        return currentPose();
    }

} // namespace pss::interaction
