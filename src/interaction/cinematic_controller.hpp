/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_path.hpp"
#include "interaction/input_event_bus.hpp"
#include <memory>
#include <optional>

namespace pss::interaction {

    inline constexpr float PATH_SPEED_SCALE = 0.02f;
    inline constexpr float AUTONOMOUS_LERP = 0.03f;
    inline constexpr float MIN_COOLDOWN = 0.8f;
    inline constexpr float DEFAULT_PAUSE_TIME = 2.0f;
    inline constexpr float DEFAULT_BLEND_DURATION = 2.5f;
    inline constexpr float DEFAULT_TRANSITION_DURATION = 2.5f;

    enum class InteractionState : uint8_t {
        AUTONOMOUS,
        USER_CONTROLLED,
        RESUMING,
        PATTERN_TRANSITIONING
    };

    enum class InteractionSensitivity : uint8_t {
        LOW,
        MEDIUM,
        HIGH
    };

    [[nodiscard]] std::string_view to_string(InteractionState state);
    [[nodiscard]] std::string_view to_string(InteractionSensitivity sensitivity);
    [[nodiscard]] std::optional<InteractionSensitivity> parse_sensitivity(std::string_view name);

    // Minimum |wheel delta| that counts as interaction
    [[nodiscard]] float wheel_threshold(InteractionSensitivity sensitivity);

    struct CinematicSettings {
        bool enabled = false;
        camera::CinematicType type = camera::CinematicType::NONE;
        float speed = 1.0f;
        float pause_time = DEFAULT_PAUSE_TIME;
        float blend_duration = DEFAULT_BLEND_DURATION;
        float transition_duration = DEFAULT_TRANSITION_DURATION;
        InteractionSensitivity sensitivity = InteractionSensitivity::MEDIUM;

        [[nodiscard]] bool active() const { return enabled && type != camera::CinematicType::NONE; }
    };

    /**
     * @brief Arbitrates between the autonomous camera path and direct user control
     *
     * Driven once per frame with the host camera's current pose. A returned
     * pose should be applied to the camera; nullopt leaves the host's own
     * controls in charge. Time is the sum of update() deltas, so behaviour is
     * independent of wall-clock time.
     */
    class CinematicController {
    public:
        explicit CinematicController(InputEventBus& bus);
        ~CinematicController() = default;

        CinematicController(const CinematicController&) = delete;
        CinematicController& operator=(const CinematicController&) = delete;

        // Enabling subscribes to input; disabling is idempotent
        void setSettings(const CinematicSettings& settings);
        [[nodiscard]] const CinematicSettings& settings() const { return settings_; }
        void disable();

        void setPath(std::shared_ptr<const camera::CameraPath> path);
        [[nodiscard]] const std::shared_ptr<const camera::CameraPath>& path() const { return path_; }

        // Animation type or layout changed. Deferred while the user has control.
        void beginPatternTransition();

        void handleInput(const InputEvent& event);

        [[nodiscard]] std::optional<camera::CameraPose> update(float delta_seconds,
                                                               const camera::CameraPose& current);

        [[nodiscard]] InteractionState state() const { return state_; }
        [[nodiscard]] bool isActive() const { return active_; }
        [[nodiscard]] bool isSubscribed() const { return subscription_.active(); }
        [[nodiscard]] bool hasPendingTransition() const { return pending_transition_; }
        [[nodiscard]] bool isContactHeld() const { return contact_held_; }
        [[nodiscard]] float pathProgress() const;
        [[nodiscard]] float blendProgress() const;
        [[nodiscard]] double clock() const { return clock_; }
        [[nodiscard]] std::optional<double> lastInteractionTime() const { return last_interaction_; }

    private:
        void enterUserControl();
        void beginBlend(InteractionState state);
        [[nodiscard]] float cooldown() const;
        [[nodiscard]] float blendDuration() const;

        InputEventBus& bus_;
        InputEventBus::Subscription subscription_;
        CinematicSettings settings_;
        std::shared_ptr<const camera::CameraPath> path_;

        bool active_ = false;
        InteractionState state_ = InteractionState::AUTONOMOUS;
        double clock_ = 0.0;
        double progress_ = 0.0;
        std::optional<double> last_interaction_;
        bool contact_held_ = false;
        bool pending_transition_ = false;

        camera::CameraPose blend_start_;
        float blend_elapsed_ = 0.0f;
        bool capture_pending_ = false;
    };

} // namespace pss::interaction
