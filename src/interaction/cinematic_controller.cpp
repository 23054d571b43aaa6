/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/cinematic_controller.hpp"
#include "camera/interpolation.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace pss::interaction {

    namespace {
        constexpr float LOW_WHEEL_THRESHOLD = 30.0f;
        constexpr float MEDIUM_WHEEL_THRESHOLD = 10.0f;
        constexpr float HIGH_WHEEL_THRESHOLD = 5.0f;
    } // namespace

    std::string_view to_string(const InteractionState state) {
        switch (state) {
        case InteractionState::AUTONOMOUS: return "autonomous";
        case InteractionState::USER_CONTROLLED: return "user_controlled";
        case InteractionState::RESUMING: return "resuming";
        case InteractionState::PATTERN_TRANSITIONING: return "pattern_transitioning";
        }
        return "unknown";
    }

    std::string_view to_string(const InteractionSensitivity sensitivity) {
        switch (sensitivity) {
        case InteractionSensitivity::LOW: return "low";
        case InteractionSensitivity::MEDIUM: return "medium";
        case InteractionSensitivity::HIGH: return "high";
        }
        return "medium";
    }

    std::optional<InteractionSensitivity> parse_sensitivity(const std::string_view name) {
        if (name == "low") return InteractionSensitivity::LOW;
        if (name == "medium") return InteractionSensitivity::MEDIUM;
        if (name == "high") return InteractionSensitivity::HIGH;
        return std::nullopt;
    }

    float wheel_threshold(const InteractionSensitivity sensitivity) {
        switch (sensitivity) {
        case InteractionSensitivity::LOW: return LOW_WHEEL_THRESHOLD;
        case InteractionSensitivity::MEDIUM: return MEDIUM_WHEEL_THRESHOLD;
        case InteractionSensitivity::HIGH: return HIGH_WHEEL_THRESHOLD;
        }
        return MEDIUM_WHEEL_THRESHOLD;
    }

    CinematicController::CinematicController(InputEventBus& bus)
        : bus_(bus) {}

    void CinematicController::setSettings(const CinematicSettings& settings) {
        settings_ = settings;
        settings_.speed = std::max(settings.speed, 0.0f);
        settings_.pause_time = std::max(settings.pause_time, 0.0f);
        settings_.blend_duration = std::max(settings.blend_duration, 0.0f);
        settings_.transition_duration = std::max(settings.transition_duration, 0.0f);

        if (!settings_.active()) {
            disable();
            return;
        }
        if (active_) return;

        active_ = true;
        state_ = InteractionState::AUTONOMOUS;
        subscription_ = bus_.subscribe([this](const InputEvent& event) { handleInput(event); });
        LOG_INFO("Cinematic camera enabled: {} at speed {:.2f}", camera::to_string(settings_.type), settings_.speed);
    }

    void CinematicController::disable() {
        const bool was_active = active_ || subscription_.active();
        subscription_.reset();
        active_ = false;
        state_ = InteractionState::AUTONOMOUS;
        clock_ = 0.0;
        progress_ = 0.0;
        last_interaction_.reset();
        contact_held_ = false;
        pending_transition_ = false;
        blend_elapsed_ = 0.0f;
        capture_pending_ = false;
        if (was_active) {
            LOG_INFO("Cinematic camera disabled");
        }
    }

    void CinematicController::setPath(std::shared_ptr<const camera::CameraPath> path) {
        const bool blending = state_ == InteractionState::RESUMING ||
                              state_ == InteractionState::PATTERN_TRANSITIONING;
        if (blending && path_ && path != path_ && !capture_pending_) {
            // Restart from the live pose so the new target cannot pull the camera in one frame
            LOG_DEBUG("Camera path replaced during {}, restarting blend", to_string(state_));
            blend_elapsed_ = 0.0f;
            capture_pending_ = true;
        }
        path_ = std::move(path);
    }

    void CinematicController::beginPatternTransition() {
        if (!active_) return;
        if (state_ == InteractionState::USER_CONTROLLED) {
            pending_transition_ = true;
            LOG_DEBUG("Pattern transition deferred until user releases control");
            return;
        }
        beginBlend(InteractionState::PATTERN_TRANSITIONING);
    }

    void CinematicController::handleInput(const InputEvent& event) {
        if (!active_) return;

        // Releases count wherever they land, a drag may end outside the surface
        const bool release = event.type == InputEventType::POINTER_UP || event.type == InputEventType::TOUCH_END;
        if (!release && !event.targets_surface) return;

        switch (event.type) {
        case InputEventType::POINTER_DOWN:
        case InputEventType::TOUCH_START:
            contact_held_ = true;
            enterUserControl();
            break;
        case InputEventType::POINTER_UP:
        case InputEventType::TOUCH_END:
            if (contact_held_) {
                contact_held_ = false;
                last_interaction_ = clock_;
            }
            break;
        case InputEventType::POINTER_MOVE:
            // Hover alone never takes control
            if (contact_held_) {
                last_interaction_ = clock_;
            }
            break;
        case InputEventType::WHEEL:
            if (std::abs(event.wheel_delta) >= wheel_threshold(settings_.sensitivity)) {
                enterUserControl();
            }
            break;
        case InputEventType::KEY_DOWN:
            enterUserControl();
            break;
        }
    }

    void CinematicController::enterUserControl() {
        if (state_ == InteractionState::RESUMING || state_ == InteractionState::PATTERN_TRANSITIONING) {
            LOG_DEBUG("{} cancelled by input", to_string(state_));
            pending_transition_ = false;
            blend_elapsed_ = 0.0f;
            capture_pending_ = false;
        }
        if (state_ != InteractionState::USER_CONTROLLED) {
            LOG_DEBUG("Camera: {} -> user_controlled", to_string(state_));
        }
        state_ = InteractionState::USER_CONTROLLED;
        last_interaction_ = clock_;
    }

    void CinematicController::beginBlend(const InteractionState state) {
        LOG_DEBUG("Camera: {} -> {}", to_string(state_), to_string(state));
        state_ = state;
        blend_elapsed_ = 0.0f;
        capture_pending_ = true;
        if (state == InteractionState::PATTERN_TRANSITIONING) {
            pending_transition_ = false;
        }
    }

    float CinematicController::cooldown() const {
        return std::max(settings_.pause_time, MIN_COOLDOWN);
    }

    float CinematicController::blendDuration() const {
        return state_ == InteractionState::PATTERN_TRANSITIONING ? settings_.transition_duration
                                                                 : settings_.blend_duration;
    }

    float CinematicController::pathProgress() const {
        return camera::CameraPath::wrap(static_cast<float>(std::fmod(progress_, 1.0)));
    }

    float CinematicController::blendProgress() const {
        switch (state_) {
        case InteractionState::AUTONOMOUS: return 1.0f;
        case InteractionState::USER_CONTROLLED: return 0.0f;
        default: break;
        }
        const float duration = blendDuration();
        return duration <= 0.0f ? 1.0f : std::clamp(blend_elapsed_ / duration, 0.0f, 1.0f);
    }

    std::optional<camera::CameraPose> CinematicController::update(const float delta_seconds,
                                                                  const camera::CameraPose& current) {
        if (!active_) return std::nullopt;

        const float dt = std::max(delta_seconds, 0.0f);
        clock_ += dt;
        progress_ += static_cast<double>(dt) * settings_.speed * PATH_SPEED_SCALE;

        if (state_ == InteractionState::USER_CONTROLLED) {
            if (contact_held_) return std::nullopt;
            const double since = clock_ - last_interaction_.value_or(0.0);
            if (since < cooldown()) return std::nullopt;
            beginBlend(pending_transition_ ? InteractionState::PATTERN_TRANSITIONING : InteractionState::RESUMING);
        }

        // No path: the host keeps control until one is built
        if (!path_) return std::nullopt;

        const camera::CameraPose target = path_->sample(pathProgress());

        if (state_ == InteractionState::AUTONOMOUS) {
            return camera::blendPoses(current, target, AUTONOMOUS_LERP);
        }

        if (capture_pending_) {
            blend_start_ = current;
            capture_pending_ = false;
        } else {
            blend_elapsed_ += dt;
        }

        const float factor = blendProgress();
        const camera::CameraPose pose = camera::blendPoses(blend_start_, target, camera::blendEasing(factor));
        if (factor >= 1.0f) {
            LOG_DEBUG("Camera: {} -> autonomous", to_string(state_));
            state_ = InteractionState::AUTONOMOUS;
            pending_transition_ = false;
        }
        return pose;
    }

} // namespace pss::interaction
