/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera/camera_path_builder.hpp"
#include "config/scene_settings.hpp"
#include "core/photo.hpp"
#include "core/resource_cache.hpp"
#include "interaction/auto_rotate_camera.hpp"
#include "interaction/cinematic_controller.hpp"
#include "interaction/input_event_bus.hpp"
#include "layout/layout_engine.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace pss::runtime {

    inline constexpr size_t DEFAULT_PATH_CACHE_CAPACITY = 16;

    struct PathCacheKey {
        camera::CinematicType type = camera::CinematicType::NONE;
        layout::PatternKind pattern = layout::PatternKind::GRID;
        int slot_count = 0;

        bool operator==(const PathCacheKey&) const = default;
    };

    struct PathCacheKeyHash {
        size_t operator()(const PathCacheKey& key) const noexcept;
    };

    using PathCache = core::ResourceCache<PathCacheKey, std::shared_ptr<const camera::CameraPath>, PathCacheKeyHash>;

    struct FrameOutput {
        layout::LayoutFrame layout;
        std::optional<camera::CameraPose> camera; // nullopt: host controls own the camera
        interaction::InteractionState interaction_state = interaction::InteractionState::AUTONOMOUS;
        bool cinematic_active = false;
        bool auto_rotating = false;
        bool path_rebuilt = false;
        std::optional<std::string> path_error;
        double time = 0.0;
    };

    /**
     * @brief Per-frame driver for layout, camera path and camera control
     *
     * tick() runs layout, then path refresh, then the cinematic controller
     * (or auto-rotate when the cinematic camera is off). The host posts input
     * to inputBus() between ticks.
     */
    class SceneRuntime {
    public:
        explicit SceneRuntime(const config::SceneSettings& settings = {},
                              size_t path_cache_capacity = DEFAULT_PATH_CACHE_CAPACITY);

        SceneRuntime(const SceneRuntime&) = delete;
        SceneRuntime& operator=(const SceneRuntime&) = delete;

        void applySettings(const config::SceneSettings& settings);
        [[nodiscard]] const config::SceneSettings& settings() const { return settings_; }

        [[nodiscard]] FrameOutput tick(float delta_seconds, std::span<const core::Photo> photos,
                                       const camera::CameraPose& camera_pose);

        [[nodiscard]] interaction::InputEventBus& inputBus() { return bus_; }
        [[nodiscard]] layout::LayoutEngine& layoutEngine() { return layout_; }
        [[nodiscard]] const interaction::CinematicController& cinematic() const { return cinematic_; }
        [[nodiscard]] const interaction::AutoRotateCamera& autoRotate() const { return auto_rotate_; }
        [[nodiscard]] const PathCache& pathCache() const { return path_cache_; }

    private:
        // Returns true if a new path was installed
        bool refreshPath(const layout::LayoutFrame& frame, std::optional<std::string>& error);

        config::SceneSettings settings_;
        camera::CameraPathSettings path_settings_;

        // Declared before its subscribers so it outlives their subscriptions
        interaction::InputEventBus bus_;
        layout::LayoutEngine layout_;
        interaction::CinematicController cinematic_;
        interaction::AutoRotateCamera auto_rotate_;
        PathCache path_cache_;

        std::optional<PathCacheKey> current_key_;
        std::optional<camera::CinematicType> last_type_;
        std::optional<layout::PatternKind> last_pattern_;
        double time_ = 0.0;
    };

} // namespace pss::runtime
