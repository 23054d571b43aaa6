/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "runtime/scene_runtime.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <functional>

namespace pss::runtime {

    size_t PathCacheKeyHash::operator()(const PathCacheKey& key) const noexcept {
        size_t h = std::hash<int>{}(key.slot_count);
        const auto mix = [&h](const size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
        mix(static_cast<size_t>(key.type));
        mix(static_cast<size_t>(key.pattern));
        return h;
    }

    SceneRuntime::SceneRuntime(const config::SceneSettings& settings, const size_t path_cache_capacity)
        : settings_(settings),
          path_settings_(settings.toCameraPathSettings()),
          layout_(settings.toLayoutConfig()),
          cinematic_(bus_),
          auto_rotate_(bus_),
          path_cache_(path_cache_capacity) {
        applySettings(settings);
    }

    void SceneRuntime::applySettings(const config::SceneSettings& settings) {
        const auto new_layout = settings.toLayoutConfig();
        auto new_path_settings = settings.toCameraPathSettings();

        // Anything other than pattern and slot count reshapes every cached path
        auto previous_path_settings = path_settings_;
        previous_path_settings.pattern = new_path_settings.pattern;
        if (previous_path_settings != new_path_settings || layout_.config().params != new_layout.params) {
            if (path_cache_.size() > 0) {
                LOG_DEBUG("Camera settings changed, dropping {} cached paths", path_cache_.size());
            }
            path_cache_.clear();
            current_key_.reset();
        }

        settings_ = settings;
        path_settings_ = std::move(new_path_settings);
        layout_.setConfig(new_layout);

        const auto cinematic = settings.toCinematicSettings();
        const bool was_active = cinematic_.isActive();
        cinematic_.setSettings(cinematic);
        if (!cinematic_.isActive()) {
            current_key_.reset();
            last_type_.reset();
            last_pattern_.reset();
            cinematic_.setPath(nullptr);
        } else if (!was_active) {
            current_key_.reset();
        }

        auto auto_rotate = settings.auto_rotate;
        auto_rotate.enabled = auto_rotate.enabled && !cinematic_.isActive();
        auto_rotate_.setSettings(auto_rotate);
    }

    bool SceneRuntime::refreshPath(const layout::LayoutFrame& frame, std::optional<std::string>& error) {
        // Slot poses depend only on pattern and slot count, so photo changes keep the current path
        const PathCacheKey key{settings_.camera_animation.type, frame.pattern, layout_.config().slot_count};
        if (current_key_ && *current_key_ == key) return false;

        std::shared_ptr<const camera::CameraPath> path;
        if (auto* cached = path_cache_.find(key)) {
            path = *cached;
            LOG_TRACE("Camera path cache hit ({} entries)", path_cache_.size());
        } else {
            LOG_TIMER("Camera path build");
            auto built = camera::CameraPathBuilder::build(key.type, frame.state, path_settings_);
            if (built) {
                path = std::make_shared<const camera::CameraPath>(std::move(*built));
                path_cache_.insert(key, path);
            } else {
                error = built.error();
                LOG_WARN("Camera path unavailable: {}", built.error());
            }
        }

        const bool style_changed = (last_type_ && *last_type_ != key.type) ||
                                   (last_pattern_ && *last_pattern_ != key.pattern);
        cinematic_.setPath(path);
        if (style_changed && path) {
            cinematic_.beginPatternTransition();
        }

        current_key_ = key;
        last_type_ = key.type;
        last_pattern_ = key.pattern;
        return path != nullptr;
    }

    FrameOutput SceneRuntime::tick(const float delta_seconds, const std::span<const core::Photo> photos,
                                   const camera::CameraPose& camera_pose) {
        const float dt = std::max(delta_seconds, 0.0f);
        time_ += dt;

        FrameOutput out;
        out.time = time_;
        out.layout = layout_.update(photos, static_cast<float>(time_));

        out.cinematic_active = cinematic_.isActive();
        if (out.cinematic_active) {
            out.path_rebuilt = refreshPath(out.layout, out.path_error);
            out.camera = cinematic_.update(dt, camera_pose);
        } else {
            out.camera = auto_rotate_.update(dt);
            out.auto_rotating = out.camera.has_value();
        }
        out.interaction_state = cinematic_.state();
        return out;
    }

} // namespace pss::runtime
