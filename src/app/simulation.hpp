/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "config/scene_settings.hpp"
#include "core/photo.hpp"
#include "interaction/input_event.hpp"
#include "runtime/scene_runtime.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pss::app {

    // One timed entry of an input script. Every field except frame is optional.
    struct ScriptAction {
        int frame = 0;
        std::optional<interaction::InputEvent> event;
        std::optional<nlohmann::json> settings_patch; // RFC 7386 merge patch
        std::vector<core::Photo> add_photos;
        std::vector<std::string> remove_photos;
    };

    struct FrameRecord {
        int frame = 0;
        double time = 0.0;
        interaction::InteractionState state = interaction::InteractionState::AUTONOMOUS;
        camera::CameraPose camera;
        bool camera_driven = false;
        bool used_fallback = false;
        int occupied_slots = 0;
    };

    [[nodiscard]] std::expected<core::Photo, std::string> parse_photo(const nlohmann::json& j);
    [[nodiscard]] std::expected<std::vector<core::Photo>, std::string> parse_photos(const nlohmann::json& j);
    [[nodiscard]] std::expected<std::vector<core::Photo>, std::string> load_photos(const std::filesystem::path& path);

    [[nodiscard]] std::expected<std::vector<ScriptAction>, std::string> parse_input_script(const nlohmann::json& j);
    [[nodiscard]] std::expected<std::vector<ScriptAction>, std::string> load_input_script(const std::filesystem::path& path);

    /**
     * @brief Headless host for SceneRuntime
     *
     * Plays the role of the renderer: owns the photo list and the camera,
     * posts scripted input, applies returned poses, and records each frame.
     */
    class Simulation {
    public:
        Simulation(config::SceneSettings settings, std::vector<core::Photo> photos,
                   std::vector<ScriptAction> script = {});

        [[nodiscard]] std::expected<void, std::string> run(int frames, float dt);

        [[nodiscard]] const std::vector<FrameRecord>& records() const { return records_; }
        [[nodiscard]] const runtime::SceneRuntime& runtime() const { return runtime_; }
        [[nodiscard]] nlohmann::json toJson() const;

    private:
        [[nodiscard]] std::expected<void, std::string> applyActions(int frame);

        config::SceneSettings settings_;
        std::vector<core::Photo> photos_;
        std::vector<ScriptAction> script_; // sorted by frame
        size_t next_action_ = 0;

        runtime::SceneRuntime runtime_;
        camera::CameraPose camera_;
        std::vector<FrameRecord> records_;
    };

    [[nodiscard]] std::expected<void, std::string> write_json(const nlohmann::json& j, const std::filesystem::path& path);

} // namespace pss::app
