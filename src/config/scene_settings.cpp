/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "config/scene_settings.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace pss::config {

    namespace {
        constexpr int JSON_VERSION = 1;

        constexpr float MAX_PHOTO_SIZE = 50.0f;
        constexpr float MIN_PHOTO_SIZE = 0.5f;
        constexpr float MAX_SPEED = 10.0f;
        constexpr float MIN_CAMERA_SPEED = 0.05f;
        constexpr float MAX_GRID_SPACING = 2.0f;
        constexpr float MIN_CUSTOM_ASPECT = 0.25f;
        constexpr float MAX_CUSTOM_ASPECT = 4.0f;
        constexpr float MAX_DURATION = 60.0f;
        constexpr float MAX_DISTANCE = 500.0f;

        using json = nlohmann::json;

        // Reads section[key] as T, falling back to the current value. Clamps with a warning.
        template <typename T>
        void read_clamped(const json& section, const std::string_view section_name, const char* key,
                          T& value, const T lo, const T hi) {
            const T raw = section.value(key, value);
            const T clamped = std::clamp(raw, lo, hi);
            if (clamped != raw) {
                LOG_WARN("{}.{} = {} out of range [{}, {}], using {}", section_name, key, raw, lo, hi, clamped);
            }
            value = clamped;
        }

        void read_optional(const json& section, const std::string_view section_name, const char* key,
                           std::optional<float>& value, const float lo, const float hi) {
            if (!section.contains(key) || section[key].is_null()) return;
            const float raw = section[key].get<float>();
            const float clamped = std::clamp(raw, lo, hi);
            if (clamped != raw) {
                LOG_WARN("{}.{} = {} out of range [{}, {}], using {}", section_name, key, raw, lo, hi, clamped);
            }
            value = clamped;
        }

        template <typename Enum, typename Parser>
        void read_enum(const json& section, const std::string_view section_name, const char* key,
                       Enum& value, Parser parse) {
            if (!section.contains(key)) return;
            const auto name = section[key].get<std::string>();
            if (const auto parsed = parse(name)) {
                value = *parsed;
            } else {
                LOG_WARN("{}.{}: unknown value '{}', keeping default", section_name, key, name);
            }
        }

        [[nodiscard]] const json& section_or_empty(const json& root, const char* name) {
            static const json EMPTY = json::object();
            if (!root.contains(name)) return EMPTY;
            const auto& section = root[name];
            if (!section.is_object()) {
                throw std::invalid_argument(std::string("section '") + name + "' must be an object");
            }
            return section;
        }

        [[nodiscard]] std::string_view log_level_name(const core::LogLevel level) {
            switch (level) {
            case core::LogLevel::Trace: return "trace";
            case core::LogLevel::Debug: return "debug";
            case core::LogLevel::Info: return "info";
            case core::LogLevel::Performance: return "perf";
            case core::LogLevel::Warn: return "warn";
            case core::LogLevel::Error: return "error";
            case core::LogLevel::Critical: return "critical";
            case core::LogLevel::Off: return "off";
            }
            return "info";
        }

        void put_optional(json& section, const char* key, const std::optional<float>& value) {
            if (value) section[key] = *value;
        }
    } // namespace

    std::string_view to_string(const GridAspectPreset preset) {
        switch (preset) {
        case GridAspectPreset::SQUARE: return "1:1";
        case GridAspectPreset::STANDARD: return "4:3";
        case GridAspectPreset::WIDE: return "16:9";
        case GridAspectPreset::ULTRAWIDE: return "21:9";
        case GridAspectPreset::CUSTOM: return "custom";
        }
        return "16:9";
    }

    std::optional<GridAspectPreset> parse_grid_aspect_preset(const std::string_view name) {
        if (name == "1:1") return GridAspectPreset::SQUARE;
        if (name == "4:3") return GridAspectPreset::STANDARD;
        if (name == "16:9") return GridAspectPreset::WIDE;
        if (name == "21:9") return GridAspectPreset::ULTRAWIDE;
        if (name == "custom") return GridAspectPreset::CUSTOM;
        return std::nullopt;
    }

    float resolve_grid_aspect(const GridAspectPreset preset, const float custom_ratio) {
        switch (preset) {
        case GridAspectPreset::SQUARE: return 1.0f;
        case GridAspectPreset::STANDARD: return 4.0f / 3.0f;
        case GridAspectPreset::WIDE: return 16.0f / 9.0f;
        case GridAspectPreset::ULTRAWIDE: return 21.0f / 9.0f;
        case GridAspectPreset::CUSTOM: return std::clamp(custom_ratio, MIN_CUSTOM_ASPECT, MAX_CUSTOM_ASPECT);
        }
        return 16.0f / 9.0f;
    }

    layout::LayoutConfig SceneSettings::toLayoutConfig() const {
        layout::LayoutConfig config;
        config.pattern = layout.pattern;
        config.slot_count = layout::clamp_slot_count(layout.photo_count);

        auto& params = config.params;
        params.photo_size = layout.photo_size;
        params.floor_height = layout.floor_height;
        params.speed = layout.animation_speed;
        params.animation_enabled = layout.animation_enabled;
        params.rotation_enabled = layout.rotation_enabled;
        params.grid.spacing = grid.spacing;
        params.grid.aspect_ratio = resolve_grid_aspect(grid.aspect_preset, grid.custom_aspect_ratio);
        params.grid.center_height = grid.center_height;
        params.wave = wave;
        params.spiral = spiral;
        return config;
    }

    interaction::CinematicSettings SceneSettings::toCinematicSettings() const {
        interaction::CinematicSettings settings;
        settings.enabled = camera_animation.enabled;
        settings.type = camera_animation.type;
        settings.speed = camera_animation.speed;
        settings.pause_time = camera_animation.pause_time;
        settings.blend_duration = camera_animation.blend_duration;
        settings.transition_duration = camera_animation.transition_duration;
        settings.sensitivity = camera_animation.sensitivity;
        return settings;
    }

    camera::CameraPathSettings SceneSettings::toCameraPathSettings() const {
        camera::CameraPathSettings settings;
        settings.pattern = layout.pattern;
        settings.photo_size = layout.photo_size;
        settings.floor_height = layout.floor_height;
        settings.focus_distance = camera_animation.focus_distance;
        settings.wave_frequency = wave.frequency;
        settings.base_height = camera_animation.base_height;
        settings.base_distance = camera_animation.base_distance;
        settings.height_variation = camera_animation.height_variation;
        settings.distance_variation = camera_animation.distance_variation;
        return settings;
    }

    std::expected<SceneSettings, std::string> parse_scene_settings(const nlohmann::json& j) {
        try {
            if (!j.is_object()) {
                return std::unexpected("Settings document must be a JSON object");
            }
            if (const int version = j.value("version", JSON_VERSION); version != JSON_VERSION) {
                LOG_WARN("Settings version {} (expected {}), reading known keys only", version, JSON_VERSION);
            }

            SceneSettings s;

            const auto& jl = section_or_empty(j, "layout");
            read_enum(jl, "layout", "pattern", s.layout.pattern, layout::parse_pattern_kind);
            read_clamped(jl, "layout", "photo_count", s.layout.photo_count, layout::MIN_SLOTS, layout::MAX_SLOTS);
            read_clamped(jl, "layout", "photo_size", s.layout.photo_size, MIN_PHOTO_SIZE, MAX_PHOTO_SIZE);
            s.layout.floor_height = jl.value("floor_height", s.layout.floor_height);
            read_clamped(jl, "layout", "animation_speed", s.layout.animation_speed, 0.0f, MAX_SPEED);
            s.layout.animation_enabled = jl.value("animation_enabled", s.layout.animation_enabled);
            s.layout.rotation_enabled = jl.value("rotation_enabled", s.layout.rotation_enabled);

            const auto& jg = section_or_empty(j, "grid");
            read_clamped(jg, "grid", "spacing", s.grid.spacing, 0.0f, MAX_GRID_SPACING);
            read_enum(jg, "grid", "aspect_ratio_preset", s.grid.aspect_preset, parse_grid_aspect_preset);
            read_clamped(jg, "grid", "aspect_ratio", s.grid.custom_aspect_ratio, MIN_CUSTOM_ASPECT, MAX_CUSTOM_ASPECT);
            s.grid.center_height = jg.value("center_height", s.grid.center_height);

            const auto& jw = section_or_empty(j, "wave");
            read_clamped(jw, "wave", "spacing", s.wave.spacing, 0.0f, MAX_GRID_SPACING);
            read_clamped(jw, "wave", "amplitude", s.wave.amplitude, 0.0f, MAX_PHOTO_SIZE);
            read_clamped(jw, "wave", "frequency", s.wave.frequency, 0.01f, 2.0f);
            read_clamped(jw, "wave", "min_hover_height", s.wave.min_hover_height, 0.0f, MAX_DISTANCE);
            read_clamped(jw, "wave", "max_hover_height", s.wave.max_hover_height, s.wave.min_hover_height, MAX_DISTANCE);

            const auto& js = section_or_empty(j, "spiral");
            read_clamped(js, "spiral", "orbital_chance", s.spiral.orbital_chance, 0.0f, 1.0f);
            read_clamped(js, "spiral", "height_step", s.spiral.height_step, 0.1f, 5.0f);
            read_clamped(js, "spiral", "vertical_bias", s.spiral.vertical_bias, 0.0f, 1.0f);

            const auto& jc = section_or_empty(j, "camera_animation");
            auto& cam = s.camera_animation;
            cam.enabled = jc.value("enabled", cam.enabled);
            read_enum(jc, "camera_animation", "type", cam.type, camera::parse_cinematic_type);
            read_clamped(jc, "camera_animation", "speed", cam.speed, MIN_CAMERA_SPEED, MAX_SPEED);
            read_clamped(jc, "camera_animation", "focus_distance", cam.focus_distance, 0.5f, MAX_DISTANCE);
            read_clamped(jc, "camera_animation", "pause_time", cam.pause_time, 0.0f, MAX_DURATION);
            read_clamped(jc, "camera_animation", "blend_duration", cam.blend_duration, 0.0f, MAX_DURATION);
            read_clamped(jc, "camera_animation", "transition_duration", cam.transition_duration, 0.0f, MAX_DURATION);
            read_enum(jc, "camera_animation", "interaction_sensitivity", cam.sensitivity, interaction::parse_sensitivity);
            read_optional(jc, "camera_animation", "base_height", cam.base_height, -MAX_DISTANCE, MAX_DISTANCE);
            read_optional(jc, "camera_animation", "base_distance", cam.base_distance, 1.0f, MAX_DISTANCE);
            read_optional(jc, "camera_animation", "height_variation", cam.height_variation, 0.0f, MAX_DISTANCE);
            read_optional(jc, "camera_animation", "distance_variation", cam.distance_variation, 0.0f, MAX_DISTANCE);

            const auto& ja = section_or_empty(j, "auto_rotate");
            auto& ar = s.auto_rotate;
            ar.enabled = ja.value("enabled", ar.enabled);
            read_clamped(ja, "auto_rotate", "speed", ar.speed, 0.0f, MAX_SPEED);
            read_clamped(ja, "auto_rotate", "radius", ar.radius, 1.0f, MAX_DISTANCE);
            ar.height = ja.value("height", ar.height);
            read_clamped(ja, "auto_rotate", "elevation_min", ar.elevation_min, 0.0f, 1.5f);
            read_clamped(ja, "auto_rotate", "elevation_max", ar.elevation_max, ar.elevation_min, 1.5f);
            read_clamped(ja, "auto_rotate", "elevation_speed", ar.elevation_speed, 0.0f, MAX_SPEED);
            read_clamped(ja, "auto_rotate", "distance_variation", ar.distance_variation, 0.0f, MAX_DISTANCE);
            read_clamped(ja, "auto_rotate", "distance_speed", ar.distance_speed, 0.0f, MAX_SPEED);
            read_clamped(ja, "auto_rotate", "vertical_drift", ar.vertical_drift, 0.0f, MAX_DISTANCE);
            read_clamped(ja, "auto_rotate", "vertical_drift_speed", ar.vertical_drift_speed, 0.0f, MAX_SPEED);
            read_clamped(ja, "auto_rotate", "pause_on_interaction", ar.pause_on_interaction, 0.0f, MAX_DURATION);
            if (ja.contains("focus_offset")) {
                const auto& f = ja["focus_offset"];
                if (!f.is_array() || f.size() != 3) {
                    return std::unexpected("auto_rotate.focus_offset must be an array of 3 numbers");
                }
                ar.focus_offset = {f[0].get<float>(), f[1].get<float>(), f[2].get<float>()};
            }

            const auto& jlog = section_or_empty(j, "logging");
            read_enum(jlog, "logging", "level", s.logging.level, core::parse_log_level);
            s.logging.file = jlog.value("file", s.logging.file);

            return s;
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Invalid settings: ") + e.what());
        }
    }

    nlohmann::json scene_settings_to_json(const SceneSettings& s) {
        json j;
        j["version"] = JSON_VERSION;

        j["layout"] = {
            {"pattern", std::string(layout::to_string(s.layout.pattern))},
            {"photo_count", s.layout.photo_count},
            {"photo_size", s.layout.photo_size},
            {"floor_height", s.layout.floor_height},
            {"animation_speed", s.layout.animation_speed},
            {"animation_enabled", s.layout.animation_enabled},
            {"rotation_enabled", s.layout.rotation_enabled}};

        j["grid"] = {
            {"spacing", s.grid.spacing},
            {"aspect_ratio_preset", std::string(to_string(s.grid.aspect_preset))},
            {"aspect_ratio", s.grid.custom_aspect_ratio},
            {"center_height", s.grid.center_height}};

        j["wave"] = {
            {"spacing", s.wave.spacing},
            {"amplitude", s.wave.amplitude},
            {"frequency", s.wave.frequency},
            {"min_hover_height", s.wave.min_hover_height},
            {"max_hover_height", s.wave.max_hover_height}};

        j["spiral"] = {
            {"orbital_chance", s.spiral.orbital_chance},
            {"height_step", s.spiral.height_step},
            {"vertical_bias", s.spiral.vertical_bias}};

        const auto& cam = s.camera_animation;
        j["camera_animation"] = {
            {"enabled", cam.enabled},
            {"type", std::string(camera::to_string(cam.type))},
            {"speed", cam.speed},
            {"focus_distance", cam.focus_distance},
            {"pause_time", cam.pause_time},
            {"blend_duration", cam.blend_duration},
            {"transition_duration", cam.transition_duration},
            {"interaction_sensitivity", std::string(interaction::to_string(cam.sensitivity))}};
        put_optional(j["camera_animation"], "base_height", cam.base_height);
        put_optional(j["camera_animation"], "base_distance", cam.base_distance);
        put_optional(j["camera_animation"], "height_variation", cam.height_variation);
        put_optional(j["camera_animation"], "distance_variation", cam.distance_variation);

        const auto& ar = s.auto_rotate;
        j["auto_rotate"] = {
            {"enabled", ar.enabled},
            {"speed", ar.speed},
            {"radius", ar.radius},
            {"height", ar.height},
            {"elevation_min", ar.elevation_min},
            {"elevation_max", ar.elevation_max},
            {"elevation_speed", ar.elevation_speed},
            {"distance_variation", ar.distance_variation},
            {"distance_speed", ar.distance_speed},
            {"vertical_drift", ar.vertical_drift},
            {"vertical_drift_speed", ar.vertical_drift_speed},
            {"focus_offset", {ar.focus_offset.x, ar.focus_offset.y, ar.focus_offset.z}},
            {"pause_on_interaction", ar.pause_on_interaction}};

        j["logging"] = {
            {"level", std::string(log_level_name(s.logging.level))},
            {"file", s.logging.file}};
        return j;
    }

    std::expected<SceneSettings, std::string> load_scene_settings(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected("Failed to open settings file: " + path.string());
        }

        json j;
        try {
            j = json::parse(file);
        } catch (const json::parse_error& e) {
            return std::unexpected("Failed to parse " + path.string() + ": " + e.what());
        }

        auto settings = parse_scene_settings(j);
        if (settings) {
            LOG_INFO("Loaded settings from {}", path.string());
        }
        return settings;
    }

    std::expected<void, std::string> save_scene_settings(const SceneSettings& settings,
                                                         const std::filesystem::path& path) {
        try {
            std::ofstream file(path);
            if (!file.is_open()) {
                return std::unexpected("Failed to open settings file for writing: " + path.string());
            }
            file << scene_settings_to_json(settings).dump(2);
            LOG_INFO("Saved settings to {}", path.string());
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Settings save failed: ") + e.what());
        }
    }

} // namespace pss::config
