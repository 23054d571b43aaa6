/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "config/scene_settings.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace pss;
using namespace pss::config;
using json = nlohmann::json;

// ============= Parsing =============

TEST(SceneSettingsTest, EmptyDocumentGivesDefaults) {
    const auto parsed = parse_scene_settings(json::object());
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    EXPECT_EQ(parsed->layout.pattern, layout::PatternKind::GRID);
    EXPECT_EQ(parsed->layout.photo_count, 50);
    EXPECT_EQ(parsed->grid.aspect_preset, GridAspectPreset::WIDE);
    EXPECT_FALSE(parsed->camera_animation.enabled);
    EXPECT_EQ(parsed->camera_animation.type, camera::CinematicType::NONE);
    EXPECT_EQ(parsed->camera_animation.pause_time, interaction::DEFAULT_PAUSE_TIME);
    EXPECT_EQ(parsed->camera_animation.sensitivity, interaction::InteractionSensitivity::MEDIUM);
    EXPECT_FALSE(parsed->camera_animation.base_height.has_value());
    EXPECT_EQ(parsed->logging.level, core::LogLevel::Info);
}

TEST(SceneSettingsTest, ReadsAllSections) {
    const json j = {
        {"layout", {{"pattern", "spiral"}, {"photo_count", 120}, {"photo_size", 6.0}, {"rotation_enabled", true}}},
        {"grid", {{"spacing", 0.3}, {"aspect_ratio_preset", "4:3"}}},
        {"wave", {{"amplitude", 2.0}, {"frequency", 0.25}}},
        {"spiral", {{"orbital_chance", 0.2}}},
        {"camera_animation", {{"enabled", true}, {"type", "wave_follow"}, {"speed", 1.5},
                              {"interaction_sensitivity", "high"}, {"base_height", 22.0}}},
        {"auto_rotate", {{"enabled", true}, {"radius", 40.0}, {"focus_offset", {1.0, 2.0, 3.0}}}},
        {"logging", {{"level", "debug"}, {"file", "pss.log"}}}};

    const auto s = parse_scene_settings(j);
    ASSERT_TRUE(s.has_value()) << s.error();
    EXPECT_EQ(s->layout.pattern, layout::PatternKind::SPIRAL);
    EXPECT_EQ(s->layout.photo_count, 120);
    EXPECT_FLOAT_EQ(s->layout.photo_size, 6.0f);
    EXPECT_TRUE(s->layout.rotation_enabled);
    EXPECT_FLOAT_EQ(s->grid.spacing, 0.3f);
    EXPECT_EQ(s->grid.aspect_preset, GridAspectPreset::STANDARD);
    EXPECT_FLOAT_EQ(s->wave.amplitude, 2.0f);
    EXPECT_FLOAT_EQ(s->wave.frequency, 0.25f);
    EXPECT_FLOAT_EQ(s->spiral.orbital_chance, 0.2f);
    EXPECT_TRUE(s->camera_animation.enabled);
    EXPECT_EQ(s->camera_animation.type, camera::CinematicType::WAVE_FOLLOW);
    EXPECT_EQ(s->camera_animation.sensitivity, interaction::InteractionSensitivity::HIGH);
    EXPECT_EQ(s->camera_animation.base_height, 22.0f);
    EXPECT_TRUE(s->auto_rotate.enabled);
    EXPECT_EQ(s->auto_rotate.focus_offset, glm::vec3(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(s->logging.level, core::LogLevel::Debug);
    EXPECT_EQ(s->logging.file, "pss.log");
}

TEST(SceneSettingsTest, OutOfRangeValuesAreClamped) {
    const json j = {
        {"layout", {{"photo_count", 9000}, {"photo_size", 0.0}}},
        {"grid", {{"aspect_ratio", 12.0}}},
        {"camera_animation", {{"speed", 0.0}, {"pause_time", -4.0}}}};

    const auto s = parse_scene_settings(j);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->layout.photo_count, layout::MAX_SLOTS);
    EXPECT_FLOAT_EQ(s->layout.photo_size, 0.5f);
    EXPECT_FLOAT_EQ(s->grid.custom_aspect_ratio, 4.0f);
    EXPECT_FLOAT_EQ(s->camera_animation.speed, 0.05f);
    EXPECT_FLOAT_EQ(s->camera_animation.pause_time, 0.0f);

    const auto low = parse_scene_settings({{"layout", {{"photo_count", -5}}}});
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->layout.photo_count, layout::MIN_SLOTS);
}

TEST(SceneSettingsTest, HoverBandStaysOrdered) {
    const auto s = parse_scene_settings({{"wave", {{"min_hover_height", 20.0}, {"max_hover_height", 5.0}}}});
    ASSERT_TRUE(s.has_value());
    EXPECT_GE(s->wave.max_hover_height, s->wave.min_hover_height);
}

TEST(SceneSettingsTest, UnknownEnumKeepsDefault) {
    const json j = {
        {"layout", {{"pattern", "helix"}}},
        {"camera_animation", {{"type", "dolly_zoom"}, {"interaction_sensitivity", "extreme"}}}};
    const auto s = parse_scene_settings(j);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->layout.pattern, layout::PatternKind::GRID);
    EXPECT_EQ(s->camera_animation.type, camera::CinematicType::NONE);
    EXPECT_EQ(s->camera_animation.sensitivity, interaction::InteractionSensitivity::MEDIUM);
}

TEST(SceneSettingsTest, NullOverrideIsIgnored) {
    const auto s = parse_scene_settings({{"camera_animation", {{"base_distance", nullptr}}}});
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->camera_animation.base_distance.has_value());
}

TEST(SceneSettingsTest, WrongTypesFail) {
    EXPECT_FALSE(parse_scene_settings(json::array()).has_value());
    EXPECT_FALSE(parse_scene_settings({{"layout", 5}}).has_value());
    EXPECT_FALSE(parse_scene_settings({{"layout", {{"photo_count", "many"}}}}).has_value());
    EXPECT_FALSE(parse_scene_settings({{"camera_animation", {{"type", 3}}}}).has_value());
    EXPECT_FALSE(parse_scene_settings({{"auto_rotate", {{"focus_offset", {1.0, 2.0}}}}}).has_value());

    const auto error = parse_scene_settings({{"grid", "wide"}});
    ASSERT_FALSE(error.has_value());
    EXPECT_NE(error.error().find("grid"), std::string::npos);
}

TEST(SceneSettingsTest, JsonRoundTrip) {
    SceneSettings s;
    s.layout.pattern = layout::PatternKind::WAVE;
    s.layout.photo_count = 77;
    s.grid.aspect_preset = GridAspectPreset::CUSTOM;
    s.grid.custom_aspect_ratio = 2.5f;
    s.camera_animation.enabled = true;
    s.camera_animation.type = camera::CinematicType::PHOTO_FOCUS;
    s.camera_animation.sensitivity = interaction::InteractionSensitivity::LOW;
    s.camera_animation.base_distance = 60.0f;
    s.auto_rotate.focus_offset = {0.0f, 3.0f, -1.0f};
    s.logging.level = core::LogLevel::Warn;

    const json j = scene_settings_to_json(s);
    EXPECT_EQ(j["version"], 1);
    EXPECT_FALSE(j["camera_animation"].contains("base_height"));

    const auto back = parse_scene_settings(j);
    ASSERT_TRUE(back.has_value()) << back.error();
    EXPECT_EQ(back->layout.pattern, layout::PatternKind::WAVE);
    EXPECT_EQ(back->layout.photo_count, 77);
    EXPECT_EQ(back->grid.aspect_preset, GridAspectPreset::CUSTOM);
    EXPECT_FLOAT_EQ(back->grid.custom_aspect_ratio, 2.5f);
    EXPECT_EQ(back->camera_animation.type, camera::CinematicType::PHOTO_FOCUS);
    EXPECT_EQ(back->camera_animation.sensitivity, interaction::InteractionSensitivity::LOW);
    EXPECT_EQ(back->camera_animation.base_distance, 60.0f);
    EXPECT_FALSE(back->camera_animation.base_height.has_value());
    EXPECT_EQ(back->auto_rotate.focus_offset, s.auto_rotate.focus_offset);
    EXPECT_EQ(back->logging.level, core::LogLevel::Warn);
}

// ============= Files =============

TEST(SceneSettingsTest, SaveAndLoad) {
    const auto path = std::filesystem::temp_directory_path() / "pss_scene_settings_test.json";
    SceneSettings s;
    s.layout.photo_count = 33;
    s.camera_animation.type = camera::CinematicType::GRID_SWEEP;

    ASSERT_TRUE(save_scene_settings(s, path).has_value());
    const auto loaded = load_scene_settings(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->layout.photo_count, 33);
    EXPECT_EQ(loaded->camera_animation.type, camera::CinematicType::GRID_SWEEP);
    std::filesystem::remove(path);
}

TEST(SceneSettingsTest, LoadReportsMissingAndMalformedFiles) {
    const auto dir = std::filesystem::temp_directory_path();
    EXPECT_FALSE(load_scene_settings(dir / "pss_does_not_exist.json").has_value());

    const auto path = dir / "pss_malformed_settings.json";
    {
        std::ofstream out(path);
        out << "{ \"layout\": ";
    }
    const auto result = load_scene_settings(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("parse"), std::string::npos);
    std::filesystem::remove(path);
}

// ============= Conversion =============

TEST(SceneSettingsTest, GridAspectPresets) {
    EXPECT_FLOAT_EQ(resolve_grid_aspect(GridAspectPreset::SQUARE, 3.0f), 1.0f);
    EXPECT_FLOAT_EQ(resolve_grid_aspect(GridAspectPreset::STANDARD, 3.0f), 4.0f / 3.0f);
    EXPECT_FLOAT_EQ(resolve_grid_aspect(GridAspectPreset::WIDE, 3.0f), 16.0f / 9.0f);
    EXPECT_FLOAT_EQ(resolve_grid_aspect(GridAspectPreset::ULTRAWIDE, 3.0f), 21.0f / 9.0f);
    EXPECT_FLOAT_EQ(resolve_grid_aspect(GridAspectPreset::CUSTOM, 3.0f), 3.0f);
    EXPECT_FLOAT_EQ(resolve_grid_aspect(GridAspectPreset::CUSTOM, 0.01f), 0.25f);

    for (const auto preset : {GridAspectPreset::SQUARE, GridAspectPreset::STANDARD, GridAspectPreset::WIDE,
                              GridAspectPreset::ULTRAWIDE, GridAspectPreset::CUSTOM}) {
        EXPECT_EQ(parse_grid_aspect_preset(to_string(preset)), preset);
    }
}

TEST(SceneSettingsTest, ConvertsToRuntimeConfigs) {
    SceneSettings s;
    s.layout.pattern = layout::PatternKind::SPIRAL;
    s.layout.photo_count = 80;
    s.layout.photo_size = 5.0f;
    s.grid.aspect_preset = GridAspectPreset::SQUARE;
    s.camera_animation.enabled = true;
    s.camera_animation.type = camera::CinematicType::SPIRAL_TOUR;
    s.camera_animation.focus_distance = 14.0f;
    s.camera_animation.height_variation = 3.0f;

    const auto layout = s.toLayoutConfig();
    EXPECT_EQ(layout.pattern, layout::PatternKind::SPIRAL);
    EXPECT_EQ(layout.slot_count, 80);
    EXPECT_FLOAT_EQ(layout.params.photo_size, 5.0f);
    EXPECT_FLOAT_EQ(layout.params.grid.aspect_ratio, 1.0f);

    const auto cinematic = s.toCinematicSettings();
    EXPECT_TRUE(cinematic.active());
    EXPECT_EQ(cinematic.type, camera::CinematicType::SPIRAL_TOUR);

    const auto path = s.toCameraPathSettings();
    EXPECT_EQ(path.pattern, layout::PatternKind::SPIRAL);
    EXPECT_FLOAT_EQ(path.focus_distance, 14.0f);
    EXPECT_EQ(path.height_variation, 3.0f);
    EXPECT_FALSE(path.base_height.has_value());
}
