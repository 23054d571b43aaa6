/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "runtime/scene_runtime.hpp"
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <vector>

using namespace pss;
using namespace pss::runtime;

namespace {
    constexpr float DT = 0.125f;

    std::vector<core::Photo> makePhotos(const int count, const int first = 0) {
        std::vector<core::Photo> photos;
        for (int i = first; i < first + count; ++i) {
            core::Photo photo;
            photo.id = "photo-" + std::to_string(i);
            photo.created_at = 1000 + i;
            photos.push_back(photo);
        }
        return photos;
    }

    config::SceneSettings cinematicSettings(const camera::CinematicType type) {
        config::SceneSettings s;
        s.layout.photo_count = 40;
        s.camera_animation.enabled = true;
        s.camera_animation.type = type;
        return s;
    }
} // namespace

class SceneRuntimeTest : public ::testing::Test {
protected:
    FrameOutput tick(SceneRuntime& runtime) {
        auto out = runtime.tick(DT, photos, pose);
        if (out.camera) pose = *out.camera;
        return out;
    }

    std::vector<core::Photo> photos = makePhotos(10);
    camera::CameraPose pose{{0.0f, 5.0f, 40.0f}, {0.0f, 5.0f, 0.0f}};
};

// ============= Layout =============

TEST_F(SceneRuntimeTest, LayoutCoversEverySlot) {
    config::SceneSettings s;
    s.layout.photo_count = 25;
    SceneRuntime runtime(s);

    const auto out = tick(runtime);
    EXPECT_EQ(out.layout.placements.size(), 25u);
    EXPECT_EQ(out.layout.stats.occupied_slots, 10);
    EXPECT_FALSE(out.cinematic_active);
    EXPECT_FALSE(out.camera.has_value());
    EXPECT_DOUBLE_EQ(out.time, DT);
}

TEST_F(SceneRuntimeTest, FloatPatternFallsBackToGrid) {
    config::SceneSettings s;
    s.layout.pattern = layout::PatternKind::FLOAT;
    s.layout.photo_count = 30;
    SceneRuntime runtime(s);

    const auto out = tick(runtime);
    EXPECT_TRUE(out.layout.used_fallback);
    EXPECT_EQ(out.layout.placements.size(), 30u);
}

// ============= Camera Paths =============

TEST_F(SceneRuntimeTest, BuildsPathOnceAndDrivesCamera) {
    SceneRuntime runtime(cinematicSettings(camera::CinematicType::SHOWCASE));

    const auto first = tick(runtime);
    EXPECT_TRUE(first.cinematic_active);
    EXPECT_TRUE(first.path_rebuilt);
    EXPECT_FALSE(first.path_error.has_value());
    EXPECT_TRUE(first.camera.has_value());
    EXPECT_EQ(runtime.pathCache().size(), 1u);

    const auto second = tick(runtime);
    EXPECT_FALSE(second.path_rebuilt);
    EXPECT_TRUE(second.camera.has_value());
    EXPECT_EQ(runtime.pathCache().size(), 1u);
    EXPECT_EQ(runtime.cinematic().state(), interaction::InteractionState::AUTONOMOUS);
}

TEST_F(SceneRuntimeTest, PhotoChangeKeepsPath) {
    SceneRuntime runtime(cinematicSettings(camera::CinematicType::GALLERY_WALK));
    (void)tick(runtime);

    photos = makePhotos(12);
    auto out = tick(runtime);
    EXPECT_FALSE(out.path_rebuilt);
    EXPECT_EQ(out.layout.stats.occupied_slots, 12);

    photos.erase(photos.begin(), photos.begin() + 5);
    out = tick(runtime);
    EXPECT_FALSE(out.path_rebuilt);
    EXPECT_EQ(runtime.pathCache().size(), 1u);
    EXPECT_EQ(out.interaction_state, interaction::InteractionState::AUTONOMOUS);
}

TEST_F(SceneRuntimeTest, SwitchingBackReusesCachedPath) {
    auto s = cinematicSettings(camera::CinematicType::SHOWCASE);
    SceneRuntime runtime(s);
    (void)tick(runtime);

    s.camera_animation.type = camera::CinematicType::SPIRAL_TOUR;
    runtime.applySettings(s);
    (void)tick(runtime);
    EXPECT_EQ(runtime.pathCache().size(), 2u);

    const auto hits = runtime.pathCache().hits();
    s.camera_animation.type = camera::CinematicType::SHOWCASE;
    runtime.applySettings(s);
    const auto out = tick(runtime);
    EXPECT_TRUE(out.path_rebuilt);
    EXPECT_EQ(runtime.pathCache().size(), 2u);
    EXPECT_EQ(runtime.pathCache().hits(), hits + 1);
}

TEST_F(SceneRuntimeTest, CacheIsBoundedByCapacity) {
    auto s = cinematicSettings(camera::CinematicType::SHOWCASE);
    SceneRuntime runtime(s, 2);

    for (const auto type : camera::ALL_CINEMATIC_TYPES) {
        s.camera_animation.type = type;
        runtime.applySettings(s);
        (void)tick(runtime);
        EXPECT_LE(runtime.pathCache().size(), 2u);
    }
    EXPECT_EQ(runtime.pathCache().size(), 2u);
}

TEST_F(SceneRuntimeTest, FramingChangeDropsCachedPaths) {
    auto s = cinematicSettings(camera::CinematicType::SHOWCASE);
    SceneRuntime runtime(s);
    (void)tick(runtime);
    ASSERT_EQ(runtime.pathCache().size(), 1u);

    // Speed does not affect path shape
    s.camera_animation.speed = 2.0f;
    runtime.applySettings(s);
    EXPECT_EQ(runtime.pathCache().size(), 1u);

    s.camera_animation.focus_distance = 25.0f;
    runtime.applySettings(s);
    EXPECT_EQ(runtime.pathCache().size(), 0u);
    EXPECT_TRUE(tick(runtime).path_rebuilt);
}

TEST_F(SceneRuntimeTest, PatternChangeStartsTransition) {
    auto s = cinematicSettings(camera::CinematicType::SHOWCASE);
    SceneRuntime runtime(s);
    (void)tick(runtime);

    s.layout.pattern = layout::PatternKind::WAVE;
    runtime.applySettings(s);
    const auto out = tick(runtime);
    EXPECT_TRUE(out.path_rebuilt);
    EXPECT_EQ(out.interaction_state, interaction::InteractionState::PATTERN_TRANSITIONING);
}

TEST_F(SceneRuntimeTest, PatternChangeDuringUserControlIsDeferred) {
    auto s = cinematicSettings(camera::CinematicType::SHOWCASE);
    SceneRuntime runtime(s);
    (void)tick(runtime);

    interaction::InputEvent down;
    down.type = interaction::InputEventType::POINTER_DOWN;
    runtime.inputBus().post(down);

    s.camera_animation.type = camera::CinematicType::GRID_SWEEP;
    runtime.applySettings(s);
    const auto out = tick(runtime);
    EXPECT_FALSE(out.camera.has_value());
    EXPECT_EQ(out.interaction_state, interaction::InteractionState::USER_CONTROLLED);
    EXPECT_TRUE(runtime.cinematic().hasPendingTransition());

    interaction::InputEvent up;
    up.type = interaction::InputEventType::POINTER_UP;
    runtime.inputBus().post(up);
    FrameOutput last;
    for (int i = 0; i < 16; ++i) last = tick(runtime);
    EXPECT_EQ(last.interaction_state, interaction::InteractionState::PATTERN_TRANSITIONING);
}

TEST_F(SceneRuntimeTest, LookAtStaysAboveFloorLine) {
    for (const auto type : camera::ALL_CINEMATIC_TYPES) {
        for (const auto kind : {layout::PatternKind::GRID, layout::PatternKind::WAVE, layout::PatternKind::SPIRAL}) {
            auto s = cinematicSettings(type);
            s.layout.pattern = kind;
            SceneRuntime runtime(s);
            pose = {{0.0f, 5.0f, 40.0f}, {0.0f, 5.0f, 0.0f}};
            for (int i = 0; i < 60; ++i) {
                const auto out = tick(runtime);
                ASSERT_TRUE(out.camera.has_value());
                EXPECT_GE(out.camera->look_at.y, out.camera->position.y - camera::MAX_LOOK_DROP - 1e-3f)
                    << camera::to_string(type) << " over " << layout::to_string(kind);
            }
        }
    }
}

// ============= Auto Rotate =============

TEST_F(SceneRuntimeTest, AutoRotateRunsOnlyWithoutCinematic) {
    config::SceneSettings s;
    s.auto_rotate.enabled = true;
    SceneRuntime runtime(s);

    const auto idle = tick(runtime);
    EXPECT_TRUE(idle.auto_rotating);
    EXPECT_TRUE(idle.camera.has_value());
    EXPECT_TRUE(runtime.autoRotate().isSubscribed());
    EXPECT_EQ(runtime.inputBus().listenerCount(), 1u);

    s.camera_animation.enabled = true;
    s.camera_animation.type = camera::CinematicType::SHOWCASE;
    runtime.applySettings(s);
    EXPECT_FALSE(runtime.autoRotate().isSubscribed());
    EXPECT_TRUE(runtime.cinematic().isSubscribed());
    EXPECT_EQ(runtime.inputBus().listenerCount(), 1u);

    const auto cinematic = tick(runtime);
    EXPECT_FALSE(cinematic.auto_rotating);
    EXPECT_TRUE(cinematic.cinematic_active);

    s.camera_animation.enabled = false;
    runtime.applySettings(s);
    EXPECT_TRUE(runtime.autoRotate().isSubscribed());
    EXPECT_FALSE(runtime.cinematic().isSubscribed());
    EXPECT_TRUE(tick(runtime).auto_rotating);
}

TEST(PathCacheKeyTest, HashDistinguishesFields) {
    const PathCacheKeyHash hash;
    std::unordered_set<size_t> seen;
    for (const auto type : camera::ALL_CINEMATIC_TYPES) {
        for (const int slots : {50, 51}) {
            seen.insert(hash({type, layout::PatternKind::GRID, slots}));
        }
    }
    EXPECT_EQ(seen.size(), 12u);
    EXPECT_NE(hash({camera::CinematicType::SHOWCASE, layout::PatternKind::WAVE, 10}),
              hash({camera::CinematicType::SHOWCASE, layout::PatternKind::SPIRAL, 10}));
    EXPECT_EQ(hash({camera::CinematicType::SHOWCASE, layout::PatternKind::WAVE, 10}),
              hash({camera::CinematicType::SHOWCASE, layout::PatternKind::WAVE, 10}));
}
