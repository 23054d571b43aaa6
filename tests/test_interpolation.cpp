/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera/interpolation.hpp"
#include "camera/spline_curve.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using namespace pss::camera;

namespace {
    constexpr float EPSILON = 1e-5f;

    bool isFinite(const glm::vec3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }
} // namespace

// ============= Easing =============

TEST(EasingTest, Endpoints) {
    EXPECT_EQ(blendEasing(0.0f), 0.0f);
    EXPECT_NEAR(blendEasing(1.0f), 1.0f, EPSILON);
}

TEST(EasingTest, InputIsClamped) {
    EXPECT_EQ(blendEasing(-2.0f), 0.0f);
    EXPECT_EQ(blendEasing(3.0f), 1.0f);
}

TEST(EasingTest, EaseInOutIsSymmetricAndMonotonic) {
    EXPECT_NEAR(blendEasing(0.5f), 0.5f, EPSILON);
    float prev = blendEasing(0.0f);
    for (int i = 1; i <= 100; ++i) {
        const float t = static_cast<float>(i) / 100.0f;
        const float v = blendEasing(t);
        EXPECT_GE(v, prev);
        EXPECT_NEAR(v, 1.0f - blendEasing(1.0f - t), 1e-4f);
        prev = v;
    }
}

TEST(EasingTest, StartsAndEndsSlow) {
    EXPECT_LT(blendEasing(0.25f), 0.25f);
    EXPECT_GT(blendEasing(0.75f), 0.75f);
    EXPECT_NEAR(blendEasing(0.25f), 0.0625f, EPSILON);
}

// ============= Catmull-Rom =============

TEST(CatmullRomTest, PassesThroughInnerPoints) {
    const glm::vec3 p0{-1.0f, 0.0f, 0.0f};
    const glm::vec3 p1{0.0f, 1.0f, 0.0f};
    const glm::vec3 p2{2.0f, 1.5f, 1.0f};
    const glm::vec3 p3{3.0f, 0.0f, 4.0f};

    const auto b0 = centripetalCatmullRom(p0, p1, p2, p3, 0.0f);
    const auto b1 = centripetalCatmullRom(p0, p1, p2, p3, 1.0f);
    for (int c = 0; c < 3; ++c) {
        EXPECT_NEAR(b0[c], p1[c], EPSILON);
        EXPECT_NEAR(b1[c], p2[c], 1e-4f);
    }
}

TEST(CatmullRomTest, CollinearPointsStayOnLine) {
    const glm::vec3 p0{0.0f}, p1{1.0f, 0.0f, 0.0f}, p2{2.0f, 0.0f, 0.0f}, p3{3.0f, 0.0f, 0.0f};
    for (const float t : {0.25f, 0.5f, 0.75f}) {
        const auto p = centripetalCatmullRom(p0, p1, p2, p3, t);
        EXPECT_NEAR(p.y, 0.0f, EPSILON);
        EXPECT_NEAR(p.z, 0.0f, EPSILON);
        EXPECT_GT(p.x, 1.0f);
        EXPECT_LT(p.x, 2.0f);
    }
}

TEST(CatmullRomTest, CoincidentPointsStayFinite) {
    const glm::vec3 p{1.0f, 2.0f, 3.0f};
    for (const float t : {0.0f, 0.3f, 1.0f}) {
        EXPECT_TRUE(isFinite(centripetalCatmullRom(p, p, p, p, t)));
        EXPECT_TRUE(isFinite(centripetalCatmullRom(p, p, p + glm::vec3(1.0f), p + glm::vec3(2.0f), t)));
    }
}

// ============= Pose Blend =============

TEST(BlendPosesTest, FactorIsClamped) {
    const CameraPose from{{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}};
    const CameraPose to{{10.0f, 4.0f, 0.0f}, {10.0f, 4.0f, -1.0f}};

    const auto mid = blendPoses(from, to, 0.5f);
    EXPECT_NEAR(mid.position.x, 5.0f, EPSILON);
    EXPECT_NEAR(mid.look_at.y, 2.0f, EPSILON);

    EXPECT_EQ(blendPoses(from, to, -1.0f).position, from.position);
    EXPECT_EQ(blendPoses(from, to, 7.0f).position, to.position);
}

// ============= Closed Spline =============

TEST(ClosedSplineTest, LoopsBackToStart) {
    const std::vector<glm::vec3> square{{0, 0, 0}, {10, 0, 0}, {10, 0, 10}, {0, 0, 10}};
    const ClosedSpline spline(square);

    const auto start = spline.evaluateRaw(0.0f);
    EXPECT_NEAR(glm::length(start - square[0]), 0.0f, EPSILON);
    EXPECT_NEAR(glm::length(spline.evaluateRaw(1.0f) - start), 0.0f, 1e-4f);
    EXPECT_NEAR(glm::length(spline.evaluateRaw(0.25f) - square[1]), 0.0f, 1e-4f);
    EXPECT_GT(spline.length(), 30.0f);
}

TEST(ClosedSplineTest, ArcLengthIsMonotonic) {
    const std::vector<glm::vec3> uneven{{0, 0, 0}, {1, 0, 0}, {30, 0, 0}, {30, 0, 30}};
    const ClosedSpline spline(uneven);

    EXPECT_EQ(spline.arcLengthToRaw(0.0f), 0.0f);
    EXPECT_NEAR(spline.arcLengthToRaw(1.0f), 1.0f, EPSILON);
    float prev = 0.0f;
    for (int i = 1; i <= 50; ++i) {
        const float raw = spline.arcLengthToRaw(static_cast<float>(i) / 50.0f);
        EXPECT_GE(raw, prev);
        prev = raw;
    }
    // The short first segment is crossed quickly in length terms
    EXPECT_GT(spline.arcLengthToRaw(0.05f), 0.0f);
}

TEST(ClosedSplineTest, PassesThroughControlPoints) {
    const std::vector<glm::vec3> tri{{0, 0, 0}, {5, 1, 0}, {2, 0, 6}};
    const ClosedSpline spline(tri);
    for (size_t i = 0; i < tri.size(); ++i) {
        const float u = static_cast<float>(i) / 3.0f;
        EXPECT_NEAR(glm::length(spline.evaluateRaw(u) - tri[i]), 0.0f, 1e-4f);
    }
}

TEST(ClosedSplineTest, NoOvershootOnUnevenSpacing) {
    // Centripetal parameterisation keeps a tight corner from looping past its neighbours
    const std::vector<glm::vec3> corner{{0, 0, 0}, {20, 0, 0}, {20.5f, 0, 0.5f}, {20, 0, 20}};
    const ClosedSpline spline(corner);
    for (int i = 0; i <= 400; ++i) {
        const auto p = spline.evaluateRaw(static_cast<float>(i) / 400.0f);
        EXPECT_TRUE(isFinite(p));
        EXPECT_LT(p.x, 23.0f);
    }
}
