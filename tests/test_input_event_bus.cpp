/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/auto_rotate_camera.hpp"
#include "interaction/input_event_bus.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <vector>

using namespace pss;
using namespace pss::interaction;

namespace {
    InputEvent event(const InputEventType type) {
        InputEvent e;
        e.type = type;
        return e;
    }
} // namespace

// ============= Input Event Bus =============

TEST(InputEventBusTest, DeliversToAllListeners) {
    InputEventBus bus;
    std::vector<InputEventType> first;
    std::vector<InputEventType> second;
    auto a = bus.subscribe([&](const InputEvent& e) { first.push_back(e.type); });
    auto b = bus.subscribe([&](const InputEvent& e) { second.push_back(e.type); });

    bus.post(event(InputEventType::WHEEL));
    bus.post(event(InputEventType::KEY_DOWN));
    EXPECT_EQ(first, (std::vector{InputEventType::WHEEL, InputEventType::KEY_DOWN}));
    EXPECT_EQ(second, first);
}

TEST(InputEventBusTest, SubscriptionDestructionRemovesListener) {
    InputEventBus bus;
    int calls = 0;
    {
        auto sub = bus.subscribe([&](const InputEvent&) { ++calls; });
        EXPECT_TRUE(sub.active());
        EXPECT_EQ(bus.listenerCount(), 1u);
        bus.post(event(InputEventType::POINTER_DOWN));
    }
    EXPECT_EQ(bus.listenerCount(), 0u);
    bus.post(event(InputEventType::POINTER_DOWN));
    EXPECT_EQ(calls, 1);
}

TEST(InputEventBusTest, ResetIsIdempotent) {
    InputEventBus bus;
    auto sub = bus.subscribe([](const InputEvent&) {});
    sub.reset();
    sub.reset();
    EXPECT_FALSE(sub.active());
    EXPECT_EQ(bus.listenerCount(), 0u);
}

TEST(InputEventBusTest, MoveTransfersOwnership) {
    InputEventBus bus;
    int calls = 0;
    InputEventBus::Subscription outer;
    {
        auto inner = bus.subscribe([&](const InputEvent&) { ++calls; });
        outer = std::move(inner);
        EXPECT_FALSE(inner.active());
    }
    EXPECT_TRUE(outer.active());
    bus.post(event(InputEventType::KEY_DOWN));
    EXPECT_EQ(calls, 1);

    // Assigning over a live subscription releases the old listener
    outer = bus.subscribe([](const InputEvent&) {});
    EXPECT_EQ(bus.listenerCount(), 1u);
    bus.post(event(InputEventType::KEY_DOWN));
    EXPECT_EQ(calls, 1);
}

TEST(InputEventBusTest, SubscriptionMayOutliveBus) {
    auto bus = std::make_unique<InputEventBus>();
    auto sub = bus->subscribe([](const InputEvent&) {});
    bus.reset();
    EXPECT_FALSE(sub.active());
    sub.reset();
}

TEST(InputEventBusTest, ListenerMayUnsubscribeItselfDuringDispatch) {
    InputEventBus bus;
    int self_calls = 0;
    int other_calls = 0;
    InputEventBus::Subscription self;
    self = bus.subscribe([&](const InputEvent&) {
        ++self_calls;
        self.reset();
    });
    auto other = bus.subscribe([&](const InputEvent&) { ++other_calls; });

    bus.post(event(InputEventType::POINTER_UP));
    bus.post(event(InputEventType::POINTER_UP));
    EXPECT_EQ(self_calls, 1);
    EXPECT_EQ(other_calls, 2);
    EXPECT_EQ(bus.listenerCount(), 1u);
}

TEST(InputEventBusTest, ListenerRemovedMidDispatchIsSkipped) {
    InputEventBus bus;
    int late_calls = 0;
    InputEventBus::Subscription late;
    auto early = bus.subscribe([&](const InputEvent&) { late.reset(); });
    late = bus.subscribe([&](const InputEvent&) { ++late_calls; });

    bus.post(event(InputEventType::KEY_DOWN));
    EXPECT_EQ(late_calls, 0);
}

TEST(InputEventBusTest, ListenerAddedMidDispatchWaitsForNextPost) {
    InputEventBus bus;
    int added_calls = 0;
    std::vector<InputEventBus::Subscription> added;
    auto adder = bus.subscribe([&](const InputEvent&) {
        added.push_back(bus.subscribe([&](const InputEvent&) { ++added_calls; }));
    });

    bus.post(event(InputEventType::KEY_DOWN));
    EXPECT_EQ(added_calls, 0);
    bus.post(event(InputEventType::KEY_DOWN));
    EXPECT_EQ(added_calls, 1);
}

TEST(InputEventBusTest, EventNamesRoundTrip) {
    for (const auto type : {InputEventType::POINTER_DOWN, InputEventType::POINTER_UP, InputEventType::POINTER_MOVE,
                            InputEventType::TOUCH_START, InputEventType::TOUCH_END, InputEventType::WHEEL,
                            InputEventType::KEY_DOWN}) {
        EXPECT_EQ(parse_input_event_type(to_string(type)), type);
    }
    EXPECT_FALSE(parse_input_event_type("double_click").has_value());
}

// ============= Auto Rotate =============

class AutoRotateTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.enabled = true;
        settings.pause_on_interaction = 1.5f;
    }

    InputEventBus bus;
    AutoRotateCamera camera{bus};
    AutoRotateSettings settings;
    static constexpr float DT = 0.125f;
};

TEST_F(AutoRotateTest, DisabledDoesNothing) {
    EXPECT_FALSE(camera.update(DT).has_value());
    EXPECT_FALSE(camera.isSubscribed());
    EXPECT_EQ(bus.listenerCount(), 0u);
}

TEST_F(AutoRotateTest, OrbitsFocusWithinElevationBand) {
    settings.focus_offset = {1.0f, 2.0f, 3.0f};
    camera.setSettings(settings);
    EXPECT_TRUE(camera.isSubscribed());

    for (int i = 0; i < 200; ++i) {
        const auto pose = camera.update(DT);
        ASSERT_TRUE(pose.has_value());
        EXPECT_EQ(pose->look_at, settings.focus_offset);

        glm::vec3 offset = pose->position - pose->look_at;
        const float horizontal = std::sqrt(offset.x * offset.x + offset.z * offset.z);
        EXPECT_GE(horizontal, settings.radius * std::sin(settings.elevation_min) - 1e-3f);
        EXPECT_LE(horizontal, settings.radius * std::sin(settings.elevation_max) + 1e-3f);
        EXPECT_GT(offset.y, settings.height);
    }
}

TEST_F(AutoRotateTest, PausesWhileHeldAndAfterRelease) {
    camera.setSettings(settings);
    ASSERT_TRUE(camera.update(DT).has_value());

    bus.post(event(InputEventType::POINTER_DOWN));
    EXPECT_TRUE(camera.isPaused());
    for (int i = 0; i < 40; ++i) {
        EXPECT_FALSE(camera.update(DT).has_value());
    }

    bus.post(event(InputEventType::POINTER_UP));
    // 1.5 s = 12 frames
    for (int i = 0; i < 12; ++i) {
        EXPECT_FALSE(camera.update(DT).has_value()) << "frame " << i;
    }
    EXPECT_FALSE(camera.isPaused());
    EXPECT_TRUE(camera.update(DT).has_value());
}

TEST_F(AutoRotateTest, WheelPausesHoverDoesNot) {
    camera.setSettings(settings);
    bus.post(event(InputEventType::POINTER_MOVE));
    EXPECT_FALSE(camera.isPaused());

    bus.post(event(InputEventType::WHEEL));
    EXPECT_TRUE(camera.isPaused());
}

TEST_F(AutoRotateTest, DisablingUnsubscribes) {
    camera.setSettings(settings);
    camera.setSettings(settings);
    EXPECT_EQ(bus.listenerCount(), 1u);

    settings.enabled = false;
    camera.setSettings(settings);
    EXPECT_EQ(bus.listenerCount(), 0u);
    EXPECT_FALSE(camera.update(DT).has_value());
}

TEST_F(AutoRotateTest, ElevationBoundsAreOrdered) {
    settings.elevation_min = 1.2f;
    settings.elevation_max = 0.4f;
    camera.setSettings(settings);
    EXPECT_LT(camera.settings().elevation_min, camera.settings().elevation_max);
}
