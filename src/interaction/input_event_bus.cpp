/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interaction/input_event_bus.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace pss::interaction {

    namespace {
        struct EventName {
            InputEventType type;
            std::string_view name;
        };

        constexpr EventName EVENT_NAMES[] = {
            {InputEventType::POINTER_DOWN, "pointer_down"},
            {InputEventType::POINTER_UP, "pointer_up"},
            {InputEventType::POINTER_MOVE, "pointer_move"},
            {InputEventType::TOUCH_START, "touch_start"},
            {InputEventType::TOUCH_END, "touch_end"},
            {InputEventType::WHEEL, "wheel"},
            {InputEventType::KEY_DOWN, "key_down"},
        };
    } // namespace

    std::string_view to_string(const InputEventType type) {
        for (const auto& [t, name] : EVENT_NAMES) {
            if (t == type) return name;
        }
        return "unknown";
    }

    std::optional<InputEventType> parse_input_event_type(const std::string_view name) {
        for (const auto& [t, n] : EVENT_NAMES) {
            if (n == name) return t;
        }
        return std::nullopt;
    }

    InputEventBus::Subscription::Subscription(Subscription&& other) noexcept
        : registry_(std::move(other.registry_)),
          id_(std::exchange(other.id_, 0)) {}

    InputEventBus::Subscription& InputEventBus::Subscription::operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            registry_ = std::move(other.registry_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    void InputEventBus::Subscription::reset() {
        if (id_ == 0) return;
        if (const auto registry = registry_.lock()) {
            std::erase_if(registry->listeners, [this](const auto& entry) { return entry.first == id_; });
        }
        registry_.reset();
        id_ = 0;
    }

    bool InputEventBus::Subscription::active() const {
        return id_ != 0 && !registry_.expired();
    }

    InputEventBus::InputEventBus()
        : registry_(std::make_shared<Registry>()) {}

    InputEventBus::Subscription InputEventBus::subscribe(InputListener listener) {
        const uint64_t id = registry_->next_id++;
        registry_->listeners.emplace_back(id, std::move(listener));
        LOG_TRACE("Input listener {} subscribed ({} total)", id, registry_->listeners.size());
        return Subscription(registry_, id);
    }

    void InputEventBus::post(const InputEvent& event) const {
        std::vector<uint64_t> ids;
        ids.reserve(registry_->listeners.size());
        for (const auto& entry : registry_->listeners) {
            ids.push_back(entry.first);
        }

        for (const uint64_t id : ids) {
            // Skip listeners removed by an earlier callback in this dispatch
            const auto it = std::ranges::find(registry_->listeners, id, &std::pair<uint64_t, InputListener>::first);
            if (it == registry_->listeners.end() || !it->second) continue;
            const InputListener listener = it->second;
            listener(event);
        }
    }

} // namespace pss::interaction
