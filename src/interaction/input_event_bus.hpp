/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "interaction/input_event.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace pss::interaction {

    using InputListener = std::function<void(const InputEvent&)>;

    /**
     * @brief Synchronous fan-out of host input events
     *
     * Listeners are held only as long as their Subscription lives. A
     * Subscription may outlive the bus; releasing it then does nothing.
     */
    class InputEventBus {
        struct Registry {
            std::vector<std::pair<uint64_t, InputListener>> listeners;
            uint64_t next_id = 1;
        };

    public:
        // RAII guard: the listener is removed on destruction or reset()
        class Subscription {
        public:
            Subscription() = default;
            ~Subscription() { reset(); }

            Subscription(const Subscription&) = delete;
            Subscription& operator=(const Subscription&) = delete;
            Subscription(Subscription&& other) noexcept;
            Subscription& operator=(Subscription&& other) noexcept;

            void reset();
            [[nodiscard]] bool active() const;

        private:
            friend class InputEventBus;
            Subscription(std::weak_ptr<Registry> registry, uint64_t id)
                : registry_(std::move(registry)),
                  id_(id) {}

            std::weak_ptr<Registry> registry_;
            uint64_t id_ = 0;
        };

        InputEventBus();

        [[nodiscard]] Subscription subscribe(InputListener listener);

        // Listeners removed during dispatch are not called; ones added wait for the next post
        void post(const InputEvent& event) const;

        [[nodiscard]] size_t listenerCount() const { return registry_->listeners.size(); }

    private:
        std::shared_ptr<Registry> registry_;
    };

} // namespace pss::interaction
