/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layout/slot_manager.hpp"
#include "core/logger.hpp"
#include "layout/pattern_types.hpp"
#include <algorithm>
#include <tuple>

namespace pss::layout {

    namespace {
        [[nodiscard]] std::optional<float> initial_aspect_ratio(const core::Photo& photo) {
            if (photo.width && photo.height && *photo.width > 0 && *photo.height > 0) {
                return static_cast<float>(*photo.width) / static_cast<float>(*photo.height);
            }
            if (photo.aspect_ratio && *photo.aspect_ratio > 0.0f) {
                return *photo.aspect_ratio;
            }
            return std::nullopt;
        }

        // Dated photos first, ascending; undated after; ties by id
        [[nodiscard]] bool assignment_order(const core::Photo* a, const core::Photo* b) {
            const bool a_undated = !a->created_at.has_value();
            const bool b_undated = !b->created_at.has_value();
            return std::tie(a_undated, a->created_at, a->id) < std::tie(b_undated, b->created_at, b->id);
        }
    } // namespace

    SlotManager::SlotManager(const int total_slots) {
        updateSlotCount(total_slots);
    }

    void SlotManager::updateSlotCount(const int new_total) {
        const int clamped = clamp_slot_count(new_total);
        if (clamped == total_slots_) return;

        LOG_DEBUG("Slot count {} -> {}", total_slots_, clamped);

        for (int slot = clamped; slot < total_slots_; ++slot) {
            if (const auto& owner = slot_owner_[static_cast<size_t>(slot)]) {
                LOG_TRACE("Evicting '{}' from slot {} (out of range)", *owner, slot);
                assignments_.erase(*owner);
            }
        }

        total_slots_ = clamped;
        slot_owner_.resize(static_cast<size_t>(clamped));
        rebuildAvailableSlots();
    }

    void SlotManager::release(const std::string& photo_id) {
        if (const auto it = assignments_.find(photo_id); it != assignments_.end()) {
            slot_owner_[static_cast<size_t>(it->second)].reset();
            assignments_.erase(it);
        }
        aspect_ratios_.erase(photo_id);
        present_.erase(photo_id);
    }

    void SlotManager::rebuildAvailableSlots() {
        available_slots_.clear();
        for (int slot = 0; slot < total_slots_; ++slot) {
            if (!slot_owner_[static_cast<size_t>(slot)]) {
                available_slots_.push_back(slot);
            }
        }
    }

    SlotAssignments SlotManager::assignSlots(const std::span<const core::Photo> photos) {
        std::vector<const core::Photo*> current;
        current.reserve(photos.size());
        std::unordered_set<std::string> current_ids;
        for (const auto& photo : photos) {
            if (photo.id.empty() || !current_ids.insert(photo.id).second) continue;
            current.push_back(&photo);
        }

        // Drop photos that disappeared
        std::vector<std::string> removed;
        for (const auto& id : present_) {
            if (!current_ids.contains(id)) removed.push_back(id);
        }
        for (const auto& id : removed) {
            LOG_TRACE("Releasing slot of removed photo '{}'", id);
            release(id);
        }

        for (const auto* photo : current) {
            if (present_.insert(photo->id).second) {
                if (const auto ratio = initial_aspect_ratio(*photo)) {
                    aspect_ratios_.emplace(photo->id, *ratio);
                }
            }
        }

        rebuildAvailableSlots();

        std::ranges::sort(current, assignment_order);

        size_t next_free = 0;
        for (const auto* photo : current) {
            if (assignments_.contains(photo->id)) continue;
            if (next_free >= available_slots_.size()) {
                LOG_TRACE("No free slot for '{}'", photo->id);
                continue;
            }
            const int slot = available_slots_[next_free++];
            assignments_.emplace(photo->id, slot);
            slot_owner_[static_cast<size_t>(slot)] = photo->id;
        }
        available_slots_.erase(available_slots_.begin(),
                               available_slots_.begin() + static_cast<ptrdiff_t>(next_free));

        return assignments_;
    }

    std::optional<int> SlotManager::slotOf(const std::string& photo_id) const {
        if (const auto it = assignments_.find(photo_id); it != assignments_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    const std::string* SlotManager::photoAtSlot(const int slot) const {
        if (slot < 0 || slot >= total_slots_) return nullptr;
        const auto& owner = slot_owner_[static_cast<size_t>(slot)];
        return owner ? &*owner : nullptr;
    }

    std::optional<float> SlotManager::getAspectRatio(const std::string& photo_id) const {
        if (const auto it = aspect_ratios_.find(photo_id); it != aspect_ratios_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool SlotManager::recordDetectedAspectRatio(const std::string& photo_id, const float ratio) {
        if (ratio <= 0.0f || !present_.contains(photo_id)) return false;
        return aspect_ratios_.emplace(photo_id, ratio).second;
    }

    SlotStats SlotManager::stats() const {
        SlotStats s;
        s.total_slots = total_slots_;
        s.occupied_slots = static_cast<int>(std::ranges::count_if(slot_owner_, [](const auto& o) { return o.has_value(); }));
        s.available_slots = s.total_slots - s.occupied_slots;
        s.assignments = assignments_.size();
        return s;
    }

} // namespace pss::layout
