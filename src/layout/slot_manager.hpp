/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/photo.hpp"
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pss::layout {

    using SlotAssignments = std::unordered_map<std::string, int>;

    struct SlotStats {
        int total_slots = 0;
        int occupied_slots = 0;
        int available_slots = 0;
        size_t assignments = 0;
    };

    // Stable photo -> slot mapping. A photo keeps its slot until it disappears
    // from the input; freed slots are handed out smallest-first to new photos
    // ordered by (created_at, id).
    class SlotManager {
    public:
        explicit SlotManager(int total_slots);

        // Clamped to [1, 500]. Shrinking evicts assignments at or past the new count.
        void updateSlotCount(int new_total);

        SlotAssignments assignSlots(std::span<const core::Photo> photos);

        [[nodiscard]] std::optional<int> slotOf(const std::string& photo_id) const;
        [[nodiscard]] const std::string* photoAtSlot(int slot) const;

        // Recorded once per photo; later data for the same id is ignored.
        [[nodiscard]] std::optional<float> getAspectRatio(const std::string& photo_id) const;

        // For ratios the renderer detects after loading. Returns false if a
        // ratio is already recorded, the photo is unknown, or ratio <= 0.
        bool recordDetectedAspectRatio(const std::string& photo_id, float ratio);

        [[nodiscard]] int totalSlots() const { return total_slots_; }
        [[nodiscard]] SlotStats stats() const;

    private:
        void release(const std::string& photo_id);
        void rebuildAvailableSlots();

        int total_slots_ = 0;
        SlotAssignments assignments_;
        std::vector<std::optional<std::string>> slot_owner_;
        std::vector<int> available_slots_; // ascending
        std::unordered_map<std::string, float> aspect_ratios_;
        std::unordered_set<std::string> present_;
    };

} // namespace pss::layout
