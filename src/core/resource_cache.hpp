/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace pss::core {

    /**
     * @brief Bounded key/value cache with least-recently-used eviction
     *
     * Owned explicitly by whoever needs it and passed by reference to
     * collaborators. There is no global instance.
     *
     * Example:
     *   ResourceCache<std::string, TextureHandle> textures(64);
     *   if (auto* tex = textures.find(url)) { ... }
     *   else textures.insert(url, load(url));
     */
    template <typename Key, typename Value, typename Hash = std::hash<Key>>
    class ResourceCache {
    public:
        explicit ResourceCache(const size_t capacity)
            : capacity_(std::max<size_t>(capacity, 1)) {}

        ResourceCache(const ResourceCache&) = delete;
        ResourceCache& operator=(const ResourceCache&) = delete;

        // Returns nullptr on miss. A hit makes the entry most recent.
        [[nodiscard]] Value* find(const Key& key) {
            const auto it = index_.find(key);
            if (it == index_.end()) {
                ++misses_;
                return nullptr;
            }
            ++hits_;
            entries_.splice(entries_.begin(), entries_, it->second);
            return &it->second->second;
        }

        [[nodiscard]] bool contains(const Key& key) const {
            return index_.contains(key);
        }

        // Inserts or replaces. Returns the evicted key, if any.
        std::optional<Key> insert(const Key& key, Value value) {
            if (const auto it = index_.find(key); it != index_.end()) {
                it->second->second = std::move(value);
                entries_.splice(entries_.begin(), entries_, it->second);
                return std::nullopt;
            }

            entries_.emplace_front(key, std::move(value));
            index_.emplace(key, entries_.begin());

            if (entries_.size() <= capacity_) {
                return std::nullopt;
            }
            auto evicted = std::move(entries_.back().first);
            index_.erase(evicted);
            entries_.pop_back();
            return evicted;
        }

        bool erase(const Key& key) {
            const auto it = index_.find(key);
            if (it == index_.end()) return false;
            entries_.erase(it->second);
            index_.erase(it);
            return true;
        }

        void clear() {
            entries_.clear();
            index_.clear();
        }

        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] size_t capacity() const { return capacity_; }
        [[nodiscard]] size_t hits() const { return hits_; }
        [[nodiscard]] size_t misses() const { return misses_; }

    private:
        using Entry = std::pair<Key, Value>;

        size_t capacity_;
        std::list<Entry> entries_; // front = most recent
        std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
        size_t hits_ = 0;
        size_t misses_ = 0;
    };

} // namespace pss::core
