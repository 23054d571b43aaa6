/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/simulation.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <string_view>

namespace pss::app {

    namespace {
        using json = nlohmann::json;

        constexpr glm::vec3 INITIAL_CAMERA_POSITION{0.0f, 5.0f, 40.0f};
        constexpr glm::vec3 INITIAL_CAMERA_TARGET{0.0f, 5.0f, 0.0f};

        [[nodiscard]] json vec_to_json(const glm::vec3& v) {
            return json::array({v.x, v.y, v.z});
        }

        // Accepts snake_case and the camelCase used by web clients
        [[nodiscard]] const json* find_key(const json& j, const char* snake, const char* camel) {
            if (const auto it = j.find(snake); it != j.end() && !it->is_null()) return &*it;
            if (const auto it = j.find(camel); it != j.end() && !it->is_null()) return &*it;
            return nullptr;
        }

        // YYYY-MM-DD[(T| )hh:mm[:ss[.fff]]][Z|(+|-)hh[:mm]] to epoch milliseconds
        [[nodiscard]] std::optional<int64_t> parse_iso_timestamp(const std::string_view text) {
            size_t pos = 0;
            const auto number = [&](const size_t digits, int& out) {
                if (pos + digits > text.size()) return false;
                const char* begin = text.data() + pos;
                const auto [ptr, ec] = std::from_chars(begin, begin + digits, out);
                if (ec != std::errc{} || ptr != begin + digits) return false;
                pos += digits;
                return true;
            };
            const auto accept = [&](const char c) {
                if (pos < text.size() && text[pos] == c) {
                    ++pos;
                    return true;
                }
                return false;
            };

            int year = 0, month = 0, day = 0;
            if (!number(4, year) || !accept('-') || !number(2, month) || !accept('-') || !number(2, day)) {
                return std::nullopt;
            }
            const std::chrono::year_month_day date{std::chrono::year{year},
                                                   std::chrono::month{static_cast<unsigned>(month)},
                                                   std::chrono::day{static_cast<unsigned>(day)}};
            if (!date.ok()) return std::nullopt;

            int hour = 0, minute = 0, second = 0, millis = 0;
            if (accept('T') || accept(' ')) {
                if (!number(2, hour) || !accept(':') || !number(2, minute)) return std::nullopt;
                if (accept(':')) {
                    if (!number(2, second)) return std::nullopt;
                    if (accept('.')) {
                        // Digits past milliseconds are dropped
                        const size_t start = pos;
                        int scale = 100;
                        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                            millis += (text[pos] - '0') * scale;
                            scale /= 10;
                            ++pos;
                        }
                        if (pos == start) return std::nullopt;
                    }
                }
                if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
            }

            int offset_minutes = 0;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
                const int sign = text[pos] == '-' ? -1 : 1;
                ++pos;
                int offset_hours = 0, offset_mins = 0;
                if (!number(2, offset_hours)) return std::nullopt;
                accept(':');
                if (pos < text.size() && !number(2, offset_mins)) return std::nullopt;
                offset_minutes = sign * (offset_hours * 60 + offset_mins);
            } else {
                accept('Z');
            }
            if (pos != text.size()) return std::nullopt;

            const auto utc = std::chrono::sys_days{date} + std::chrono::hours{hour} +
                             std::chrono::minutes{minute - offset_minutes} + std::chrono::seconds{second} +
                             std::chrono::milliseconds{millis};
            return std::chrono::duration_cast<std::chrono::milliseconds>(utc.time_since_epoch()).count();
        }

        // Epoch milliseconds, or an ISO-8601 string as stored by the web backend
        [[nodiscard]] std::optional<int64_t> parse_created_at(const json& value) {
            if (value.is_number_integer()) return value.get<int64_t>();
            if (value.is_number_float()) {
                const double ms = value.get<double>();
                if (!std::isfinite(ms)) return std::nullopt;
                return static_cast<int64_t>(std::llround(ms));
            }
            if (value.is_string()) return parse_iso_timestamp(value.get_ref<const std::string&>());
            return std::nullopt;
        }

        [[nodiscard]] std::expected<json, std::string> read_json_file(const std::filesystem::path& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                return std::unexpected("Failed to open " + path.string());
            }
            try {
                return json::parse(file);
            } catch (const json::parse_error& e) {
                return std::unexpected("Failed to parse " + path.string() + ": " + e.what());
            }
        }
    } // namespace

    std::expected<core::Photo, std::string> parse_photo(const json& j) {
        if (!j.is_object()) return std::unexpected("photo entry must be an object");
        try {
            core::Photo photo;
            photo.id = j.value("id", std::string{});
            photo.url = j.value("url", std::string{});
            if (const auto* v = find_key(j, "aspect_ratio", "aspectRatio")) photo.aspect_ratio = v->get<float>();
            if (const auto* v = find_key(j, "width", "width")) photo.width = v->get<int>();
            if (const auto* v = find_key(j, "height", "height")) photo.height = v->get<int>();
            if (const auto* v = find_key(j, "created_at", "createdAt")) {
                const auto created = parse_created_at(*v);
                if (!created) {
                    return std::unexpected(std::format("photo '{}': unreadable createdAt {}", photo.id, v->dump()));
                }
                photo.created_at = *created;
            }
            return photo;
        } catch (const json::exception& e) {
            return std::unexpected(std::format("photo '{}': {}", j.value("id", std::string{"?"}), e.what()));
        }
    }

    std::expected<std::vector<core::Photo>, std::string> parse_photos(const json& j) {
        const json* list = &j;
        if (j.is_object()) {
            if (!j.contains("photos")) return std::unexpected("expected a 'photos' array");
            list = &j["photos"];
        }
        if (!list->is_array()) return std::unexpected("photos must be an array");

        std::vector<core::Photo> photos;
        photos.reserve(list->size());
        size_t skipped = 0;
        for (const auto& entry : *list) {
            auto photo = parse_photo(entry);
            if (!photo) {
                LOG_WARN("Skipping malformed photo entry: {}", photo.error());
                ++skipped;
                continue;
            }
            photos.push_back(std::move(*photo));
        }
        if (skipped > 0) {
            LOG_WARN("Skipped {} of {} photo entries", skipped, list->size());
        }
        return photos;
    }

    std::expected<std::vector<core::Photo>, std::string> load_photos(const std::filesystem::path& path) {
        const auto j = read_json_file(path);
        if (!j) return std::unexpected(j.error());
        auto photos = parse_photos(*j);
        if (!photos) return std::unexpected(path.string() + ": " + photos.error());
        LOG_INFO("Loaded {} photos from {}", photos->size(), path.string());
        return photos;
    }

    std::expected<std::vector<ScriptAction>, std::string> parse_input_script(const json& j) {
        const json* list = &j;
        if (j.is_object()) {
            if (!j.contains("actions")) return std::unexpected("expected an 'actions' array");
            list = &j["actions"];
        }
        if (!list->is_array()) return std::unexpected("input script must be an array");

        std::vector<ScriptAction> actions;
        try {
            for (const auto& entry : *list) {
                ScriptAction action;
                action.frame = entry.at("frame").get<int>();
                if (action.frame < 0) return std::unexpected("action frame must be >= 0");

                if (entry.contains("event")) {
                    const auto name = entry["event"].get<std::string>();
                    const auto type = interaction::parse_input_event_type(name);
                    if (!type) return std::unexpected(std::format("unknown input event '{}'", name));
                    interaction::InputEvent event;
                    event.type = *type;
                    event.targets_surface = entry.value("targets_surface", true);
                    event.wheel_delta = entry.value("wheel_delta", 0.0f);
                    action.event = event;
                }
                if (entry.contains("settings")) {
                    action.settings_patch = entry["settings"];
                }
                if (entry.contains("add_photos")) {
                    auto added = parse_photos(entry["add_photos"]);
                    if (!added) return std::unexpected(added.error());
                    action.add_photos = std::move(*added);
                }
                if (entry.contains("remove_photos")) {
                    action.remove_photos = entry["remove_photos"].get<std::vector<std::string>>();
                }
                actions.push_back(std::move(action));
            }
        } catch (const json::exception& e) {
            return std::unexpected(std::string("input script: ") + e.what());
        }

        std::ranges::stable_sort(actions, {}, &ScriptAction::frame);
        return actions;
    }

    std::expected<std::vector<ScriptAction>, std::string> load_input_script(const std::filesystem::path& path) {
        const auto j = read_json_file(path);
        if (!j) return std::unexpected(j.error());
        auto actions = parse_input_script(*j);
        if (!actions) return std::unexpected(path.string() + ": " + actions.error());
        LOG_INFO("Loaded {} scripted actions from {}", actions->size(), path.string());
        return actions;
    }

    Simulation::Simulation(config::SceneSettings settings, std::vector<core::Photo> photos,
                           std::vector<ScriptAction> script)
        : settings_(std::move(settings)),
          photos_(std::move(photos)),
          script_(std::move(script)),
          runtime_(settings_),
          camera_{INITIAL_CAMERA_POSITION, INITIAL_CAMERA_TARGET} {
        std::ranges::stable_sort(script_, {}, &ScriptAction::frame);
    }

    std::expected<void, std::string> Simulation::applyActions(const int frame) {
        while (next_action_ < script_.size() && script_[next_action_].frame <= frame) {
            const auto& action = script_[next_action_++];

            if (action.settings_patch) {
                auto doc = config::scene_settings_to_json(settings_);
                doc.merge_patch(*action.settings_patch);
                auto updated = config::parse_scene_settings(doc);
                if (!updated) {
                    return std::unexpected(std::format("frame {}: {}", frame, updated.error()));
                }
                settings_ = std::move(*updated);
                runtime_.applySettings(settings_);
                LOG_INFO("Frame {}: settings updated", frame);
            }

            for (const auto& id : action.remove_photos) {
                std::erase_if(photos_, [&id](const core::Photo& p) { return p.id == id; });
            }
            photos_.insert(photos_.end(), action.add_photos.begin(), action.add_photos.end());

            if (action.event) {
                LOG_DEBUG("Frame {}: input {}", frame, interaction::to_string(action.event->type));
                runtime_.inputBus().post(*action.event);
            }
        }
        return {};
    }

    std::expected<void, std::string> Simulation::run(const int frames, const float dt) {
        LOG_TIMER("Simulation");
        records_.clear();
        records_.reserve(static_cast<size_t>(std::max(frames, 0)));
        std::chrono::steady_clock::duration tick_time{};

        for (int frame = 0; frame < frames; ++frame) {
            if (auto applied = applyActions(frame); !applied) {
                return applied;
            }

            const auto tick_start = std::chrono::steady_clock::now();
            auto output = runtime_.tick(dt, photos_, camera_);
            tick_time += std::chrono::steady_clock::now() - tick_start;
            if (output.camera) {
                camera_ = *output.camera;
            }

            FrameRecord record;
            record.frame = frame;
            record.time = output.time;
            record.state = output.interaction_state;
            record.camera = camera_;
            record.camera_driven = output.camera.has_value();
            record.used_fallback = output.layout.used_fallback;
            record.occupied_slots = output.layout.stats.occupied_slots;
            records_.push_back(record);
        }

        LOG_INFO("Simulated {} frames ({:.2f}s)", frames, static_cast<double>(frames) * dt);
        if (frames > 0) {
            const double tick_ms = std::chrono::duration<double, std::milli>(tick_time).count();
            LOG_PERF("Runtime tick: {:.3f}ms average over {} frames", tick_ms / frames, frames);
        }
        return {};
    }

    json Simulation::toJson() const {
        json frames = json::array();
        size_t driven = 0;
        size_t fallback = 0;
        float min_look_margin = std::numeric_limits<float>::infinity();

        for (const auto& r : records_) {
            frames.push_back({
                {"frame", r.frame},
                {"time", r.time},
                {"state", std::string(interaction::to_string(r.state))},
                {"camera_driven", r.camera_driven},
                {"position", vec_to_json(r.camera.position)},
                {"look_at", vec_to_json(r.camera.look_at)},
                {"used_fallback", r.used_fallback},
                {"occupied_slots", r.occupied_slots}});
            driven += r.camera_driven ? 1 : 0;
            fallback += r.used_fallback ? 1 : 0;
            if (r.camera_driven) {
                min_look_margin = std::min(min_look_margin, r.camera.look_at.y - r.camera.position.y);
            }
        }

        json summary = {
            {"frames", records_.size()},
            {"camera_driven_frames", driven},
            {"fallback_frames", fallback},
            {"cached_paths", runtime_.pathCache().size()}};
        if (std::isfinite(min_look_margin)) {
            summary["min_look_margin"] = min_look_margin;
        }
        return {{"version", 1}, {"summary", summary}, {"frames", frames}};
    }

    std::expected<void, std::string> write_json(const json& j, const std::filesystem::path& path) {
        try {
            std::ofstream file(path);
            if (!file.is_open()) {
                return std::unexpected("Failed to open " + path.string() + " for writing");
            }
            file << j.dump(2);
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Write failed: ") + e.what());
        }
    }

} // namespace pss::app
