/* SPDX-FileCopyrightText: 2025 PhotoSphere Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera/waypoint_generator.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>

namespace pss::camera {

    namespace {
        constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
        constexpr float PI = std::numbers::pi_v<float>;

        constexpr int SHOWCASE_POINTS = 24;
        constexpr size_t GALLERY_MAX_STOPS = 24;
        constexpr int SPIRAL_TURNS = 3;
        constexpr int SPIRAL_POINTS_PER_TURN = 20;
        constexpr int WAVE_DESCENT_POINTS = 3;
        constexpr int WAVE_PASSES = 3;
        constexpr int WAVE_POINTS_PER_PASS = 24;
        constexpr int WAVE_RETURN_POINTS = 5;
        constexpr int SWEEP_ROWS = 5;
        constexpr int SWEEP_COLS = 6;
        constexpr float SWEEP_FLOOR_MARGIN = 10.0f;
        constexpr size_t FOCUS_MAX_STOPS = 20;

        constexpr float WALL_DEPTH_RATIO = 0.25f;
        constexpr float MIN_DIRECTION = 1e-4f;

        [[nodiscard]] glm::vec3 horizontal(glm::vec3 v) {
            v.y = 0.0f;
            return v;
        }

        // Direction from which a photo at p is viewed
        [[nodiscard]] glm::vec3 viewing_normal(const glm::vec3& p, const SceneFrame& frame) {
            if (frame.is_wall) return {0.0f, 0.0f, 1.0f};
            const glm::vec3 out = horizontal(p - frame.centroid);
            if (glm::length(out) < MIN_DIRECTION) return {0.0f, 0.0f, 1.0f};
            return glm::normalize(out);
        }

        [[nodiscard]] glm::vec3 at_height(glm::vec3 p, const float y) {
            p.y = y;
            return p;
        }

        // Small loop around a single point so every type yields a closed path
        void append_orbit(std::vector<Waypoint>& out, const glm::vec3& target, const float radius, const float height) {
            for (int i = 0; i < 4; ++i) {
                const float angle = static_cast<float>(i) * 0.5f * PI;
                const glm::vec3 offset{std::cos(angle) * radius, 0.0f, std::sin(angle) * radius};
                out.push_back({at_height(target + offset, height), target});
            }
        }

        std::vector<Waypoint> showcase(const SceneFrame& frame) {
            std::vector<Waypoint> out;
            out.reserve(SHOWCASE_POINTS);
            for (int i = 0; i < SHOWCASE_POINTS; ++i) {
                const float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(SHOWCASE_POINTS);
                const glm::vec3 offset{std::cos(angle) * frame.base_distance, 0.0f,
                                       std::sin(angle) * frame.base_distance};
                out.push_back({at_height(frame.centroid + offset, frame.base_height), frame.centroid});
            }
            return out;
        }

        std::vector<Waypoint> gallery_walk(std::span<const glm::vec3> positions, const SceneFrame& frame,
                                           const CameraPathSettings& settings) {
            const float ps = settings.photo_size;
            const float walk_distance = ps * 3.0f;

            // Back-to-front rows of one photo depth, left to right inside a row
            std::vector<size_t> order(positions.size());
            std::iota(order.begin(), order.end(), size_t{0});
            const auto row_of = [&](const size_t i) { return std::lround(positions[i].z / ps); };
            std::ranges::stable_sort(order, [&](const size_t a, const size_t b) {
                const long ra = row_of(a);
                const long rb = row_of(b);
                if (ra != rb) return ra < rb;
                return positions[a].x < positions[b].x;
            });

            const size_t step = (order.size() + GALLERY_MAX_STOPS - 1) / GALLERY_MAX_STOPS;
            std::vector<Waypoint> out;
            for (size_t k = 0; k < order.size(); k += step) {
                const glm::vec3& p = positions[order[k]];
                const auto index = static_cast<float>(out.size());
                const glm::vec3 normal = viewing_normal(p, frame);
                const glm::vec3 side{-normal.z, 0.0f, normal.x};
                const float sway = std::sin(index * 0.1f) * ps * 0.2f;
                glm::vec3 camera = p + normal * walk_distance + side * sway;
                camera.y = p.y + 1.0f + std::sin(index * 0.05f);
                out.push_back({camera, p});
            }

            if (out.size() < 2) {
                out.clear();
                const glm::vec3& p = positions.front();
                append_orbit(out, p, walk_distance, p.y + 1.0f);
            }
            return out;
        }

        std::vector<Waypoint> spiral_tour(const SceneFrame& frame, const CameraPathSettings& settings) {
            const float max_radius = std::max(frame.radius + settings.photo_size * 3.0f, frame.base_distance * 0.5f);
            constexpr int total = SPIRAL_TURNS * SPIRAL_POINTS_PER_TURN;

            std::vector<Waypoint> out;
            out.reserve(total);
            for (int i = 0; i < total; ++i) {
                const float t = static_cast<float>(i) / static_cast<float>(total);
                const float angle = t * static_cast<float>(SPIRAL_TURNS) * TWO_PI;
                const float radius = max_radius * (0.3f + 0.7f * t);
                const float height = frame.base_height + std::sin(t * TWO_PI) * frame.height_variation +
                                     t * frame.height_variation;
                const glm::vec3 offset{std::cos(angle) * radius, 0.0f, std::sin(angle) * radius};
                out.push_back({at_height(frame.centroid + offset, height), frame.centroid});
            }
            return out;
        }

        std::vector<Waypoint> wave_follow(const SceneFrame& frame, const CameraPathSettings& settings) {
            const float ps = settings.photo_size;
            const float field_radius = std::max(frame.radius, ps * 6.0f);
            const float hv = frame.height_variation;
            const glm::vec3& c = frame.centroid;

            // Look slightly inward of the camera at photo height
            const auto look_for = [&](const glm::vec3& camera) {
                return at_height(glm::mix(c, camera, 0.3f), c.y);
            };

            std::vector<Waypoint> out;
            const glm::vec3 entry = at_height(c, frame.base_height + hv * 2.0f);
            out.push_back({entry, c});

            for (int i = 1; i <= WAVE_DESCENT_POINTS; ++i) {
                const float t = static_cast<float>(i) / static_cast<float>(WAVE_DESCENT_POINTS);
                const glm::vec3 camera{c.x + std::sin(t * PI) * ps * 2.0f,
                                       frame.base_height + hv * 2.0f * (1.0f - t),
                                       c.z + std::cos(t * PI) * ps * 2.0f};
                out.push_back({camera, look_for(camera)});
            }

            for (int pass = 0; pass < WAVE_PASSES; ++pass) {
                const float radius = field_radius * (0.4f + 0.3f * static_cast<float>(pass));
                for (int i = 0; i < WAVE_POINTS_PER_PASS; ++i) {
                    const float t = static_cast<float>(i) / static_cast<float>(WAVE_POINTS_PER_PASS);
                    const float angle = t * TWO_PI;
                    const float wave = std::sin(radius * settings.wave_frequency) * hv;
                    const glm::vec3 camera{c.x + std::cos(angle) * radius + std::sin(angle * 3.0f) * ps,
                                           frame.base_height + wave + std::sin(t * 2.0f * TWO_PI) * hv * 0.5f,
                                           c.z + std::sin(angle) * radius + std::cos(angle * 3.0f) * ps};
                    out.push_back({camera, look_for(camera)});
                }
            }

            const float last_radius = field_radius * (0.4f + 0.3f * static_cast<float>(WAVE_PASSES - 1));
            for (int i = 1; i <= WAVE_RETURN_POINTS; ++i) {
                const float t = static_cast<float>(i) / static_cast<float>(WAVE_RETURN_POINTS + 1);
                const float radius = last_radius * (1.0f - t);
                const glm::vec3 camera{c.x + std::cos(t * TWO_PI) * radius,
                                       frame.base_height + hv * 2.0f * t,
                                       c.z + std::sin(t * TWO_PI) * radius};
                out.push_back({camera, look_for(camera)});
            }
            return out;
        }

        std::vector<Waypoint> grid_sweep(const SceneFrame& frame, const CameraPathSettings& settings) {
            const float ps = settings.photo_size;
            std::vector<Waypoint> out;
            out.reserve(SWEEP_ROWS * SWEEP_COLS);

            const auto lerp_axis = [](const float lo, const float hi, const int i, const int n) {
                return lo + (hi - lo) * static_cast<float>(i) / static_cast<float>(n - 1);
            };

            for (int row = 0; row < SWEEP_ROWS; ++row) {
                for (int col = 0; col < SWEEP_COLS; ++col) {
                    const int column = row % 2 == 0 ? col : SWEEP_COLS - 1 - col;
                    const float wobble = std::sin(static_cast<float>(row) * 0.3f + static_cast<float>(column) * 0.2f);

                    if (frame.is_wall) {
                        // Face the x/y wall from the front, top row first
                        const float front = std::max(ps * 3.0f, frame.base_distance * 0.5f);
                        const float x = lerp_axis(frame.min.x - ps, frame.max.x + ps, column, SWEEP_COLS);
                        const float y = lerp_axis(frame.max.y + ps, frame.min.y - ps, row, SWEEP_ROWS) +
                                        wobble * frame.height_variation * 0.5f;
                        const glm::vec3 camera{x, y, frame.max.z + front};
                        out.push_back({camera, glm::vec3{x, y, frame.min.z}});
                    } else {
                        const float x = lerp_axis(frame.min.x - SWEEP_FLOOR_MARGIN, frame.max.x + SWEEP_FLOOR_MARGIN,
                                                  column, SWEEP_COLS);
                        const float z = lerp_axis(frame.min.z - SWEEP_FLOOR_MARGIN, frame.max.z + SWEEP_FLOOR_MARGIN,
                                                  row, SWEEP_ROWS);
                        const glm::vec3 camera{x, frame.base_height + wobble * frame.height_variation, z};
                        out.push_back({camera, glm::vec3{x, frame.centroid.y, z - ps * 3.0f}});
                    }
                }
            }
            return out;
        }

        std::vector<Waypoint> photo_focus(std::span<const glm::vec3> positions, const SceneFrame& frame,
                                          const CameraPathSettings& settings) {
            const size_t step = std::max<size_t>(1, positions.size() / FOCUS_MAX_STOPS);
            std::vector<glm::vec3> candidates;
            for (size_t i = 0; i < positions.size() && candidates.size() < FOCUS_MAX_STOPS; i += step) {
                candidates.push_back(positions[i]);
            }

            // Greedy nearest-unvisited tour starting from the stop nearest the centroid
            std::vector<bool> visited(candidates.size(), false);
            const auto nearest = [&](const glm::vec3& from) {
                size_t best = candidates.size();
                float best_distance = 0.0f;
                for (size_t i = 0; i < candidates.size(); ++i) {
                    if (visited[i]) continue;
                    const float d = glm::length(candidates[i] - from);
                    if (best == candidates.size() || d < best_distance) {
                        best = i;
                        best_distance = d;
                    }
                }
                return best;
            };

            const float distance = settings.focus_distance;
            const float lateral = settings.photo_size * 0.5f;
            std::vector<Waypoint> out;
            out.reserve(candidates.size() * 2);

            glm::vec3 cursor = frame.centroid;
            for (size_t visit = 0; visit < candidates.size(); ++visit) {
                const size_t i = nearest(cursor);
                visited[i] = true;
                const glm::vec3& p = candidates[i];
                const glm::vec3 normal = viewing_normal(p, frame);
                const glm::vec3 side{-normal.z, 0.0f, normal.x};

                // Drift across the photo while holding focus on it
                for (const float sign : {-1.0f, 1.0f}) {
                    glm::vec3 camera = p + normal * distance + side * (sign * lateral);
                    camera.y = p.y + 1.5f;
                    out.push_back({camera, p});
                }
                cursor = p;
            }
            return out;
        }
    } // namespace

    SceneFrame resolve_scene_frame(const std::span<const glm::vec3> positions, const CameraPathSettings& settings) {
        SceneFrame frame;
        const float ps = settings.photo_size;
        frame.min_camera_height = settings.floor_height + ps + CAMERA_FLOOR_CLEARANCE;

        if (!positions.empty()) {
            frame.min = frame.max = positions.front();
            glm::vec3 sum{0.0f};
            for (const auto& p : positions) {
                sum += p;
                frame.min = glm::min(frame.min, p);
                frame.max = glm::max(frame.max, p);
            }
            frame.centroid = sum / static_cast<float>(positions.size());
            for (const auto& p : positions) {
                frame.radius = std::max(frame.radius, glm::length(horizontal(p - frame.centroid)));
            }
        }

        const float depth = frame.max.z - frame.min.z;
        const float height = frame.max.y - frame.min.y;
        frame.is_wall = (height > 0.0f && depth <= WALL_DEPTH_RATIO * height) ||
                        (settings.pattern == layout::PatternKind::GRID && depth <= ps);

        const auto& defaults = camera_defaults(settings.pattern);
        frame.base_height = settings.base_height.value_or(frame.centroid.y + defaults.eye_offset);
        frame.base_height = std::max(frame.base_height, frame.min_camera_height);
        frame.base_distance = settings.base_distance.value_or(
            std::max(defaults.min_distance_photos * ps, frame.radius * defaults.extent_factor));
        frame.height_variation = settings.height_variation.value_or(ps * defaults.height_variation_photos);
        frame.distance_variation = settings.distance_variation.value_or(
            frame.base_distance * defaults.distance_variation_fraction);
        return frame;
    }

    std::vector<Waypoint> generate_waypoints(const CinematicType type, const std::span<const glm::vec3> positions,
                                             const CameraPathSettings& settings) {
        if (type == CinematicType::NONE || positions.empty()) return {};

        const SceneFrame frame = resolve_scene_frame(positions, settings);
        std::vector<Waypoint> waypoints;
        switch (type) {
        case CinematicType::SHOWCASE: waypoints = showcase(frame); break;
        case CinematicType::GALLERY_WALK: waypoints = gallery_walk(positions, frame, settings); break;
        case CinematicType::SPIRAL_TOUR: waypoints = spiral_tour(frame, settings); break;
        case CinematicType::WAVE_FOLLOW: waypoints = wave_follow(frame, settings); break;
        case CinematicType::GRID_SWEEP: waypoints = grid_sweep(frame, settings); break;
        case CinematicType::PHOTO_FOCUS: waypoints = photo_focus(positions, frame, settings); break;
        case CinematicType::NONE: break;
        }

        for (auto& wp : waypoints) {
            wp.position.y = std::max(wp.position.y, frame.min_camera_height);
        }
        LOG_TRACE("{}: {} waypoints around ({:.1f}, {:.1f}, {:.1f})", to_string(type), waypoints.size(),
                  frame.centroid.x, frame.centroid.y, frame.centroid.z);
        return waypoints;
    }

} // namespace pss::camera
