#pragma once

#include <cmath>
#include <cstddef>

#include <datapod/datapod.hpp>

namespace plotgrid {

    namespace utils {

        /**
         * @brief Signed area of a ring (positive = CCW, negative = CW)
         *
         * Works for closed and open vertex lists alike; a repeated closing vertex adds nothing.
         */
        inline double signed_area(const datapod::Polygon &polygon) {
            const auto &verts = polygon.vertices;
            std::size_t n = verts.size();
            if (n < 3) {
                return 0.0;
            }

            // Shift by the first vertex to keep UTM sized coordinates from swamping the sum
            const double x0 = verts[0].x;
            const double y0 = verts[0].y;
            double area = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                std::size_t j = (i + 1) % n;
                area += (verts[i].x - x0) * (verts[j].y - y0);
                area -= (verts[j].x - x0) * (verts[i].y - y0);
            }
            return area * 0.5;
        }

        inline bool is_ccw(const datapod::Polygon &polygon) { return signed_area(polygon) > 0.0; }

        inline bool same_point(const datapod::Point &a, const datapod::Point &b, double epsilon = 1e-10) {
            double dx = a.x - b.x;
            double dy = a.y - b.y;
            return dx * dx + dy * dy <= epsilon * epsilon;
        }

        inline bool is_closed(const datapod::Polygon &polygon) {
            return polygon.vertices.size() > 1 && same_point(polygon.vertices.front(), polygon.vertices.back());
        }

        /**
         * @brief Repeat the first vertex at the end if the ring is open
         */
        inline datapod::Polygon close_ring(datapod::Polygon polygon) {
            if (polygon.vertices.size() > 1 && !is_closed(polygon)) {
                polygon.vertices.push_back(polygon.vertices.front());
            }
            return polygon;
        }

        /**
         * @brief Check a ring is fit to hand to a writer
         *
         * Closed, at least three distinct corners (four vertices with the closing one),
         * no repeated consecutive vertices, counter-clockwise with non-zero area.
         */
        inline bool is_valid_ring(const datapod::Polygon &polygon, double epsilon = 1e-10) {
            const auto &verts = polygon.vertices;
            if (verts.size() < 4 || !is_closed(polygon)) {
                return false;
            }
            for (std::size_t i = 0; i + 1 < verts.size(); ++i) {
                if (same_point(verts[i], verts[i + 1], epsilon)) {
                    return false;
                }
            }
            return signed_area(polygon) > epsilon;
        }

        /**
         * @brief Mean of the distinct ring vertices (the closing vertex is skipped)
         *
         * For the rectangles produced here this is the area centroid.
         */
        inline datapod::Point centroid(const datapod::Polygon &polygon) {
            const auto &verts = polygon.vertices;
            if (verts.empty()) {
                return datapod::Point{0.0, 0.0, 0.0};
            }
            std::size_t n = is_closed(polygon) ? verts.size() - 1 : verts.size();
            double sum_x = 0.0, sum_y = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                sum_x += verts[i].x - verts[0].x;
                sum_y += verts[i].y - verts[0].y;
            }
            return datapod::Point{verts[0].x + sum_x / static_cast<double>(n),
                                  verts[0].y + sum_y / static_cast<double>(n), 0.0};
        }

        /**
         * @brief Point in convex CCW ring test
         *
         * @param strict Require the point to lie at least epsilon inside every edge
         */
        inline bool contains(const datapod::Polygon &ring, const datapod::Point &p, bool strict = false,
                             double epsilon = 1e-9) {
            const auto &verts = ring.vertices;
            std::size_t n = is_closed(ring) ? verts.size() - 1 : verts.size();
            if (n < 3) {
                return false;
            }
            for (std::size_t i = 0; i < n; ++i) {
                const auto &a = verts[i];
                const auto &b = verts[(i + 1) % n];
                double ex = b.x - a.x;
                double ey = b.y - a.y;
                double len = std::hypot(ex, ey);
                if (len <= 0.0) {
                    continue;
                }
                // Signed distance of p to the left of edge a->b
                double side = (ex * (p.y - a.y) - ey * (p.x - a.x)) / len;
                if (strict ? side <= epsilon : side < -epsilon) {
                    return false;
                }
            }
            return true;
        }

    } // namespace utils

} // namespace plotgrid
