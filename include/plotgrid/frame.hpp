#pragma once

#include <cmath>

#include <datapod/datapod.hpp>

#include "plotgrid/errors.hpp"

namespace plotgrid {

    /**
     * @brief A point in the field frame
     *
     * `row` runs across the planting rows (local x), `range` runs along them (local y).
     */
    struct LocalPoint {
        double row = 0.0;
        double range = 0.0;
    };

    /**
     * @brief Field aligned coordinate frame derived from the AB line
     *
     * A is the origin. `u` points from A towards B (along the range axis) and `v` is `u`
     * turned 90 degrees clockwise, so row offsets grow to the right of the AB line when
     * looking from A to B. With `v` as local x and `u` as local y the mapping keeps its
     * orientation: counter-clockwise local rings stay counter-clockwise.
     */
    class ReferenceFrame {
      public:
        /**
         * @brief Build the frame for the line A -> B
         *
         * @param a Origin of the frame (absolute coordinates)
         * @param b Second point fixing the range direction
         * @param epsilon Minimum accepted length of the AB line
         * @throws DegenerateFrameError if |B - A| <= epsilon
         */
        static ReferenceFrame build(const datapod::Point &a, const datapod::Point &b, double epsilon = 1e-9) {
            const double dx = b.x - a.x;
            const double dy = b.y - a.y;
            const double len = std::hypot(dx, dy);
            if (!(len > epsilon))
                throw DegenerateFrameError(len);

            ReferenceFrame frame;
            frame.origin_ = datapod::Point{a.x, a.y, 0.0};
            frame.ux_ = dx / len;
            frame.uy_ = dy / len;
            frame.vx_ = frame.uy_;
            frame.vy_ = -frame.ux_;
            frame.theta_ = std::atan2(frame.uy_, frame.ux_);
            frame.length_ = len;
            return frame;
        }

        /**
         * @brief Map a field point to absolute coordinates
         *
         * The offset is summed on its own before the origin is added, so small offsets keep
         * their precision next to UTM sized origins.
         */
        datapod::Point to_absolute(const LocalPoint &local) const {
            const double ox = local.row * vx_ + local.range * ux_;
            const double oy = local.row * vy_ + local.range * uy_;
            return datapod::Point{origin_.x + ox, origin_.y + oy, 0.0};
        }

        LocalPoint to_local(const datapod::Point &p) const {
            const double dx = p.x - origin_.x;
            const double dy = p.y - origin_.y;
            return LocalPoint{dx * vx_ + dy * vy_, dx * ux_ + dy * uy_};
        }

        const datapod::Point &origin() const { return origin_; }
        datapod::Point u() const { return datapod::Point{ux_, uy_, 0.0}; }
        datapod::Point v() const { return datapod::Point{vx_, vy_, 0.0}; }

        /// Angle of `u` from the absolute x axis, radians in (-pi, pi]
        double theta() const { return theta_; }
        double theta_degrees() const { return theta_ * 180.0 / M_PI; }

        /// Length of the AB line the frame was built from
        double baseline_length() const { return length_; }

        /**
         * @brief Rotation for text drawn along the range axis, degrees in [0, 360)
         */
        double label_angle_degrees() const {
            double deg = std::fmod(90.0 - theta_degrees(), 360.0);
            if (deg < 0.0)
                deg += 360.0;
            return deg;
        }

      private:
        ReferenceFrame() = default;

        datapod::Point origin_{0.0, 0.0, 0.0};
        double ux_ = 0.0;
        double uy_ = 1.0;
        double vx_ = 1.0;
        double vy_ = 0.0;
        double theta_ = M_PI / 2.0;
        double length_ = 0.0;
    };

} // namespace plotgrid
