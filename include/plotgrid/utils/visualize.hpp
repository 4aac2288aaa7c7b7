#pragma once

#ifdef HAS_RERUN

#include <array>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "../engine.hpp"
#include "../plot.hpp"
#include "rerun.hpp"
#include <rerun/recording_stream.hpp>

namespace plotgrid {
    namespace visualize {

        /**
         * @brief Ring vertices as float triples
         *
         * Absolute rings are drawn relative to `origin`; UTM sized values do not survive the
         * cast to float.
         */
        inline std::vector<std::array<float, 3>> to_strip(const datapod::Polygon &ring, const datapod::Point &origin,
                                                          float z = 0.0f) {
            std::vector<std::array<float, 3>> pts;
            pts.reserve(ring.vertices.size());
            for (auto const &p : ring.vertices)
                pts.push_back({float(p.x - origin.x), float(p.y - origin.y), z});
            return pts;
        }

        inline void show_collection(const GeometryCollection &collection, std::shared_ptr<rerun::RecordingStream> rec,
                                    const rerun::Color &color, float radius = 0.05f, float z = 0.0f) {
            datapod::Point origin{0.0, 0.0, 0.0};
            if (collection.frame())
                origin = collection.frame()->origin();

            std::cout << "Visualizing " << collection.size() << " " << collection.label() << " plots" << std::endl;

            const std::string base = "/plots/" + collection.label() + "/";
            for (auto const &unit : collection) {
                std::string path = base + "plot" + std::to_string(unit.plot);
                if (unit.rows.size() == 1)
                    path += "_row" + std::to_string(unit.first_row());
                auto strip = to_strip(unit.ring, origin, z);
                rec->log_static(path, rerun::LineStrips3D(rerun::components::LineStrip3D(strip))
                                          .with_colors({{color}})
                                          .with_radii({{radius}}));
            }
        }

        /**
         * @brief Rotated raw and buffered plots, the way they land in the field
         */
        inline void show_rotated(const PlotSet &plots, std::shared_ptr<rerun::RecordingStream> rec) {
            show_collection(plots.raw, rec, rerun::Color(20, 20, 20));
            show_collection(plots.buffered, rec, rerun::Color(220, 40, 40), 0.05f, 0.01f);
        }

        /**
         * @brief Unrotated layout, rows along x and ranges along y
         */
        inline void show_square(const PlotSet &plots, std::shared_ptr<rerun::RecordingStream> rec) {
            show_collection(plots.square, rec, rerun::Color(20, 20, 20));
            show_collection(plots.square_buffered, rec, rerun::Color(220, 40, 40), 0.05f, 0.01f);
        }

    } // namespace visualize
} // namespace plotgrid

#endif
