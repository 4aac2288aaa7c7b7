#pragma once

#include <vector>

#include <datapod/datapod.hpp>

#include "plotgrid/crs.hpp"
#include "plotgrid/frame.hpp"
#include "plotgrid/plot.hpp"

namespace plotgrid {

    /**
     * @brief Turns local footprints into closed rings
     */
    class PlotAssembler {
      public:
        /**
         * @brief Map every footprint into absolute coordinates
         *
         * Corners are visited counter-clockwise in (row, range) space and the ring is closed
         * by repeating the first one. The frame keeps orientation, so rings stay CCW.
         *
         * @throws EmptyLayoutError if there are no units
         */
        static GeometryCollection assemble(const ReferenceFrame &frame, std::vector<PlotUnit> units,
                                           const CrsInfo &crs = {});

        /**
         * @brief Unrotated rings in the field frame (x = row offset, y = range offset)
         *
         * @throws EmptyLayoutError if there are no units
         */
        static GeometryCollection square(std::vector<PlotUnit> units, const CrsInfo &crs = {});

        /// Closed CCW ring of a footprint mapped through the frame
        static datapod::Polygon ring(const ReferenceFrame &frame, const LocalRect &rect);

        /// Closed CCW ring of a footprint in local coordinates
        static datapod::Polygon local_ring(const LocalRect &rect);
    };

} // namespace plotgrid
