#pragma once

#include "plotgrid/plot.hpp"

namespace plotgrid {

    /**
     * @brief Inward margins that keep extraction away from plot edges
     *
     * The shrink happens on the local footprint, so margins follow the field axes rather
     * than north/east, and the result is mapped through the same frame as the input.
     */
    class Buffer {
      public:
        /**
         * @brief Buffer an assembled raw collection
         *
         * @param raw Collection from PlotAssembler::assemble
         * @param rowbuf Removed from both row sides of every footprint
         * @param rangebuf Removed from both range ends of every footprint
         * @param epsilon Tolerance on the remaining extent
         * @throws InvalidBufferError if a buffer is negative or would leave no area
         * @throws std::invalid_argument if `raw` carries no frame
         */
        static GeometryCollection apply(const GeometryCollection &raw, double rowbuf, double rangebuf,
                                        double epsilon = 1e-9);

        /**
         * @brief Buffer a square (local) collection, keeping it in local coordinates
         */
        static GeometryCollection apply_local(const GeometryCollection &square, double rowbuf, double rangebuf,
                                              double epsilon = 1e-9);

        /**
         * @brief Shrink one footprint
         *
         * @throws InvalidBufferError naming the unit when the footprint would collapse
         */
        static LocalRect shrink(const PlotUnit &unit, double rowbuf, double rangebuf, double epsilon = 1e-9);
    };

} // namespace plotgrid
