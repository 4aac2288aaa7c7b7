#pragma once

#include <vector>

#include "plotgrid/assembler.hpp"
#include "plotgrid/buffer.hpp"
#include "plotgrid/config.hpp"
#include "plotgrid/crs.hpp"
#include "plotgrid/frame.hpp"
#include "plotgrid/layout.hpp"
#include "plotgrid/plot.hpp"
#include "plotgrid/table.hpp"

namespace plotgrid {

    /**
     * @brief Everything produced for one field
     */
    struct PlotSet {
        GeometryCollection raw;
        GeometryCollection buffered;
        GeometryCollection square;          ///< Raw footprints, unrotated
        GeometryCollection square_buffered; ///< Buffered footprints, unrotated
    };

    /**
     * @brief Runs layout, assembly and buffering for one configuration
     *
     * Holds only the validated configuration and its frame; `run` has no side effects and
     * can be called concurrently.
     */
    class PlotEngine {
      public:
        /**
         * @throws InvalidConfigError for unusable settings
         * @throws DegenerateFrameError if A and B coincide
         */
        explicit PlotEngine(const LayoutConfig &config);

        PlotSet run(const Table &table, const CrsInfo &crs = {}) const;
        PlotSet run(const std::vector<TrialRecord> &records, const CrsInfo &crs = {}) const;

        const LayoutConfig &config() const { return layout_.config(); }
        const ReferenceFrame &frame() const { return frame_; }

      private:
        LayoutGrid layout_;
        ReferenceFrame frame_;
    };

} // namespace plotgrid
