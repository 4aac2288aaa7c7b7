#pragma once

#include <vector>

#include "plotgrid/config.hpp"
#include "plotgrid/plot.hpp"
#include "plotgrid/table.hpp"

namespace plotgrid {

    /**
     * @brief Lays the trial design out as rectangles in the field frame
     *
     * Row r sits at row offset (r - 1) * rowspc and range g at range offset
     * (g - 1) * rangespc; footprints are widened by half a row spacing on each side so that
     * neighbouring plots share an edge. Output follows the first appearance of each group
     * key in the input and carries no absolute geometry yet.
     */
    class LayoutGrid {
      public:
        explicit LayoutGrid(const LayoutConfig &config);

        /**
         * @brief Group the records into plot units with local footprints
         *
         * In individual mode each unit is labelled `<barcode of the plot's lowest row>_<k>`,
         * k being the 1-based position of the row within its plot.
         *
         * @throws InvalidValueError if a Range or Row index is below 1
         * @throws DuplicateRowError if a (Plot, Row) pair repeats
         * @throws InvalidGroupError if a merged plot spans several ranges or skips a row
         */
        std::vector<PlotUnit> build(const std::vector<TrialRecord> &records) const;

        /**
         * @brief Same as above, reading the records from a table first
         *
         * @throws MissingColumnError, InvalidValueError from Table::records()
         */
        std::vector<PlotUnit> build(const Table &table) const;

        /// Footprint of rows [row_lo, row_hi] in the given range, before any stagger
        LocalRect footprint(int range, int row_lo, int row_hi) const;

        /// Whether the planter pass containing this row is shifted by the stagger offset
        bool is_staggered(int row) const;

        const LayoutConfig &config() const { return config_; }

      private:
        std::vector<PlotUnit> build_merged(const std::vector<TrialRecord> &records) const;
        std::vector<PlotUnit> build_individual(const std::vector<TrialRecord> &records) const;
        void apply_stagger(PlotUnit &unit) const;

        LayoutConfig config_;
    };

} // namespace plotgrid
