#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "plotgrid/crs.hpp"
#include "plotgrid/frame.hpp"

namespace plotgrid {

    /**
     * @brief Axis aligned footprint in the field frame
     */
    struct LocalRect {
        double row_lo = 0.0;
        double row_hi = 0.0;
        double range_lo = 0.0;
        double range_hi = 0.0;

        double row_extent() const { return row_hi - row_lo; }
        double range_extent() const { return range_hi - range_lo; }

        /// Corners counter-clockwise in (row, range) space, starting at (row_lo, range_lo)
        std::array<LocalPoint, 4> corners() const {
            return {LocalPoint{row_lo, range_lo}, LocalPoint{row_hi, range_lo}, LocalPoint{row_hi, range_hi},
                    LocalPoint{row_lo, range_hi}};
        }
    };

    /**
     * @brief One output footprint and the design rows it stands for
     */
    struct PlotUnit {
        int plot = 0;
        int range = 1;
        std::vector<int> rows;             ///< Contiguous, ascending
        std::vector<std::string> barcodes; ///< Barcodes of the rows covered by the footprint
        std::vector<std::string> siblings; ///< Individual mode: barcodes of every row of the plot
        std::string label;                 ///< Identifier written next to the geometry
        bool staggered = false;

        LocalRect local;
        datapod::Polygon ring; ///< Closed, counter-clockwise; empty until assembled

        int first_row() const { return rows.empty() ? 0 : rows.front(); }
        int last_row() const { return rows.empty() ? 0 : rows.back(); }
    };

    enum class CollectionKind {
        Raw,
        Buffered,
        Square,         ///< Local, unrotated footprints for drawing
        SquareBuffered, ///< Local, unrotated buffered footprints
    };

    inline std::string to_string(CollectionKind kind) {
        switch (kind) {
        case CollectionKind::Raw:
            return "raw";
        case CollectionKind::Buffered:
            return "buffered";
        case CollectionKind::Square:
            return "square";
        case CollectionKind::SquareBuffered:
            return "square_buffered";
        }
        return "unknown";
    }

    /**
     * @brief Ordered plot units of one kind, as handed to writers and viewers
     *
     * Absolute collections keep the frame they were mapped with so derived collections
     * (the buffered one) reuse exactly the same transform.
     */
    class GeometryCollection {
      public:
        using const_iterator = std::vector<PlotUnit>::const_iterator;

        GeometryCollection(CollectionKind kind, std::vector<PlotUnit> units,
                           std::optional<ReferenceFrame> frame = std::nullopt, CrsInfo crs = {})
            : kind_(kind), units_(std::move(units)), frame_(std::move(frame)), crs_(std::move(crs)) {}

        CollectionKind kind() const { return kind_; }
        std::string label() const { return to_string(kind_); }

        const std::vector<PlotUnit> &units() const { return units_; }
        std::size_t size() const { return units_.size(); }
        bool empty() const { return units_.empty(); }
        const PlotUnit &operator[](std::size_t i) const { return units_[i]; }
        const PlotUnit &at(std::size_t i) const { return units_.at(i); }
        const_iterator begin() const { return units_.begin(); }
        const_iterator end() const { return units_.end(); }

        const std::optional<ReferenceFrame> &frame() const { return frame_; }
        const CrsInfo &crs() const { return crs_; }

        /// True for collections in absolute (projected) coordinates
        bool is_absolute() const { return kind_ == CollectionKind::Raw || kind_ == CollectionKind::Buffered; }

      private:
        CollectionKind kind_;
        std::vector<PlotUnit> units_;
        std::optional<ReferenceFrame> frame_;
        CrsInfo crs_;
    };

} // namespace plotgrid
