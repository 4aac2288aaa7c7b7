#include "plotgrid/assembler.hpp"

#include <utility>

#include "plotgrid/errors.hpp"
#include "plotgrid/utils/utils.hpp"

namespace plotgrid {

    datapod::Polygon PlotAssembler::ring(const ReferenceFrame &frame, const LocalRect &rect) {
        datapod::Polygon poly;
        poly.vertices.reserve(5);
        for (const auto &corner : rect.corners()) {
            poly.vertices.push_back(frame.to_absolute(corner));
        }
        return utils::close_ring(std::move(poly));
    }

    datapod::Polygon PlotAssembler::local_ring(const LocalRect &rect) {
        datapod::Polygon poly;
        poly.vertices.reserve(5);
        for (const auto &corner : rect.corners()) {
            poly.vertices.push_back(datapod::Point{corner.row, corner.range, 0.0});
        }
        return utils::close_ring(std::move(poly));
    }

    GeometryCollection PlotAssembler::assemble(const ReferenceFrame &frame, std::vector<PlotUnit> units,
                                               const CrsInfo &crs) {
        if (units.empty())
            throw EmptyLayoutError();

        for (auto &unit : units) {
            unit.ring = ring(frame, unit.local);
        }
        return GeometryCollection(CollectionKind::Raw, std::move(units), frame, crs);
    }

    GeometryCollection PlotAssembler::square(std::vector<PlotUnit> units, const CrsInfo &crs) {
        if (units.empty())
            throw EmptyLayoutError();

        for (auto &unit : units) {
            unit.ring = local_ring(unit.local);
        }
        return GeometryCollection(CollectionKind::Square, std::move(units), std::nullopt, crs);
    }

} // namespace plotgrid
