#include "plotgrid/buffer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "plotgrid/assembler.hpp"
#include "plotgrid/errors.hpp"

namespace plotgrid {

    LocalRect Buffer::shrink(const PlotUnit &unit, double rowbuf, double rangebuf, double epsilon) {
        if (!(rowbuf >= 0.0) || !(rangebuf >= 0.0))
            throw InvalidBufferError(unit.plot, unit.first_row(), "buffers must be non-negative");

        const LocalRect &in = unit.local;
        if (2.0 * rowbuf >= in.row_extent() - epsilon)
            throw InvalidBufferError(unit.plot, unit.first_row(),
                                     "2 * rowbuf (" + std::to_string(2.0 * rowbuf) + ") >= row extent (" +
                                         std::to_string(in.row_extent()) + ")");
        if (2.0 * rangebuf >= in.range_extent() - epsilon)
            throw InvalidBufferError(unit.plot, unit.first_row(),
                                     "2 * rangebuf (" + std::to_string(2.0 * rangebuf) + ") >= range extent (" +
                                         std::to_string(in.range_extent()) + ")");

        LocalRect out;
        out.row_lo = in.row_lo + rowbuf;
        out.row_hi = in.row_hi - rowbuf;
        out.range_lo = in.range_lo + rangebuf;
        out.range_hi = in.range_hi - rangebuf;
        return out;
    }

    GeometryCollection Buffer::apply(const GeometryCollection &raw, double rowbuf, double rangebuf, double epsilon) {
        if (!raw.frame())
            throw std::invalid_argument("collection '" + raw.label() + "' has no reference frame to buffer with");

        const ReferenceFrame &frame = *raw.frame();
        std::vector<PlotUnit> units;
        units.reserve(raw.size());
        for (const auto &unit : raw) {
            PlotUnit buffered = unit;
            buffered.local = shrink(unit, rowbuf, rangebuf, epsilon);
            buffered.ring = PlotAssembler::ring(frame, buffered.local);
            units.push_back(std::move(buffered));
        }
        return GeometryCollection(CollectionKind::Buffered, std::move(units), frame, raw.crs());
    }

    GeometryCollection Buffer::apply_local(const GeometryCollection &square, double rowbuf, double rangebuf,
                                           double epsilon) {
        std::vector<PlotUnit> units;
        units.reserve(square.size());
        for (const auto &unit : square) {
            PlotUnit buffered = unit;
            buffered.local = shrink(unit, rowbuf, rangebuf, epsilon);
            buffered.ring = PlotAssembler::local_ring(buffered.local);
            units.push_back(std::move(buffered));
        }
        return GeometryCollection(CollectionKind::SquareBuffered, std::move(units), std::nullopt, square.crs());
    }

} // namespace plotgrid
