#include "plotgrid/engine.hpp"

#include <utility>

namespace plotgrid {

    PlotEngine::PlotEngine(const LayoutConfig &config)
        : layout_(config), frame_(ReferenceFrame::build(config.a, config.b, config.epsilon)) {}

    PlotSet PlotEngine::run(const Table &table, const CrsInfo &crs) const { return run(table.records(), crs); }

    PlotSet PlotEngine::run(const std::vector<TrialRecord> &records, const CrsInfo &crs) const {
        const LayoutConfig &cfg = layout_.config();

        auto units = layout_.build(records);
        GeometryCollection raw = PlotAssembler::assemble(frame_, units, crs);
        GeometryCollection buffered = Buffer::apply(raw, cfg.rowbuf, cfg.rangebuf, cfg.epsilon);
        GeometryCollection square = PlotAssembler::square(std::move(units), crs);
        GeometryCollection square_buffered = Buffer::apply_local(square, cfg.rowbuf, cfg.rangebuf, cfg.epsilon);

        return PlotSet{std::move(raw), std::move(buffered), std::move(square), std::move(square_buffered)};
    }

} // namespace plotgrid
