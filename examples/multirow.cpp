#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "plotgrid/engine.hpp"

#ifdef HAS_RERUN
#include "plotgrid/utils/visualize.hpp"
#include "rerun.hpp"
#include "rerun/recording_stream.hpp"
#endif

namespace {

    // 25 plots of two rows each, five plots per range
    std::vector<plotgrid::TrialRecord> two_row_design() {
        std::vector<plotgrid::TrialRecord> records;
        for (int i = 0; i < 50; ++i) {
            int plot = i / 2 + 1;
            int range = (plot - 1) / 5 + 1;
            int row = i % 10 + 1;
            records.push_back({plot, range, row, "ENTRY_" + std::to_string(i + 1)});
        }
        return records;
    }

    void report(const std::string &title, const plotgrid::PlotSet &plots) {
        std::cout << title << ": " << plots.raw.size() << " raw, " << plots.buffered.size() << " buffered\n";
        for (std::size_t i = 0; i < 4 && i < plots.raw.size(); ++i) {
            const auto &unit = plots.raw[i];
            std::cout << "  " << unit.label << " plot " << unit.plot << " rows " << unit.first_row() << "-"
                      << unit.last_row() << "\n";
        }
    }

} // namespace

int main() {
    plotgrid::LayoutConfig config;
    config.a = datapod::Point{746239.817, 3382052.264, 0.0};
    config.b = datapod::Point{746334.224, 3382152.870, 0.0};
    config.nrowplot = 2;

    plotgrid::CrsInfo crs{"14", "N", "Trial2017"};
    auto records = two_row_design();

    try {
        // One polygon spanning both rows of every plot
        config.multirowind = false;
        auto combined = plotgrid::PlotEngine(config).run(records, crs);
        report("Combined", combined);

        // One polygon per row, rows of a plot tagged as siblings
        config.multirowind = true;
        auto individual = plotgrid::PlotEngine(config).run(records, crs);
        report("Individual", individual);

#ifdef HAS_RERUN
        auto rec = std::make_shared<rerun::RecordingStream>("plotgrid", "space");
        if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
            std::cerr << "Failed to connect to rerun\n";
            return 1;
        }
        plotgrid::visualize::show_square(combined, rec);
#endif
    } catch (const plotgrid::PlotError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
