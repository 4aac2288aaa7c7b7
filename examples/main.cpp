#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <datapod/datapod.hpp>

#include "plotgrid/engine.hpp"
#include "plotgrid/utils/utils.hpp"

#ifdef HAS_RERUN
#include "plotgrid/utils/visualize.hpp"
#include "rerun.hpp"
#include "rerun/recording_stream.hpp"
#endif

int main() {
    // 10 ranges of 10 single row plots
    plotgrid::Table table({"Plot", "Range", "Row", "Barcode"});
    for (int i = 0; i < 100; ++i) {
        std::string code = std::to_string(i + 1);
        table.add_row({std::to_string(i + 1), std::to_string(i / 10 + 1), std::to_string(i % 10 + 1),
                       "BC" + std::string(3 - code.size(), '0') + code});
    }

    plotgrid::LayoutConfig config;
    config.a = datapod::Point{746239.817, 3382052.264, 0.0};
    config.b = datapod::Point{746334.224, 3382152.870, 0.0};
    config.unit = plotgrid::Unit::Feet;

    plotgrid::CrsInfo crs{"14", "N", "CS17-G2FE"};

    try {
        plotgrid::PlotEngine engine(config);
        auto plots = engine.run(table, crs);

        std::cout << "AB line: " << std::fixed << std::setprecision(2) << engine.frame().baseline_length() << " "
                  << plotgrid::to_string(config.unit) << " at " << engine.frame().theta_degrees() << " deg\n";
        std::cout << "CRS: " << plotgrid::proj_string(crs) << "\n";

        std::cout << plotgrid::artifact_name(crs.field, "plots", false) << ": " << plots.raw.size() << " polygons\n";
        std::cout << plotgrid::artifact_name(crs.field, "plots", true) << ": " << plots.buffered.size()
                  << " polygons\n";

        std::cout << std::setprecision(3);
        for (std::size_t i = 0; i < 3 && i < plots.raw.size(); ++i) {
            const auto &unit = plots.raw[i];
            auto c = plotgrid::utils::centroid(unit.ring);
            std::cout << "  plot " << unit.plot << " (" << unit.label << ") range " << unit.range << " row "
                      << unit.first_row() << " centre " << c.x << ", " << c.y << "\n";
        }

#ifdef HAS_RERUN
        auto rec = std::make_shared<rerun::RecordingStream>("plotgrid", "space");
        if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
            std::cerr << "Failed to connect to rerun\n";
            return 1;
        }
        plotgrid::visualize::show_rotated(plots, rec);
#endif
    } catch (const plotgrid::PlotError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
