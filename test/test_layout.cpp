#include "doctest/doctest.h"
#include "plotgrid/layout.hpp"

#include <climits>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
    // Three plots of two rows each in one range
    std::vector<plotgrid::TrialRecord> two_row_plots() {
        return {
            {1, 1, 1, "BC1"}, {1, 1, 2, "BC2"}, {2, 1, 3, "BC3"},
            {2, 1, 4, "BC4"}, {3, 1, 5, "BC5"}, {3, 1, 6, "BC6"},
        };
    }

    plotgrid::LayoutConfig default_config() {
        plotgrid::LayoutConfig config;
        config.a = datapod::Point{0.0, 0.0, 0.0};
        config.b = datapod::Point{0.0, 100.0, 0.0};
        return config;
    }

    // Captures std::cerr for the lifetime of the object
    struct CerrCapture {
        std::ostringstream out;
        std::streambuf *old;

        CerrCapture() : old(std::cerr.rdbuf(out.rdbuf())) {}
        ~CerrCapture() { std::cerr.rdbuf(old); }

        std::string str() const { return out.str(); }
    };
} // namespace

TEST_CASE("Single row plots abut with half spacing padding") {
    plotgrid::LayoutGrid grid(default_config());
    auto units = grid.build({{1, 1, 1, "BC1"}, {2, 1, 2, "BC2"}});

    REQUIRE(units.size() == 2);
    CHECK(units[0].local.row_lo == doctest::Approx(-1.25));
    CHECK(units[0].local.row_hi == doctest::Approx(1.25));
    CHECK(units[1].local.row_lo == doctest::Approx(1.25));
    CHECK(units[1].local.row_hi == doctest::Approx(3.75));

    for (const auto &unit : units) {
        CHECK(unit.local.range_lo == doctest::Approx(0.0));
        CHECK(unit.local.range_hi == doctest::Approx(25.0));
        CHECK(unit.local.row_extent() == doctest::Approx(2.5));
        CHECK(unit.local.range_extent() == doctest::Approx(25.0));
        CHECK(unit.siblings.empty());
    }
    CHECK(units[0].label == "BC1");
    CHECK(units[1].label == "BC2");
}

TEST_CASE("Range and row offsets come from the indices only") {
    auto config = default_config();
    config.rowspc = 0.76;
    config.rangespc = 7.62;
    config.unit = plotgrid::Unit::Meter;
    plotgrid::LayoutGrid grid(config);

    auto units = grid.build({{7, 3, 4, "X"}});
    REQUIRE(units.size() == 1);
    CHECK(units[0].range == 3);
    CHECK(units[0].local.range_lo == doctest::Approx(2 * 7.62));
    CHECK(units[0].local.range_hi == doctest::Approx(3 * 7.62));
    CHECK(units[0].local.row_lo == doctest::Approx(3 * 0.76 - 0.38));
    CHECK(units[0].local.row_hi == doctest::Approx(3 * 0.76 + 0.38));
}

TEST_CASE("Merged plots span all of their rows") {
    auto config = default_config();
    config.nrowplot = 2;
    plotgrid::LayoutGrid grid(config);

    auto units = grid.build(two_row_plots());
    REQUIRE(units.size() == 3);

    CHECK(units[0].plot == 1);
    CHECK(units[0].rows == std::vector<int>{1, 2});
    CHECK(units[0].barcodes == std::vector<std::string>{"BC1", "BC2"});
    CHECK(units[0].label == "BC1");
    CHECK(units[0].local.row_lo == doctest::Approx(-1.25));
    CHECK(units[0].local.row_hi == doctest::Approx(3.75));

    CHECK(units[1].local.row_lo == doctest::Approx(3.75));
    CHECK(units[1].local.row_hi == doctest::Approx(8.75));
    CHECK(units[2].rows == std::vector<int>{5, 6});
    CHECK(units[2].local.row_extent() == doctest::Approx(5.0));
}

TEST_CASE("Individual rows keep their own footprint and know their siblings") {
    auto config = default_config();
    config.nrowplot = 2;
    config.multirowind = true;
    plotgrid::LayoutGrid grid(config);

    auto units = grid.build(two_row_plots());
    REQUIRE(units.size() == 6);

    CHECK(units[0].plot == 1);
    CHECK(units[1].plot == 1);
    CHECK(units[0].label == "BC1_1");
    CHECK(units[1].label == "BC1_2");
    CHECK(units[2].label == "BC3_1");
    CHECK(units[1].barcodes == std::vector<std::string>{"BC2"});
    CHECK(units[1].siblings == std::vector<std::string>{"BC1", "BC2"});
    CHECK(units[1].local.row_lo == doctest::Approx(1.25));
    CHECK(units[1].local.row_hi == doctest::Approx(3.75));
}

TEST_CASE("Output follows first appearance in the table") {
    auto config = default_config();
    config.nrowplot = 2;
    plotgrid::LayoutGrid grid(config);

    // Plot 3 first, plot 1 rows interleaved with plot 2
    std::vector<plotgrid::TrialRecord> records = {
        {3, 1, 6, "BC6"}, {1, 1, 2, "BC2"}, {2, 1, 3, "BC3"},
        {1, 1, 1, "BC1"}, {3, 1, 5, "BC5"}, {2, 1, 4, "BC4"},
    };
    auto units = grid.build(records);
    REQUIRE(units.size() == 3);
    CHECK(units[0].plot == 3);
    CHECK(units[1].plot == 1);
    CHECK(units[2].plot == 2);

    // Geometry depends on Row, not on where the row appeared
    CHECK(units[0].rows == std::vector<int>{5, 6});
    CHECK(units[0].local.row_lo == doctest::Approx(8.75));
    CHECK(units[1].label == "BC1");
}

TEST_CASE("Layout rejects inconsistent designs") {
    auto config = default_config();
    config.nrowplot = 2;
    plotgrid::LayoutGrid grid(config);

    SUBCASE("Duplicate plot and row") {
        try {
            grid.build({{1, 1, 1, "A"}, {1, 1, 2, "B"}, {1, 2, 1, "C"}});
            CHECK(false);
        } catch (const plotgrid::DuplicateRowError &e) {
            CHECK(e.plot() == 1);
            CHECK(e.row() == 1);
        }
    }

    SUBCASE("Merged plot with a gap") {
        CHECK_THROWS_AS(grid.build({{1, 1, 1, "A"}, {1, 1, 3, "B"}}), plotgrid::InvalidGroupError);
    }

    SUBCASE("Merged plot across ranges") {
        try {
            grid.build({{4, 1, 1, "A"}, {4, 2, 2, "B"}});
            CHECK(false);
        } catch (const plotgrid::InvalidGroupError &e) {
            CHECK(e.plot() == 4);
        }
    }

    SUBCASE("Individual rows may be anywhere") {
        auto ind = config;
        ind.multirowind = true;
        plotgrid::LayoutGrid individual(ind);
        CHECK(individual.build({{1, 1, 1, "A"}, {1, 1, 3, "B"}}).size() == 2);
    }
}

TEST_CASE("Records with indices below one are rejected") {
    plotgrid::LayoutGrid grid(default_config());

    SUBCASE("Row 0") {
        try {
            grid.build({{1, 1, 1, "A"}, {2, 1, 0, "B"}});
            CHECK(false);
        } catch (const plotgrid::InvalidValueError &e) {
            CHECK(e.column() == "Row");
            CHECK(e.record() == 1);
        }
    }

    SUBCASE("Range 0") {
        try {
            grid.build({{1, 0, 1, "A"}});
            CHECK(false);
        } catch (const plotgrid::InvalidValueError &e) {
            CHECK(e.column() == "Range");
            CHECK(e.record() == 0);
        }
    }

    SUBCASE("Most negative row") { CHECK_THROWS_AS(grid.build({{1, 1, INT_MIN, "Q"}}), plotgrid::InvalidValueError); }
}

TEST_CASE("Short merged plots warn but are laid out") {
    auto config = default_config();
    config.nrowplot = 2;
    plotgrid::LayoutGrid grid(config);

    CerrCapture capture;
    auto units = grid.build({{1, 1, 1, "A"}, {1, 1, 2, "B"}, {2, 1, 3, "C"}});

    REQUIRE(units.size() == 2);
    CHECK(units[1].rows == std::vector<int>{3});
    CHECK(units[1].local.row_extent() == doctest::Approx(2.5));
    CHECK(capture.str().find("Warning: plot 2 has 1 rows, expected 2") != std::string::npos);
    CHECK(capture.str().find("Warning: plot 1") == std::string::npos);
}

TEST_CASE("Incomplete design grid warns but is laid out") {
    plotgrid::LayoutGrid grid(default_config());

    SUBCASE("Missing cell") {
        CerrCapture capture;
        auto units = grid.build({{1, 1, 1, "A"}, {2, 1, 2, "B"}, {3, 2, 1, "C"}});
        CHECK(units.size() == 3);
        CHECK(capture.str().find("Warning: 3 records for 2 ranges x 2 rows") != std::string::npos);
    }

    SUBCASE("Full grid stays quiet") {
        CerrCapture capture;
        auto units = grid.build({{1, 1, 1, "A"}, {2, 1, 2, "B"}, {3, 2, 1, "C"}, {4, 2, 2, "D"}});
        CHECK(units.size() == 4);
        CHECK(capture.str().empty());
    }
}

TEST_CASE("Empty input gives an empty layout") {
    plotgrid::LayoutGrid grid(default_config());
    CHECK(grid.build(std::vector<plotgrid::TrialRecord>{}).empty());
}

TEST_CASE("Layout reads tables") {
    plotgrid::LayoutGrid grid(default_config());

    plotgrid::Table table({"Plot", "Range", "Row"});
    table.add_row({"1", "1", "1"});
    CHECK_THROWS_AS(grid.build(table), plotgrid::MissingColumnError);

    auto units = grid.build(plotgrid::Table::from_records({{1, 1, 1, "A"}, {2, 1, 2, "B"}}));
    CHECK(units.size() == 2);
}

TEST_CASE("Plot subset keeps interior rows") {
    auto config = default_config();
    config.nrowplot = 4;
    config.plotsubset = 1;
    plotgrid::LayoutGrid grid(config);

    auto units = grid.build({{1, 1, 1, "A"}, {1, 1, 2, "B"}, {1, 1, 3, "C"}, {1, 1, 4, "D"},
                             {2, 1, 5, "E"}, {2, 1, 6, "F"}, {2, 1, 7, "G"}, {2, 1, 8, "H"}});
    REQUIRE(units.size() == 4);
    CHECK(units[0].rows == std::vector<int>{2});
    CHECK(units[1].rows == std::vector<int>{3});
    CHECK(units[2].rows == std::vector<int>{6});
    CHECK(units[3].rows == std::vector<int>{7});
    CHECK(units[0].label == "A_2");
    CHECK(units[0].siblings.size() == 4);
}

TEST_CASE("Plot subset needs enough rows") {
    auto config = default_config();
    config.plotsubset = 1;

    config.nrowplot = 1;
    CHECK_THROWS_AS(plotgrid::LayoutGrid{config}, plotgrid::InvalidConfigError);
    config.nrowplot = 2;
    CHECK_THROWS_AS(plotgrid::LayoutGrid{config}, plotgrid::InvalidConfigError);
    config.nrowplot = 4;
    config.plotsubset = 2;
    CHECK_THROWS_AS(plotgrid::LayoutGrid{config}, plotgrid::InvalidConfigError);
    config.nrowplot = 5;
    CHECK_NOTHROW(plotgrid::LayoutGrid{config});
}

TEST_CASE("Stagger shifts alternate planter passes along the range") {
    auto config = default_config();
    config.multirowind = true;
    config.stagger = plotgrid::Stagger{5, 4, 1.5};
    plotgrid::LayoutGrid grid(config);

    for (int row = 1; row <= 4; ++row)
        CHECK_FALSE(grid.is_staggered(row));
    for (int row = 5; row <= 8; ++row)
        CHECK(grid.is_staggered(row));
    for (int row = 9; row <= 12; ++row)
        CHECK_FALSE(grid.is_staggered(row));
    CHECK(grid.is_staggered(13));

    auto units = grid.build({{1, 1, 4, "A"}, {2, 1, 5, "B"}});
    REQUIRE(units.size() == 2);
    CHECK_FALSE(units[0].staggered);
    CHECK(units[0].local.range_lo == doctest::Approx(0.0));
    CHECK(units[1].staggered);
    CHECK(units[1].local.range_lo == doctest::Approx(1.5));
    CHECK(units[1].local.range_hi == doctest::Approx(26.5));
}

TEST_CASE("Stagger settings are validated") {
    auto config = default_config();

    config.stagger = plotgrid::Stagger{1, 4, 1.0};
    CHECK_THROWS_AS(plotgrid::LayoutGrid{config}, plotgrid::InvalidConfigError);

    config.stagger = plotgrid::Stagger{7, 4, 1.0};
    CHECK_THROWS_AS(plotgrid::LayoutGrid{config}, plotgrid::InvalidConfigError);

    // Two row merged plots cannot follow a two row pass stagger
    config.stagger = plotgrid::Stagger{3, 2, 1.0};
    config.nrowplot = 2;
    CHECK_THROWS_AS(plotgrid::LayoutGrid{config}, plotgrid::InvalidConfigError);
    config.multirowind = true;
    CHECK_NOTHROW(plotgrid::LayoutGrid{config});
}

TEST_CASE("Configuration values are validated") {
    auto config = default_config();

    SUBCASE("Spacing") {
        config.rowspc = 0.0;
        CHECK_THROWS_AS(plotgrid::validate(config), plotgrid::InvalidConfigError);
    }
    SUBCASE("Range spacing") {
        config.rangespc = -25.0;
        CHECK_THROWS_AS(plotgrid::validate(config), plotgrid::InvalidConfigError);
    }
    SUBCASE("Rows per plot") {
        config.nrowplot = 0;
        CHECK_THROWS_AS(plotgrid::validate(config), plotgrid::InvalidConfigError);
    }
    SUBCASE("Negative buffer") {
        config.rowbuf = -0.1;
        CHECK_THROWS_AS(plotgrid::validate(config), plotgrid::InvalidConfigError);
    }
    SUBCASE("Units") {
        CHECK(plotgrid::unit_from_string("feet") == plotgrid::Unit::Feet);
        CHECK(plotgrid::unit_from_string("meter") == plotgrid::Unit::Meter);
        CHECK(plotgrid::to_string(plotgrid::Unit::Meter) == "meter");
        CHECK_THROWS_AS(plotgrid::unit_from_string("yards"), plotgrid::InvalidConfigError);
    }
}
