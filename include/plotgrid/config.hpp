#pragma once

#include <cmath>
#include <optional>
#include <string>

#include <datapod/datapod.hpp>

#include "plotgrid/errors.hpp"

namespace plotgrid {

    /**
     * @brief Unit the caller measured spacing and buffers in
     *
     * Informational only: values are never rescaled.
     */
    enum class Unit {
        Feet,
        Meter,
    };

    /**
     * @brief How rows sharing a plot id become plot units
     */
    enum class GroupingMode {
        Merge,      ///< One footprint spanning every row of the plot
        Individual, ///< One footprint per row, rows of a plot tagged as siblings
    };

    /**
     * @brief Planter stagger: alternate passes are shifted along the range axis
     */
    struct Stagger {
        int start_row = 2;      ///< First row of the first shifted pass
        int rows_per_pass = 1;  ///< Rows sown in a single planter pass
        double offset = 0.0;    ///< Shift along the range axis, in spacing units
    };

    /**
     * @brief Everything one layout run needs besides the table itself
     */
    struct LayoutConfig {
        datapod::Point a{0.0, 0.0, 0.0}; ///< Bottom left corner of the first plot
        datapod::Point b{0.0, 1.0, 0.0}; ///< Point further along the first row, fixes the range direction

        double rowspc = 2.5;
        double rangespc = 25.0;
        double rowbuf = 0.1;
        double rangebuf = 2.0;

        int nrowplot = 1;
        bool multirowind = false;
        int plotsubset = 0;
        std::optional<Stagger> stagger;

        Unit unit = Unit::Feet;
        double epsilon = 1e-9;

        GroupingMode grouping() const {
            if (multirowind || plotsubset > 0)
                return GroupingMode::Individual;
            return GroupingMode::Merge;
        }
    };

    inline std::string to_string(Unit unit) { return unit == Unit::Feet ? "feet" : "meter"; }

    inline Unit unit_from_string(const std::string &name) {
        if (name == "feet" || name == "ft")
            return Unit::Feet;
        if (name == "meter" || name == "meters" || name == "m")
            return Unit::Meter;
        throw InvalidConfigError("unknown unit '" + name + "'");
    }

    /**
     * @brief Reject configurations that cannot produce a layout
     *
     * The AB line itself is checked when the reference frame is built.
     */
    inline void validate(const LayoutConfig &config) {
        if (!std::isfinite(config.a.x) || !std::isfinite(config.a.y) || !std::isfinite(config.b.x) ||
            !std::isfinite(config.b.y))
            throw InvalidConfigError("A and B must be finite");
        if (!(config.rowspc > 0.0))
            throw InvalidConfigError("rowspc must be positive");
        if (!(config.rangespc > 0.0))
            throw InvalidConfigError("rangespc must be positive");
        if (config.rowbuf < 0.0 || config.rangebuf < 0.0)
            throw InvalidConfigError("buffers must not be negative");
        if (config.nrowplot < 1)
            throw InvalidConfigError("nrowplot must be at least 1");
        if (!(config.epsilon > 0.0))
            throw InvalidConfigError("epsilon must be positive");

        if (config.plotsubset < 0)
            throw InvalidConfigError("plotsubset must not be negative");
        if (config.plotsubset > 0) {
            if (config.nrowplot == 1)
                throw InvalidConfigError("nrowplot == 1: cannot subset a single row plot");
            if (config.nrowplot < 3)
                throw InvalidConfigError("nrowplot < 3: cannot subset the central rows of a plot");
            if (config.nrowplot <= 2 * config.plotsubset)
                throw InvalidConfigError("plotsubset removes every row of the plot");
        }

        if (config.stagger) {
            const auto &s = *config.stagger;
            if (s.rows_per_pass < 1)
                throw InvalidConfigError("stagger rows_per_pass must be at least 1");
            if (s.start_row == 1)
                throw InvalidConfigError("stagger must start beyond the first row");
            if (s.start_row < 1 || s.start_row > s.rows_per_pass + 1)
                throw InvalidConfigError("stagger start_row must lie within the first planter pass");
            if (!std::isfinite(s.offset))
                throw InvalidConfigError("stagger offset must be finite");
            if (config.nrowplot > 1 && config.grouping() == GroupingMode::Merge &&
                config.nrowplot > s.rows_per_pass / 2.0)
                throw InvalidConfigError("merged plots are not adjusted by stagger, use multirowind");
        }
    }

} // namespace plotgrid
