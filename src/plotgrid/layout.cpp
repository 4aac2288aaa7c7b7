#include "plotgrid/layout.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace plotgrid {

    namespace {

        // Records of one plot id, in table order
        struct PlotRows {
            int plot = 0;
            std::vector<const TrialRecord *> members;

            std::vector<const TrialRecord *> by_row() const {
                auto sorted = members;
                std::stable_sort(sorted.begin(), sorted.end(),
                                 [](const TrialRecord *a, const TrialRecord *b) { return a->row < b->row; });
                return sorted;
            }
        };

        std::vector<PlotRows> group_by_plot(const std::vector<TrialRecord> &records) {
            std::vector<PlotRows> groups;
            std::map<int, std::size_t> index;
            for (const auto &rec : records) {
                auto it = index.find(rec.plot);
                if (it == index.end()) {
                    index.emplace(rec.plot, groups.size());
                    groups.push_back(PlotRows{rec.plot, {&rec}});
                } else {
                    groups[it->second].members.push_back(&rec);
                }
            }
            return groups;
        }

        void check_duplicates(const std::vector<TrialRecord> &records) {
            std::set<std::pair<int, int>> seen;
            for (const auto &rec : records) {
                if (!seen.insert({rec.plot, rec.row}).second)
                    throw DuplicateRowError(rec.plot, rec.row);
            }
        }

        void check_indices(const std::vector<TrialRecord> &records) {
            for (std::size_t r = 0; r < records.size(); ++r) {
                if (records[r].range < 1)
                    throw InvalidValueError("Range", r, std::to_string(records[r].range));
                if (records[r].row < 1)
                    throw InvalidValueError("Row", r, std::to_string(records[r].row));
            }
        }

        void warn_incomplete_grid(const std::vector<TrialRecord> &records) {
            std::set<int> ranges, rows;
            for (const auto &rec : records) {
                ranges.insert(rec.range);
                rows.insert(rec.row);
            }
            if (records.size() != ranges.size() * rows.size()) {
                std::cerr << "Warning: " << records.size() << " records for " << ranges.size() << " ranges x "
                          << rows.size() << " rows, the design grid is incomplete" << std::endl;
            }
        }

    } // namespace

    LayoutGrid::LayoutGrid(const LayoutConfig &config) : config_(config) { validate(config_); }

    LocalRect LayoutGrid::footprint(int range, int row_lo, int row_hi) const {
        const double half = config_.rowspc / 2.0;
        LocalRect rect;
        rect.row_lo = (static_cast<double>(row_lo) - 1.0) * config_.rowspc - half;
        rect.row_hi = (static_cast<double>(row_hi) - 1.0) * config_.rowspc + half;
        rect.range_lo = (static_cast<double>(range) - 1.0) * config_.rangespc;
        rect.range_hi = rect.range_lo + config_.rangespc;
        return rect;
    }

    bool LayoutGrid::is_staggered(int row) const {
        if (!config_.stagger)
            return false;
        const auto &s = *config_.stagger;
        // Passes are rows_per_pass wide and counted from the pass holding start_row; odd
        // passes are shifted
        double pass = std::ceil(static_cast<double>(row - s.start_row + 1 + s.rows_per_pass) / s.rows_per_pass);
        return static_cast<long long>(pass) % 2 == 0;
    }

    void LayoutGrid::apply_stagger(PlotUnit &unit) const {
        if (!is_staggered(unit.first_row()))
            return;
        unit.staggered = true;
        unit.local.range_lo += config_.stagger->offset;
        unit.local.range_hi += config_.stagger->offset;
    }

    std::vector<PlotUnit> LayoutGrid::build(const Table &table) const { return build(table.records()); }

    std::vector<PlotUnit> LayoutGrid::build(const std::vector<TrialRecord> &records) const {
        if (records.empty())
            return {};

        check_indices(records);
        check_duplicates(records);
        warn_incomplete_grid(records);

        if (config_.grouping() == GroupingMode::Merge)
            return build_merged(records);
        return build_individual(records);
    }

    std::vector<PlotUnit> LayoutGrid::build_merged(const std::vector<TrialRecord> &records) const {
        std::vector<PlotUnit> out;
        auto groups = group_by_plot(records);
        out.reserve(groups.size());

        for (const auto &group : groups) {
            auto rows = group.by_row();
            const TrialRecord &first = *rows.front();

            PlotUnit unit;
            unit.plot = group.plot;
            unit.range = first.range;
            for (std::size_t i = 0; i < rows.size(); ++i) {
                if (rows[i]->range != unit.range)
                    throw InvalidGroupError(group.plot, "rows span ranges " + std::to_string(unit.range) + " and " +
                                                            std::to_string(rows[i]->range));
                if (i > 0 && rows[i]->row != rows[i - 1]->row + 1)
                    throw InvalidGroupError(group.plot, "rows " + std::to_string(rows[i - 1]->row) + " and " +
                                                            std::to_string(rows[i]->row) + " are not adjacent");
                unit.rows.push_back(rows[i]->row);
                unit.barcodes.push_back(rows[i]->barcode);
            }

            if (static_cast<int>(rows.size()) != config_.nrowplot) {
                std::cerr << "Warning: plot " << group.plot << " has " << rows.size() << " rows, expected "
                          << config_.nrowplot << std::endl;
            }

            unit.label = first.barcode;
            unit.local = footprint(unit.range, unit.first_row(), unit.last_row());
            apply_stagger(unit);
            out.push_back(std::move(unit));
        }
        return out;
    }

    std::vector<PlotUnit> LayoutGrid::build_individual(const std::vector<TrialRecord> &records) const {
        // Sibling data per plot: barcodes in row order, first/last row for subsetting
        struct PlotInfo {
            std::vector<std::string> barcodes;
            std::map<int, std::size_t> position; // row -> 1-based position within the plot
            std::string head;
            int lo = 0;
            int hi = 0;
        };
        std::map<int, PlotInfo> info;
        for (const auto &group : group_by_plot(records)) {
            auto rows = group.by_row();
            PlotInfo pi;
            for (std::size_t i = 0; i < rows.size(); ++i) {
                pi.barcodes.push_back(rows[i]->barcode);
                pi.position[rows[i]->row] = i + 1;
            }
            pi.head = rows.front()->barcode;
            pi.lo = rows.front()->row;
            pi.hi = rows.back()->row;
            info.emplace(group.plot, std::move(pi));
        }

        std::vector<PlotUnit> out;
        out.reserve(records.size());
        for (const auto &rec : records) {
            const PlotInfo &pi = info.at(rec.plot);

            const int subset = config_.plotsubset;
            if (subset > 0 && (rec.row < pi.lo + subset || rec.row > pi.hi - subset))
                continue;

            PlotUnit unit;
            unit.plot = rec.plot;
            unit.range = rec.range;
            unit.rows = {rec.row};
            unit.barcodes = {rec.barcode};
            unit.siblings = pi.barcodes;
            unit.label = pi.head + "_" + std::to_string(pi.position.at(rec.row));
            unit.local = footprint(rec.range, rec.row, rec.row);
            apply_stagger(unit);
            out.push_back(std::move(unit));
        }
        return out;
    }

} // namespace plotgrid
