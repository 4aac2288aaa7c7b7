#include "plotgrid/table.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "plotgrid/errors.hpp"

namespace plotgrid {

    namespace {

        std::string trim(const std::string &s) {
            std::size_t b = 0, e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
                ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                --e;
            return s.substr(b, e - b);
        }

        // Integers may arrive as "3" or "3.0" depending on who wrote the table
        int parse_int(const std::string &column, std::size_t record, const std::string &raw) {
            std::string text = trim(raw);
            if (text.empty())
                throw InvalidValueError(column, record, raw);

            std::size_t used = 0;
            double value = 0.0;
            try {
                value = std::stod(text, &used);
            } catch (const std::exception &) {
                throw InvalidValueError(column, record, raw);
            }
            if (used != text.size() || !std::isfinite(value) || value != std::floor(value) || value < -2147483648.0 ||
                value > 2147483647.0)
                throw InvalidValueError(column, record, raw);
            return static_cast<int>(value);
        }

    } // namespace

    const std::vector<std::string> &required_columns() {
        static const std::vector<std::string> names = {"Plot", "Range", "Row", "Barcode"};
        return names;
    }

    Table::Table(std::vector<std::string> columns) : columns_(std::move(columns)) {}

    void Table::add_row(std::vector<std::string> cells) {
        if (cells.size() != columns_.size())
            throw std::invalid_argument("row has " + std::to_string(cells.size()) + " cells, table has " +
                                        std::to_string(columns_.size()) + " columns");
        cells_.push_back(std::move(cells));
    }

    std::optional<std::size_t> Table::column_index(const std::string &name) const {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i] == name)
                return i;
        }
        return std::nullopt;
    }

    const std::string &Table::cell(std::size_t record, std::size_t column) const {
        return cells_.at(record).at(column);
    }

    std::vector<TrialRecord> Table::records() const {
        std::vector<std::string> missing;
        std::vector<std::size_t> idx;
        for (const auto &name : required_columns()) {
            auto i = column_index(name);
            if (!i)
                missing.push_back(name);
            else
                idx.push_back(*i);
        }
        if (!missing.empty())
            throw MissingColumnError(missing);

        std::vector<TrialRecord> out;
        out.reserve(cells_.size());
        for (std::size_t r = 0; r < cells_.size(); ++r) {
            TrialRecord rec;
            rec.plot = parse_int("Plot", r, cells_[r][idx[0]]);
            rec.range = parse_int("Range", r, cells_[r][idx[1]]);
            rec.row = parse_int("Row", r, cells_[r][idx[2]]);
            rec.barcode = trim(cells_[r][idx[3]]);
            if (rec.range < 1)
                throw InvalidValueError("Range", r, cells_[r][idx[1]]);
            if (rec.row < 1)
                throw InvalidValueError("Row", r, cells_[r][idx[2]]);
            out.push_back(std::move(rec));
        }
        return out;
    }

    Table Table::from_records(const std::vector<TrialRecord> &records) {
        Table table(required_columns());
        for (const auto &rec : records) {
            table.add_row({std::to_string(rec.plot), std::to_string(rec.range), std::to_string(rec.row), rec.barcode});
        }
        return table;
    }

} // namespace plotgrid
