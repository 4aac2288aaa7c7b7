#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace plotgrid {

    /**
     * @brief One physical row position of the trial design
     */
    struct TrialRecord {
        int plot = 0;
        int range = 1;
        int row = 1;
        std::string barcode;
    };

    /**
     * @brief Untyped in-memory table as handed over by a reader
     *
     * Cells are kept as text; `records()` checks the layout columns and converts them.
     */
    class Table {
      public:
        Table() = default;
        explicit Table(std::vector<std::string> columns);

        const std::vector<std::string> &columns() const { return columns_; }
        std::size_t size() const { return cells_.size(); }
        bool empty() const { return cells_.empty(); }

        /**
         * @brief Append one record, one cell per column
         *
         * @throws std::invalid_argument if the cell count does not match the columns
         */
        void add_row(std::vector<std::string> cells);

        std::optional<std::size_t> column_index(const std::string &name) const;
        const std::string &cell(std::size_t record, std::size_t column) const;

        /**
         * @brief Convert to typed records in table order
         *
         * Extra columns are ignored.
         *
         * @throws MissingColumnError listing every absent layout column
         * @throws InvalidValueError for non-integer Plot/Range/Row cells or Range/Row below 1
         */
        std::vector<TrialRecord> records() const;

        /// Table with the four layout columns, in Plot/Range/Row/Barcode order
        static Table from_records(const std::vector<TrialRecord> &records);

      private:
        std::vector<std::string> columns_;
        std::vector<std::vector<std::string>> cells_;
    };

    /// Column names a layout table must provide
    const std::vector<std::string> &required_columns();

} // namespace plotgrid
