#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace plotgrid {

    /**
     * @brief Base class of every error raised while building plot geometry
     *
     * None of these are transient: the call that raised it produced no output.
     */
    class PlotError : public std::runtime_error {
      public:
        explicit PlotError(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief The input table lacks one or more required columns
     */
    class MissingColumnError : public PlotError {
      public:
        explicit MissingColumnError(std::vector<std::string> missing)
            : PlotError(make_message(missing)), missing_(std::move(missing)) {}

        const std::vector<std::string> &missing() const { return missing_; }

      private:
        static std::string make_message(const std::vector<std::string> &missing) {
            std::string msg = "table missing required columns:";
            for (const auto &name : missing) {
                msg += " " + name;
            }
            return msg;
        }

        std::vector<std::string> missing_;
    };

    /**
     * @brief A table cell could not be read as the value its column requires
     */
    class InvalidValueError : public PlotError {
      public:
        InvalidValueError(const std::string &column, std::size_t record, const std::string &value)
            : PlotError("invalid value '" + value + "' in column " + column + " of record " + std::to_string(record)),
              column_(column), record_(record) {}

        const std::string &column() const { return column_; }
        std::size_t record() const { return record_; }

      private:
        std::string column_;
        std::size_t record_;
    };

    /**
     * @brief The same (Plot, Row) pair appears more than once
     */
    class DuplicateRowError : public PlotError {
      public:
        DuplicateRowError(int plot, int row)
            : PlotError("duplicate entry for plot " + std::to_string(plot) + " row " + std::to_string(row)),
              plot_(plot), row_(row) {}

        int plot() const { return plot_; }
        int row() const { return row_; }

      private:
        int plot_;
        int row_;
    };

    /**
     * @brief A merged plot whose rows cannot form one rectangle
     */
    class InvalidGroupError : public PlotError {
      public:
        InvalidGroupError(int plot, const std::string &reason)
            : PlotError("plot " + std::to_string(plot) + ": " + reason), plot_(plot) {}

        int plot() const { return plot_; }

      private:
        int plot_;
    };

    /**
     * @brief A and B coincide, so no field direction can be derived
     */
    class DegenerateFrameError : public PlotError {
      public:
        explicit DegenerateFrameError(double length)
            : PlotError("AB line has zero length (" + std::to_string(length) + ")"), length_(length) {}

        double length() const { return length_; }

      private:
        double length_;
    };

    /**
     * @brief Nothing to assemble
     */
    class EmptyLayoutError : public PlotError {
      public:
        EmptyLayoutError() : PlotError("layout contains no plot units") {}
    };

    /**
     * @brief A buffer would collapse or invert a plot footprint
     */
    class InvalidBufferError : public PlotError {
      public:
        InvalidBufferError(int plot, int row, const std::string &reason)
            : PlotError("buffer invalid for plot " + std::to_string(plot) + " row " + std::to_string(row) + ": " +
                        reason),
              plot_(plot), row_(row) {}

        int plot() const { return plot_; }
        int row() const { return row_; }

      private:
        int plot_;
        int row_;
    };

    /**
     * @brief Configuration values that cannot produce a layout
     */
    class InvalidConfigError : public PlotError {
      public:
        explicit InvalidConfigError(const std::string &what) : PlotError("invalid configuration: " + what) {}
    };

} // namespace plotgrid
