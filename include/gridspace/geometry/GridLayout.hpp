#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>
#include <gridspace/geometry/SpanIndex.hpp>

#include <cstdint>
#include <optional>

namespace GS::Geometry {

// Row and column span indices combined into cell geometry. Owns the two
// axes but nothing about cell content.
class GridLayout {
public:
    GridLayout(SpanIndex rows, SpanIndex columns);

    [[nodiscard]] auto rows() const -> SpanIndex const& { return rows_; }
    [[nodiscard]] auto columns() const -> SpanIndex const& { return columns_; }

    [[nodiscard]] auto row_count() const -> std::int32_t { return rows_.count(); }
    [[nodiscard]] auto column_count() const -> std::int32_t { return columns_.count(); }
    [[nodiscard]] auto default_row_height() const -> double { return rows_.default_size(); }
    [[nodiscard]] auto default_column_width() const -> double { return columns_.default_size(); }
    [[nodiscard]] auto total_height() const -> double { return rows_.total_size(); }
    [[nodiscard]] auto total_width() const -> double { return columns_.total_size(); }
    [[nodiscard]] auto total_size() const -> Size { return Size{total_width(), total_height()}; }

    [[nodiscard]] auto cell_bounds(std::int32_t row, std::int32_t column) const -> Rect;
    [[nodiscard]] auto cell_bounds(CellCoordinate coord) const -> Rect {
        return cell_bounds(coord.row, coord.column);
    }

    // Empty when the point lies outside the content on either axis.
    [[nodiscard]] auto cell_at(Point position) const -> std::optional<CellCoordinate>;

    [[nodiscard]] auto row_at(double y) const -> std::int32_t { return rows_.index_at_position(y); }
    [[nodiscard]] auto column_at(double x) const -> std::int32_t { return columns_.index_at_position(x); }

    [[nodiscard]] auto row_top(std::int32_t row) const -> double { return rows_.position_at(row); }
    [[nodiscard]] auto column_left(std::int32_t column) const -> double { return columns_.position_at(column); }
    [[nodiscard]] auto row_height(std::int32_t row) const -> double { return rows_.size_at(row); }
    [[nodiscard]] auto column_width(std::int32_t column) const -> double { return columns_.size_at(column); }
    [[nodiscard]] auto row_end(std::int32_t row) const -> double { return row_top(row) + row_height(row); }
    [[nodiscard]] auto column_end(std::int32_t column) const -> double {
        return column_left(column) + column_width(column);
    }

    auto set_row_height(std::int32_t row, double height) -> void { rows_.set_size(row, height); }
    auto set_column_width(std::int32_t column, double width) -> void { columns_.set_size(column, width); }

    [[nodiscard]] auto visible_rows(double start_y, double height) const -> SpanRange {
        return rows_.get_range(start_y, start_y + height);
    }
    [[nodiscard]] auto visible_columns(double start_x, double width) const -> SpanRange {
        return columns_.get_range(start_x, start_x + width);
    }

    // Inclusive end indices map to the exclusive boundary position_at(end + 1),
    // so the last row/column reaches exactly the axis total size. Inputs must
    // already be within range.
    [[nodiscard]] auto range_bounds(std::int32_t start_row,
                                    std::int32_t start_column,
                                    std::int32_t end_row,
                                    std::int32_t end_column) const -> Rect;
    [[nodiscard]] auto range_bounds(CellRange const& range) const -> Rect {
        return range_bounds(range.start_row, range.start_column, range.end_row, range.end_column);
    }

private:
    SpanIndex rows_;
    SpanIndex columns_;
};

} // namespace GS::Geometry
