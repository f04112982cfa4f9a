#pragma once

#include <gridspace/core/Error.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace GS::Geometry {

// Lookups at the far edge of a half-open interval subtract this so that a
// range ending exactly on a span or tile boundary does not pull in the next
// span or tile. Far below any realistic cell or tile size.
inline constexpr double kBoundaryEpsilon = 1e-6;

struct Point {
    double x = 0.0;
    double y = 0.0;

    auto operator==(Point const&) const -> bool = default;
};

struct Size {
    double width = 0.0;
    double height = 0.0;

    auto operator==(Size const&) const -> bool = default;
};

struct Rect {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;

    [[nodiscard]] static constexpr auto from_ltwh(double left, double top, double width, double height) -> Rect {
        return Rect{left, top, left + width, top + height};
    }

    [[nodiscard]] constexpr auto width() const -> double { return right - left; }
    [[nodiscard]] constexpr auto height() const -> double { return bottom - top; }
    [[nodiscard]] constexpr auto size() const -> Size { return Size{width(), height()}; }

    [[nodiscard]] constexpr auto empty() const -> bool {
        return left >= right || top >= bottom;
    }

    [[nodiscard]] constexpr auto contains(Point p) const -> bool {
        return p.x >= left && p.x < right && p.y >= top && p.y < bottom;
    }

    [[nodiscard]] constexpr auto overlaps(Rect const& other) const -> bool {
        return left < other.right && other.left < right && top < other.bottom && other.top < bottom;
    }

    auto operator==(Rect const&) const -> bool = default;
};

struct CellCoordinate {
    std::int32_t row = 0;
    std::int32_t column = 0;

    [[nodiscard]] auto offset(std::int32_t row_delta, std::int32_t column_delta) const -> CellCoordinate {
        return CellCoordinate{std::max(0, row + row_delta), std::max(0, column + column_delta)};
    }

    // "A1" style: column letters (A..Z, AA..) followed by the 1-based row.
    [[nodiscard]] auto to_notation() const -> std::string;
    [[nodiscard]] static auto from_notation(std::string_view notation) -> Expected<CellCoordinate>;

    auto operator==(CellCoordinate const&) const -> bool = default;
};

// Inclusive rectangle of cells.
struct CellRange {
    std::int32_t start_row = 0;
    std::int32_t start_column = 0;
    std::int32_t end_row = 0;
    std::int32_t end_column = 0;

    [[nodiscard]] static auto single(CellCoordinate coord) -> CellRange {
        return CellRange{coord.row, coord.column, coord.row, coord.column};
    }

    [[nodiscard]] static auto from_coordinates(CellCoordinate a, CellCoordinate b) -> CellRange {
        return CellRange{std::min(a.row, b.row),
                         std::min(a.column, b.column),
                         std::max(a.row, b.row),
                         std::max(a.column, b.column)};
    }

    [[nodiscard]] auto row_count() const -> std::int32_t { return end_row - start_row + 1; }
    [[nodiscard]] auto column_count() const -> std::int32_t { return end_column - start_column + 1; }
    [[nodiscard]] auto cell_count() const -> std::int64_t {
        return static_cast<std::int64_t>(row_count()) * static_cast<std::int64_t>(column_count());
    }

    [[nodiscard]] auto top_left() const -> CellCoordinate { return CellCoordinate{start_row, start_column}; }
    [[nodiscard]] auto bottom_right() const -> CellCoordinate { return CellCoordinate{end_row, end_column}; }

    [[nodiscard]] auto contains(std::int32_t row, std::int32_t column) const -> bool {
        return row >= start_row && row <= end_row && column >= start_column && column <= end_column;
    }

    [[nodiscard]] auto contains(CellCoordinate coord) const -> bool {
        return contains(coord.row, coord.column);
    }

    [[nodiscard]] auto intersects(CellRange const& other) const -> bool {
        return !(other.end_row < start_row || other.start_row > end_row
                 || other.end_column < start_column || other.start_column > end_column);
    }

    [[nodiscard]] auto intersection(CellRange const& other) const -> std::optional<CellRange>;
    [[nodiscard]] auto union_with(CellRange const& other) const -> CellRange;
    [[nodiscard]] auto expand(CellCoordinate coord) const -> CellRange;
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(CellRange const&) const -> bool = default;
};

// Inclusive range of indices along one axis.
struct SpanRange {
    std::int32_t start_index = 0;
    std::int32_t end_index = 0;

    [[nodiscard]] auto length() const -> std::int32_t { return end_index - start_index + 1; }

    auto operator==(SpanRange const&) const -> bool = default;
};

} // namespace GS::Geometry
