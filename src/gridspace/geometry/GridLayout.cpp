#include <gridspace/geometry/GridLayout.hpp>

#include <utility>

namespace GS::Geometry {

GridLayout::GridLayout(SpanIndex rows, SpanIndex columns)
    : rows_(std::move(rows))
    , columns_(std::move(columns)) {}

auto GridLayout::cell_bounds(std::int32_t row, std::int32_t column) const -> Rect {
    return Rect::from_ltwh(columns_.position_at(column),
                           rows_.position_at(row),
                           columns_.size_at(column),
                           rows_.size_at(row));
}

auto GridLayout::cell_at(Point position) const -> std::optional<CellCoordinate> {
    auto const row = row_at(position.y);
    auto const column = column_at(position.x);
    if (row == SpanIndex::kNotFound || column == SpanIndex::kNotFound) {
        return std::nullopt;
    }
    return CellCoordinate{row, column};
}

auto GridLayout::range_bounds(std::int32_t start_row,
                              std::int32_t start_column,
                              std::int32_t end_row,
                              std::int32_t end_column) const -> Rect {
    return Rect{columns_.position_at(start_column),
                rows_.position_at(start_row),
                columns_.position_at(end_column + 1),
                rows_.position_at(end_row + 1)};
}

} // namespace GS::Geometry
