#include <gridspace/geometry/VisibleRangeCalculator.hpp>

#include <algorithm>

namespace GS::Geometry {

auto VisibleRangeCalculator::visible_range(Rect const& viewport) const -> CellRange {
    auto const rows = layout_.visible_rows(viewport.top, viewport.height());
    auto const columns = layout_.visible_columns(viewport.left, viewport.width());
    return CellRange{rows.start_index, columns.start_index, rows.end_index, columns.end_index};
}

auto VisibleRangeCalculator::visible_range_with_padding(Rect const& viewport,
                                                        std::int32_t row_padding,
                                                        std::int32_t column_padding) const -> CellRange {
    auto const base = visible_range(viewport);
    return CellRange{
        .start_row = std::max(0, base.start_row - row_padding),
        .start_column = std::max(0, base.start_column - column_padding),
        .end_row = std::min(layout_.row_count() - 1, base.end_row + row_padding),
        .end_column = std::min(layout_.column_count() - 1, base.end_column + column_padding),
    };
}

auto VisibleRangeCalculator::is_cell_visible(std::int32_t row, std::int32_t column, Rect const& viewport) const
    -> bool {
    return visible_range(viewport).contains(row, column);
}

auto VisibleRangeCalculator::is_range_visible(CellRange const& range, Rect const& viewport) const -> bool {
    return range.intersects(visible_range(viewport));
}

auto VisibleRangeCalculator::minimal_viewport_for(CellRange const& range) const -> Rect {
    return layout_.range_bounds(range);
}

} // namespace GS::Geometry
