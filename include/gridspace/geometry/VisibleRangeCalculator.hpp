#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>
#include <gridspace/geometry/GridLayout.hpp>

#include <cstdint>

namespace GS::Geometry {

// Viewport rectangle (content space) to the cells it touches. Borrows the
// layout; the layout must outlive the calculator.
class VisibleRangeCalculator {
public:
    explicit VisibleRangeCalculator(GridLayout const& layout) : layout_(layout) {}

    [[nodiscard]] auto layout() const -> GridLayout const& { return layout_; }

    // Every cell at least partially inside the viewport.
    [[nodiscard]] auto visible_range(Rect const& viewport) const -> CellRange;

    // Base range grown by the given number of rows/columns on each side and
    // clamped to the grid, for rendering just outside the viewport.
    [[nodiscard]] auto visible_range_with_padding(Rect const& viewport,
                                                  std::int32_t row_padding = 1,
                                                  std::int32_t column_padding = 1) const -> CellRange;

    [[nodiscard]] auto is_cell_visible(std::int32_t row, std::int32_t column, Rect const& viewport) const -> bool;
    [[nodiscard]] auto is_range_visible(CellRange const& range, Rect const& viewport) const -> bool;

    // Smallest rectangle that shows the whole range.
    [[nodiscard]] auto minimal_viewport_for(CellRange const& range) const -> Rect;

private:
    GridLayout const& layout_;
};

} // namespace GS::Geometry
