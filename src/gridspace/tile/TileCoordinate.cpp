#include <gridspace/tile/TileCoordinate.hpp>

#include <algorithm>
#include <cmath>

namespace GS::Tiles {

auto TileCoordinate::from_pixel(double x, double y, double tile_width, double tile_height) -> TileCoordinate {
    auto const column = static_cast<std::int32_t>(std::floor(x / tile_width));
    auto const row = static_cast<std::int32_t>(std::floor(y / tile_height));
    return TileCoordinate{std::max(0, row), std::max(0, column)};
}

auto TileCoordinate::pixel_bounds(double tile_width, double tile_height) const -> Rect {
    return Rect::from_ltwh(static_cast<double>(column) * tile_width,
                           static_cast<double>(row) * tile_height,
                           tile_width,
                           tile_height);
}

auto TileCoordinate::offset(std::int32_t row_delta, std::int32_t column_delta) const -> TileCoordinate {
    return TileCoordinate{std::max(0, row + row_delta), std::max(0, column + column_delta)};
}

auto tiles_in_range(double start_x,
                    double start_y,
                    double end_x,
                    double end_y,
                    double tile_width,
                    double tile_height) -> std::vector<TileCoordinate> {
    auto const first = TileCoordinate::from_pixel(start_x, start_y, tile_width, tile_height);
    auto const last = TileCoordinate::from_pixel(end_x - Geometry::kBoundaryEpsilon,
                                                 end_y - Geometry::kBoundaryEpsilon,
                                                 tile_width,
                                                 tile_height);

    std::vector<TileCoordinate> tiles;
    if (last.row < first.row || last.column < first.column) {
        return tiles;
    }
    tiles.reserve(static_cast<std::size_t>(last.row - first.row + 1)
                  * static_cast<std::size_t>(last.column - first.column + 1));
    for (auto row = first.row; row <= last.row; ++row) {
        for (auto column = first.column; column <= last.column; ++column) {
            tiles.push_back(TileCoordinate{row, column});
        }
    }
    return tiles;
}

auto tiles_covering(Rect const& rect, double tile_width, double tile_height) -> std::vector<TileCoordinate> {
    return tiles_in_range(rect.left, rect.top, rect.right, rect.bottom, tile_width, tile_height);
}

} // namespace GS::Tiles
