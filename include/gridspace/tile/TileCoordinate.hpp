#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>

#include <parallel_hashmap/phmap_utils.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace GS::Tiles {

using Geometry::Rect;

// Position in the fixed-size tile partition of the content plane; (0, 0) is
// the top-left tile. Independent of row and column sizes.
struct TileCoordinate {
    std::int32_t row = 0;
    std::int32_t column = 0;

    // Tile containing (x, y); negative positions clamp to the first row/column.
    [[nodiscard]] static auto from_pixel(double x, double y, double tile_width, double tile_height)
        -> TileCoordinate;

    [[nodiscard]] auto pixel_bounds(double tile_width, double tile_height) const -> Rect;

    // Clamped to non-negative.
    [[nodiscard]] auto offset(std::int32_t row_delta, std::int32_t column_delta) const -> TileCoordinate;

    auto operator==(TileCoordinate const&) const -> bool = default;
};

// Tiles intersecting [start, end) in row-major order. The far corner is
// pulled in by kBoundaryEpsilon so an edge that falls exactly on a tile
// boundary does not add a row or column of tiles.
[[nodiscard]] auto tiles_in_range(double start_x,
                                  double start_y,
                                  double end_x,
                                  double end_y,
                                  double tile_width,
                                  double tile_height) -> std::vector<TileCoordinate>;

[[nodiscard]] auto tiles_covering(Rect const& rect, double tile_width, double tile_height)
    -> std::vector<TileCoordinate>;

} // namespace GS::Tiles

namespace std {

template <>
struct hash<GS::Tiles::TileCoordinate> {
    std::size_t operator()(GS::Tiles::TileCoordinate const& coord) const noexcept {
        return phmap::HashState().combine(0, coord.row, coord.column);
    }
};

} // namespace std
