#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>
#include <gridspace/geometry/ZoomTransform.hpp>
#include <gridspace/tile/Tile.hpp>
#include <gridspace/tile/TileCoordinate.hpp>

namespace GS::Tiles {

// Produces the drawable for one tile. Called synchronously on a cache miss;
// the returned picture is owned by the tile from then on.
class TileRenderer {
public:
    virtual ~TileRenderer() = default;

    virtual auto render_tile(TileCoordinate const& coordinate,
                             Rect const& pixel_bounds,
                             CellRange const& cell_range,
                             ZoomBucket zoom_bucket) -> TilePicture = 0;
};

} // namespace GS::Tiles
