#pragma once

#include <gridspace/geometry/GridLayout.hpp>
#include <gridspace/tile/Tile.hpp>
#include <gridspace/tile/TileCache.hpp>
#include <gridspace/tile/TileConfig.hpp>
#include <gridspace/tile/TileCoordinate.hpp>
#include <gridspace/tile/TileRenderer.hpp>

#include <cstddef>
#include <vector>

namespace GS::Tiles {

struct TileFrameStats {
    std::size_t tiles_requested = 0;
    std::size_t cache_hits = 0;
    std::size_t tiles_rendered = 0;
    std::size_t invalid_rerenders = 0;
    std::size_t evictions = 0;
    double      elapsed_ms = 0.0;
};

// Serves the tiles covering a viewport, rendering misses through the
// TileRenderer and caching them. The layout and renderer are borrowed and
// must outlive the manager.
//
// Per paint: tiles_for_viewport(), draw the tiles in the returned order,
// then cleanup() exactly once.
class TileManager {
public:
    // Throws std::invalid_argument when the config fails validation.
    TileManager(Geometry::GridLayout const& layout, TileConfig config, TileRenderer& renderer);

    TileManager(TileManager const&) = delete;
    TileManager& operator=(TileManager const&) = delete;

    // Row-major, matching tiles_covering(). Pointers stay valid until the
    // next cleanup(), clear_cache() or dispose().
    auto tiles_for_viewport(Rect const& viewport, ZoomBucket zoom_bucket) -> std::vector<Tile const*>;

    [[nodiscard]] auto tile_coordinates_for_viewport(Rect const& viewport) const -> std::vector<TileCoordinate>;

    // Cells under the tile's pixel bounds, clamped to the grid. A tile past
    // the content edge maps to the last row/column.
    [[nodiscard]] auto cell_range_for_tile(TileCoordinate const& coordinate) const -> CellRange;

    auto tile(TileKey const& key) -> Tile const*;

    auto invalidate_range(CellRange const& range) -> void { cache_.invalidate_range(range); }
    auto invalidate_zoom_bucket(ZoomBucket zoom_bucket) -> void { cache_.invalidate_zoom_bucket(zoom_bucket); }
    auto invalidate_all() -> void { cache_.invalidate_all(); }
    auto clear_cache() -> void { cache_.clear(); }

    auto cleanup() -> std::size_t { return cache_.cleanup(); }

    // Releases every cached and pending tile.
    auto dispose() -> void;

    [[nodiscard]] auto config() const -> TileConfig const& { return config_; }
    [[nodiscard]] auto cache() const -> TileCache const& { return cache_; }
    [[nodiscard]] auto last_frame_stats() const -> TileFrameStats const& { return last_frame_stats_; }

private:
    auto render(TileCoordinate const& coordinate, ZoomBucket zoom_bucket) -> std::unique_ptr<Tile>;

    Geometry::GridLayout const& layout_;
    TileConfig                  config_;
    TileRenderer&               renderer_;
    TileCache                   cache_;
    TileFrameStats              last_frame_stats_{};
};

} // namespace GS::Tiles
