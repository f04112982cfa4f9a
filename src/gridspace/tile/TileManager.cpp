#include <gridspace/tile/TileManager.hpp>

#include <gridspace/log/TaggedLogger.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace GS::Tiles {

namespace {

auto validated_config(TileConfig config) -> TileConfig {
    if (auto violation = ValidateTileConfig(config)) {
        throw std::invalid_argument("invalid tile config: " + *violation);
    }
    return config;
}

} // namespace

TileManager::TileManager(Geometry::GridLayout const& layout, TileConfig config, TileRenderer& renderer)
    : layout_(layout)
    , config_(validated_config(std::move(config)))
    , renderer_(renderer)
    , cache_(static_cast<std::size_t>(config_.max_cached_tiles)) {}

auto TileManager::tiles_for_viewport(Rect const& viewport, ZoomBucket zoom_bucket) -> std::vector<Tile const*> {
    auto const started = std::chrono::steady_clock::now();
    auto const evictions_before = cache_.metrics().evictions;

    TileFrameStats stats{};
    auto const coordinates = tile_coordinates_for_viewport(viewport);
    stats.tiles_requested = coordinates.size();

    std::vector<Tile const*> tiles;
    tiles.reserve(coordinates.size());
    for (auto const& coordinate : coordinates) {
        TileKey const key{coordinate, zoom_bucket};
        Tile* tile = cache_.get(key);
        if (tile != nullptr && tile->is_valid()) {
            ++stats.cache_hits;
        } else {
            if (tile != nullptr) {
                ++stats.invalid_rerenders;
            }
            tile = cache_.put(key, render(coordinate, zoom_bucket));
            ++stats.tiles_rendered;
        }
        tiles.push_back(tile);
    }

    stats.evictions = static_cast<std::size_t>(cache_.metrics().evictions - evictions_before);
    stats.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    last_frame_stats_ = stats;

    gs_log("frame: " + std::to_string(stats.tiles_requested) + " tiles, " + std::to_string(stats.tiles_rendered)
               + " rendered, " + std::to_string(stats.evictions) + " evicted",
           "TileManager",
           "Verbose");
    return tiles;
}

auto TileManager::tile_coordinates_for_viewport(Rect const& viewport) const -> std::vector<TileCoordinate> {
    return tiles_covering(viewport, config_.tile_width(), config_.tile_height());
}

auto TileManager::cell_range_for_tile(TileCoordinate const& coordinate) const -> CellRange {
    auto const bounds = coordinate.pixel_bounds(config_.tile_width(), config_.tile_height());
    auto const rows = layout_.visible_rows(bounds.top, bounds.height());
    auto const columns = layout_.visible_columns(bounds.left, bounds.width());
    return CellRange{rows.start_index, columns.start_index, rows.end_index, columns.end_index};
}

auto TileManager::tile(TileKey const& key) -> Tile const* {
    return cache_.get(key);
}

auto TileManager::dispose() -> void {
    cache_.clear();
    cache_.cleanup();
}

auto TileManager::render(TileCoordinate const& coordinate, ZoomBucket zoom_bucket) -> std::unique_ptr<Tile> {
    auto const bounds = coordinate.pixel_bounds(config_.tile_width(), config_.tile_height());
    auto const cell_range = cell_range_for_tile(coordinate);
    auto picture = renderer_.render_tile(coordinate, bounds, cell_range, zoom_bucket);
    gs_log("rendered tile (" + std::to_string(coordinate.row) + ", " + std::to_string(coordinate.column) + ") at "
               + std::string{Geometry::zoom_bucket_name(zoom_bucket)},
           "TileManager",
           "Verbose");
    return std::make_unique<Tile>(coordinate, zoom_bucket, std::move(picture), cell_range);
}

} // namespace GS::Tiles
