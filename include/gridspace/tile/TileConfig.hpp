#pragma once

#include <gridspace/core/Error.hpp>
#include <gridspace/geometry/ZoomTransform.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace GS::Tiles {

struct TileConfig {
    int tile_size{256};        // pixels, square tiles
    int max_cached_tiles{100}; // LRU capacity
    // Rings of tiles beyond the visible edge a caller may prefetch. Not used
    // by TileManager itself.
    int prefetch_rings{1};

    [[nodiscard]] auto tile_width() const -> double { return static_cast<double>(tile_size); }
    [[nodiscard]] auto tile_height() const -> double { return static_cast<double>(tile_size); }

    // On-screen edge length of one tile at `scale`.
    [[nodiscard]] auto tile_size_for_zoom(double scale) const -> double {
        return static_cast<double>(tile_size) * scale;
    }

    // Content area covered by one tile edge at a bucket; zoomed-out buckets
    // cover more content per tile.
    [[nodiscard]] auto zoom_bucket_tile_size(Geometry::ZoomBucket bucket) const -> int;

    // Tiles needed to span `dimension` pixels.
    [[nodiscard]] auto tile_count_for_dimension(double dimension) const -> int;

    auto operator==(TileConfig const&) const -> bool = default;
};

// Returns the first violated constraint, or nullopt when the config is usable.
auto ValidateTileConfig(TileConfig const& config) -> std::optional<std::string>;

// Reads GRIDSPACE_TILE_SIZE, GRIDSPACE_MAX_CACHED_TILES and
// GRIDSPACE_PREFETCH_RINGS. Returns false if any present value fails to
// parse; that field keeps its previous value.
bool ApplyTileConfigEnvOverrides(TileConfig& config);

// JSON object with optional integer keys tile_size, max_cached_tiles and
// prefetch_rings; absent keys keep their defaults. The result is validated.
auto LoadTileConfigFromJson(std::string_view json_text) -> Expected<TileConfig>;
auto LoadTileConfigFile(std::filesystem::path const& path) -> Expected<TileConfig>;

auto TileConfigToJson(TileConfig const& config) -> std::string;

} // namespace GS::Tiles
