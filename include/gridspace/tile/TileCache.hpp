#pragma once

#include <gridspace/tile/Tile.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <vector>

namespace GS::Tiles {

// LRU map from TileKey to Tile with two-phase release. Tiles leaving the map
// through replacement or eviction move to a pending list and keep their
// resources until cleanup(), so a paint pass that still holds pointers to
// them stays safe. Pointers returned by put()/get() are valid until the
// next cleanup() or clear().
//
// Not synchronized; confine all calls to one thread.
class TileCache {
public:
    struct Metrics {
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::uint64_t evictions = 0;
        std::uint64_t replacements = 0;
        std::uint64_t disposals = 0;
        std::size_t   size = 0;
        std::size_t   capacity = 0;
        std::size_t   pending_disposal = 0;
    };

    // Throws std::invalid_argument when max_tiles is 0.
    explicit TileCache(std::size_t max_tiles);
    ~TileCache();

    TileCache(TileCache const&) = delete;
    TileCache& operator=(TileCache const&) = delete;

    auto put(TileKey const& key, std::unique_ptr<Tile> tile) -> Tile*;

    // Marks the entry most recently used on a hit; null on a miss.
    auto get(TileKey const& key) -> Tile*;

    // Does not touch recency.
    [[nodiscard]] auto contains(TileKey const& key) const -> bool;

    // Ownership passes to the caller; the tile is not disposed.
    auto remove(TileKey const& key) -> std::unique_ptr<Tile>;

    [[nodiscard]] auto size() const -> std::size_t { return lru_list_.size(); }
    [[nodiscard]] auto empty() const -> bool { return lru_list_.empty(); }
    [[nodiscard]] auto max_tiles() const -> std::size_t { return max_tiles_; }
    [[nodiscard]] auto pending_disposal_count() const -> std::size_t { return pending_.size(); }

    // Least recently used first.
    [[nodiscard]] auto valid_tiles_for_zoom(ZoomBucket bucket) const -> std::vector<Tile const*>;

    auto invalidate_range(CellRange const& range) -> std::size_t;
    auto invalidate_zoom_bucket(ZoomBucket bucket) -> std::size_t;
    auto invalidate_all() -> void;

    // Disposes and frees every pending tile. Returns how many were released.
    auto cleanup() -> std::size_t;

    // Disposes every live tile and empties the map. Pending tiles are left
    // for cleanup().
    auto clear() -> void;

    [[nodiscard]] auto metrics() const -> Metrics;

private:
    struct Entry {
        TileKey               key;
        std::unique_ptr<Tile> tile;
    };
    using LruList = std::list<Entry>;

    auto evict_oldest() -> void;

    std::size_t                                      max_tiles_;
    LruList                                          lru_list_; // front is most recent
    phmap::flat_hash_map<TileKey, LruList::iterator> index_;
    std::vector<std::unique_ptr<Tile>>               pending_;

    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::uint64_t evictions_ = 0;
    std::uint64_t replacements_ = 0;
    std::uint64_t disposals_ = 0;
};

} // namespace GS::Tiles
