#include <gridspace/tile/TileCache.hpp>

#include <gridspace/log/TaggedLogger.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace GS::Tiles {

TileCache::TileCache(std::size_t max_tiles)
    : max_tiles_(max_tiles) {
    if (max_tiles_ == 0) {
        throw std::invalid_argument("tile cache capacity must be positive");
    }
    index_.reserve(max_tiles_);
}

TileCache::~TileCache() {
    clear();
    cleanup();
}

auto TileCache::put(TileKey const& key, std::unique_ptr<Tile> tile) -> Tile* {
    if (!tile) {
        throw std::invalid_argument("tile cache cannot store a null tile");
    }

    if (auto it = index_.find(key); it != index_.end()) {
        pending_.push_back(std::move(it->second->tile));
        lru_list_.erase(it->second);
        index_.erase(it);
        ++replacements_;
    }

    while (lru_list_.size() >= max_tiles_) {
        evict_oldest();
    }

    lru_list_.push_front(Entry{key, std::move(tile)});
    index_[key] = lru_list_.begin();
    return lru_list_.front().tile.get();
}

auto TileCache::get(TileKey const& key) -> Tile* {
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->tile.get();
}

auto TileCache::contains(TileKey const& key) const -> bool {
    return index_.find(key) != index_.end();
}

auto TileCache::remove(TileKey const& key) -> std::unique_ptr<Tile> {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    auto tile = std::move(it->second->tile);
    lru_list_.erase(it->second);
    index_.erase(it);
    return tile;
}

auto TileCache::valid_tiles_for_zoom(ZoomBucket bucket) const -> std::vector<Tile const*> {
    std::vector<Tile const*> tiles;
    for (auto it = lru_list_.rbegin(); it != lru_list_.rend(); ++it) {
        if (it->key.zoom_bucket == bucket && it->tile->is_valid()) {
            tiles.push_back(it->tile.get());
        }
    }
    return tiles;
}

auto TileCache::invalidate_range(CellRange const& range) -> std::size_t {
    std::size_t invalidated = 0;
    for (auto& entry : lru_list_) {
        if (entry.tile->is_valid() && entry.tile->intersects_cell_range(range)) {
            entry.tile->invalidate();
            ++invalidated;
        }
    }
    gs_log("invalidated " + std::to_string(invalidated) + " tiles in " + range.to_string(), "TileCache", "Verbose");
    return invalidated;
}

auto TileCache::invalidate_zoom_bucket(ZoomBucket bucket) -> std::size_t {
    std::size_t invalidated = 0;
    for (auto& entry : lru_list_) {
        if (entry.key.zoom_bucket == bucket && entry.tile->is_valid()) {
            entry.tile->invalidate();
            ++invalidated;
        }
    }
    return invalidated;
}

auto TileCache::invalidate_all() -> void {
    for (auto& entry : lru_list_) {
        entry.tile->invalidate();
    }
}

auto TileCache::cleanup() -> std::size_t {
    auto const released = pending_.size();
    for (auto& tile : pending_) {
        tile->dispose();
    }
    pending_.clear();
    disposals_ += released;
    if (released > 0) {
        gs_log("released " + std::to_string(released) + " evicted tiles", "TileCache");
    }
    return released;
}

auto TileCache::clear() -> void {
    for (auto& entry : lru_list_) {
        entry.tile->dispose();
    }
    disposals_ += lru_list_.size();
    index_.clear();
    lru_list_.clear();
}

auto TileCache::metrics() const -> Metrics {
    Metrics m{};
    m.hits = hits_;
    m.misses = misses_;
    m.evictions = evictions_;
    m.replacements = replacements_;
    m.disposals = disposals_;
    m.size = lru_list_.size();
    m.capacity = max_tiles_;
    m.pending_disposal = pending_.size();
    return m;
}

auto TileCache::evict_oldest() -> void {
    if (lru_list_.empty()) {
        return;
    }
    auto& back = lru_list_.back();
    index_.erase(back.key);
    pending_.push_back(std::move(back.tile));
    lru_list_.pop_back();
    ++evictions_;
}

} // namespace GS::Tiles
