#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>
#include <gridspace/geometry/ZoomTransform.hpp>
#include <gridspace/tile/TileCoordinate.hpp>

#include <parallel_hashmap/phmap_utils.h>

#include <cstdint>
#include <functional>

namespace GS::Tiles {

using Geometry::CellRange;
using Geometry::ZoomBucket;

// Opaque rendered payload (a GPU texture, a recorded picture, ...). The
// handle is never inspected; the disposer releases it exactly once.
class TilePicture {
public:
    using Disposer = std::function<void(std::uint64_t)>;

    TilePicture() = default;
    TilePicture(std::uint64_t handle, Disposer disposer);
    ~TilePicture();

    TilePicture(TilePicture const&) = delete;
    TilePicture& operator=(TilePicture const&) = delete;
    TilePicture(TilePicture&& other) noexcept;
    TilePicture& operator=(TilePicture&& other) noexcept;

    [[nodiscard]] auto handle() const -> std::uint64_t { return handle_; }
    [[nodiscard]] auto released() const -> bool { return released_; }

    // Idempotent.
    auto release() -> void;

private:
    std::uint64_t handle_ = 0;
    Disposer      disposer_;
    bool          released_ = true;
};

struct TileKey {
    TileCoordinate coordinate{};
    ZoomBucket     zoom_bucket{ZoomBucket::Full};

    auto operator==(TileKey const&) const -> bool = default;
};

// One rendered tile. Validity only ever goes from true to false; an invalid
// tile is replaced, never revived.
class Tile {
public:
    Tile(TileCoordinate coordinate, ZoomBucket zoom_bucket, TilePicture picture, CellRange cell_range);
    ~Tile();

    Tile(Tile const&) = delete;
    Tile& operator=(Tile const&) = delete;

    [[nodiscard]] auto coordinate() const -> TileCoordinate const& { return coordinate_; }
    [[nodiscard]] auto zoom_bucket() const -> ZoomBucket { return zoom_bucket_; }
    [[nodiscard]] auto picture() const -> TilePicture const& { return picture_; }
    [[nodiscard]] auto cell_range() const -> CellRange const& { return cell_range_; }
    [[nodiscard]] auto key() const -> TileKey { return TileKey{coordinate_, zoom_bucket_}; }

    [[nodiscard]] auto is_valid() const -> bool { return valid_; }
    [[nodiscard]] auto is_disposed() const -> bool { return disposed_; }

    auto invalidate() -> void { valid_ = false; }

    // Releases the picture. Safe to call more than once.
    auto dispose() -> void;

    [[nodiscard]] auto contains_cell(std::int32_t row, std::int32_t column) const -> bool {
        return cell_range_.contains(row, column);
    }
    [[nodiscard]] auto intersects_cell_range(CellRange const& range) const -> bool {
        return cell_range_.intersects(range);
    }

private:
    TileCoordinate coordinate_;
    ZoomBucket     zoom_bucket_;
    TilePicture    picture_;
    CellRange      cell_range_;
    bool           valid_ = true;
    bool           disposed_ = false;
};

} // namespace GS::Tiles

namespace std {

template <>
struct hash<GS::Tiles::TileKey> {
    std::size_t operator()(GS::Tiles::TileKey const& key) const noexcept {
        return phmap::HashState().combine(0,
                                          key.coordinate.row,
                                          key.coordinate.column,
                                          static_cast<std::uint8_t>(key.zoom_bucket));
    }
};

} // namespace std
