#include <gridspace/tile/Tile.hpp>

#include <utility>

namespace GS::Tiles {

TilePicture::TilePicture(std::uint64_t handle, Disposer disposer)
    : handle_(handle)
    , disposer_(std::move(disposer))
    , released_(false) {}

TilePicture::~TilePicture() {
    release();
}

TilePicture::TilePicture(TilePicture&& other) noexcept
    : handle_(other.handle_)
    , disposer_(std::move(other.disposer_))
    , released_(std::exchange(other.released_, true)) {}

TilePicture& TilePicture::operator=(TilePicture&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = other.handle_;
        disposer_ = std::move(other.disposer_);
        released_ = std::exchange(other.released_, true);
    }
    return *this;
}

auto TilePicture::release() -> void {
    if (released_) {
        return;
    }
    released_ = true;
    if (disposer_) {
        disposer_(handle_);
    }
}

Tile::Tile(TileCoordinate coordinate, ZoomBucket zoom_bucket, TilePicture picture, CellRange cell_range)
    : coordinate_(coordinate)
    , zoom_bucket_(zoom_bucket)
    , picture_(std::move(picture))
    , cell_range_(cell_range) {}

Tile::~Tile() {
    dispose();
}

auto Tile::dispose() -> void {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    picture_.release();
}

} // namespace GS::Tiles
