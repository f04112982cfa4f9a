#include <doctest/doctest.h>

#include "TileTestHelpers.hpp"

#include <unordered_set>
#include <utility>

using namespace GS::Tiles;
using namespace GS::Tiles::Test;

TEST_SUITE("tile.tile") {
    TEST_CASE("picture_releases_once") {
        DisposalLog log;
        {
            auto picture = log.picture(7);
            CHECK_FALSE(picture.released());
            CHECK(picture.handle() == 7);
            picture.release();
            picture.release();
            CHECK(picture.released());
        }
        CHECK(log.released.size() == 1);
    }

    TEST_CASE("picture_move_transfers_ownership") {
        DisposalLog log;
        {
            auto first = log.picture(1);
            TilePicture second = std::move(first);
            CHECK(first.released());
            CHECK_FALSE(second.released());

            TilePicture third = log.picture(2);
            third = std::move(second);
            // Assigning over a live picture releases what it held.
            CHECK(log.released == std::vector<std::uint64_t>{2});
            CHECK(third.handle() == 1);
        }
        CHECK(log.released == std::vector<std::uint64_t>{2, 1});
    }

    TEST_CASE("default_picture_has_nothing_to_release") {
        TilePicture empty;
        CHECK(empty.released());
        empty.release();
    }

    TEST_CASE("tile_state") {
        DisposalLog log;
        auto tile = make_tile(log, 5, TileCoordinate{1, 2}, ZoomBucket::Half, CellRange{10, 3, 20, 6});

        CHECK(tile->coordinate() == TileCoordinate{1, 2});
        CHECK(tile->zoom_bucket() == ZoomBucket::Half);
        CHECK(tile->key() == TileKey{TileCoordinate{1, 2}, ZoomBucket::Half});
        CHECK(tile->picture().handle() == 5);
        CHECK(tile->is_valid());
        CHECK_FALSE(tile->is_disposed());

        CHECK(tile->contains_cell(10, 3));
        CHECK(tile->contains_cell(20, 6));
        CHECK_FALSE(tile->contains_cell(21, 6));
        CHECK(tile->intersects_cell_range(CellRange{0, 0, 10, 3}));
        CHECK_FALSE(tile->intersects_cell_range(CellRange{0, 0, 9, 9}));

        tile->invalidate();
        CHECK_FALSE(tile->is_valid());
        CHECK_FALSE(tile->is_disposed());
    }

    TEST_CASE("dispose_is_idempotent") {
        DisposalLog log;
        auto tile = make_tile(log, 9, TileCoordinate{0, 0});
        tile->dispose();
        tile->dispose();
        CHECK(tile->is_disposed());
        CHECK(log.released.size() == 1);
        tile.reset();
        CHECK(log.released.size() == 1);
    }

    TEST_CASE("destroying_tile_disposes") {
        DisposalLog log;
        auto tile = make_tile(log, 3, TileCoordinate{0, 0});
        tile.reset();
        CHECK(log.was_released(3));
    }

    TEST_CASE("keys_differ_by_zoom_bucket") {
        TileKey full{TileCoordinate{2, 2}, ZoomBucket::Full};
        TileKey half{TileCoordinate{2, 2}, ZoomBucket::Half};
        CHECK_FALSE(full == half);

        std::unordered_set<TileKey> keys{full, half, full};
        CHECK(keys.size() == 2);
    }
}
