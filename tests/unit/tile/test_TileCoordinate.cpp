#include <doctest/doctest.h>

#include <gridspace/tile/TileCoordinate.hpp>

#include <unordered_set>
#include <vector>

using namespace GS::Tiles;

TEST_SUITE("tile.coordinate") {
    TEST_CASE("from_pixel") {
        CHECK(TileCoordinate::from_pixel(0.0, 0.0, 256.0, 256.0) == TileCoordinate{0, 0});
        CHECK(TileCoordinate::from_pixel(255.9, 256.0, 256.0, 256.0) == TileCoordinate{1, 0});
        CHECK(TileCoordinate::from_pixel(600.0, 100.0, 256.0, 128.0) == TileCoordinate{0, 2});
        CHECK(TileCoordinate::from_pixel(-10.0, -300.0, 256.0, 256.0) == TileCoordinate{0, 0});
    }

    TEST_CASE("pixel_bounds_inverts_from_pixel") {
        TileCoordinate coord{3, 2};
        auto const bounds = coord.pixel_bounds(256.0, 128.0);
        CHECK(bounds == Rect{512.0, 384.0, 768.0, 512.0});
        CHECK(TileCoordinate::from_pixel(bounds.left, bounds.top, 256.0, 128.0) == coord);
    }

    TEST_CASE("offset_clamps") {
        CHECK(TileCoordinate{1, 1}.offset(2, 3) == TileCoordinate{3, 4});
        CHECK(TileCoordinate{1, 1}.offset(-2, -1) == TileCoordinate{0, 0});
    }

    TEST_CASE("small_viewport_is_single_tile") {
        auto const tiles = tiles_covering(Rect{10.0, 10.0, 100.0, 25.0}, 256.0, 256.0);
        REQUIRE(tiles.size() == 1);
        CHECK(tiles.front() == TileCoordinate{0, 0});
    }

    TEST_CASE("edge_on_tile_boundary_adds_no_tile") {
        auto const tiles = tiles_covering(Rect{0.0, 0.0, 256.0, 512.0}, 256.0, 256.0);
        REQUIRE(tiles.size() == 2);
        CHECK(tiles[0] == TileCoordinate{0, 0});
        CHECK(tiles[1] == TileCoordinate{1, 0});
    }

    TEST_CASE("enumeration_is_row_major") {
        auto const tiles = tiles_in_range(300.0, 100.0, 800.0, 600.0, 256.0, 256.0);
        std::vector<TileCoordinate> expected{
            {0, 1}, {0, 2}, {0, 3},
            {1, 1}, {1, 2}, {1, 3},
            {2, 1}, {2, 2}, {2, 3},
        };
        CHECK(tiles == expected);
    }

    TEST_CASE("hash_distinguishes_row_and_column") {
        std::unordered_set<TileCoordinate> seen;
        for (std::int32_t row = 0; row < 8; ++row) {
            for (std::int32_t column = 0; column < 8; ++column) {
                seen.insert(TileCoordinate{row, column});
            }
        }
        CHECK(seen.size() == 64);
        CHECK(seen.contains(TileCoordinate{3, 5}));
        CHECK_FALSE(seen.contains(TileCoordinate{8, 0}));
    }
}
