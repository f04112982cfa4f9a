#include <doctest/doctest.h>

#include "TileTestHelpers.hpp"

#include <gridspace/tile/TileCache.hpp>

#include <stdexcept>

using namespace GS::Tiles;
using namespace GS::Tiles::Test;

namespace {

auto key_at(std::int32_t row, std::int32_t column, ZoomBucket bucket = ZoomBucket::Full) -> TileKey {
    return TileKey{TileCoordinate{row, column}, bucket};
}

} // namespace

TEST_SUITE("tile.cache") {
    TEST_CASE("zero_capacity_throws") {
        CHECK_THROWS_AS(TileCache(0), std::invalid_argument);
    }

    TEST_CASE("put_then_get") {
        DisposalLog log;
        TileCache cache(4);
        auto* stored = cache.put(key_at(0, 0), make_tile(log, 1, TileCoordinate{0, 0}));
        REQUIRE(stored != nullptr);
        CHECK(cache.size() == 1);
        CHECK_FALSE(cache.empty());
        CHECK(cache.get(key_at(0, 0)) == stored);
        CHECK(cache.get(key_at(0, 1)) == nullptr);
        CHECK(cache.get(key_at(0, 0, ZoomBucket::Half)) == nullptr);

        auto const m = cache.metrics();
        CHECK(m.hits == 1);
        CHECK(m.misses == 2);
        CHECK(m.capacity == 4);
    }

    TEST_CASE("size_never_exceeds_capacity") {
        DisposalLog log;
        TileCache cache(5);
        for (std::int32_t i = 0; i < 40; ++i) {
            cache.put(key_at(i / 7, i % 7), make_tile(log, static_cast<std::uint64_t>(i), TileCoordinate{i / 7, i % 7}));
            CHECK(cache.size() <= cache.max_tiles());
        }
        CHECK(cache.size() == 5);
        CHECK(cache.metrics().evictions == 35);
        CHECK(cache.pending_disposal_count() == 35);
    }

    TEST_CASE("least_recently_used_is_evicted") {
        DisposalLog log;
        TileCache cache(2);
        auto const a = key_at(0, 0);
        auto const b = key_at(0, 1);
        auto const c = key_at(0, 2);

        cache.put(a, make_tile(log, 1, a.coordinate));
        cache.put(b, make_tile(log, 2, b.coordinate));
        REQUIRE(cache.get(a) != nullptr);
        cache.put(c, make_tile(log, 3, c.coordinate));

        CHECK(cache.contains(a));
        CHECK_FALSE(cache.contains(b));
        CHECK(cache.contains(c));
    }

    TEST_CASE("contains_does_not_touch_recency") {
        DisposalLog log;
        TileCache cache(2);
        auto const a = key_at(0, 0);
        auto const b = key_at(0, 1);
        cache.put(a, make_tile(log, 1, a.coordinate));
        cache.put(b, make_tile(log, 2, b.coordinate));
        CHECK(cache.contains(a));
        cache.put(key_at(0, 2), make_tile(log, 3, TileCoordinate{0, 2}));
        CHECK_FALSE(cache.contains(a));
        CHECK(cache.contains(b));
    }

    TEST_CASE("eviction_defers_disposal") {
        DisposalLog log;
        TileCache cache(1);
        auto const a = key_at(0, 0);
        auto const b = key_at(1, 0);

        auto* first = cache.put(a, make_tile(log, 1, a.coordinate));
        cache.put(b, make_tile(log, 2, b.coordinate));

        CHECK_FALSE(cache.contains(a));
        CHECK(cache.get(a) == nullptr);
        // Still usable by an in-flight paint.
        CHECK_FALSE(first->is_disposed());
        CHECK(log.released.empty());
        CHECK(cache.pending_disposal_count() == 1);

        CHECK(cache.cleanup() == 1);
        CHECK(log.was_released(1));
        CHECK_FALSE(log.was_released(2));
        CHECK(cache.pending_disposal_count() == 0);
        CHECK(cache.cleanup() == 0);
    }

    TEST_CASE("replacement_defers_disposal") {
        DisposalLog log;
        TileCache cache(4);
        auto const a = key_at(0, 0);
        cache.put(a, make_tile(log, 1, a.coordinate));
        auto* replacement = cache.put(a, make_tile(log, 2, a.coordinate));

        CHECK(cache.size() == 1);
        CHECK(cache.get(a) == replacement);
        CHECK(cache.pending_disposal_count() == 1);
        CHECK(cache.metrics().replacements == 1);
        CHECK(log.released.empty());

        cache.cleanup();
        CHECK(log.released == std::vector<std::uint64_t>{1});
    }

    TEST_CASE("remove_hands_over_ownership") {
        DisposalLog log;
        TileCache cache(4);
        auto const a = key_at(0, 0);
        cache.put(a, make_tile(log, 1, a.coordinate));

        auto removed = cache.remove(a);
        REQUIRE(removed != nullptr);
        CHECK_FALSE(removed->is_disposed());
        CHECK_FALSE(cache.contains(a));
        CHECK(cache.remove(a) == nullptr);
        CHECK(cache.cleanup() == 0);
        CHECK(log.released.empty());
    }

    TEST_CASE("invalidation_keeps_entries") {
        DisposalLog log;
        TileCache cache(8);
        auto const top = key_at(0, 0);
        auto const bottom = key_at(1, 0);
        auto const half = key_at(0, 0, ZoomBucket::Half);
        cache.put(top, make_tile(log, 1, top.coordinate, ZoomBucket::Full, CellRange{0, 0, 9, 2}));
        cache.put(bottom, make_tile(log, 2, bottom.coordinate, ZoomBucket::Full, CellRange{10, 0, 19, 2}));
        cache.put(half, make_tile(log, 3, half.coordinate, ZoomBucket::Half, CellRange{0, 0, 19, 5}));

        SUBCASE("by_range") {
            CHECK(cache.invalidate_range(CellRange{12, 1, 12, 1}) == 2);
            CHECK(cache.get(top)->is_valid());
            CHECK_FALSE(cache.get(bottom)->is_valid());
            CHECK_FALSE(cache.get(half)->is_valid());
            CHECK(cache.size() == 3);
        }
        SUBCASE("by_zoom_bucket") {
            CHECK(cache.invalidate_zoom_bucket(ZoomBucket::Half) == 1);
            CHECK(cache.get(top)->is_valid());
            CHECK(cache.get(bottom)->is_valid());
            CHECK_FALSE(cache.get(half)->is_valid());
            auto const valid_full = cache.valid_tiles_for_zoom(ZoomBucket::Full);
            CHECK(valid_full.size() == 2);
            CHECK(cache.valid_tiles_for_zoom(ZoomBucket::Half).empty());
        }
        SUBCASE("everything") {
            cache.invalidate_all();
            CHECK_FALSE(cache.get(top)->is_valid());
            CHECK_FALSE(cache.get(bottom)->is_valid());
            CHECK_FALSE(cache.get(half)->is_valid());
            CHECK(cache.size() == 3);
        }
        CHECK(log.released.empty());
    }

    TEST_CASE("clear_disposes_live_tiles") {
        DisposalLog log;
        TileCache cache(2);
        cache.put(key_at(0, 0), make_tile(log, 1, TileCoordinate{0, 0}));
        cache.put(key_at(0, 1), make_tile(log, 2, TileCoordinate{0, 1}));
        cache.put(key_at(0, 2), make_tile(log, 3, TileCoordinate{0, 2}));

        cache.clear();
        CHECK(cache.empty());
        CHECK(log.was_released(2));
        CHECK(log.was_released(3));
        // The evicted tile waits for cleanup.
        CHECK_FALSE(log.was_released(1));
        CHECK(cache.cleanup() == 1);
        CHECK(log.released.size() == 3);
    }

    TEST_CASE("destructor_releases_everything") {
        DisposalLog log;
        {
            TileCache cache(1);
            cache.put(key_at(0, 0), make_tile(log, 1, TileCoordinate{0, 0}));
            cache.put(key_at(0, 1), make_tile(log, 2, TileCoordinate{0, 1}));
        }
        CHECK(log.released.size() == 2);
    }
}
