#include <doctest/doctest.h>

#include <gridspace/tile/TileConfig.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace GS;
using namespace GS::Tiles;
using GS::Geometry::ZoomBucket;

namespace {

struct EnvGuard {
    explicit EnvGuard(char const* name) : name_(name) {}
    ~EnvGuard() { ::unsetenv(name_); }
    auto set(char const* value) -> void { ::setenv(name_, value, 1); }

    char const* name_;
};

} // namespace

TEST_SUITE("tile.config") {
    TEST_CASE("defaults") {
        TileConfig config{};
        CHECK(config.tile_size == 256);
        CHECK(config.max_cached_tiles == 100);
        CHECK(config.prefetch_rings == 1);
        CHECK(config.tile_width() == doctest::Approx(256.0));
        CHECK(config.tile_height() == doctest::Approx(256.0));
        CHECK_FALSE(ValidateTileConfig(config).has_value());
    }

    TEST_CASE("derived_sizes") {
        TileConfig config{};
        CHECK(config.tile_size_for_zoom(0.5) == doctest::Approx(128.0));
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::Tenth) == 2560);
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::Quarter) == 1024);
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::Forty) == 512);
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::Half) == 512);
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::Full) == 256);
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::TwoX) == 128);
        CHECK(config.zoom_bucket_tile_size(ZoomBucket::Quadruple) == 64);
        CHECK(config.tile_count_for_dimension(256.0) == 1);
        CHECK(config.tile_count_for_dimension(257.0) == 2);
        CHECK(config.tile_count_for_dimension(1920.0) == 8);
    }

    TEST_CASE("validation") {
        CHECK(ValidateTileConfig(TileConfig{.tile_size = 0}).has_value());
        CHECK(ValidateTileConfig(TileConfig{.max_cached_tiles = 0}).has_value());
        CHECK(ValidateTileConfig(TileConfig{.prefetch_rings = -1}).has_value());
        CHECK_FALSE(ValidateTileConfig(TileConfig{.prefetch_rings = 0}).has_value());
    }

    TEST_CASE("json_loading") {
        SUBCASE("partial_object_keeps_defaults") {
            auto config = LoadTileConfigFromJson(R"({"tile_size": 512})");
            REQUIRE(config.has_value());
            CHECK(config->tile_size == 512);
            CHECK(config->max_cached_tiles == 100);
            CHECK(config->prefetch_rings == 1);
        }
        SUBCASE("round_trip_through_text") {
            TileConfig original{.tile_size = 128, .max_cached_tiles = 40, .prefetch_rings = 2};
            auto loaded = LoadTileConfigFromJson(TileConfigToJson(original));
            REQUIRE(loaded.has_value());
            CHECK(*loaded == original);
        }
        SUBCASE("rejects_bad_input") {
            for (auto text : {"not json", "[1, 2]", R"({"tile_size": "big"})", R"({"tile_size": 1.5})",
                              R"({"max_cached_tiles": 0})", R"({"prefetch_rings": -2})",
                              R"({"tile_size": 99999999999})"}) {
                auto config = LoadTileConfigFromJson(text);
                REQUIRE_FALSE(config.has_value());
                CHECK(config.error().code == Error::Code::MalformedInput);
            }
        }
    }

    TEST_CASE("file_loading") {
        auto const dir = std::filesystem::temp_directory_path();
        auto const path = dir / "gridspace_tile_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"tile_size": 64, "max_cached_tiles": 12})";
        }
        auto config = LoadTileConfigFile(path);
        REQUIRE(config.has_value());
        CHECK(config->tile_size == 64);
        CHECK(config->max_cached_tiles == 12);
        std::filesystem::remove(path);

        auto missing = LoadTileConfigFile(dir / "gridspace_tile_config_missing.json");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }

    TEST_CASE("environment_overrides") {
        EnvGuard tile_size{"GRIDSPACE_TILE_SIZE"};
        EnvGuard max_tiles{"GRIDSPACE_MAX_CACHED_TILES"};
        EnvGuard rings{"GRIDSPACE_PREFETCH_RINGS"};

        SUBCASE("unset_leaves_config") {
            TileConfig config{};
            CHECK(ApplyTileConfigEnvOverrides(config));
            CHECK(config == TileConfig{});
        }
        SUBCASE("values_applied") {
            tile_size.set("128");
            max_tiles.set("64");
            rings.set("0");
            TileConfig config{};
            CHECK(ApplyTileConfigEnvOverrides(config));
            CHECK(config.tile_size == 128);
            CHECK(config.max_cached_tiles == 64);
            CHECK(config.prefetch_rings == 0);
        }
        SUBCASE("unparsable_value_reported") {
            tile_size.set("huge");
            max_tiles.set("32");
            TileConfig config{};
            CHECK_FALSE(ApplyTileConfigEnvOverrides(config));
            CHECK(config.tile_size == 256);
            CHECK(config.max_cached_tiles == 32);
        }
    }
}
