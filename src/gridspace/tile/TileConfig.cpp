#include <gridspace/tile/TileConfig.hpp>

#include <gridspace/log/TaggedLogger.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

namespace GS::Tiles {

namespace {

using json = nlohmann::json;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        if (!setter(std::string_view{raw})) {
            gs_log(std::string("ignoring unparsable ") + key + "=" + raw, "TileConfig", "WARN");
            return false;
        }
    }
    return true;
}

auto make_config_error(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto read_int_field(json const& doc, char const* key, int& out) -> std::optional<Error> {
    if (!doc.contains(key) || doc[key].is_null()) {
        return std::nullopt;
    }
    auto const& value = doc[key];
    if (!value.is_number_integer()) {
        return make_config_error(std::string{"tile config field '"} + key + "' must be an integer");
    }
    auto const raw = value.get<std::int64_t>();
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        return make_config_error(std::string{"tile config field '"} + key + "' is out of range");
    }
    out = static_cast<int>(raw);
    return std::nullopt;
}

} // namespace

auto TileConfig::zoom_bucket_tile_size(Geometry::ZoomBucket bucket) const -> int {
    using Geometry::ZoomBucket;
    switch (bucket) {
    case ZoomBucket::Tenth:
        return tile_size * 10;
    case ZoomBucket::Quarter:
        return tile_size * 4;
    case ZoomBucket::Forty:
    case ZoomBucket::Half:
        return tile_size * 2;
    case ZoomBucket::Full:
        return tile_size;
    case ZoomBucket::TwoX:
        return tile_size / 2;
    case ZoomBucket::Quadruple:
        return tile_size / 4;
    }
    return tile_size;
}

auto TileConfig::tile_count_for_dimension(double dimension) const -> int {
    return static_cast<int>(std::ceil(dimension / static_cast<double>(tile_size)));
}

auto ValidateTileConfig(TileConfig const& config) -> std::optional<std::string> {
    if (config.tile_size <= 0) {
        return std::string{"tile_size must be > 0"};
    }
    if (config.max_cached_tiles <= 0) {
        return std::string{"max_cached_tiles must be > 0"};
    }
    if (config.prefetch_rings < 0) {
        return std::string{"prefetch_rings must be >= 0"};
    }
    return std::nullopt;
}

bool ApplyTileConfigEnvOverrides(TileConfig& config) {
    bool ok = true;
    ok &= apply_env("GRIDSPACE_TILE_SIZE", [&](std::string_view value) {
        return parse_integer(value, config.tile_size);
    });
    ok &= apply_env("GRIDSPACE_MAX_CACHED_TILES", [&](std::string_view value) {
        return parse_integer(value, config.max_cached_tiles);
    });
    ok &= apply_env("GRIDSPACE_PREFETCH_RINGS", [&](std::string_view value) {
        return parse_integer(value, config.prefetch_rings);
    });
    return ok;
}

auto LoadTileConfigFromJson(std::string_view json_text) -> Expected<TileConfig> {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(make_config_error("tile config is not valid JSON"));
    }
    if (!doc.is_object()) {
        return std::unexpected(make_config_error("tile config must be a JSON object"));
    }

    TileConfig config{};
    if (auto error = read_int_field(doc, "tile_size", config.tile_size)) {
        return std::unexpected(std::move(*error));
    }
    if (auto error = read_int_field(doc, "max_cached_tiles", config.max_cached_tiles)) {
        return std::unexpected(std::move(*error));
    }
    if (auto error = read_int_field(doc, "prefetch_rings", config.prefetch_rings)) {
        return std::unexpected(std::move(*error));
    }

    if (auto violation = ValidateTileConfig(config)) {
        return std::unexpected(make_config_error(std::move(*violation)));
    }
    return config;
}

auto LoadTileConfigFile(std::filesystem::path const& path) -> Expected<TileConfig> {
    std::ifstream stream(path);
    if (!stream) {
        gs_log("tile config not found: " + path.string(), "TileConfig", "ERROR");
        return std::unexpected(Error{Error::Code::NotFound, "failed to open tile config " + path.string()});
    }
    std::string buffer((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    auto config = LoadTileConfigFromJson(buffer);
    if (!config) {
        gs_log("tile config rejected: " + describeError(config.error()), "TileConfig", "ERROR");
    }
    return config;
}

auto TileConfigToJson(TileConfig const& config) -> std::string {
    json payload{{"tile_size", config.tile_size},
                 {"max_cached_tiles", config.max_cached_tiles},
                 {"prefetch_rings", config.prefetch_rings}};
    return payload.dump();
}

} // namespace GS::Tiles
