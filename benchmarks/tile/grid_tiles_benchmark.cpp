#include <gridspace/geometry/GridLayout.hpp>
#include <gridspace/geometry/SpanIndex.hpp>
#include <gridspace/geometry/ZoomTransform.hpp>
#include <gridspace/tile/TileManager.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace GS;
using namespace GS::Geometry;
using namespace GS::Tiles;

namespace {

// Renders nothing; hands out handles so the cache has something to own.
class NullRenderer final : public TileRenderer {
public:
    auto render_tile(TileCoordinate const&, Rect const&, CellRange const&, ZoomBucket) -> TilePicture override {
        ++rendered_;
        return TilePicture(rendered_, [this](std::uint64_t) { ++released_; });
    }

    [[nodiscard]] auto rendered() const -> std::uint64_t { return rendered_; }
    [[nodiscard]] auto released() const -> std::uint64_t { return released_; }

private:
    std::uint64_t rendered_ = 0;
    std::uint64_t released_ = 0;
};

struct HitTestResult {
    std::size_t lookups = 0;
    double      total_ms = 0.0;
    std::uint64_t checksum = 0;

    [[nodiscard]] auto ns_per_lookup() const -> double {
        return lookups > 0 ? total_ms * 1'000'000.0 / static_cast<double>(lookups) : 0.0;
    }
};

struct ScrollResult {
    std::size_t frames = 0;
    double      avg_ms = 0.0;
    double      worst_ms = 0.0;
    double      avg_tiles = 0.0;
    double      hit_ratio = 0.0;
    std::uint64_t rendered = 0;
    std::uint64_t released = 0;
};

auto make_custom_axis(std::int32_t count, double default_size, std::uint32_t seed) -> SpanIndex {
    std::mt19937 rng{seed};
    std::uniform_int_distribution<std::int32_t> pick(0, count - 1);
    std::uniform_real_distribution<double> size(5.0, 120.0);
    std::vector<SpanOverride> overrides;
    overrides.reserve(static_cast<std::size_t>(count / 10));
    for (std::int32_t i = 0; i < count / 10; ++i) {
        overrides.push_back(SpanOverride{pick(rng), size(rng)});
    }
    return SpanIndex(count, default_size, overrides);
}

auto run_hit_test(SpanIndex const& axis, std::size_t lookups) -> HitTestResult {
    std::mt19937 rng{1234u};
    std::uniform_real_distribution<double> position(0.0, axis.total_size());
    std::vector<double> probes(lookups);
    for (auto& p : probes) {
        p = position(rng);
    }

    HitTestResult result{};
    result.lookups = lookups;
    auto const start = std::chrono::steady_clock::now();
    for (auto p : probes) {
        result.checksum += static_cast<std::uint64_t>(axis.index_at_position(p));
    }
    auto const end = std::chrono::steady_clock::now();
    result.total_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

auto run_scroll(GridLayout const& layout,
                TileConfig const& config,
                Size viewport_size,
                double scroll_step,
                std::size_t frames) -> ScrollResult {
    NullRenderer renderer;
    ScrollResult result{};
    {
        TileManager manager(layout, config, renderer);
        double total_ms = 0.0;
        std::size_t total_tiles = 0;
        std::size_t total_hits = 0;
        double y = 0.0;
        auto const max_y = std::max(0.0, layout.total_height() - viewport_size.height);

        for (std::size_t frame = 0; frame < frames; ++frame) {
            auto const viewport = Rect::from_ltwh(0.0, y, viewport_size.width, viewport_size.height);
            auto const tiles = manager.tiles_for_viewport(viewport, ZoomBucket::Full);
            manager.cleanup();

            auto const& stats = manager.last_frame_stats();
            total_ms += stats.elapsed_ms;
            result.worst_ms = std::max(result.worst_ms, stats.elapsed_ms);
            total_tiles += tiles.size();
            total_hits += stats.cache_hits;

            y += scroll_step;
            if (y > max_y) {
                y = 0.0;
            }
        }

        result.frames = frames;
        result.avg_ms = frames > 0 ? total_ms / static_cast<double>(frames) : 0.0;
        result.avg_tiles = frames > 0 ? static_cast<double>(total_tiles) / static_cast<double>(frames) : 0.0;
        result.hit_ratio = total_tiles > 0 ? static_cast<double>(total_hits) / static_cast<double>(total_tiles) : 0.0;
        manager.dispose();
    }
    result.rendered = renderer.rendered();
    result.released = renderer.released();
    return result;
}

auto parse_int(std::string_view value) -> std::optional<int> {
    int result = 0;
    auto const* begin = value.data();
    auto const* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

void print_usage(char const* program) {
    std::cout << "Usage: " << program << " [--rows=N] [--frames=N] [--write-json=PATH]" << std::endl;
    std::cout << "  --rows        Rows in the benchmark grid (default 1000000)" << std::endl;
    std::cout << "  --frames      Scroll frames to simulate (default 600)" << std::endl;
    std::cout << "  --write-json  Write the results as JSON" << std::endl;
}

} // namespace

int main(int argc, char** argv) try {
    int row_count = 1'000'000;
    int frame_count = 600;
    std::string json_report_path;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg.rfind("--rows=", 0) == 0) {
            auto rows = parse_int(arg.substr(std::string_view{"--rows="}.size()));
            if (!rows || *rows <= 0) {
                std::cerr << "invalid row count: " << arg << std::endl;
                return 1;
            }
            row_count = *rows;
            continue;
        }
        if (arg.rfind("--frames=", 0) == 0) {
            auto frames = parse_int(arg.substr(std::string_view{"--frames="}.size()));
            if (!frames || *frames <= 0) {
                std::cerr << "invalid frame count: " << arg << std::endl;
                return 1;
            }
            frame_count = *frames;
            continue;
        }
        if (arg.rfind("--write-json=", 0) == 0) {
            auto path = arg.substr(std::string_view{"--write-json="}.size());
            if (path.empty()) {
                std::cerr << "--write-json requires a non-empty path" << std::endl;
                return 1;
            }
            json_report_path = std::string(path);
            continue;
        }
        std::cerr << "unknown argument: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    TileConfig config{};
    if (!ApplyTileConfigEnvOverrides(config)) {
        std::cerr << "ignoring unparsable GRIDSPACE_* overrides" << std::endl;
    }
    if (auto violation = ValidateTileConfig(config)) {
        std::cerr << "invalid tile config: " << *violation << std::endl;
        return 1;
    }

    auto rows = make_custom_axis(row_count, 25.0, 42u);
    auto columns = make_custom_axis(200, 100.0, 7u);

    auto const hit = run_hit_test(rows, 2'000'000);

    GridLayout layout(std::move(rows), std::move(columns));
    auto const scroll = run_scroll(layout, config, Size{1920.0, 1080.0}, 37.0, static_cast<std::size_t>(frame_count));

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "index_at_position: lookups=" << hit.lookups << " total_ms=" << hit.total_ms
              << " ns_per_lookup=" << hit.ns_per_lookup() << " checksum=" << hit.checksum << std::endl;
    std::cout << "scroll: frames=" << scroll.frames << " avg_ms=" << scroll.avg_ms << " worst_ms=" << scroll.worst_ms
              << " avg_tiles=" << scroll.avg_tiles << " hit_ratio=" << scroll.hit_ratio
              << " rendered=" << scroll.rendered << " released=" << scroll.released << std::endl;

    if (scroll.rendered != scroll.released) {
        std::cerr << "leaked " << (scroll.rendered - scroll.released) << " tile pictures" << std::endl;
        return 1;
    }

    if (!json_report_path.empty()) {
        nlohmann::json report{
            {"rows", row_count},
            {"tile_config", nlohmann::json::parse(TileConfigToJson(config))},
            {"hit_test", {{"lookups", hit.lookups}, {"total_ms", hit.total_ms}, {"ns_per_lookup", hit.ns_per_lookup()}}},
            {"scroll",
             {{"frames", scroll.frames},
              {"avg_ms", scroll.avg_ms},
              {"worst_ms", scroll.worst_ms},
              {"avg_tiles", scroll.avg_tiles},
              {"hit_ratio", scroll.hit_ratio}}},
        };
        std::ofstream out(json_report_path);
        if (!out) {
            std::cerr << "failed to open " << json_report_path << std::endl;
            return 1;
        }
        out << report.dump(2) << std::endl;
    }
    return 0;
} catch (std::exception const& ex) {
    std::cerr << "grid_tiles_benchmark failed: " << ex.what() << std::endl;
    return 1;
}
