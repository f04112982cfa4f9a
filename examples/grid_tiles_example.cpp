#include <gridspace/geometry/GridLayout.hpp>
#include <gridspace/geometry/SpanIndex.hpp>
#include <gridspace/geometry/VisibleRangeCalculator.hpp>
#include <gridspace/geometry/ZoomTransform.hpp>
#include <gridspace/log/TaggedLogger.hpp>
#include <gridspace/tile/TileManager.hpp>

#include <parallel_hashmap/phmap.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace GS;
using namespace GS::Geometry;
using namespace GS::Tiles;

namespace {

struct Options {
    int rows = 10'000;
    int columns = 52;
    int frames = 12;
    int zoom_percent = 100;
    double scroll_step = 180.0;
    std::optional<std::filesystem::path> config_path{};
};

// Stands in for a real painter: records a one-line description of what
// each tile would draw and forgets it when the tile is released.
class DescribingRenderer final : public TileRenderer {
public:
    auto render_tile(TileCoordinate const& coordinate,
                     Rect const& pixel_bounds,
                     CellRange const& cell_range,
                     ZoomBucket zoom_bucket) -> TilePicture override {
        std::ostringstream oss;
        oss << "tile(" << coordinate.row << "," << coordinate.column << ") " << cell_range.to_string()
            << " px=" << pixel_bounds.width() << "x" << pixel_bounds.height() << " lod=" << zoom_bucket_name(zoom_bucket)
            << (renders_text(zoom_bucket) ? " text" : "") << (renders_gridlines(zoom_bucket) ? " grid" : "")
            << " stroke=" << gridline_stroke_width(zoom_bucket);

        auto const handle = ++next_handle_;
        pictures_.emplace(handle, oss.str());
        return TilePicture(handle, [this](std::uint64_t released) { pictures_.erase(released); });
    }

    [[nodiscard]] auto describe(std::uint64_t handle) const -> std::string {
        auto it = pictures_.find(handle);
        return it == pictures_.end() ? std::string{"<released>"} : it->second;
    }

    [[nodiscard]] auto live_pictures() const -> std::size_t { return pictures_.size(); }

private:
    phmap::flat_hash_map<std::uint64_t, std::string> pictures_;
    std::uint64_t                                    next_handle_ = 0;
};

auto parse_int(std::string_view text, char const* label) -> int {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value <= 0) {
        std::cerr << "invalid " << label << ": " << text << "\n";
        std::exit(1);
    }
    return value;
}

void print_usage(char const* program) {
    std::cout << "Usage: " << program
              << " [--rows=N] [--columns=N] [--frames=N] [--zoom=PERCENT] [--config=PATH]\n";
}

auto parse_options(int argc, char** argv) -> Options {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg.rfind("--rows=", 0) == 0) {
            opts.rows = parse_int(arg.substr(7), "rows");
        } else if (arg.rfind("--columns=", 0) == 0) {
            opts.columns = parse_int(arg.substr(10), "columns");
        } else if (arg.rfind("--frames=", 0) == 0) {
            opts.frames = parse_int(arg.substr(9), "frames");
        } else if (arg.rfind("--zoom=", 0) == 0) {
            opts.zoom_percent = parse_int(arg.substr(7), "zoom");
        } else if (arg.rfind("--config=", 0) == 0) {
            opts.config_path = std::filesystem::path{std::string(arg.substr(9))};
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return opts;
}

auto load_config(Options const& options) -> std::optional<TileConfig> {
    TileConfig config{};
    if (options.config_path) {
        auto loaded = LoadTileConfigFile(*options.config_path);
        if (!loaded) {
            std::cerr << "failed to load tile config: " << describeError(loaded.error()) << "\n";
            return std::nullopt;
        }
        config = *loaded;
    }
    if (!ApplyTileConfigEnvOverrides(config)) {
        std::cerr << "ignoring unparsable GRIDSPACE_* overrides\n";
    }
    if (auto violation = ValidateTileConfig(config)) {
        std::cerr << "invalid tile config: " << *violation << "\n";
        return std::nullopt;
    }
    return config;
}

} // namespace

int main(int argc, char** argv) try {
    auto options = parse_options(argc, argv);

#ifdef GS_LOG_DEBUG
    if (const char* env = std::getenv("GRIDSPACE_LOG"); env != nullptr && std::string_view{env} != "0") {
        GS::set_thread_name("Example");
        GS::set_logging_enabled(true);
    }
#endif

    auto config = load_config(options);
    if (!config) {
        return 1;
    }
    std::cout << "tile config " << TileConfigToJson(*config) << "\n";

    // A header row and a wide first column, like a typical sheet.
    std::vector<SpanOverride> row_overrides{{0, 40.0}};
    std::vector<SpanOverride> column_overrides{{0, 220.0}};
    GridLayout layout(SpanIndex(options.rows, 24.0, row_overrides),
                      SpanIndex(options.columns, 96.0, column_overrides));
    VisibleRangeCalculator visible{layout};
    ZoomTransform zoom{static_cast<double>(options.zoom_percent) / 100.0};

    DescribingRenderer renderer;
    TileManager manager(layout, *config, renderer);

    Size const screen{1280.0, 720.0};
    double scroll_y = 0.0;
    std::cout << std::fixed << std::setprecision(2);

    for (int frame = 0; frame < options.frames; ++frame) {
        // Screen viewport to content space at the current zoom.
        auto const viewport = zoom.screen_to_content(Rect::from_ltwh(0.0, scroll_y, screen.width, screen.height));
        auto const cells = visible.visible_range(viewport);
        auto const tiles = manager.tiles_for_viewport(viewport, zoom.zoom_bucket());

        // "Paint" in enumeration order; every tile stays alive until cleanup.
        std::cout << "frame " << frame << " zoom=" << zoom.percentage() << "% cells=" << cells.to_string() << "\n";
        for (auto const* tile : tiles) {
            std::cout << "  " << renderer.describe(tile->picture().handle()) << "\n";
        }
        auto const released = manager.cleanup();

        auto const& stats = manager.last_frame_stats();
        std::cout << "  requested=" << stats.tiles_requested << " hits=" << stats.cache_hits
                  << " rendered=" << stats.tiles_rendered << " rerendered=" << stats.invalid_rerenders
                  << " evicted=" << stats.evictions << " released=" << released << " ms=" << stats.elapsed_ms
                  << "\n";

        scroll_y += options.scroll_step;
        if (frame == options.frames / 2) {
            // Simulate an edit to a visible cell and a row resize.
            manager.invalidate_range(CellRange::single(cells.top_left()));
            auto const resized = cells.start_row + 1;
            if (resized < layout.row_count()) {
                layout.set_row_height(resized, 2.0 * layout.row_height(resized));
                // Everything from the resized row down moved.
                manager.invalidate_range(CellRange{resized, 0, layout.row_count() - 1, layout.column_count() - 1});
            }
        }
    }

    auto const metrics = manager.cache().metrics();
    std::cout << "cache hits=" << metrics.hits << " misses=" << metrics.misses << " evictions=" << metrics.evictions
              << " disposals=" << metrics.disposals << " size=" << metrics.size << "/" << metrics.capacity << "\n";

    manager.dispose();
    std::cout << "live pictures after dispose: " << renderer.live_pictures() << "\n";
    return 0;
} catch (std::exception const& ex) {
    std::cerr << "grid_tiles_example failed: " << ex.what() << "\n";
    return 1;
}
