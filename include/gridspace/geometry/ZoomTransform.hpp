#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace GS::Geometry {

// Level-of-detail class of a zoom scale. Ordered from most zoomed out to
// most zoomed in; tiles are cached per bucket.
enum class ZoomBucket : std::uint8_t {
    Tenth = 0,     // [min, 0.25)
    Quarter = 1,   // [0.25, 0.40)
    Forty = 2,     // [0.40, 0.50)
    Half = 3,      // [0.50, 1.00)
    Full = 4,      // [1.00, 2.00)
    TwoX = 5,      // [2.00, 3.00)
    Quadruple = 6, // [3.00, max]
};

inline constexpr std::size_t ZoomBucketCount = static_cast<std::size_t>(ZoomBucket::Quadruple) + 1u;

[[nodiscard]] constexpr auto zoom_bucket_for_scale(double scale) -> ZoomBucket {
    if (scale < 0.25) return ZoomBucket::Tenth;
    if (scale < 0.40) return ZoomBucket::Quarter;
    if (scale < 0.50) return ZoomBucket::Forty;
    if (scale < 1.00) return ZoomBucket::Half;
    if (scale < 2.00) return ZoomBucket::Full;
    if (scale < 3.00) return ZoomBucket::TwoX;
    return ZoomBucket::Quadruple;
}

[[nodiscard]] constexpr auto zoom_bucket_name(ZoomBucket bucket) -> std::string_view {
    switch (bucket) {
    case ZoomBucket::Tenth:
        return "Tenth";
    case ZoomBucket::Quarter:
        return "Quarter";
    case ZoomBucket::Forty:
        return "Forty";
    case ZoomBucket::Half:
        return "Half";
    case ZoomBucket::Full:
        return "Full";
    case ZoomBucket::TwoX:
        return "TwoX";
    case ZoomBucket::Quadruple:
        return "Quadruple";
    }
    return "UnknownZoomBucket";
}

// Rendering policy per bucket. Text is dropped when fully zoomed out and
// gridlines below 40%.
[[nodiscard]] constexpr auto renders_text(ZoomBucket bucket) -> bool {
    return bucket != ZoomBucket::Tenth;
}

[[nodiscard]] constexpr auto renders_gridlines(ZoomBucket bucket) -> bool {
    return bucket != ZoomBucket::Tenth && bucket != ZoomBucket::Quarter;
}

// Content-space stroke width that lands near one screen pixel after scaling.
[[nodiscard]] constexpr auto gridline_stroke_width(ZoomBucket bucket) -> double {
    switch (bucket) {
    case ZoomBucket::Tenth:
    case ZoomBucket::Quarter:
        return 5.0;
    case ZoomBucket::Forty:
        return 2.0;
    case ZoomBucket::Half:
        return 1.5;
    case ZoomBucket::Full:
        return 1.0;
    case ZoomBucket::TwoX:
        return 0.5;
    case ZoomBucket::Quadruple:
        return 0.25;
    }
    return 1.0;
}

// Screen <-> content conversion for a clamped zoom scale. At scale 2.0 a
// content point (100, 50) appears at screen (200, 100).
class ZoomTransform {
public:
    static constexpr double kDefaultMinScale = 0.1;
    static constexpr double kDefaultMaxScale = 4.0;

    // Throws std::invalid_argument when min_scale <= 0 or max_scale < min_scale.
    explicit ZoomTransform(double scale = 1.0,
                           double min_scale = kDefaultMinScale,
                           double max_scale = kDefaultMaxScale);

    [[nodiscard]] auto scale() const -> double { return scale_; }
    [[nodiscard]] auto min_scale() const -> double { return min_scale_; }
    [[nodiscard]] auto max_scale() const -> double { return max_scale_; }

    auto set_scale(double value) -> void;

    [[nodiscard]] auto percentage() const -> int;
    auto set_percentage(int percent) -> void;

    [[nodiscard]] auto can_zoom_in() const -> bool { return scale_ < max_scale_; }
    [[nodiscard]] auto can_zoom_out() const -> bool { return scale_ > min_scale_; }

    [[nodiscard]] auto screen_to_content(double value) const -> double { return value / scale_; }
    [[nodiscard]] auto content_to_screen(double value) const -> double { return value * scale_; }
    [[nodiscard]] auto screen_to_content(Point p) const -> Point;
    [[nodiscard]] auto content_to_screen(Point p) const -> Point;
    [[nodiscard]] auto screen_to_content(Size s) const -> Size;
    [[nodiscard]] auto content_to_screen(Size s) const -> Size;
    [[nodiscard]] auto screen_to_content(Rect const& r) const -> Rect;
    [[nodiscard]] auto content_to_screen(Rect const& r) const -> Rect;

    // Derived from the current scale on every call.
    [[nodiscard]] auto zoom_bucket() const -> ZoomBucket { return zoom_bucket_for_scale(scale_); }

private:
    double min_scale_;
    double max_scale_;
    double scale_;
};

} // namespace GS::Geometry
