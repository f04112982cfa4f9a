#include <gridspace/geometry/ZoomTransform.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace GS::Geometry {

namespace {

auto validate_min_scale(double min_scale) -> double {
    if (!(min_scale > 0.0)) {
        throw std::invalid_argument("minimum zoom scale must be positive");
    }
    return min_scale;
}

auto validate_max_scale(double max_scale, double min_scale) -> double {
    if (!(max_scale >= min_scale)) {
        throw std::invalid_argument("maximum zoom scale must not be below the minimum");
    }
    return max_scale;
}

} // namespace

ZoomTransform::ZoomTransform(double scale, double min_scale, double max_scale)
    : min_scale_(validate_min_scale(min_scale))
    , max_scale_(validate_max_scale(max_scale, min_scale_))
    , scale_(std::clamp(scale, min_scale_, max_scale_)) {}

auto ZoomTransform::set_scale(double value) -> void {
    scale_ = std::clamp(value, min_scale_, max_scale_);
}

auto ZoomTransform::percentage() const -> int {
    return static_cast<int>(std::lround(scale_ * 100.0));
}

auto ZoomTransform::set_percentage(int percent) -> void {
    set_scale(static_cast<double>(percent) / 100.0);
}

auto ZoomTransform::screen_to_content(Point p) const -> Point {
    return Point{p.x / scale_, p.y / scale_};
}

auto ZoomTransform::content_to_screen(Point p) const -> Point {
    return Point{p.x * scale_, p.y * scale_};
}

auto ZoomTransform::screen_to_content(Size s) const -> Size {
    return Size{s.width / scale_, s.height / scale_};
}

auto ZoomTransform::content_to_screen(Size s) const -> Size {
    return Size{s.width * scale_, s.height * scale_};
}

auto ZoomTransform::screen_to_content(Rect const& r) const -> Rect {
    return Rect::from_ltwh(r.left / scale_, r.top / scale_, r.width() / scale_, r.height() / scale_);
}

auto ZoomTransform::content_to_screen(Rect const& r) const -> Rect {
    return Rect::from_ltwh(r.left * scale_, r.top * scale_, r.width() * scale_, r.height() * scale_);
}

} // namespace GS::Geometry
