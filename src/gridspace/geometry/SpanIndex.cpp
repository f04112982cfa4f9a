#include <gridspace/geometry/SpanIndex.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace GS::Geometry {

namespace {

auto validate_count(std::int32_t count) -> std::int32_t {
    if (count <= 0) {
        throw std::invalid_argument("span count must be positive");
    }
    return count;
}

auto validate_size(double size, char const* what) -> double {
    if (!(size > 0.0)) {
        throw std::invalid_argument(std::string(what) + " must be positive");
    }
    return size;
}

} // namespace

SpanIndex::SpanIndex(std::int32_t count, double default_size, std::span<SpanOverride const> overrides)
    : count_(validate_count(count))
    , default_size_(validate_size(default_size, "default span size"))
    , sizes_(static_cast<std::size_t>(count_), default_size_) {
    for (auto const& entry : overrides) {
        ensure_index(entry.index);
        sizes_[static_cast<std::size_t>(entry.index)] = validate_size(entry.size, "span size");
    }
    rebuild_cumulative();
}

auto SpanIndex::rebuild_cumulative() -> void {
    cumulative_.assign(static_cast<std::size_t>(count_) + 1u, 0.0);
    double sum = 0.0;
    for (std::size_t i = 0; i < sizes_.size(); ++i) {
        cumulative_[i] = sum;
        sum += sizes_[i];
    }
    cumulative_.back() = sum;
}

auto SpanIndex::ensure_index(std::int32_t index) const -> void {
    if (index < 0 || index >= count_) {
        throw std::out_of_range("span index " + std::to_string(index) + " out of range [0, "
                                + std::to_string(count_) + ")");
    }
}

auto SpanIndex::size_at(std::int32_t index) const -> double {
    ensure_index(index);
    return sizes_[static_cast<std::size_t>(index)];
}

auto SpanIndex::position_at(std::int32_t index) const -> double {
    if (index < 0 || index > count_) {
        throw std::out_of_range("span position index " + std::to_string(index) + " out of range [0, "
                                + std::to_string(count_) + "]");
    }
    return cumulative_[static_cast<std::size_t>(index)];
}

auto SpanIndex::index_at_position(double position) const -> std::int32_t {
    if (position < 0.0 || position >= total_size()) {
        return kNotFound;
    }

    // Largest i in [0, count) with cumulative[i] <= position.
    auto const first = cumulative_.begin();
    auto const last = first + count_;
    auto const it = std::upper_bound(first, last, position);
    return static_cast<std::int32_t>(std::distance(first, it)) - 1;
}

auto SpanIndex::set_size(std::int32_t index, double size) -> void {
    ensure_index(index);
    sizes_[static_cast<std::size_t>(index)] = validate_size(size, "span size");
    rebuild_cumulative();
}

auto SpanIndex::clamped_index(double position) const -> std::int32_t {
    if (position < 0.0) {
        return 0;
    }
    if (position >= total_size()) {
        return count_ - 1;
    }
    return index_at_position(position);
}

auto SpanIndex::get_range(double start_position, double end_position) const -> SpanRange {
    auto const start = clamped_index(start_position);
    auto const end = clamped_index(end_position - kBoundaryEpsilon);
    return SpanRange{start, std::max(start, end)};
}

} // namespace GS::Geometry
