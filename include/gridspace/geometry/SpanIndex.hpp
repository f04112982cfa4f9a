#pragma once

#include <gridspace/geometry/GeometryTypes.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace GS::Geometry {

struct SpanOverride {
    std::int32_t index = 0;
    double       size = 0.0;
};

// Sizes of every row (or column) along one axis plus their prefix sums, so
// that index -> position is O(1) and position -> index is a binary search.
// The span count is fixed at construction; resizing a span rebuilds the
// prefix sums in O(count).
//
// Not synchronized: concurrent readers are fine as long as no set_size runs
// at the same time.
class SpanIndex {
public:
    static constexpr std::int32_t kNotFound = -1;

    // Throws std::invalid_argument for a non-positive count, default size or
    // override size, and std::out_of_range for an override index outside
    // [0, count).
    SpanIndex(std::int32_t count, double default_size, std::span<SpanOverride const> overrides = {});

    [[nodiscard]] auto count() const -> std::int32_t { return count_; }
    [[nodiscard]] auto default_size() const -> double { return default_size_; }
    [[nodiscard]] auto total_size() const -> double { return cumulative_.back(); }

    // Throws std::out_of_range outside [0, count).
    [[nodiscard]] auto size_at(std::int32_t index) const -> double;

    // Start offset of span `index`; index == count yields total_size().
    // Throws std::out_of_range outside [0, count].
    [[nodiscard]] auto position_at(std::int32_t index) const -> double;

    // Span containing `position`, or kNotFound when the position lies before
    // the first span or at/after total_size().
    [[nodiscard]] auto index_at_position(double position) const -> std::int32_t;

    // Throws std::out_of_range for a bad index and std::invalid_argument for
    // a non-positive size.
    auto set_size(std::int32_t index, double size) -> void;

    // Inclusive spans overlapping [start_position, end_position), clamped to
    // [0, count - 1].
    [[nodiscard]] auto get_range(double start_position, double end_position) const -> SpanRange;

private:
    auto rebuild_cumulative() -> void;
    auto ensure_index(std::int32_t index) const -> void;
    [[nodiscard]] auto clamped_index(double position) const -> std::int32_t;

    std::int32_t        count_ = 0;
    double              default_size_ = 0.0;
    std::vector<double> sizes_;
    std::vector<double> cumulative_;
};

} // namespace GS::Geometry
