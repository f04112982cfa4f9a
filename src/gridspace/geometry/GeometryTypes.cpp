#include <gridspace/geometry/GeometryTypes.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace GS::Geometry {

namespace {

auto make_notation_error(std::string_view notation, std::string_view reason) -> Error {
    std::string message{"cell notation '"};
    message.append(notation.data(), notation.size());
    message.append("': ");
    message.append(reason.data(), reason.size());
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

auto CellCoordinate::to_notation() const -> std::string {
    std::string letters;
    auto col = static_cast<std::int64_t>(column) + 1;
    while (col > 0) {
        --col;
        letters.push_back(static_cast<char>('A' + (col % 26)));
        col /= 26;
    }
    std::reverse(letters.begin(), letters.end());
    return letters + std::to_string(static_cast<std::int64_t>(row) + 1);
}

auto CellCoordinate::from_notation(std::string_view notation) -> Expected<CellCoordinate> {
    if (notation.empty()) {
        return std::unexpected(make_notation_error(notation, "empty"));
    }

    std::size_t split = 0;
    while (split < notation.size() && std::isalpha(static_cast<unsigned char>(notation[split]))) {
        ++split;
    }
    if (split == 0 || split == notation.size()) {
        return std::unexpected(make_notation_error(notation, "expected column letters followed by a row number"));
    }

    std::int64_t column_index = 0;
    for (std::size_t i = 0; i < split; ++i) {
        auto const upper = std::toupper(static_cast<unsigned char>(notation[i]));
        column_index = column_index * 26 + (upper - 'A' + 1);
        if (column_index > std::numeric_limits<std::int32_t>::max()) {
            return std::unexpected(make_notation_error(notation, "column out of range"));
        }
    }

    auto const digits = notation.substr(split);
    if (!std::all_of(digits.begin(), digits.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
        return std::unexpected(make_notation_error(notation, "row must be numeric"));
    }

    std::int32_t row_number = 0;
    auto const parsed = std::from_chars(digits.data(), digits.data() + digits.size(), row_number);
    if (parsed.ec != std::errc{}) {
        return std::unexpected(make_notation_error(notation, "row out of range"));
    }
    if (row_number < 1) {
        return std::unexpected(make_notation_error(notation, "row number must be at least 1"));
    }

    return CellCoordinate{row_number - 1, static_cast<std::int32_t>(column_index - 1)};
}

auto CellRange::intersection(CellRange const& other) const -> std::optional<CellRange> {
    if (!intersects(other)) {
        return std::nullopt;
    }
    return CellRange{std::max(start_row, other.start_row),
                     std::max(start_column, other.start_column),
                     std::min(end_row, other.end_row),
                     std::min(end_column, other.end_column)};
}

auto CellRange::union_with(CellRange const& other) const -> CellRange {
    return CellRange{std::min(start_row, other.start_row),
                     std::min(start_column, other.start_column),
                     std::max(end_row, other.end_row),
                     std::max(end_column, other.end_column)};
}

auto CellRange::expand(CellCoordinate coord) const -> CellRange {
    if (contains(coord)) {
        return *this;
    }
    return union_with(CellRange::single(coord));
}

auto CellRange::to_string() const -> std::string {
    return "CellRange(" + top_left().to_notation() + ":" + bottom_right().to_notation() + ")";
}

} // namespace GS::Geometry
