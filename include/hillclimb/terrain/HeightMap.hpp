#pragma once
#include "Elevation.hpp"

#include <expected>
#include <string_view>
#include <vector>

namespace hillclimb::terrain {

class HeightMap;

// One row per line; lines are trimmed and blank lines skipped.
// Stops at the first unknown symbol or repeated 'S'/'E'; exactly one of each is required.
[[nodiscard]] std::expected<HeightMap, Error> ParseHeightMap(std::string_view text,
                                                             const ElevationTable& table = ElevationTable::Default());

// Rectangular, fully populated elevation grid with its Start and End markers.
// Immutable once returned by ParseHeightMap.
class HeightMap {
public:
    HeightMap() = default;

    [[nodiscard]] std::int32_t rows() const noexcept { return _rows; }
    [[nodiscard]] std::int32_t cols() const noexcept { return _cols; }
    [[nodiscard]] std::size_t  size() const noexcept { return _cells.size(); }
    [[nodiscard]] bool         empty() const noexcept { return _cells.empty(); }

    [[nodiscard]] bool contains(Coord c) const noexcept {
        return c.row >= 0 && c.col >= 0 && c.row < _rows && c.col < _cols;
    }

    [[nodiscard]] const CellRole& role(Coord c) const { return _cells[ToId(c, _cols)]; }
    [[nodiscard]] Elevation elevation(Coord c) const { return ElevationOf(role(c)); }

    [[nodiscard]] Coord start() const noexcept { return _start; }
    [[nodiscard]] Coord end()   const noexcept { return _end; }

    [[nodiscard]] const std::vector<CellRole>& cells() const noexcept { return _cells; }

    bool operator==(const HeightMap&) const = default;

private:
    friend std::expected<HeightMap, Error> ParseHeightMap(std::string_view, const ElevationTable&);

    std::int32_t          _rows = 0;
    std::int32_t          _cols = 0;
    std::vector<CellRole> _cells;   // row-major
    Coord                 _start{};
    Coord                 _end{};
};

} // namespace hillclimb::terrain
