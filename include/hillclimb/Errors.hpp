#pragma once
// include/hillclimb/Errors.hpp
//
// Error values returned through std::expected by every stage of the pipeline.
// Parse errors and search errors share one type so a caller can hold either,
// but IsParseError/IsSearchError keep them distinguishable.

#include "GridTypes.hpp"

#include <string>

namespace hillclimb {

enum class SearchMode : std::uint8_t {
    None,
    Forward,
    Reverse,
};

struct Error {
    enum class Code {
        UnknownElevationSymbol,
        NoStartCoordinate,
        NoEndCoordinate,
        DuplicateMarker,
        RaggedRow,
        NoPathFound,
    } code{};
    std::string message;

    char       symbol = '\0';               // UnknownElevationSymbol, DuplicateMarker
    Coord      at{};                        // UnknownElevationSymbol, DuplicateMarker, RaggedRow
    SearchMode mode = SearchMode::None;     // NoPathFound
};

[[nodiscard]] constexpr bool IsParseError(Error::Code c) noexcept {
    switch (c) {
        case Error::Code::UnknownElevationSymbol:
        case Error::Code::NoStartCoordinate:
        case Error::Code::NoEndCoordinate:
        case Error::Code::DuplicateMarker:
        case Error::Code::RaggedRow:
            return true;
        case Error::Code::NoPathFound:
            return false;
    }
    return false;
}

[[nodiscard]] constexpr bool IsSearchError(Error::Code c) noexcept {
    return c == Error::Code::NoPathFound;
}

[[nodiscard]] const char* CodeName(Error::Code c) noexcept;
[[nodiscard]] const char* ModeName(SearchMode m) noexcept;

[[nodiscard]] Error UnknownSymbolError(char symbol, Coord at);
[[nodiscard]] Error MissingMarkerError(Error::Code code);
// `first` is where the marker was already seen; `at` is the second occurrence.
[[nodiscard]] Error DuplicateMarkerError(char symbol, Coord first, Coord at);
[[nodiscard]] Error RaggedRowError(std::int32_t row, std::size_t expected, std::size_t actual);
[[nodiscard]] Error NoPathError(SearchMode mode);

} // namespace hillclimb
