#include "hillclimb/Errors.hpp"

#include <cstdio>

namespace hillclimb {

const char* CodeName(Error::Code c) noexcept
{
    switch (c)
    {
    case Error::Code::UnknownElevationSymbol: return "UnknownElevationSymbol";
    case Error::Code::NoStartCoordinate:      return "NoStartCoordinate";
    case Error::Code::NoEndCoordinate:        return "NoEndCoordinate";
    case Error::Code::DuplicateMarker:        return "DuplicateMarker";
    case Error::Code::RaggedRow:              return "RaggedRow";
    case Error::Code::NoPathFound:            return "NoPathFound";
    }
    return "Unknown";
}

const char* ModeName(SearchMode m) noexcept
{
    switch (m)
    {
    case SearchMode::None:    return "none";
    case SearchMode::Forward: return "forward";
    case SearchMode::Reverse: return "reverse";
    }
    return "none";
}

Error UnknownSymbolError(char symbol, Coord at)
{
    char buf[96];
    const unsigned char u = static_cast<unsigned char>(symbol);
    if (u >= 0x20 && u < 0x7f)
        std::snprintf(buf, sizeof(buf), "Unknown elevation symbol '%c' at [%d,%d]", symbol, at.row, at.col);
    else
        std::snprintf(buf, sizeof(buf), "Unknown elevation symbol 0x%02x at [%d,%d]", u, at.row, at.col);

    Error e{ Error::Code::UnknownElevationSymbol, buf };
    e.symbol = symbol;
    e.at = at;
    return e;
}

Error MissingMarkerError(Error::Code code)
{
    return Error{ code, code == Error::Code::NoStartCoordinate ? "No start coordinate" : "No end coordinate" };
}

Error DuplicateMarkerError(char symbol, Coord first, Coord at)
{
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Second '%c' marker at [%d,%d], first seen at [%d,%d]",
                  symbol, at.row, at.col, first.row, first.col);

    Error e{ Error::Code::DuplicateMarker, buf };
    e.symbol = symbol;
    e.at = at;
    return e;
}

Error RaggedRowError(std::int32_t row, std::size_t expected, std::size_t actual)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Row %d has %zu cells, expected %zu", row, actual, expected);

    Error e{ Error::Code::RaggedRow, buf };
    e.at = Coord{ row, 0 };
    return e;
}

Error NoPathError(SearchMode mode)
{
    Error e{ Error::Code::NoPathFound, std::string("No path found (") + ModeName(mode) + " mode)" };
    e.mode = mode;
    return e;
}

} // namespace hillclimb
