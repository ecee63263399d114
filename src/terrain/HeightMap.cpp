#include "hillclimb/terrain/HeightMap.hpp"
#include "core/Log.h"
#include "core/Text.h"

#include <optional>

namespace hillclimb::terrain {

std::expected<HeightMap, Error> ParseHeightMap(std::string_view text, const ElevationTable& table)
{
    HeightMap map;
    std::optional<Coord> start, end;
    const bool trace = core::ShouldLog(core::LogLevel::Trace);

    std::int32_t row = 0;
    while (!text.empty())
    {
        const auto nl = text.find('\n');
        std::string_view line = core::TrimView(text.substr(0, nl));
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

        if (line.empty())
            continue;

        if (row == 0)
            map._cols = static_cast<std::int32_t>(line.size());
        else if (line.size() != static_cast<std::size_t>(map._cols))
            return std::unexpected(RaggedRowError(row, static_cast<std::size_t>(map._cols), line.size()));

        for (std::int32_t col = 0; col < map._cols; ++col)
        {
            const Coord at{ row, col };
            auto decoded = DecodeElevation(line[static_cast<std::size_t>(col)], table, at);
            if (!decoded)
                return std::unexpected(std::move(decoded.error()));

            if (IsStart(*decoded))
            {
                if (start)
                    return std::unexpected(DuplicateMarkerError('S', *start, at));
                start = at;
            }
            else if (IsEnd(*decoded))
            {
                if (end)
                    return std::unexpected(DuplicateMarkerError('E', *end, at));
                end = at;
            }

            if (trace)
                HILLCLIMB_LOG_TRACE("Adding value: [%d,%d] -> %s(%u)", row, col,
                                    RoleName(*decoded), static_cast<unsigned>(ElevationOf(*decoded)));

            map._cells.push_back(*decoded);
        }
        ++row;
    }
    map._rows = row;

    if (!start)
        return std::unexpected(MissingMarkerError(Error::Code::NoStartCoordinate));
    if (!end)
        return std::unexpected(MissingMarkerError(Error::Code::NoEndCoordinate));

    map._start = *start;
    map._end = *end;

    HILLCLIMB_LOG_DEBUG("Parsed height map %dx%d, start [%d,%d], end [%d,%d]",
                        map._rows, map._cols, map._start.row, map._start.col, map._end.row, map._end.col);
    return map;
}

} // namespace hillclimb::terrain
