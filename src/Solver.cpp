#include "hillclimb/Solver.hpp"
#include "core/Log.h"

#include <utility>

namespace hillclimb {

std::expected<SearchResult, Error> SolveForward(const terrain::HeightMap& map, const SearchOptions& opt)
{
    const auto g = graph::ClimbGraph::Build(map);
    return search::FindForward(g, g.node(map.start()), g.node(map.end()), opt);
}

std::expected<SearchResult, Error> SolveReverse(const terrain::HeightMap& map, const SearchOptions& opt)
{
    const auto reversed = graph::ClimbGraph::Build(map).Reversed();
    return search::FindReverse(reversed, reversed.node(map.end()), opt);
}

std::expected<SearchResult, Error> SolveForward(std::string_view text, const SearchOptions& opt)
{
    const auto map = terrain::ParseHeightMap(text);
    if (!map)
        return std::unexpected(map.error());
    return SolveForward(*map, opt);
}

std::expected<SearchResult, Error> SolveReverse(std::string_view text, const SearchOptions& opt)
{
    const auto map = terrain::ParseHeightMap(text);
    if (!map)
        return std::unexpected(map.error());
    return SolveReverse(*map, opt);
}

std::expected<Report, Error> Solve(std::string_view text, const SearchOptions& opt)
{
    auto map = terrain::ParseHeightMap(text);
    if (!map)
    {
        HILLCLIMB_LOG_DEBUG("Solve: parse failed (%s)", map.error().message.c_str());
        return std::unexpected(std::move(map.error()));
    }

    const auto g = graph::ClimbGraph::Build(*map);
    const auto reversed = g.Reversed();

    Report report;
    report.forward = search::FindForward(g, g.node(map->start()), g.node(map->end()), opt);
    report.reverse = search::FindReverse(reversed, reversed.node(map->end()), opt);
    return report;
}

} // namespace hillclimb
