#pragma once
// include/hillclimb/Solver.hpp
//
// Text-in, distance-out entry points. Each call parses its own grid and builds
// its own graph, so calls share no state.

#include "hillclimb/search/Bfs.hpp"

#include <expected>
#include <string_view>

namespace hillclimb {

using search::SearchOptions;
using search::SearchResult;

// Start -> End.
[[nodiscard]] std::expected<SearchResult, Error> SolveForward(std::string_view text, const SearchOptions& opt = {});

// End -> nearest elevation-0 cell over reversed edges. The recorded route runs End .. lowest cell.
[[nodiscard]] std::expected<SearchResult, Error> SolveReverse(std::string_view text, const SearchOptions& opt = {});

struct Report {
    std::expected<SearchResult, Error> forward = std::unexpected(Error{});
    std::expected<SearchResult, Error> reverse = std::unexpected(Error{});
};

// Both modes over one parsed grid. Only a parse failure is returned as the outer error.
[[nodiscard]] std::expected<Report, Error> Solve(std::string_view text, const SearchOptions& opt = {});

// Modes over an already parsed grid.
[[nodiscard]] std::expected<SearchResult, Error> SolveForward(const terrain::HeightMap& map, const SearchOptions& opt = {});
[[nodiscard]] std::expected<SearchResult, Error> SolveReverse(const terrain::HeightMap& map, const SearchOptions& opt = {});

} // namespace hillclimb
