#pragma once
// Input acquisition and result printing for hillclimb_cli.

#include "cli/CliArgs.h"
#include "hillclimb/Solver.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace hillclimb::cli {

// Reads InputPath(args), or all of `stdinStream` when no file was named.
[[nodiscard]] std::optional<std::string> ReadInput(const CliArgs& args, std::istream& stdinStream);

[[nodiscard]] nlohmann::json RouteJson(const std::vector<Coord>& route);
[[nodiscard]] nlohmann::json ErrorJson(const Error& e);
[[nodiscard]] nlohmann::json ResultJson(const std::expected<SearchResult, Error>& r, bool withRoute);

// Parses the grid once and runs the modes cfg.mode asks for, writing a plain or JSON
// report to `out`. Reverse routes are printed from the lowest cell up to End.
[[nodiscard]] ExitCode RunCli(const CliArgs& args, const core::Config& cfg, std::istream& in, std::ostream& out);

} // namespace hillclimb::cli
