#include "cli/CliReport.h"
#include "core/Log.h"
#include "hillclimb/terrain/HeightMap.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>

namespace hillclimb::cli {

using json = nlohmann::json;

namespace {

void PrintPlain(std::ostream& out, const char* label, const std::expected<SearchResult, Error>& r, bool withRoute)
{
    if (!r) {
        out << label << ": " << r.error().message << "\n";
        return;
    }
    out << label << ": " << r->distance << "\n";
    if (withRoute) {
        out << " ";
        for (const auto& c : r->route)
            out << " [" << c.row << "," << c.col << "]";
        out << "\n";
    }
}

} // namespace

std::optional<std::string> ReadInput(const CliArgs& args, std::istream& stdinStream)
{
    const auto file = InputPath(args);
    if (!file)
        return std::string(std::istreambuf_iterator<char>(stdinStream), std::istreambuf_iterator<char>());

    std::ifstream f(*file, std::ios::binary);
    if (!f) {
        HILLCLIMB_LOG_ERROR("Cannot open input file %s", file->string().c_str());
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    HILLCLIMB_LOG_DEBUG("Read %zu bytes from %s", oss.str().size(), file->string().c_str());
    return oss.str();
}

json RouteJson(const std::vector<Coord>& route)
{
    json arr = json::array();
    for (const auto& c : route)
        arr.push_back({ c.row, c.col });
    return arr;
}

json ErrorJson(const Error& e)
{
    return { { "code", CodeName(e.code) }, { "message", e.message } };
}

json ResultJson(const std::expected<SearchResult, Error>& r, bool withRoute)
{
    if (!r)
        return { { "error", ErrorJson(r.error()) } };
    json j = { { "distance", r->distance } };
    if (withRoute)
        j["route"] = RouteJson(r->route);
    return j;
}

ExitCode RunCli(const CliArgs& args, const core::Config& cfg, std::istream& in, std::ostream& out)
{
    const auto text = ReadInput(args, in);
    if (!text)
        return kExitNoInput;

    const auto map = terrain::ParseHeightMap(*text);
    if (!map) {
        HILLCLIMB_LOG_ERROR("Parse failed: %s", map.error().message.c_str());
        if (cfg.json)
            out << json{ { "error", ErrorJson(map.error()) } }.dump(2) << "\n";
        else
            out << "Error: " << map.error().message << "\n";
        return kExitParse;
    }

    SearchOptions opt;
    opt.recordRoute = cfg.route;

    std::optional<std::expected<SearchResult, Error>> forward;
    std::optional<std::expected<SearchResult, Error>> reverse;
    if (cfg.mode != core::RunMode::Reverse)
        forward = SolveForward(*map, opt);
    if (cfg.mode != core::RunMode::Forward) {
        reverse = SolveReverse(*map, opt);
        if (*reverse)
            std::reverse((*reverse)->route.begin(), (*reverse)->route.end());
    }

    ExitCode exitCode = kExitOk;
    auto check = [&](const char* label, const std::expected<SearchResult, Error>& r) {
        if (r) {
            HILLCLIMB_LOG_INFO("%s: %u steps (%zu nodes expanded)", label, r->distance, r->expanded);
        } else {
            HILLCLIMB_LOG_ERROR("%s: %s", label, r.error().message.c_str());
            exitCode = kExitNoPath;
        }
    };
    if (forward) check("Forward", *forward);
    if (reverse) check("Reverse", *reverse);

    if (cfg.json) {
        json report = json::object();
        if (forward) report["forward"] = ResultJson(*forward, cfg.route);
        if (reverse) report["reverse"] = ResultJson(*reverse, cfg.route);
        out << report.dump(2) << "\n";
    } else {
        if (forward) PrintPlain(out, "Forward", *forward, cfg.route);
        if (reverse) PrintPlain(out, "Reverse", *reverse, cfg.route);
    }

    return exitCode;
}

} // namespace hillclimb::cli
