// tests/test_cli_args.cpp
//
// Regression coverage for src/cli/CliArgs.{h,cpp} and src/cli/CliReport.{h,cpp}.
//
// Goals:
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options, missing values and bad values are reported in order
//   - Flags override hillclimb.ini, unset flags keep it
//   - Every exit code (0..4) is reachable through RunCli / ValidateCliArgs
//   - The JSON report carries only the requested modes, reverse routes end at E

#include <doctest/doctest.h>

#include "cli/CliArgs.h"
#include "cli/CliReport.h"
#include "test_support/Grids.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace hillclimb;
using namespace hillclimb::cli;

namespace {

[[nodiscard]] CliArgs Parse(std::initializer_list<std::string_view> argv)
{
    std::vector<std::string_view> v;
    v.reserve(argv.size());
    for (const auto& a : argv)
        v.push_back(a);
    return ParseCliArgs(v);
}

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("hillclimb_cli_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_text(const fs::path& file, std::string_view text)
{
    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    REQUIRE(static_cast<bool>(f));
    f << text;
}

struct Run {
    ExitCode    code = kExitOk;
    std::string out;
};

// Runs the front end on `grid` fed through stdin.
Run run_on(std::string_view grid, const core::Config& cfg, const CliArgs& args = {})
{
    std::istringstream in{ std::string(grid) };
    std::ostringstream out;
    Run r;
    r.code = RunCli(args, cfg, in, out);
    r.out = out.str();
    return r;
}

core::Config json_config(core::RunMode mode, bool route)
{
    core::Config cfg;
    cfg.mode = mode;
    cfg.json = true;
    cfg.route = route;
    return cfg;
}

// Character at `c` in a newline-separated grid.
char cell_at(std::string_view grid, Coord c)
{
    for (int32_t row = 0; row < c.row; ++row)
        grid.remove_prefix(grid.find('\n') + 1);
    return grid[static_cast<std::size_t>(c.col)];
}

} // namespace

TEST_CASE("ParseCliArgs reads value options in both forms")
{
    const auto args = Parse({
        "hillclimb_cli",
        "--input", "grid.txt",
        "--config=etc",
        "--mode=reverse",
        "--log-level", "debug",
        "--log-file=logs/run.log",
        "--json",
        "--route",
    });

    REQUIRE(args.input.has_value());
    CHECK(*args.input == fs::path("grid.txt"));
    CHECK(args.configDir == fs::path("etc"));
    REQUIRE(args.mode.has_value());
    CHECK(*args.mode == core::RunMode::Reverse);
    REQUIRE(args.logLevel.has_value());
    CHECK(*args.logLevel == core::LogLevel::Debug);
    REQUIRE(args.logFile.has_value());
    CHECK(*args.logFile == fs::path("logs/run.log"));
    CHECK(args.json == true);
    CHECK(args.route == true);
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());

    std::ostringstream err;
    CHECK(ValidateCliArgs(args, err) == kExitOk);
    CHECK(err.str().empty());
}

TEST_CASE("ParseCliArgs leaves unset options empty and last boolean override wins")
{
    const auto args = Parse({ "hillclimb_cli", "--json", "--no-json" });

    CHECK_FALSE(args.input.has_value());
    CHECK_FALSE(args.dataDir.has_value());
    CHECK(args.configDir == fs::path("."));
    CHECK_FALSE(args.mode.has_value());
    CHECK_FALSE(args.route.has_value());
    REQUIRE(args.json.has_value());
    CHECK(*args.json == false);
    CHECK_FALSE(InputPath(args).has_value());
}

TEST_CASE("ParseCliArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "hillclimb_cli",
        "--mode", "sideways",
        "--does-not-exist",
        "--log-level=loud",
        "--input",
    });

    CHECK_FALSE(args.mode.has_value());
    CHECK_FALSE(args.logLevel.has_value());
    CHECK_FALSE(args.input.has_value());

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--mode=sideways");
    CHECK(args.unknown[1] == "--does-not-exist");
    CHECK(args.unknown[2] == "--log-level=loud");
    CHECK(args.unknown[3] == "--input");

    std::ostringstream err;
    CHECK(ValidateCliArgs(args, err) == kExitBadArgs);
    CHECK(err.str().find("--does-not-exist") != std::string::npos);
}

TEST_CASE("--input and --data-dir are mutually exclusive")
{
    const auto args = Parse({ "hillclimb_cli", "--input", "a.txt", "--data-dir", "data" });

    CHECK(args.unknown.empty());
    CHECK(args.conflictingInputs);

    std::ostringstream err;
    CHECK(ValidateCliArgs(args, err) == kExitBadArgs);
    CHECK(err.str().find("mutually exclusive") != std::string::npos);
}

TEST_CASE("--help is recognised on its own")
{
    const auto args = Parse({ "hillclimb_cli", "-h" });
    CHECK(args.showHelp);

    std::ostringstream err;
    CHECK(ValidateCliArgs(args, err) == kExitOk);
    CHECK(BuildHelpText("hillclimb_cli").find("--data-dir") != std::string::npos);
}

TEST_CASE("--data-dir resolves to DIR/day12.txt")
{
    const auto args = Parse({ "hillclimb_cli", "--data-dir", "puzzles" });
    const auto path = InputPath(args);
    REQUIRE(path.has_value());
    CHECK(*path == fs::path("puzzles") / "day12.txt");

    const auto explicitFile = Parse({ "hillclimb_cli", "--input=grid.txt" });
    REQUIRE(InputPath(explicitFile).has_value());
    CHECK(*InputPath(explicitFile) == fs::path("grid.txt"));
}

TEST_CASE("Flags override hillclimb.ini values and unset flags keep them")
{
    const fs::path dir = make_unique_temp_dir();
    write_text(core::ConfigPath(dir),
               "mode=reverse\n"
               "logLevel=error\n"
               "json=false\n"
               "route=true\n");

    const std::string configDir = dir.string();
    const auto args = Parse({ "hillclimb_cli", "--config", configDir, "--mode=forward", "--json" });
    CHECK(args.configDir == dir);

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, args.configDir));
    CHECK(cfg.mode == core::RunMode::Reverse);

    ApplyOverrides(args, cfg);
    CHECK(cfg.mode == core::RunMode::Forward);
    CHECK(cfg.json);
    CHECK(cfg.route);
    CHECK(cfg.logLevel == core::LogLevel::Error);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("RunCli reads the grid from --data-dir")
{
    const fs::path dir = make_unique_temp_dir();
    write_text(dir / "day12.txt", hillclimb_test::kCanonical);

    const std::string dataDir = dir.string();
    const auto args = Parse({ "hillclimb_cli", "--data-dir", dataDir });

    core::Config cfg;
    const Run r = run_on("", cfg, args);
    CHECK(r.code == kExitOk);
    CHECK(r.out == "Forward: 31\nReverse: 29\n");

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("RunCli exit codes")
{
    core::Config cfg;

    SUBCASE("0 when every requested search finds a route")
    {
        CHECK(run_on(hillclimb_test::kCanonical, cfg).code == kExitOk);
    }

    SUBCASE("2 when the input file cannot be opened")
    {
        const fs::path dir = make_unique_temp_dir() / "absent";
        const std::string dataDir = dir.string();
        const auto args = Parse({ "hillclimb_cli", "--data-dir", dataDir });

        const Run r = run_on(hillclimb_test::kCanonical, cfg, args);
        CHECK(r.code == kExitNoInput);
        CHECK(r.out.empty());

        std::error_code dec;
        fs::remove_all(dir.parent_path(), dec);
    }

    SUBCASE("3 when the grid is rejected")
    {
        const Run r = run_on("Sa?\nbcE\n", cfg);
        CHECK(r.code == kExitParse);
        CHECK(r.out.find("Error:") == 0);
    }

    SUBCASE("4 when a search has no route")
    {
        CHECK(run_on(hillclimb_test::kWalledOff, cfg).code == kExitNoPath);
    }

    SUBCASE("only the requested mode decides the exit code")
    {
        // S is boxed in by a cliff, but the ramp from 'a' climbs to E.
        constexpr std::string_view grid = "SzabcdefghijklmnopqrstuvwxyE\n";

        cfg.mode = core::RunMode::Forward;
        CHECK(run_on(grid, cfg).code == kExitNoPath);

        cfg.mode = core::RunMode::Reverse;
        const Run r = run_on(grid, cfg);
        CHECK(r.code == kExitOk);
        CHECK(r.out == "Reverse: 25\n");
    }
}

TEST_CASE("JSON report carries only the requested modes")
{
    SUBCASE("both")
    {
        const Run r = run_on(hillclimb_test::kCanonical, json_config(core::RunMode::Both, false));
        REQUIRE(r.code == kExitOk);
        const json j = json::parse(r.out);
        REQUIRE(j.is_object());
        CHECK(j.size() == 2u);
        CHECK(j["forward"]["distance"] == 31);
        CHECK(j["reverse"]["distance"] == 29);
        CHECK_FALSE(j["forward"].contains("route"));
        CHECK_FALSE(j["reverse"].contains("route"));
    }

    SUBCASE("forward only")
    {
        const Run r = run_on(hillclimb_test::kCanonical, json_config(core::RunMode::Forward, false));
        const json j = json::parse(r.out);
        CHECK(j.contains("forward"));
        CHECK_FALSE(j.contains("reverse"));
    }

    SUBCASE("reverse only")
    {
        const Run r = run_on(hillclimb_test::kCanonical, json_config(core::RunMode::Reverse, false));
        const json j = json::parse(r.out);
        CHECK_FALSE(j.contains("forward"));
        CHECK(j["reverse"]["distance"] == 29);
    }

    SUBCASE("parse failure")
    {
        const Run r = run_on("SaS\nEbc\n", json_config(core::RunMode::Both, false));
        CHECK(r.code == kExitParse);
        const json j = json::parse(r.out);
        CHECK(j["error"]["code"] == "DuplicateMarker");
        CHECK(j["error"]["message"].is_string());
    }

    SUBCASE("no route")
    {
        const Run r = run_on(hillclimb_test::kWalledOff, json_config(core::RunMode::Both, true));
        CHECK(r.code == kExitNoPath);
        const json j = json::parse(r.out);
        CHECK(j["forward"]["error"]["code"] == "NoPathFound");
        CHECK(j["reverse"]["error"]["code"] == "NoPathFound");
        CHECK_FALSE(j["forward"].contains("distance"));
    }
}

TEST_CASE("JSON routes: forward runs S to E, reverse runs lowest cell up to E")
{
    const Run r = run_on(hillclimb_test::kCanonical, json_config(core::RunMode::Both, true));
    REQUIRE(r.code == kExitOk);
    const json j = json::parse(r.out);

    const json& fwd = j["forward"]["route"];
    REQUIRE(fwd.is_array());
    REQUIRE(fwd.size() == 32u);
    CHECK(fwd.front() == json::array({ 0, 0 }));
    CHECK(fwd.back() == json::array({ 2, 5 }));

    const json& rev = j["reverse"]["route"];
    REQUIRE(rev.is_array());
    REQUIRE(rev.size() == 30u);
    CHECK(rev.back() == json::array({ 2, 5 }));

    const Coord lowest{ rev.front()[0].get<int32_t>(), rev.front()[1].get<int32_t>() };
    const char c = cell_at(hillclimb_test::kCanonical, lowest);
    CHECK((c == 'a' || c == 'S'));

    // Consecutive cells are orthogonal neighbours.
    for (std::size_t i = 1; i < rev.size(); ++i)
    {
        const int dr = rev[i][0].get<int>() - rev[i - 1][0].get<int>();
        const int dc = rev[i][1].get<int>() - rev[i - 1][1].get<int>();
        CHECK(std::abs(dr) + std::abs(dc) == 1);
    }
}

TEST_CASE("Plain report lists routes when asked")
{
    core::Config cfg;
    cfg.mode = core::RunMode::Forward;
    cfg.route = true;

    const Run r = run_on("SbcdefghijklmnopqrstuvwxyzE\n", cfg);
    CHECK(r.code == kExitOk);
    CHECK(r.out.find("Forward: 26\n") == 0);
    CHECK(r.out.find("[0,0] [0,1]") != std::string::npos);
    CHECK(r.out.find("Reverse") == std::string::npos);
}
