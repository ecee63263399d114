#pragma once

#include "core/Config.h"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hillclimb::cli {

enum ExitCode : int {
    kExitOk      = 0,
    kExitBadArgs = 1,
    kExitNoInput = 2,
    kExitParse   = 3,
    kExitNoPath  = 4,
};

// Parsed command line for hillclimb_cli.
//
// Notes:
//   - Both "--opt value" and "--opt=value" are accepted.
//   - Unset optionals mean "use the value from hillclimb.ini".
struct CliArgs
{
    bool showHelp = false;                     // --help / -h

    std::optional<std::filesystem::path> input;   // --input FILE
    std::optional<std::filesystem::path> dataDir; // --data-dir DIR (reads DIR/day12.txt)
    std::filesystem::path configDir = ".";        // --config DIR

    std::optional<core::RunMode>  mode;        // --mode forward|reverse|both
    std::optional<core::LogLevel> logLevel;    // --log-level LEVEL
    std::optional<std::filesystem::path> logFile; // --log-file FILE
    std::optional<bool> json;                  // --json / --no-json
    std::optional<bool> route;                 // --route / --no-route

    // Unknown options, missing values and bad values, in command-line order.
    std::vector<std::string> unknown;

    // --input and --data-dir were both given.
    bool conflictingInputs = false;
};

inline constexpr std::string_view kDataFileName = "day12.txt";

// argv[0] is the program name and is skipped.
[[nodiscard]] CliArgs ParseCliArgs(std::span<const std::string_view> argv);

// Reports every problem found by ParseCliArgs to `err`.
// Returns kExitBadArgs when there is at least one, kExitOk otherwise.
[[nodiscard]] ExitCode ValidateCliArgs(const CliArgs& args, std::ostream& err);

// Flags win over the config file.
void ApplyOverrides(const CliArgs& args, core::Config& cfg);

// File to read the grid from; nullopt means standard input.
[[nodiscard]] std::optional<std::filesystem::path> InputPath(const CliArgs& args);

[[nodiscard]] std::string BuildHelpText(std::string_view exe);

} // namespace hillclimb::cli
