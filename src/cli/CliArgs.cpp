#include "cli/CliArgs.h"

#include <ostream>
#include <sstream>

namespace hillclimb::cli {

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value" form.
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view name, std::string_view& outValue)
{
    if (!StartsWith(arg, name) || arg.size() <= name.size() || arg[name.size()] != '=')
        return false;

    outValue = arg.substr(name.size() + 1);
    return true;
}

} // namespace

CliArgs ParseCliArgs(std::span<const std::string_view> argv)
{
    CliArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view arg = argv[i];
        if (arg.empty())
            continue;

        if (arg == "--help" || arg == "-h") { out.showHelp = true; continue; }

        // Boolean overrides
        if (arg == "--json")     { out.json = true; continue; }
        if (arg == "--no-json")  { out.json = false; continue; }
        if (arg == "--route")    { out.route = true; continue; }
        if (arg == "--no-route") { out.route = false; continue; }

        // Options with values: "--opt value" or "--opt=value".
        std::string_view name = arg;
        std::string_view value;
        bool haveValue = false;
        if (const auto eq = arg.find('='); StartsWith(arg, "--") && eq != std::string_view::npos)
        {
            name = arg.substr(0, eq);
            haveValue = ConsumeValue(arg, name, value);
        }

        const bool known = name == "--input" || name == "--data-dir" || name == "--config" ||
                           name == "--mode" || name == "--log-level" || name == "--log-file";
        if (!known)
        {
            addUnknown(arg);
            continue;
        }

        if (!haveValue)
        {
            if (i + 1 >= argv.size())
            {
                addUnknown(arg);
                continue;
            }
            value = argv[++i];
        }

        // Bad values are reported in "--opt=value" form whichever way they were given.
        auto badValue = [&] {
            out.unknown.push_back(std::string(name) + "=" + std::string(value));
        };

        if (name == "--input")
            out.input = std::filesystem::path(value);
        else if (name == "--data-dir")
            out.dataDir = std::filesystem::path(value);
        else if (name == "--config")
            out.configDir = std::filesystem::path(value);
        else if (name == "--log-file")
            out.logFile = std::filesystem::path(value);
        else if (name == "--mode")
        {
            core::RunMode m{};
            if (core::ParseRunMode(value, m))
                out.mode = m;
            else
                badValue();
        }
        else if (name == "--log-level")
        {
            core::LogLevel l{};
            if (core::ParseLogLevel(value, l))
                out.logLevel = l;
            else
                badValue();
        }
    }

    out.conflictingInputs = out.input.has_value() && out.dataDir.has_value();
    return out;
}

ExitCode ValidateCliArgs(const CliArgs& args, std::ostream& err)
{
    for (const auto& u : args.unknown)
        err << "Unknown or malformed argument: " << u << "\n";
    if (args.conflictingInputs)
        err << "--input and --data-dir are mutually exclusive\n";

    return (args.unknown.empty() && !args.conflictingInputs) ? kExitOk : kExitBadArgs;
}

void ApplyOverrides(const CliArgs& args, core::Config& cfg)
{
    if (args.mode)     cfg.mode = *args.mode;
    if (args.logLevel) cfg.logLevel = *args.logLevel;
    if (args.logFile)  cfg.logFile = *args.logFile;
    if (args.json)     cfg.json = *args.json;
    if (args.route)    cfg.route = *args.route;
}

std::optional<std::filesystem::path> InputPath(const CliArgs& args)
{
    if (args.input)
        return *args.input;
    if (args.dataDir)
        return *args.dataDir / kDataFileName;
    return std::nullopt;
}

std::string BuildHelpText(std::string_view exe)
{
    std::ostringstream oss;
    oss << "Usage: " << exe << " [--input FILE | --data-dir DIR] [--mode forward|reverse|both]\n"
        << "       [--config DIR] [--json] [--route] [--log-level LEVEL] [--log-file FILE]\n"
        << "Reads an elevation grid (a-z, S, E) and prints the fewest steps from S to E (forward)\n"
        << "and from E back to the nearest 'a' cell (reverse). Reads stdin without --input/--data-dir;\n"
        << "--data-dir DIR reads DIR/" << kDataFileName << ". Options also accept --opt=value.\n"
        << "Exit codes: 0 ok, 1 bad arguments, 2 input unreadable, 3 grid rejected, 4 no path.\n";
    return oss.str();
}

} // namespace hillclimb::cli
