// Command-line driver: reads a height map, prints the forward and/or reverse distance.
// Example:
//   hillclimb_cli --data-dir ./data --mode both --route
//   hillclimb_cli --input grid.txt --json > report.json

#include <iostream>
#include <string_view>
#include <vector>

#include "cli/CliArgs.h"
#include "cli/CliReport.h"
#include "core/Config.h"
#include "core/Log.h"

int main(int argc, char** argv)
{
    using namespace hillclimb;

    const std::vector<std::string_view> argvView(argv, argv + argc);
    const cli::CliArgs args = cli::ParseCliArgs(argvView);
    const char* exe = argc > 0 ? argv[0] : "hillclimb_cli";

    if (cli::ValidateCliArgs(args, std::cerr) != cli::kExitOk) {
        std::cerr << cli::BuildHelpText(exe);
        return cli::kExitBadArgs;
    }
    if (args.showHelp) {
        std::cerr << cli::BuildHelpText(exe);
        return cli::kExitOk;
    }

    core::Config cfg;
    const bool haveConfig = core::LoadConfig(cfg, args.configDir);
    cli::ApplyOverrides(args, cfg);

    core::LogInit({ cfg.logLevel, cfg.logFile, true });
    if (haveConfig)
        HILLCLIMB_LOG_DEBUG("Loaded %s", core::ConfigPath(args.configDir).string().c_str());

    const cli::ExitCode code = cli::RunCli(args, cfg, std::cin, std::cout);

    core::LogShutdown();
    return code;
}
