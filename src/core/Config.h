#pragma once
#include "Log.h"

#include <filesystem>
#include <string>

namespace hillclimb::core {

enum class RunMode { Forward, Reverse, Both };

struct Config {
    RunMode               mode     = RunMode::Both;
    LogLevel              logLevel = LogLevel::Info;
    std::filesystem::path logFile;          // empty => console only
    bool                  json     = false;
    bool                  route    = false;
};

[[nodiscard]] const char* RunModeName(RunMode mode) noexcept;
[[nodiscard]] bool ParseRunMode(std::string_view text, RunMode& out) noexcept;

// Reads `dir`/hillclimb.ini. Returns false when the file is missing or unreadable;
// keys that fail to parse keep their current value.
bool LoadConfig(Config& cfg, const std::filesystem::path& dir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& dir);

[[nodiscard]] std::filesystem::path ConfigPath(const std::filesystem::path& dir);

} // namespace hillclimb::core
