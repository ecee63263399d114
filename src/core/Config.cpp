#include "Config.h"
#include "Text.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace hillclimb::core {

std::filesystem::path ConfigPath(const std::filesystem::path& dir)
{
    return dir / "hillclimb.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

const char* RunModeName(RunMode mode) noexcept
{
    switch (mode)
    {
    case RunMode::Forward: return "forward";
    case RunMode::Reverse: return "reverse";
    case RunMode::Both:    return "both";
    }
    return "both";
}

bool ParseRunMode(std::string_view text, RunMode& out) noexcept
{
    for (RunMode m : { RunMode::Forward, RunMode::Reverse, RunMode::Both })
    {
        if (EqualsI(text, RunModeName(m)))
        {
            out = m;
            return true;
        }
    }
    return false;
}

// key=value lines, '#' or ';' comments
bool LoadConfig(Config& cfg, const std::filesystem::path& dir)
{
    const auto path = ConfigPath(dir);

    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;

    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Tolerate a UTF-8 BOM from editors.
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;
        TrimInPlace(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;

        const auto pos = line.find('=');
        if (pos == std::string::npos)
        {
            HILLCLIMB_LOG_WARN("%s:%d: expected key=value", path.string().c_str(), lineNo);
            continue;
        }

        std::string k = line.substr(0, pos);
        std::string v = line.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments, e.g. "mode=forward  # fast path".
        // logFile is a path and may contain '#' or ';', so it is taken verbatim.
        if (k != "logFile")
        {
            std::size_t cut = std::string::npos;
            for (std::size_t p : { v.find('#'), v.find(';') })
                if (p != std::string::npos && (cut == std::string::npos || p < cut))
                    cut = p;

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        bool ok = true;
        if (k == "mode")
        {
            RunMode parsed = cfg.mode;
            if ((ok = ParseRunMode(v, parsed)))
                cfg.mode = parsed;
        }
        else if (k == "logLevel")
        {
            LogLevel parsed = cfg.logLevel;
            if ((ok = ParseLogLevel(v, parsed)))
                cfg.logLevel = parsed;
        }
        else if (k == "logFile")
        {
            cfg.logFile = v;
        }
        else if (k == "json")
        {
            bool parsed = cfg.json;
            if ((ok = ParseBool(v, parsed)))
                cfg.json = parsed;
        }
        else if (k == "route")
        {
            bool parsed = cfg.route;
            if ((ok = ParseBool(v, parsed)))
                cfg.route = parsed;
        }
        else
        {
            HILLCLIMB_LOG_DEBUG("%s:%d: ignoring unknown key '%s'", path.string().c_str(), lineNo, k.c_str());
        }

        if (!ok)
            HILLCLIMB_LOG_WARN("%s:%d: bad value '%s' for %s, keeping default", path.string().c_str(), lineNo, v.c_str(), k.c_str());
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        HILLCLIMB_LOG_ERROR("SaveConfig: create_directories failed for %s (%d: %s)",
                            dir.string().c_str(), ec.value(), ec.message().c_str());
        return false;
    }

    std::ostringstream oss;
    oss << "mode="     << RunModeName(cfg.mode) << "\n";
    oss << "logLevel=" << LogLevelName(cfg.logLevel) << "\n";
    oss << "logFile="  << cfg.logFile.string() << "\n";
    oss << "json="     << (cfg.json ? 1 : 0) << "\n";
    oss << "route="    << (cfg.route ? 1 : 0) << "\n";
    const std::string text = oss.str();

    const auto path = ConfigPath(dir);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        HILLCLIMB_LOG_ERROR("SaveConfig: cannot open %s for writing", path.string().c_str());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace hillclimb::core
