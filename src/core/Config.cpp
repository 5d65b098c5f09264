#include "core/Config.h"
#include "core/FileIO.h"
#include "core/Log.h"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace outpost::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static std::string_view TrimView(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

static bool ParseInt(std::string_view sv, int& out) noexcept
{
    sv = TrimView(sv);

    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || begin == end)
        return false;

    out = v;
    return true;
}

static bool ParseDouble(std::string_view sv, double& out) noexcept
{
    sv = TrimView(sv);
    if (sv.empty())
        return false;

    // strtod needs a terminated buffer; config values are short.
    const std::string tmp(sv);
    char* end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size() || !std::isfinite(v))
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = TrimView(sv);

    // Common INI boolean tokens (case-insensitive):
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

// Shortest text that parses back to the same double.
static std::string FormatDouble(double v)
{
    char buf[32]{};
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{})
        return "0";
    return std::string(buf, ptr);
}

std::filesystem::path ConfigPath(const std::filesystem::path& dir)
{
    return dir / "outpost.ini";
}

bool LoadConfig(Config& cfg, const std::filesystem::path& dir)
{
    const auto path = ConfigPath(dir);

    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false; // Missing config is normal on first run; don't spam logs.

    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Files saved by some editors start with a UTF-8 BOM.
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;

        // Comments / empty
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;
        if (tmp[0] == '[') continue; // section headers are accepted and ignored

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments, e.g.:
        //   tickIntervalSeconds=1.0  # seconds
        //   worldWidth=768           ; tiles
        {
            std::size_t cut = std::string::npos;
            auto consider = [&](std::size_t p)
            {
                if (p == std::string::npos) return;
                if (cut == std::string::npos || p < cut) cut = p;
            };

            consider(v.find('#'));
            consider(v.find(';'));
            consider(v.find("//"));

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        bool ok = true;
        if (k == "tickIntervalSeconds")
        {
            double parsed = cfg.tickIntervalSeconds;
            ok = ParseDouble(v, parsed) && parsed > 0.0;
            if (ok) cfg.tickIntervalSeconds = parsed;
        }
        else if (k == "maxCatchUpTicks")
        {
            int parsed = cfg.maxCatchUpTicks;
            ok = ParseInt(v, parsed) && parsed >= 1;
            if (ok) cfg.maxCatchUpTicks = parsed;
        }
        else if (k == "maxFrameSeconds")
        {
            double parsed = cfg.maxFrameSeconds;
            ok = ParseDouble(v, parsed) && parsed > 0.0;
            if (ok) cfg.maxFrameSeconds = parsed;
        }
        else if (k == "defaultInputCapacity")
        {
            int parsed = cfg.defaultInputCapacity;
            ok = ParseInt(v, parsed) && parsed >= 0;
            if (ok) cfg.defaultInputCapacity = parsed;
        }
        else if (k == "defaultOutputCapacity")
        {
            int parsed = cfg.defaultOutputCapacity;
            ok = ParseInt(v, parsed) && parsed >= 0;
            if (ok) cfg.defaultOutputCapacity = parsed;
        }
        else if (k == "worldWidth")
        {
            int parsed = cfg.worldWidth;
            ok = ParseInt(v, parsed) && parsed > 0;
            if (ok) cfg.worldWidth = parsed;
        }
        else if (k == "worldHeight")
        {
            int parsed = cfg.worldHeight;
            ok = ParseInt(v, parsed) && parsed > 0;
            if (ok) cfg.worldHeight = parsed;
        }
        else if (k == "logLevel")
        {
            LogLevel parsed = cfg.logLevel;
            ok = LogLevelFromName(v, parsed);
            if (ok) cfg.logLevel = parsed;
        }
        else if (k == "logOverflowWarnings")
        {
            bool parsed = cfg.logOverflowWarnings;
            ok = ParseBool(v, parsed);
            if (ok) cfg.logOverflowWarnings = parsed;
        }
        else
        {
            LOG_DEBUG("LoadConfig: unknown key '%s' at %s:%d", k.c_str(), path.string().c_str(), lineNo);
            continue;
        }

        if (!ok)
            LOG_WARN("LoadConfig: ignoring invalid value '%s' for %s (line %d)", v.c_str(), k.c_str(), lineNo);
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        LOG_ERROR("SaveConfig: create_directories failed for %s (%d: %s)",
                  dir.string().c_str(), ec.value(), ec.message().c_str());
        return false;
    }

    std::ostringstream oss;
    oss << "tickIntervalSeconds="   << FormatDouble(cfg.tickIntervalSeconds) << "\n";
    oss << "maxCatchUpTicks="       << cfg.maxCatchUpTicks       << "\n";
    oss << "maxFrameSeconds="       << FormatDouble(cfg.maxFrameSeconds) << "\n";
    oss << "defaultInputCapacity="  << cfg.defaultInputCapacity  << "\n";
    oss << "defaultOutputCapacity=" << cfg.defaultOutputCapacity << "\n";
    oss << "worldWidth="            << cfg.worldWidth            << "\n";
    oss << "worldHeight="           << cfg.worldHeight           << "\n";
    oss << "logLevel="              << LogLevelName(cfg.logLevel) << "\n";
    oss << "logOverflowWarnings="   << (cfg.logOverflowWarnings ? 1 : 0) << "\n";
    const std::string text = oss.str();

    std::string err;
    if (!WriteFileAtomic(ConfigPath(dir), text, &err))
    {
        LOG_ERROR("SaveConfig: %s", err.c_str());
        return false;
    }
    return true;
}

} // namespace outpost::core
