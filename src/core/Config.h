#pragma once
#include <filesystem>
#include <string>

#include "core/Log.h"

namespace outpost::core {

struct Config {
    // Production tick.
    double tickIntervalSeconds = 1.0;
    int    maxCatchUpTicks     = 5;
    double maxFrameSeconds     = 0.25;

    // Storage sizes used when a structure definition has no storage block.
    int defaultInputCapacity  = 50;
    int defaultOutputCapacity = 50;

    int worldWidth  = 768;
    int worldHeight = 432;

    LogLevel logLevel = LogLevel::Info;
    bool     logOverflowWarnings = true;
};

[[nodiscard]] std::filesystem::path ConfigPath(const std::filesystem::path& dir);

// Tiny INI-style key=value reader. Returns false if the file is missing or unreadable;
// invalid values are skipped and leave the existing field untouched.
bool LoadConfig(Config& cfg, const std::filesystem::path& dir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& dir);

} // namespace outpost::core
