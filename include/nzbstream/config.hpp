#pragma once

#include <string>

namespace nzbstream {

struct Config {
    // Root for per-mount working directories (<dir>/<mountId>/{download,extracted}).
    std::string extractionDir{"./nzbstream-data"};
    // Download state records; empty means <extractionDir>/.state
    std::string stateDir;
    // Extracted files survive this long after extraction or last access.
    int retentionHours{48};
    // Soft cap on extracted bytes; 0 = unbounded.
    int maxCacheSizeGB{0};
    int downloadConcurrency{10};
    int progressIntervalMs{500};
    // Leading bytes fetched per archive volume for header parsing.
    int headerPeekBytes{64 * 1024};
    // Segments fetched ahead of the reader while streaming.
    int prefetchSegments{5};
    int streamCleanupDelaySeconds{120};
    int cacheSweepIntervalMinutes{60};
    int cacheInitialSweepDelaySeconds{10};
    int manifestCacheTtlMinutes{60};
    int archiveCacheTtlMinutes{60};
    int cacheMaintenanceIntervalMinutes{5};
    // Directory of pre-decoded article bodies used by the CLI.
    std::string spoolDir;
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Empty keeps logging on stdout only.
    std::string logPath;
};

// Applies envPath (.env) then jsonPath (flat JSON object); either may be empty.
bool loadConfig(const std::string& envPath, const std::string& jsonPath, Config& outCfg, std::string& outError);
bool validateConfig(const Config& cfg, std::string& outError);
std::string resolveStateDir(const Config& cfg);

#ifdef UNIT_TEST
// Test helper: parse .env-style content from an in-memory string.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);
bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError);
#endif

} // namespace nzbstream
