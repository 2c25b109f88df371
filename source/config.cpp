#include "nzbstream/config.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/util.hpp"
#include "mini/json.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace nzbstream {

namespace {

bool parseIntValue(const std::string& key, const std::string& val, int& out, std::string& outError) {
    char* end = nullptr;
    long v = std::strtol(val.c_str(), &end, 10);
    if (val.empty() || end == nullptr || *end != '\0') {
        outError = "Invalid config value for " + key + ": '" + val + "'";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool applyEnvKey(const std::string& key, const std::string& val, Config& cfg, std::string& outError) {
    if (key == "extraction_dir") cfg.extractionDir = val;
    else if (key == "state_dir") cfg.stateDir = val;
    else if (key == "spool_dir") cfg.spoolDir = val;
    else if (key == "log_level") cfg.logLevel = util::toLower(val);
    else if (key == "log_path") cfg.logPath = val;
    else if (key == "retention_hours") return parseIntValue(key, val, cfg.retentionHours, outError);
    else if (key == "max_cache_size_gb") return parseIntValue(key, val, cfg.maxCacheSizeGB, outError);
    else if (key == "download_concurrency") return parseIntValue(key, val, cfg.downloadConcurrency, outError);
    else if (key == "progress_interval_ms") return parseIntValue(key, val, cfg.progressIntervalMs, outError);
    else if (key == "header_peek_bytes") return parseIntValue(key, val, cfg.headerPeekBytes, outError);
    else if (key == "prefetch_segments") return parseIntValue(key, val, cfg.prefetchSegments, outError);
    else if (key == "stream_cleanup_delay_seconds") return parseIntValue(key, val, cfg.streamCleanupDelaySeconds, outError);
    else if (key == "cache_sweep_interval_minutes") return parseIntValue(key, val, cfg.cacheSweepIntervalMinutes, outError);
    else if (key == "cache_initial_sweep_delay_seconds") return parseIntValue(key, val, cfg.cacheInitialSweepDelaySeconds, outError);
    else if (key == "manifest_cache_ttl_minutes") return parseIntValue(key, val, cfg.manifestCacheTtlMinutes, outError);
    else if (key == "archive_cache_ttl_minutes") return parseIntValue(key, val, cfg.archiveCacheTtlMinutes, outError);
    else if (key == "cache_maintenance_interval_minutes") return parseIntValue(key, val, cfg.cacheMaintenanceIntervalMinutes, outError);
    else logDebug("Ignoring unknown config key: " + key, "CFG");
    return true;
}

bool parseEnvStream(std::istream& in, Config& outCfg, std::string& outError) {
    std::string line;
    while (std::getline(in, line)) {
        util::trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = util::toLower(line.substr(0, pos));
        std::string val = line.substr(pos + 1);
        util::trim(key); util::trim(val);
        if (!val.empty() && val.front() == '"' && val.back() == '"' && val.size() >= 2) {
            val = val.substr(1, val.size() - 2);
        }
        if (!applyEnvKey(key, val, outCfg, outError)) return false;
    }
    return true;
}

bool parseJsonContent(const std::string& content, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(content, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    mini::getString(obj, "extraction_dir", outCfg.extractionDir);
    mini::getString(obj, "state_dir", outCfg.stateDir);
    mini::getString(obj, "spool_dir", outCfg.spoolDir);
    mini::getString(obj, "log_path", outCfg.logPath);
    mini::getInt(obj, "retention_hours", outCfg.retentionHours);
    mini::getInt(obj, "max_cache_size_gb", outCfg.maxCacheSizeGB);
    mini::getInt(obj, "download_concurrency", outCfg.downloadConcurrency);
    mini::getInt(obj, "progress_interval_ms", outCfg.progressIntervalMs);
    mini::getInt(obj, "header_peek_bytes", outCfg.headerPeekBytes);
    mini::getInt(obj, "prefetch_segments", outCfg.prefetchSegments);
    mini::getInt(obj, "stream_cleanup_delay_seconds", outCfg.streamCleanupDelaySeconds);
    mini::getInt(obj, "cache_sweep_interval_minutes", outCfg.cacheSweepIntervalMinutes);
    mini::getInt(obj, "cache_initial_sweep_delay_seconds", outCfg.cacheInitialSweepDelaySeconds);
    mini::getInt(obj, "manifest_cache_ttl_minutes", outCfg.manifestCacheTtlMinutes);
    mini::getInt(obj, "archive_cache_ttl_minutes", outCfg.archiveCacheTtlMinutes);
    mini::getInt(obj, "cache_maintenance_interval_minutes", outCfg.cacheMaintenanceIntervalMinutes);
    {
        std::string lvl;
        mini::getString(obj, "log_level", lvl);
        if (!lvl.empty()) outCfg.logLevel = util::toLower(lvl);
    }
    return true;
}

} // namespace

bool validateConfig(const Config& cfg, std::string& outError) {
    if (cfg.extractionDir.empty()) {
        outError = "Config missing extraction_dir.";
        return false;
    }
    if (cfg.downloadConcurrency < 1 || cfg.downloadConcurrency > 64) {
        outError = "Invalid config: download_concurrency must be between 1 and 64.";
        return false;
    }
    if (cfg.retentionHours < 0 || cfg.maxCacheSizeGB < 0) {
        outError = "Invalid config: retention_hours and max_cache_size_gb must not be negative.";
        return false;
    }
    if (cfg.headerPeekBytes <= 0) {
        outError = "Invalid config: header_peek_bytes must be positive.";
        return false;
    }
    if (cfg.prefetchSegments <= 0) {
        outError = "Invalid config: prefetch_segments must be positive.";
        return false;
    }
    if (cfg.progressIntervalMs < 0 || cfg.streamCleanupDelaySeconds < 0) {
        outError = "Invalid config: intervals must not be negative.";
        return false;
    }
    return true;
}

std::string resolveStateDir(const Config& cfg) {
    if (!cfg.stateDir.empty()) return cfg.stateDir;
    return (std::filesystem::path(cfg.extractionDir) / ".state").string();
}

bool loadConfig(const std::string& envPath, const std::string& jsonPath, Config& outCfg, std::string& outError) {
    bool envTried = false;
    bool jsonTried = false;

    if (!envPath.empty()) {
        std::ifstream f(envPath);
        if (f) {
            envTried = true;
            if (!parseEnvStream(f, outCfg, outError)) return false;
        }
    }
    if (!jsonPath.empty()) {
        std::ifstream file(jsonPath, std::ios::in | std::ios::binary);
        if (file) {
            jsonTried = true;
            std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            if (!parseJsonContent(content, outCfg, outError)) return false;
        }
    }

    if (!envTried && !jsonTried) {
        outError = "Missing config: expected " + (envPath.empty() ? jsonPath : envPath);
        return false;
    }
    return validateConfig(outCfg, outError);
}

#ifdef UNIT_TEST
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    if (!parseEnvStream(in, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}

bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError) {
    if (!parseJsonContent(contents, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}
#endif

} // namespace nzbstream
