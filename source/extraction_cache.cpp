#include "nzbstream/extraction_cache.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <vector>

namespace nzbstream {

namespace {

constexpr const char* kStateDirName = ".state";

} // namespace

ExtractionCacheManager::ExtractionCacheManager(MountStore& mounts, TaskScheduler& scheduler, std::string baseDir,
                                               CacheSettings settings)
    : mounts_(mounts), scheduler_(scheduler), baseDir_(std::move(baseDir)), settings_(settings) {}

ExtractionCacheManager::~ExtractionCacheManager() { stop(); }

void ExtractionCacheManager::start() {
    if (sweepTask_ != 0) return;
    const CacheSettings s = settings();
    sweepTask_ = scheduler_.scheduleEvery(std::chrono::minutes(s.sweepIntervalMinutes), [this] { runCleanup(); },
                                          std::chrono::minutes(s.sweepIntervalMinutes));
    initialTask_ = scheduler_.scheduleAfter(std::chrono::seconds(s.initialSweepDelaySeconds), [this] { runCleanup(); });
    logInfo("Started: retention " + std::to_string(s.retentionHours) + "h, max size " +
            std::to_string(s.maxCacheSizeGB) + " GB", "CACHE");
}

void ExtractionCacheManager::stop() {
    if (sweepTask_ == 0) return;
    scheduler_.cancel(sweepTask_);
    scheduler_.cancel(initialTask_);
    sweepTask_ = 0;
    initialTask_ = 0;
    logInfo("Stopped", "CACHE");
}

void ExtractionCacheManager::updateSettings(const CacheSettings& settings) {
    {
        std::lock_guard<std::mutex> lock(settingsMutex_);
        settings_ = settings;
    }
    logInfo("Settings updated: retention " + std::to_string(settings.retentionHours) + "h, max size " +
            std::to_string(settings.maxCacheSizeGB) + " GB", "CACHE");
}

CacheSettings ExtractionCacheManager::settings() const {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    return settings_;
}

void ExtractionCacheManager::setInUsePredicate(InUseFn fn) {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    inUse_ = std::move(fn);
}

// The whole extracted tree of a mount, not just the folder holding the
// registered file; archives often nest the feature and a sample side by side.
std::string ExtractionCacheManager::extractDirFor(const std::string& mountId) const {
    return (std::filesystem::path(baseDir_) / mountId / "extracted").string();
}

WallClock::time_point ExtractionCacheManager::expiryFromNow() const {
    return WallClock::now() + std::chrono::hours(settings().retentionHours);
}

CleanupResult ExtractionCacheManager::runCleanup() {
    std::lock_guard<std::mutex> guard(cleanupMutex_);
    CleanupResult result;
    const auto now = WallClock::now();

    for (const auto& mount : mounts_.listMounts()) {
        if (mount.extractedFilePath.empty() || !mount.expiresAt || *mount.expiresAt >= now) continue;
        const std::string dir = extractDirFor(mount.id);
        if (fileExists(dir)) {
            const uint64_t size = directorySize(dir);
            if (!removeDirRecursive(dir)) {
                logError("Failed to remove expired extraction: " + dir, "CACHE");
                continue;
            }
            result.freedBytes += size;
            result.cleaned++;
        }
        mounts_.clearExtractedFile(mount.id, MountStatus::RequiresExtraction);
        logDebug("Expired extraction cleared for mount " + mount.id, "CACHE");
    }

    result.cleaned += cleanupOrphanedDirectories();
    result.cleaned += enforceSizeLimit(result.freedBytes);

    if (result.cleaned > 0) {
        logInfo("Cleanup complete: " + std::to_string(result.cleaned) + " removed, " +
                std::to_string(result.freedBytes / (1024 * 1024)) + " MB freed", "CACHE");
    }
    return result;
}

int ExtractionCacheManager::cleanupOrphanedDirectories() {
    std::error_code ec;
    if (!std::filesystem::is_directory(baseDir_, ec)) return 0;

    std::set<std::string> known;
    for (const auto& m : mounts_.listMounts()) known.insert(m.id);

    int cleaned = 0;
    std::vector<std::filesystem::path> orphans;
    for (std::filesystem::directory_iterator it(baseDir_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name == kStateDirName) continue;
        std::error_code typeEc;
        if (!it->is_directory(typeEc)) continue;
        if (known.count(name)) continue;
        orphans.push_back(it->path());
    }
    for (const auto& dir : orphans) {
        if (removeDirRecursive(dir.string())) {
            cleaned++;
            logDebug("Removed orphaned directory " + dir.string(), "CACHE");
        }
    }
    return cleaned;
}

int ExtractionCacheManager::enforceSizeLimit(uint64_t& freedBytes) {
    InUseFn inUse;
    const CacheSettings s = settings();
    {
        std::lock_guard<std::mutex> lock(settingsMutex_);
        inUse = inUse_;
    }
    if (s.maxCacheSizeGB <= 0) return 0;
    const uint64_t cap = static_cast<uint64_t>(s.maxCacheSizeGB) * 1024ull * 1024ull * 1024ull;

    std::vector<Mount> candidates;
    uint64_t total = 0;
    for (auto& m : mounts_.listMounts()) {
        if (m.extractedFilePath.empty() || !fileExists(extractDirFor(m.id))) continue;
        total += directorySize(extractDirFor(m.id));
        candidates.push_back(std::move(m));
    }
    if (total <= cap) return 0;

    std::sort(candidates.begin(), candidates.end(), [](const Mount& a, const Mount& b) {
        const auto ea = a.expiresAt.value_or(WallClock::time_point::min());
        const auto eb = b.expiresAt.value_or(WallClock::time_point::min());
        return ea < eb;
    });

    int cleaned = 0;
    for (const auto& m : candidates) {
        if (total <= cap) break;
        if (inUse && inUse(m.id)) continue;
        const std::string dir = extractDirFor(m.id);
        const uint64_t size = directorySize(dir);
        if (!removeDirRecursive(dir)) continue;
        mounts_.clearExtractedFile(m.id, MountStatus::RequiresExtraction);
        total -= std::min(total, size);
        freedBytes += size;
        cleaned++;
        logInfo("Evicted mount " + m.id + " to stay under the cache size limit", "CACHE");
    }
    return cleaned;
}

bool ExtractionCacheManager::setExpiration(const std::string& mountId, const std::string& extractedFilePath) {
    if (!mounts_.setExtractedFile(mountId, extractedFilePath, expiryFromNow())) {
        logWarn("setExpiration: unknown mount " + mountId, "CACHE");
        return false;
    }
    logDebug("Expiration set for mount " + mountId, "CACHE");
    return true;
}

bool ExtractionCacheManager::refreshExpiration(const std::string& mountId) {
    Mount m;
    if (!mounts_.getMount(mountId, m) || m.extractedFilePath.empty()) return false;
    return mounts_.refreshExpiry(mountId, expiryFromNow());
}

CacheStats ExtractionCacheManager::getStats() const {
    CacheStats stats;
    const auto now = WallClock::now();
    for (const auto& m : mounts_.listMounts()) {
        if (m.extractedFilePath.empty()) continue;
        stats.fileCount++;
        if (m.expiresAt && *m.expiresAt < now) stats.expiredCount++;
    }
    stats.totalSizeBytes = directorySize(baseDir_);
    return stats;
}

bool ExtractionCacheManager::cleanupMount(const std::string& mountId) {
    Mount m;
    if (!mounts_.getMount(mountId, m) || m.extractedFilePath.empty()) return false;
    const std::string dir = extractDirFor(mountId);
    if (!removeDirRecursive(dir)) {
        logError("Failed to clean up mount " + mountId + ": " + dir, "CACHE");
        return false;
    }
    mounts_.clearExtractedFile(mountId, MountStatus::RequiresExtraction);
    logInfo("Cleaned up mount " + mountId, "CACHE");
    return true;
}

} // namespace nzbstream
