#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include "nzbstream/mount_store.hpp"
#include "nzbstream/scheduler.hpp"

namespace nzbstream {

struct CacheSettings {
    int retentionHours{48};
    int maxCacheSizeGB{0}; // 0 = unbounded
    int sweepIntervalMinutes{60};
    int initialSweepDelaySeconds{10};
};

struct CacheStats {
    int fileCount{0};
    uint64_t totalSizeBytes{0};
    int expiredCount{0};
};

struct CleanupResult {
    int cleaned{0};
    uint64_t freedBytes{0};
};

// Lifecycle of extracted output under <baseDir>/<mountId>/extracted.
class ExtractionCacheManager {
public:
    using InUseFn = std::function<bool(const std::string& mountId)>;

    ExtractionCacheManager(MountStore& mounts, TaskScheduler& scheduler, std::string baseDir,
                           CacheSettings settings = {});
    ~ExtractionCacheManager();

    ExtractionCacheManager(const ExtractionCacheManager&) = delete;
    ExtractionCacheManager& operator=(const ExtractionCacheManager&) = delete;

    // Schedules the periodic sweep plus one shortly after startup.
    void start();
    void stop();

    // Expired mounts first, then orphan directories, then the size cap.
    // Idempotent; concurrent calls are serialized.
    CleanupResult runCleanup();

    bool setExpiration(const std::string& mountId, const std::string& extractedFilePath);
    bool refreshExpiration(const std::string& mountId);
    CacheStats getStats() const;
    bool cleanupMount(const std::string& mountId);
    void updateSettings(const CacheSettings& settings);
    CacheSettings settings() const;

    // Mounts reported in use are never evicted for size.
    void setInUsePredicate(InUseFn fn);

    const std::string& baseDir() const { return baseDir_; }

private:
    int cleanupOrphanedDirectories();
    int enforceSizeLimit(uint64_t& freedBytes);
    WallClock::time_point expiryFromNow() const;
    std::string extractDirFor(const std::string& mountId) const;

    MountStore& mounts_;
    TaskScheduler& scheduler_;
    std::string baseDir_;

    mutable std::mutex settingsMutex_;
    CacheSettings settings_;
    InUseFn inUse_;

    std::mutex cleanupMutex_;
    TaskScheduler::TaskId sweepTask_{0};
    TaskScheduler::TaskId initialTask_{0};
};

} // namespace nzbstream
