#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "nzbstream/models.hpp"

namespace nzbstream {

enum class MountStatus { Pending, Parsing, Ready, RequiresExtraction, Downloading, Extracting, Error, Expired };

const char* mountStatusLabel(MountStatus s);

using WallClock = std::chrono::system_clock;

struct MountProgress {
    std::string phase;
    int downloadPercent{0};
    int extractionPercent{0};
    std::string currentFile;
    std::string error;
};

// Persisted release record. Owned by the embedding application; the pipeline
// only reads it and mutates status, progress and extraction bookkeeping.
struct Mount {
    std::string id;
    std::string manifestHash;
    MountStatus status{MountStatus::Pending};
    std::vector<ManifestFile> mediaFiles;
    uint64_t totalSize{0};
    std::string password; // optional archive password supplied by the user
    std::string extractedFilePath;
    std::optional<WallClock::time_point> expiresAt;
    std::optional<WallClock::time_point> lastAccessedAt;
    int accessCount{0};
    std::optional<MountProgress> extractionProgress;
};

class MountStore {
public:
    virtual ~MountStore() = default;

    virtual bool getMount(const std::string& id, Mount& out) const = 0;
    virtual std::vector<Mount> listMounts() const = 0;
    virtual bool updateStatus(const std::string& id, MountStatus status) = 0;
    // Last-accessed bookkeeping.
    virtual bool touchMount(const std::string& id) = 0;
    virtual bool setExtractionProgress(const std::string& id, const std::optional<MountProgress>& progress) = 0;
    virtual bool setExtractedFile(const std::string& id, const std::string& path, WallClock::time_point expiresAt) = 0;
    // Pushes expiresAt forward and counts an access.
    virtual bool refreshExpiry(const std::string& id, WallClock::time_point expiresAt) = 0;
    // Clears path, expiry and progress and moves the mount to statusAfter.
    virtual bool clearExtractedFile(const std::string& id, MountStatus statusAfter) = 0;
};

// Thread-safe in-process store used by the CLI and tests.
class MemoryMountStore : public MountStore {
public:
    void putMount(const Mount& mount);
    bool removeMount(const std::string& id);

    bool getMount(const std::string& id, Mount& out) const override;
    std::vector<Mount> listMounts() const override;
    bool updateStatus(const std::string& id, MountStatus status) override;
    bool touchMount(const std::string& id) override;
    bool setExtractionProgress(const std::string& id, const std::optional<MountProgress>& progress) override;
    bool setExtractedFile(const std::string& id, const std::string& path, WallClock::time_point expiresAt) override;
    bool refreshExpiry(const std::string& id, WallClock::time_point expiresAt) override;
    bool clearExtractedFile(const std::string& id, MountStatus statusAfter) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Mount> mounts_;
};

} // namespace nzbstream
