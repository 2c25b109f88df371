#include "nzbstream/mount_store.hpp"

namespace nzbstream {

const char* mountStatusLabel(MountStatus s) {
    switch (s) {
        case MountStatus::Pending: return "pending";
        case MountStatus::Parsing: return "parsing";
        case MountStatus::Ready: return "ready";
        case MountStatus::RequiresExtraction: return "requires_extraction";
        case MountStatus::Downloading: return "downloading";
        case MountStatus::Extracting: return "extracting";
        case MountStatus::Error: return "error";
        case MountStatus::Expired: return "expired";
        default: return "unknown";
    }
}

void MemoryMountStore::putMount(const Mount& mount) {
    std::lock_guard<std::mutex> lock(mutex_);
    mounts_[mount.id] = mount;
}

bool MemoryMountStore::removeMount(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return mounts_.erase(id) > 0;
}

bool MemoryMountStore::getMount(const std::string& id, Mount& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    out = it->second;
    return true;
}

std::vector<Mount> MemoryMountStore::listMounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Mount> out;
    out.reserve(mounts_.size());
    for (const auto& kv : mounts_) out.push_back(kv.second);
    return out;
}

bool MemoryMountStore::updateStatus(const std::string& id, MountStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    it->second.status = status;
    return true;
}

bool MemoryMountStore::touchMount(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    it->second.lastAccessedAt = WallClock::now();
    return true;
}

bool MemoryMountStore::setExtractionProgress(const std::string& id, const std::optional<MountProgress>& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    it->second.extractionProgress = progress;
    return true;
}

bool MemoryMountStore::setExtractedFile(const std::string& id, const std::string& path,
                                        WallClock::time_point expiresAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    it->second.extractedFilePath = path;
    it->second.expiresAt = expiresAt;
    return true;
}

bool MemoryMountStore::refreshExpiry(const std::string& id, WallClock::time_point expiresAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    it->second.expiresAt = expiresAt;
    it->second.lastAccessedAt = WallClock::now();
    it->second.accessCount++;
    return true;
}

bool MemoryMountStore::clearExtractedFile(const std::string& id, MountStatus statusAfter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mounts_.find(id);
    if (it == mounts_.end()) return false;
    it->second.extractedFilePath.clear();
    it->second.expiresAt.reset();
    it->second.extractionProgress.reset();
    it->second.status = statusAfter;
    return true;
}

} // namespace nzbstream
