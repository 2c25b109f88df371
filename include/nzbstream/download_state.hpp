#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace nzbstream {

// Resumability record for one output file.
struct DownloadState {
    std::string mountId;
    std::string outputPath;
    std::set<int> completedSegments; // global segment indices already flushed to disk
    uint64_t bytesWritten{0};
    int64_t lastUpdated{0}; // unix milliseconds
    bool isComplete{false};
};

// Serialize/deserialize as JSON strings (host-testable).
std::string downloadStateToJson(const DownloadState& s);
bool downloadStateFromJson(const std::string& json, DownloadState& out, std::string& err);

// Highest k such that segments 0..k-1 are all recorded complete.
int contiguousCompletedPrefix(const DownloadState& s);

class DownloadStateStore {
public:
    explicit DownloadStateStore(std::string stateDir);

    // False when no usable record exists for outputPath.
    bool load(const std::string& outputPath, DownloadState& out) const;
    bool save(const DownloadState& state, std::string& err) const;
    void remove(const std::string& outputPath) const;
    std::string pathFor(const std::string& outputPath) const;
    const std::string& directory() const { return stateDir_; }

private:
    std::string stateDir_;
};

} // namespace nzbstream
