#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "nzbstream/article_source.hpp"
#include "nzbstream/cancellation.hpp"
#include "nzbstream/download_state.hpp"
#include "nzbstream/errors.hpp"
#include "nzbstream/models.hpp"

namespace nzbstream {

enum class DownloadPhase { Downloading, Complete, Error, Cancelled };

const char* downloadPhaseLabel(DownloadPhase p);

struct DownloadProgress {
    DownloadPhase phase{DownloadPhase::Downloading};
    uint64_t totalBytes{0};      // declared bytes of all segments
    uint64_t downloadedBytes{0}; // bytes on disk, including resumed bytes
    size_t segmentsCompleted{0};
    size_t totalSegments{0};
    double speedBps{0.0};
    double etaSeconds{0.0};
    std::string error;
};

using DownloadProgressFn = std::function<void(const DownloadProgress&)>;

struct DownloadOptions {
    std::string outputPath;
    std::string mountId;
    bool resume{true};
    int concurrency{10};
    std::chrono::milliseconds progressInterval{500};
    DownloadProgressFn onProgress;
    CancellationToken cancel;
};

struct DownloadResult {
    std::string outputPath;
    uint64_t bytesWritten{0};
    size_t segmentsFetched{0}; // fetched during this call
    bool resumed{false};
    bool alreadyComplete{false};
};

// One unit of work: a segment at a global position of the concatenated stream.
struct SegmentTask {
    int index{0};
    Segment segment;
    int fileIndex{0};
    uint64_t offset{0}; // declared offset in the concatenated stream
};

std::vector<SegmentTask> buildSegmentTasks(const std::vector<ManifestFile>& files);

// Fetches every segment of `files` (concatenated in list order) into one output
// file with a bounded worker pool. Fetches complete in any order; bytes reach
// the file strictly in segment order through a reorder buffer.
class SegmentDownloader {
public:
    SegmentDownloader(ArticleSource& source, DownloadStateStore& states);

    bool download(const std::vector<ManifestFile>& files, const DownloadOptions& opts,
                  DownloadResult& out, ErrorInfo& err);

    // Drop the resume record once the caller has consumed the output.
    void cleanupState(const std::string& outputPath);

private:
    ArticleSource& source_;
    DownloadStateStore& states_;
};

} // namespace nzbstream
