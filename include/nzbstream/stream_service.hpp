#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "nzbstream/article_source.hpp"
#include "nzbstream/byte_range_reader.hpp"
#include "nzbstream/errors.hpp"
#include "nzbstream/extraction_cache.hpp"
#include "nzbstream/extraction_coordinator.hpp"
#include "nzbstream/models.hpp"
#include "nzbstream/mount_store.hpp"
#include "nzbstream/scheduler.hpp"
#include "nzbstream/streamability.hpp"
#include "nzbstream/ttl_cache.hpp"

namespace nzbstream {

struct StreamServiceOptions {
    int prefetchSegments{kDefaultPrefetchSegments};
    // Delay between the last stream of a mount ending and its extracted output being removed.
    std::chrono::milliseconds cleanupDelay{std::chrono::minutes(2)};
    std::chrono::milliseconds manifestTtl{std::chrono::minutes(60)};
    std::chrono::milliseconds maintenanceInterval{std::chrono::minutes(5)};
};

// A resolved range ready to be pumped into a consumer. Destroying it ends the
// stream for reference counting; it must not outlive the StreamService.
class ByteStream {
public:
    ByteStream(std::unique_ptr<RangeReader> reader, uint64_t start, uint64_t length,
               std::function<void()> onClose = {});
    ~ByteStream();

    ByteStream(const ByteStream&) = delete;
    ByteStream& operator=(const ByteStream&) = delete;

    bool pump(const ByteSink& sink, const CancellationToken& cancel, ErrorInfo& err);

private:
    std::unique_ptr<RangeReader> reader_;
    uint64_t start_{0};
    uint64_t length_{0};
    std::function<void()> onClose_;
};

struct StreamResult {
    std::unique_ptr<ByteStream> stream;
    uint64_t contentLength{0};
    uint64_t startByte{0};
    uint64_t endByte{0};
    uint64_t totalSize{0};
    bool isPartial{false};
    std::string contentType;
    std::string fileName;
};

struct StreamServiceStatus {
    bool ready{false};
    SourceStatus sourceStatus{SourceStatus::Pending};
    std::vector<ProviderStats> providers;
    std::map<std::string, int> activeStreams;
};

// Entry point for serving a mount: extracted file first, then direct or
// archive-internal streaming from the article source.
class StreamService {
public:
    StreamService(MountStore& mounts, ArticleSource& source, StreamabilityChecker& checker,
                  ExtractionCoordinator& coordinator, ExtractionCacheManager& cache, TaskScheduler& scheduler,
                  StreamServiceOptions options = {});
    ~StreamService();

    StreamService(const StreamService&) = delete;
    StreamService& operator=(const StreamService&) = delete;

    void start();
    void stop();

    bool createStream(const std::string& mountId, int fileIndex, const std::string& rangeHeader,
                      StreamResult& out, ErrorInfo& err);

    bool cacheManifest(const std::string& rawXml, ParsedManifest& out, ErrorInfo& err);
    bool getParsedManifest(const Mount& mount, ParsedManifest& out, ErrorInfo& err);
    bool checkStreamability(const std::string& mountId, StreamabilityInfo& out, ErrorInfo& err);

    std::shared_future<ExtractionOutcome> startExtraction(const std::string& mountId, ExtractionUpdateFn onProgress = {},
                                                          const std::string& password = {});
    bool cancelExtraction(const std::string& mountId);
    bool isExtractionInProgress(const std::string& mountId) const;
    bool cleanupExtractedFiles(const std::string& mountId);

    bool isReady() const;
    StreamServiceStatus getStatus() const;
    int activeStreamCount(const std::string& mountId) const;

private:
    struct MountStreams {
        int active{0};
        bool hasExtractedFile{false};
        TaskScheduler::TaskId cleanupTask{0};
        uint64_t cleanupSeq{0}; // identifies the latest scheduled cleanup
    };

    bool createExtractedFileStream(const std::string& mountId, const std::string& path,
                                   const std::string& rangeHeader, StreamResult& out, ErrorInfo& err);
    bool createArchiveStream(const std::string& mountId, const ParsedManifest& manifest, const ContentPlan& plan,
                             const std::string& rangeHeader, StreamResult& out, ErrorInfo& err);
    bool finishResult(const std::string& mountId, std::unique_ptr<RangeReader> reader, const std::string& name,
                      const std::string& rangeHeader, bool hasExtractedFile, StreamResult& out, ErrorInfo& err);

    void trackStreamStart(const std::string& mountId, bool hasExtractedFile);
    void trackStreamEnd(const std::string& mountId);
    void runDeferredCleanup(const std::string& mountId, uint64_t seq);

    MountStore& mounts_;
    ArticleSource& source_;
    StreamabilityChecker& checker_;
    ExtractionCoordinator& coordinator_;
    ExtractionCacheManager& cache_;
    TaskScheduler& scheduler_;
    StreamServiceOptions options_;

    TtlCache<std::string, std::shared_ptr<const ParsedManifest>> manifests_;
    TaskScheduler::TaskId maintenanceTask_{0};

    mutable std::mutex streamsMutex_;
    std::map<std::string, MountStreams> streams_;
};

} // namespace nzbstream
