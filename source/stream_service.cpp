#include "nzbstream/stream_service.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/media_types.hpp"
#include "nzbstream/nzb_parser.hpp"
#include "nzbstream/range.hpp"

#include <filesystem>

namespace nzbstream {

ByteStream::ByteStream(std::unique_ptr<RangeReader> reader, uint64_t start, uint64_t length,
                       std::function<void()> onClose)
    : reader_(std::move(reader)), start_(start), length_(length), onClose_(std::move(onClose)) {}

ByteStream::~ByteStream() {
    if (onClose_) onClose_();
}

bool ByteStream::pump(const ByteSink& sink, const CancellationToken& cancel, ErrorInfo& err) {
    if (length_ == 0) return true;
    return reader_->read(start_, start_ + length_ - 1, sink, cancel, err);
}

StreamService::StreamService(MountStore& mounts, ArticleSource& source, StreamabilityChecker& checker,
                             ExtractionCoordinator& coordinator, ExtractionCacheManager& cache,
                             TaskScheduler& scheduler, StreamServiceOptions options)
    : mounts_(mounts),
      source_(source),
      checker_(checker),
      coordinator_(coordinator),
      cache_(cache),
      scheduler_(scheduler),
      options_(options),
      manifests_(options.manifestTtl) {}

StreamService::~StreamService() { stop(); }

void StreamService::start() {
    if (maintenanceTask_ != 0) return;
    cache_.setInUsePredicate([this](const std::string& mountId) { return activeStreamCount(mountId) > 0; });
    maintenanceTask_ = scheduler_.scheduleEvery(options_.maintenanceInterval, [this] {
        const size_t manifests = manifests_.sweep();
        const size_t archives = checker_.sweepCache();
        if (manifests + archives > 0) {
            logDebug("Cache maintenance dropped " + std::to_string(manifests) + " manifest(s), " +
                     std::to_string(archives) + " archive(s)", "STREAM");
        }
    }, options_.maintenanceInterval);
    logInfo("Stream service started", "STREAM");
}

void StreamService::stop() {
    if (maintenanceTask_ != 0) {
        scheduler_.cancel(maintenanceTask_);
        maintenanceTask_ = 0;
        cache_.setInUsePredicate({});
        logInfo("Stream service stopped", "STREAM");
    }
    std::lock_guard<std::mutex> lock(streamsMutex_);
    for (auto& kv : streams_) {
        if (kv.second.cleanupTask != 0) scheduler_.cancel(kv.second.cleanupTask);
        kv.second.cleanupTask = 0;
    }
}

bool StreamService::cacheManifest(const std::string& rawXml, ParsedManifest& out, ErrorInfo& err) {
    if (!parseManifest(rawXml, out, err)) return false;
    manifests_.put(out.contentHash, std::make_shared<const ParsedManifest>(out));
    return true;
}

bool StreamService::getParsedManifest(const Mount& mount, ParsedManifest& out, ErrorInfo& err) {
    if (auto cached = manifests_.get(mount.manifestHash)) {
        out = **cached;
        return true;
    }
    if (!mount.mediaFiles.empty() && !mount.mediaFiles.front().segments.empty()) {
        auto rebuilt = std::make_shared<const ParsedManifest>(buildParsedManifest(mount.manifestHash, mount.mediaFiles));
        manifests_.put(mount.manifestHash, rebuilt);
        out = *rebuilt;
        return true;
    }
    err = makeError(ErrorCode::InvalidManifest, "NZB content not available - mount needs to be recreated.",
                    mount.id);
    return false;
}

bool StreamService::checkStreamability(const std::string& mountId, StreamabilityInfo& out, ErrorInfo& err) {
    Mount mount;
    if (!mounts_.getMount(mountId, mount)) {
        err = makeError(ErrorCode::MountNotFound, "Mount not found.", mountId);
        return false;
    }
    ParsedManifest manifest;
    if (!getParsedManifest(mount, manifest, err)) return false;
    out = checker_.check(mountId, manifest);
    return true;
}

std::shared_future<ExtractionOutcome> StreamService::startExtraction(const std::string& mountId,
                                                                     ExtractionUpdateFn onProgress,
                                                                     const std::string& password) {
    Mount mount;
    ParsedManifest manifest;
    ExtractionOutcome failed;
    if (!mounts_.getMount(mountId, mount)) {
        failed.err = makeError(ErrorCode::MountNotFound, "Mount not found.", mountId);
    } else if (getParsedManifest(mount, manifest, failed.err)) {
        return coordinator_.startExtraction(mountId, manifest, std::move(onProgress), password);
    }
    std::promise<ExtractionOutcome> p;
    p.set_value(failed);
    return p.get_future().share();
}

bool StreamService::cancelExtraction(const std::string& mountId) { return coordinator_.cancelExtraction(mountId); }

bool StreamService::isExtractionInProgress(const std::string& mountId) const {
    return coordinator_.isExtractionInProgress(mountId);
}

bool StreamService::cleanupExtractedFiles(const std::string& mountId) {
    return coordinator_.cleanupExtractedFiles(mountId);
}

bool StreamService::isReady() const { return source_.status() == SourceStatus::Ready; }

StreamServiceStatus StreamService::getStatus() const {
    StreamServiceStatus st;
    st.sourceStatus = source_.status();
    st.ready = st.sourceStatus == SourceStatus::Ready;
    st.providers = source_.getStats();
    std::lock_guard<std::mutex> lock(streamsMutex_);
    for (const auto& kv : streams_) {
        if (kv.second.active > 0) st.activeStreams[kv.first] = kv.second.active;
    }
    return st;
}

int StreamService::activeStreamCount(const std::string& mountId) const {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    auto it = streams_.find(mountId);
    return it == streams_.end() ? 0 : it->second.active;
}

bool StreamService::createStream(const std::string& mountId, int fileIndex, const std::string& rangeHeader,
                                 StreamResult& out, ErrorInfo& err) {
    Mount mount;
    if (!mounts_.getMount(mountId, mount)) {
        err = makeError(ErrorCode::MountNotFound, "Mount not found.", mountId);
        return false;
    }

    // Output on disk only counts once a run has registered it; a run in
    // flight or a cancelled one leaves partial files behind.
    const bool busy = mount.status == MountStatus::Downloading || mount.status == MountStatus::Extracting ||
                      coordinator_.isExtractionInProgress(mountId);
    if (!busy && !mount.extractedFilePath.empty()) {
        const std::string extracted = coordinator_.getExtractedFilePath(mountId);
        if (!extracted.empty() && fileExists(extracted)) {
            logInfo("Streaming " + mountId + " from extracted file " + extracted, "STREAM");
            return createExtractedFileStream(mountId, extracted, rangeHeader, out, err);
        }
    }

    switch (mount.status) {
        case MountStatus::RequiresExtraction:
            err = makeError(ErrorCode::RequiresExtraction,
                            "Content requires extraction before streaming. Start extraction first.", mountId);
            return false;
        case MountStatus::Downloading:
        case MountStatus::Extracting:
            err = makeError(ErrorCode::MountNotReady,
                            std::string("Extraction in progress: ") + mountStatusLabel(mount.status), mountId);
            return false;
        case MountStatus::Ready:
            break;
        default:
            err = makeError(ErrorCode::MountNotReady, std::string("Mount not ready: ") + mountStatusLabel(mount.status),
                            mountId);
            err.retryable = false;
            return false;
    }

    ParsedManifest manifest;
    if (!getParsedManifest(mount, manifest, err)) return false;
    const ContentPlan plan = classifyContent(manifest);
    mounts_.touchMount(mountId);

    if (plan.kind == ContentKind::Archive) {
        return createArchiveStream(mountId, manifest, plan, rangeHeader, out, err);
    }

    const ManifestFile* file = nullptr;
    for (const auto& f : manifest.files) {
        if (f.index == fileIndex) {
            file = &f;
            break;
        }
    }
    if (!file) {
        err = makeError(ErrorCode::FileNotFound, "File not found at index " + std::to_string(fileIndex) + ".",
                        mountId);
        return false;
    }
    auto reader = std::make_unique<SegmentRangeReader>(source_, *file, options_.prefetchSegments);
    return finishResult(mountId, std::move(reader), file->name, rangeHeader, false, out, err);
}

bool StreamService::createArchiveStream(const std::string& mountId, const ParsedManifest& manifest,
                                        const ContentPlan& plan, const std::string& rangeHeader, StreamResult& out,
                                        ErrorInfo& err) {
    ArchiveHandle archive;
    if (!checker_.getOrAssemble(mountId, plan.volumes, archive, err)) return false;

    if (!archive->isStreamable && !archive->isEncrypted) {
        err = makeError(ErrorCode::RequiresExtraction,
                        "This release uses archive compression and cannot be streamed directly.", mountId);
        return false;
    }
    const AssembledArchiveFile* inner = findLargestMediaFile(*archive);
    if (!inner) {
        err = makeError(ErrorCode::NoMediaFound, "No media file found inside the archive.", mountId);
        return false;
    }
    if (inner->isEncrypted || archive->isEncrypted) {
        err = makeError(ErrorCode::RequiresPassword, "This release is password protected.", inner->name);
        return false;
    }

    std::vector<ManifestFile> volumeFiles;
    for (const auto& v : archive->volumes) {
        const ManifestFile* match = nullptr;
        for (const auto& f : manifest.files) {
            if (f.index == v.manifestFileIndex) {
                match = &f;
                break;
            }
        }
        if (!match) {
            err = makeError(ErrorCode::Internal, "Archive volume is missing from the manifest.",
                            std::to_string(v.manifestFileIndex));
            return false;
        }
        volumeFiles.push_back(*match);
    }

    auto reader = std::make_unique<ArchiveRangeReader>(source_, archive, *inner, std::move(volumeFiles),
                                                       options_.prefetchSegments);
    logInfo("Archive stream for " + mountId + ": " + inner->name + " across " +
            std::to_string(archive->volumes.size()) + " volume(s)", "STREAM");
    return finishResult(mountId, std::move(reader), inner->name, rangeHeader, false, out, err);
}

bool StreamService::createExtractedFileStream(const std::string& mountId, const std::string& path,
                                              const std::string& rangeHeader, StreamResult& out, ErrorInfo& err) {
    std::unique_ptr<LocalFileRangeReader> reader = LocalFileRangeReader::open(path, err);
    if (!reader) return false;
    if (!finishResult(mountId, std::move(reader), path, rangeHeader, true, out, err)) return false;
    cache_.refreshExpiration(mountId);
    mounts_.touchMount(mountId);
    return true;
}

bool StreamService::finishResult(const std::string& mountId, std::unique_ptr<RangeReader> reader,
                                 const std::string& name, const std::string& rangeHeader, bool hasExtractedFile,
                                 StreamResult& out, ErrorInfo& err) {
    const uint64_t total = reader->size();
    const RangeRequest range = parseRangeHeader(rangeHeader, total);
    if (range.kind == RangeKind::Unsatisfiable) {
        err = makeError(ErrorCode::RangeNotSatisfiable, "Requested range not satisfiable.",
                        rangeHeader + " of " + std::to_string(total));
        return false;
    }

    trackStreamStart(mountId, hasExtractedFile);
    out.stream = std::make_unique<ByteStream>(std::move(reader), range.start, range.length,
                                              [this, mountId] { trackStreamEnd(mountId); });
    out.contentLength = range.length;
    out.startByte = range.start;
    out.endByte = range.end;
    out.totalSize = total;
    out.isPartial = range.kind == RangeKind::Partial;
    out.contentType = contentTypeFor(name);
    out.fileName = std::filesystem::path(name).filename().string();

    logInfo("Stream " + mountId + " " + out.fileName + " " +
            (out.isPartial ? std::to_string(out.startByte) + "-" + std::to_string(out.endByte) : std::string("full")) +
            " (" + out.contentType + ")", "STREAM");
    return true;
}

void StreamService::trackStreamStart(const std::string& mountId, bool hasExtractedFile) {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    MountStreams& st = streams_[mountId];
    if (st.cleanupTask != 0) {
        scheduler_.cancel(st.cleanupTask);
        st.cleanupTask = 0;
        logDebug("Deferred cleanup cancelled for " + mountId, "STREAM");
    }
    st.cleanupSeq++;
    st.active++;
    st.hasExtractedFile = st.hasExtractedFile || hasExtractedFile;
    logDebug("Stream started for " + mountId + " (active " + std::to_string(st.active) + ")", "STREAM");
}

void StreamService::trackStreamEnd(const std::string& mountId) {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    auto it = streams_.find(mountId);
    if (it == streams_.end()) return;
    MountStreams& st = it->second;
    if (st.active > 0) st.active--;
    logDebug("Stream ended for " + mountId + " (active " + std::to_string(st.active) + ")", "STREAM");

    if (st.active > 0) return;
    if (!st.hasExtractedFile) {
        streams_.erase(it);
        return;
    }
    if (st.cleanupTask != 0) scheduler_.cancel(st.cleanupTask);
    const uint64_t seq = ++st.cleanupSeq;
    st.cleanupTask = scheduler_.scheduleAfter(options_.cleanupDelay,
                                              [this, mountId, seq] { runDeferredCleanup(mountId, seq); });
    logInfo("Scheduled extracted file cleanup for " + mountId + " in " +
            std::to_string(options_.cleanupDelay.count()) + " ms", "STREAM");
}

void StreamService::runDeferredCleanup(const std::string& mountId, uint64_t seq) {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    auto it = streams_.find(mountId);
    if (it == streams_.end()) return;
    if (it->second.active != 0 || it->second.cleanupSeq != seq) return;

    logInfo("Cleaning up extracted files for " + mountId + " after streams ended", "STREAM");
    if (!coordinator_.cleanupExtractedFiles(mountId)) {
        logError("Deferred cleanup failed for " + mountId, "STREAM");
        it->second.cleanupTask = 0;
        return;
    }
    checker_.removeCachedArchive(mountId);
    streams_.erase(it);
}

} // namespace nzbstream
