#include "nzbstream/segment_downloader.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/raii.hpp"
#include "nzbstream/util.hpp"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace nzbstream {

namespace {

constexpr size_t kStateSaveEvery = 64;           // flushed segments between state saves
constexpr size_t kReorderWindowFactor = 4;       // max segments in flight ahead of the writer
constexpr uint64_t kFreeSpaceMarginBytes = 64ULL * 1024ULL * 1024ULL;
constexpr size_t kWriteBufferBytes = 256 * 1024;

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Shared between workers; every field is guarded by mutex.
struct DownloadRun {
    std::mutex mutex;
    std::condition_variable cv;
    std::map<int, std::string> pending; // fetched but not yet written, keyed by global index
    int nextTask{0};
    int nextToWrite{0};
    bool failed{false};
    bool cancelled{false};
    ErrorInfo firstError;
    uint64_t bytesWritten{0};
    uint64_t sessionBytes{0};
    size_t segmentsFetched{0};
    size_t sinceSave{0};
};

} // namespace

const char* downloadPhaseLabel(DownloadPhase p) {
    switch (p) {
        case DownloadPhase::Downloading: return "downloading";
        case DownloadPhase::Complete: return "complete";
        case DownloadPhase::Error: return "error";
        case DownloadPhase::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

std::vector<SegmentTask> buildSegmentTasks(const std::vector<ManifestFile>& files) {
    std::vector<SegmentTask> tasks;
    uint64_t offset = 0;
    int index = 0;
    for (size_t f = 0; f < files.size(); ++f) {
        for (const auto& seg : files[f].segments) {
            SegmentTask t;
            t.index = index++;
            t.segment = seg;
            t.fileIndex = static_cast<int>(f);
            t.offset = offset;
            offset += seg.byteSize;
            tasks.push_back(std::move(t));
        }
    }
    return tasks;
}

SegmentDownloader::SegmentDownloader(ArticleSource& source, DownloadStateStore& states)
    : source_(source), states_(states) {}

void SegmentDownloader::cleanupState(const std::string& outputPath) {
    states_.remove(outputPath);
}

bool SegmentDownloader::download(const std::vector<ManifestFile>& files, const DownloadOptions& opts,
                                 DownloadResult& out, ErrorInfo& err) {
    out = DownloadResult{};
    out.outputPath = opts.outputPath;

    const std::vector<SegmentTask> tasks = buildSegmentTasks(files);
    const int total = static_cast<int>(tasks.size());
    uint64_t totalBytes = 0;
    for (const auto& t : tasks) totalBytes += t.segment.byteSize;

    DownloadProgress progress;
    progress.totalBytes = totalBytes;
    progress.totalSegments = tasks.size();

    auto emitFinal = [&](DownloadPhase phase, uint64_t written, size_t done, const std::string& error) {
        if (!opts.onProgress) return;
        DownloadProgress p = progress;
        p.phase = phase;
        p.downloadedBytes = written;
        p.segmentsCompleted = done;
        p.error = error;
        opts.onProgress(p);
    };

    if (opts.outputPath.empty()) {
        err = makeError(ErrorCode::Internal, "Download output path is empty.");
        return false;
    }
    if (total == 0) {
        err = makeError(ErrorCode::InvalidManifest, "Nothing to download: files have no segments.");
        emitFinal(DownloadPhase::Error, 0, 0, err.userMessage);
        return false;
    }

    DownloadState state;
    state.mountId = opts.mountId;
    state.outputPath = opts.outputPath;
    int startIndex = 0;
    uint64_t startBytes = 0;

    if (opts.resume) {
        DownloadState prior;
        if (states_.load(opts.outputPath, prior)) {
            if (prior.isComplete && fileExists(opts.outputPath)) {
                logInfo("Already complete: " + opts.outputPath, "DL");
                out.bytesWritten = fileSize(opts.outputPath);
                out.alreadyComplete = true;
                emitFinal(DownloadPhase::Complete, out.bytesWritten, tasks.size(), {});
                return true;
            }
            const int prefix = contiguousCompletedPrefix(prior);
            const bool contiguous = static_cast<size_t>(prefix) == prior.completedSegments.size();
            if (!prior.isComplete && contiguous && prefix > 0 && prefix <= total &&
                fileSize(opts.outputPath) >= prior.bytesWritten) {
                startIndex = prefix;
                startBytes = prior.bytesWritten;
                state.completedSegments = prior.completedSegments;
                out.resumed = true;
                logInfo("Resuming " + opts.outputPath + " at segment " + std::to_string(startIndex) + "/" +
                        std::to_string(total) + " (" + util::formatBytes(startBytes) + ")", "DL");
            } else {
                logWarn("Discarding unusable download state for " + opts.outputPath, "DL");
            }
        }
    }

    const std::filesystem::path outPath(opts.outputPath);
    if (!outPath.parent_path().empty() && !ensureDirectory(outPath.parent_path().string())) {
        err = makeError(ErrorCode::FilesystemError, "Failed to create download directory.", outPath.parent_path().string());
        emitFinal(DownloadPhase::Error, 0, 0, err.userMessage);
        return false;
    }

    std::vector<char> ioBuf(kWriteBufferBytes);
    UniqueFile file;
    if (out.resumed) {
        if (::truncate(opts.outputPath.c_str(), static_cast<off_t>(startBytes)) != 0) {
            err = makeError(ErrorCode::FilesystemError, "Failed to prepare partial download.", "truncate failed: " + opts.outputPath);
            emitFinal(DownloadPhase::Error, 0, 0, err.userMessage);
            return false;
        }
        file = UniqueFile::open(opts.outputPath, "r+b");
        if (file) {
            std::setvbuf(file.f, ioBuf.data(), _IOFBF, ioBuf.size());
            if (std::fseek(file.f, 0, SEEK_END) != 0) file.reset();
        }
    } else {
        file = UniqueFile::open(opts.outputPath, "wb");
        if (file) std::setvbuf(file.f, ioBuf.data(), _IOFBF, ioBuf.size());
    }
    if (!file) {
        err = makeError(ErrorCode::FilesystemError, "Failed to open download output.", "open failed: " + opts.outputPath);
        emitFinal(DownloadPhase::Error, startBytes, static_cast<size_t>(startIndex), err.userMessage);
        return false;
    }

    const uint64_t remainingDeclared = totalBytes > startBytes ? totalBytes - startBytes : 0;
    const uint64_t freeBytes = getFreeSpace(outPath.parent_path().empty() ? "." : outPath.parent_path().string());
    if (freeBytes > 0 && freeBytes < remainingDeclared) {
        err = makeError(ErrorCode::FilesystemError, "Not enough free space for download.",
                        "need " + util::formatBytes(remainingDeclared) + ", have " + util::formatBytes(freeBytes));
        emitFinal(DownloadPhase::Error, startBytes, static_cast<size_t>(startIndex), err.userMessage);
        return false;
    }
    if (freeBytes > 0 && freeBytes < remainingDeclared + kFreeSpaceMarginBytes) {
        logWarn("Low free space for " + opts.outputPath + ": " + util::formatBytes(freeBytes), "DL");
    }

    DownloadRun run;
    run.nextTask = startIndex;
    run.nextToWrite = startIndex;
    run.bytesWritten = startBytes;

    const int concurrency = std::max(1, opts.concurrency);
    const int window = concurrency * static_cast<int>(kReorderWindowFactor);
    const auto started = std::chrono::steady_clock::now();

    std::mutex progressMutex;
    auto lastEmit = std::chrono::steady_clock::time_point{};
    auto lastBeat = started;
    uint64_t lastReported = 0;

    auto saveState = [&]() {
        // caller holds run.mutex
        std::fflush(file.f);
        state.bytesWritten = run.bytesWritten;
        state.lastUpdated = nowMillis();
        std::string serr;
        if (!states_.save(state, serr)) logWarn("Could not persist download state: " + serr, "DL");
    };

    auto reportProgress = [&](uint64_t written, uint64_t sessionBytes, size_t done) {
        std::lock_guard<std::mutex> lock(progressMutex);
        if (written < lastReported) return; // a later flush already reported
        lastReported = written;
        const auto now = std::chrono::steady_clock::now();
        if (now - lastBeat > std::chrono::seconds(10)) {
            logDebug("Heartbeat: " + opts.outputPath + " " + std::to_string(done) + "/" + std::to_string(total) +
                     " segments, " + util::formatBytes(written) + "/" + util::formatBytes(totalBytes), "DL");
            lastBeat = now;
        }
        if (!opts.onProgress) return;
        if (lastEmit != std::chrono::steady_clock::time_point{} && now - lastEmit < opts.progressInterval) return;
        lastEmit = now;

        const double elapsed = std::chrono::duration<double>(now - started).count();
        DownloadProgress p = progress;
        p.phase = DownloadPhase::Downloading;
        p.downloadedBytes = written;
        p.segmentsCompleted = done;
        p.speedBps = elapsed > 0.0 ? static_cast<double>(sessionBytes) / elapsed : 0.0;
        p.etaSeconds = (p.speedBps > 0.0 && totalBytes > written)
                           ? static_cast<double>(totalBytes - written) / p.speedBps
                           : 0.0;
        opts.onProgress(p);
    };

    auto worker = [&]() {
        while (true) {
            int idx = 0;
            {
                std::unique_lock<std::mutex> lock(run.mutex);
                while (!run.failed && !run.cancelled && run.nextTask < total &&
                       run.nextTask >= run.nextToWrite + window) {
                    if (opts.cancel.isCancelled()) break;
                    run.cv.wait_for(lock, std::chrono::milliseconds(100));
                }
                if (run.failed || run.cancelled || run.nextTask >= total) break;
                if (opts.cancel.isCancelled()) {
                    run.cancelled = true;
                    run.cv.notify_all();
                    break;
                }
                idx = run.nextTask++;
            }

            std::string data;
            ErrorInfo fetchErr;
            const bool ok = source_.getDecodedArticle(tasks[idx].segment.messageId, data, fetchErr);

            uint64_t written = 0, session = 0;
            size_t done = 0;
            {
                std::lock_guard<std::mutex> lock(run.mutex);
                if (!ok) {
                    if (!run.failed && !run.cancelled) {
                        run.failed = true;
                        run.firstError = fetchErr;
                        run.firstError.code = ErrorCode::TransportError;
                        run.firstError.category = ErrorCategory::Transport;
                        run.firstError.retryable = true;
                        if (run.firstError.userMessage.empty()) run.firstError.userMessage = "Failed to fetch segment.";
                        run.firstError.detail = "segment " + std::to_string(tasks[idx].segment.number) + " of file " +
                                                std::to_string(tasks[idx].fileIndex) + " (" +
                                                tasks[idx].segment.messageId + "): " + fetchErr.detail;
                    }
                    run.cv.notify_all();
                    break;
                }
                run.sessionBytes += data.size();
                run.segmentsFetched++;
                run.pending.emplace(idx, std::move(data));

                // Flush the contiguous run starting at nextToWrite.
                for (auto it = run.pending.find(run.nextToWrite); it != run.pending.end() && !run.failed;
                     it = run.pending.find(run.nextToWrite)) {
                    const std::string& bytes = it->second;
                    if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), file.f) != bytes.size()) {
                        run.failed = true;
                        run.firstError = makeError(ErrorCode::FilesystemError, "Failed to write download output.",
                                                   "write failed: " + opts.outputPath);
                        break;
                    }
                    run.bytesWritten += bytes.size();
                    state.completedSegments.insert(run.nextToWrite);
                    run.pending.erase(it);
                    run.nextToWrite++;
                    if (++run.sinceSave >= kStateSaveEvery) {
                        run.sinceSave = 0;
                        saveState();
                    }
                }
                written = run.bytesWritten;
                session = run.sessionBytes;
                done = static_cast<size_t>(run.nextToWrite);
                run.cv.notify_all();
                if (run.failed) break;
            }
            reportProgress(written, session, done);
        }
    };

    const int workerCount = std::min(concurrency, total - startIndex);
    logInfo("Downloading " + std::to_string(total - startIndex) + " segment(s) -> " + opts.outputPath +
            " with " + std::to_string(workerCount) + " worker(s)", "DL");
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(std::max(0, workerCount)));
    for (int i = 0; i < workerCount; ++i) workers.emplace_back(worker);
    for (auto& t : workers) t.join();

    out.segmentsFetched = run.segmentsFetched;
    out.bytesWritten = run.bytesWritten;
    const size_t done = static_cast<size_t>(run.nextToWrite);

    if (run.failed || run.cancelled || run.nextToWrite < total) {
        saveState();
        if (!file.close()) logWarn("Closing partial download failed: " + opts.outputPath, "DL");
        if (run.failed) {
            err = run.firstError;
            logError("Download failed: " + describeError(err), "DL");
            emitFinal(DownloadPhase::Error, run.bytesWritten, done, err.userMessage);
        } else {
            err = makeError(ErrorCode::Cancelled, "Download cancelled.", opts.outputPath);
            logInfo("Download cancelled at segment " + std::to_string(done) + "/" + std::to_string(total), "DL");
            emitFinal(DownloadPhase::Cancelled, run.bytesWritten, done, err.userMessage);
        }
        return false;
    }

    if (!file.close()) {
        err = makeError(ErrorCode::FilesystemError, "Failed to finalize download output.", "close failed: " + opts.outputPath);
        state.bytesWritten = run.bytesWritten;
        emitFinal(DownloadPhase::Error, run.bytesWritten, done, err.userMessage);
        return false;
    }
    state.isComplete = true;
    state.bytesWritten = run.bytesWritten;
    state.lastUpdated = nowMillis();
    std::string serr;
    if (!states_.save(state, serr)) logWarn("Could not persist completed download state: " + serr, "DL");

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    logInfo("Download complete: " + opts.outputPath + " " + util::formatBytes(run.bytesWritten) + " in " +
            std::to_string(static_cast<int>(elapsed)) + "s", "DL");
    emitFinal(DownloadPhase::Complete, run.bytesWritten, done, {});
    return true;
}

} // namespace nzbstream
