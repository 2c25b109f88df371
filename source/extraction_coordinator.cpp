#include "nzbstream/extraction_coordinator.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/media_types.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/segment_downloader.hpp"
#include "nzbstream/streamability.hpp"

#include <algorithm>
#include <filesystem>

namespace nzbstream {

namespace {

int percentOf(uint64_t done, uint64_t total) {
    if (total == 0) return 0;
    return static_cast<int>(std::min<uint64_t>(100, done * 100 / total));
}

MountProgress toMountProgress(const ExtractionUpdate& u) {
    MountProgress p;
    p.phase = extractionStageLabel(u.phase);
    p.downloadPercent = u.downloadPercent;
    p.extractionPercent = u.extractionPercent;
    p.currentFile = u.currentFile;
    p.error = u.error;
    return p;
}

std::string safeName(const std::string& name, const std::string& fallback) {
    const std::string s = sanitizeRelativePath(name);
    if (s.empty()) return fallback;
    return std::filesystem::path(s).filename().string();
}

} // namespace

const char* extractionStageLabel(ExtractionStage s) {
    switch (s) {
        case ExtractionStage::Downloading: return "downloading";
        case ExtractionStage::Extracting: return "extracting";
        case ExtractionStage::Complete: return "complete";
        case ExtractionStage::Error: return "error";
        case ExtractionStage::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

ExtractionCoordinator::ExtractionCoordinator(MountStore& mounts, ArticleSource& source, ExtractionEngine& engine,
                                             ExtractionCacheManager& cache, CoordinatorOptions options)
    : mounts_(mounts),
      source_(source),
      engine_(engine),
      cache_(cache),
      options_(std::move(options)),
      stateDir_(options_.stateDir.empty() ? (std::filesystem::path(options_.baseDir) / ".state").string()
                                          : options_.stateDir),
      states_(stateDir_) {}

ExtractionCoordinator::~ExtractionCoordinator() { shutdown(); }

std::string ExtractionCoordinator::mountDir(const std::string& mountId) const {
    return (std::filesystem::path(options_.baseDir) / mountId).string();
}

std::shared_future<ExtractionOutcome> ExtractionCoordinator::startExtraction(const std::string& mountId,
                                                                             const ParsedManifest& manifest,
                                                                             ExtractionUpdateFn onProgress,
                                                                             const std::string& password) {
    reapFinishedWorkers();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(mountId);
    if (it != active_.end()) {
        logInfo("Extraction already in progress for " + mountId, "COORD");
        return it->second.future;
    }

    Mount mount;
    if (!mounts_.getMount(mountId, mount)) {
        std::promise<ExtractionOutcome> p;
        ExtractionOutcome o;
        o.err = makeError(ErrorCode::MountNotFound, "Mount not found.", mountId);
        p.set_value(o);
        return p.get_future().share();
    }

    std::string pw = password;
    if (pw.empty()) pw = mount.password;
    if (pw.empty()) {
        auto m = manifest.meta.find("password");
        if (m != manifest.meta.end()) pw = m->second;
    }

    std::shared_future<ExtractionOutcome> previous;
    auto drain = draining_.find(mountId);
    if (drain != draining_.end()) previous = drain->second.future;

    auto promise = std::make_shared<std::promise<ExtractionOutcome>>();
    Active active;
    active.generation = nextGeneration_++;
    active.future = promise->get_future().share();
    const uint64_t generation = active.generation;
    const CancellationToken cancel = active.cancel;
    active_.emplace(mountId, active);

    workers_.emplace(generation, std::thread([this, mountId, manifest, onProgress, pw, cancel, promise, generation,
                                              previous] {
        if (previous.valid() && previous.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            logInfo("Waiting for the cancelled run of " + mountId + " to stop", "COORD");
            previous.wait();
        }
        ExtractionOutcome outcome;
        if (cancel.isCancelled()) {
            outcome.err = makeError(ErrorCode::Cancelled, "Extraction was cancelled.");
        } else {
            outcome = runExtraction(mountId, generation, manifest, onProgress, pw, cancel);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto cur = active_.find(mountId);
            if (cur != active_.end() && cur->second.generation == generation) active_.erase(cur);
            auto drained = draining_.find(mountId);
            if (drained != draining_.end() && drained->second.generation == generation) draining_.erase(drained);
        }
        promise->set_value(std::move(outcome));
        finishRun(mountId, generation);
    }));
    return active.future;
}

void ExtractionCoordinator::finishRun(const std::string& mountId, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.push_back(generation);
    logDebug("Extraction worker finished for " + mountId, "COORD");
}

void ExtractionCoordinator::reapFinishedWorkers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t gen : finished_) {
            auto it = workers_.find(gen);
            if (it == workers_.end()) continue;
            done.push_back(std::move(it->second));
            workers_.erase(it);
        }
        finished_.clear();
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

bool ExtractionCoordinator::isCurrentRun(const std::string& mountId, uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(mountId);
    return it == active_.end() || it->second.generation == generation;
}

bool ExtractionCoordinator::cancelExtraction(const std::string& mountId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(mountId);
    if (it == active_.end()) return false;
    it->second.cancel.cancel();
    draining_[mountId] = Draining{it->second.generation, it->second.future};
    active_.erase(it);
    logInfo("Extraction cancelled for " + mountId, "COORD");
    return true;
}

bool ExtractionCoordinator::isExtractionInProgress(const std::string& mountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(mountId) > 0;
}

void ExtractionCoordinator::shutdown() {
    std::map<uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : active_) {
            kv.second.cancel.cancel();
            logInfo("Cancelled extraction on shutdown: " + kv.first, "COORD");
        }
        active_.clear();
        draining_.clear();
        workers.swap(workers_);
        finished_.clear();
    }
    for (auto& kv : workers) {
        if (kv.second.joinable()) kv.second.join();
    }
}

std::string ExtractionCoordinator::getExtractedFilePath(const std::string& mountId) const {
    const std::filesystem::path dir = std::filesystem::path(mountDir(mountId)) / "extracted";
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return {};

    std::string best;
    uint64_t bestSize = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        const std::string path = it->path().string();
        if (!isMediaFile(path)) continue;
        const uint64_t size = it->file_size(fec);
        if (fec) continue;
        if (best.empty() || size > bestSize) {
            best = path;
            bestSize = size;
        }
    }
    return best;
}

bool ExtractionCoordinator::cleanupExtractedFiles(const std::string& mountId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.count(mountId) || draining_.count(mountId)) {
            logWarn("Not cleaning " + mountId + ": extraction in progress", "COORD");
            return false;
        }
    }
    const std::string dir = mountDir(mountId);
    if (!removeDirRecursive(dir)) return false;
    Mount m;
    if (mounts_.getMount(mountId, m) && (!m.extractedFilePath.empty() || m.status == MountStatus::Ready)) {
        mounts_.clearExtractedFile(mountId, MountStatus::RequiresExtraction);
    }
    logInfo("Cleaned up extracted files for " + mountId, "COORD");
    return true;
}

bool ExtractionCoordinator::downloadContent(const std::string& mountId, const ParsedManifest& manifest,
                                            const std::string& downloadDir, const ExtractionUpdateFn& onProgress,
                                            const CancellationToken& cancel, std::vector<std::string>& outPaths,
                                            ErrorInfo& err) {
    // Each entry is one output file built from one or more manifest files.
    std::vector<std::pair<std::string, std::vector<ManifestFile>>> jobs;
    const ContentPlan plan = classifyContent(manifest);
    if (plan.kind == ContentKind::Direct) {
        if (!plan.direct) {
            err = makeError(ErrorCode::InvalidManifest, "Manifest has no downloadable files.");
            return false;
        }
        jobs.emplace_back(safeName(plan.direct->name, "download.bin"), std::vector<ManifestFile>{*plan.direct});
    } else {
        if (plan.volumes.empty()) {
            err = makeError(ErrorCode::NoArchiveVolumes, "No archive volumes to download.");
            return false;
        }
        const VolumeNameInfo first = detectVolumeFromFilename(plan.volumes.front().name);
        if (first.naming == VolumeNaming::Numbered) {
            // Plain byte split: one concatenated file.
            jobs.emplace_back(safeName(first.baseName, "download.bin"), plan.volumes);
        } else {
            for (const auto& v : plan.volumes) jobs.emplace_back(safeName(v.name, "volume.rar"), std::vector<ManifestFile>{v});
        }
    }

    uint64_t grandTotal = 0;
    for (const auto& job : jobs) {
        for (const auto& f : job.second) grandTotal += f.totalSize;
    }

    SegmentDownloader downloader(source_, states_);
    uint64_t finishedBytes = 0;
    for (const auto& job : jobs) {
        const std::string outPath = (std::filesystem::path(downloadDir) / job.first).string();
        DownloadOptions opts;
        opts.outputPath = outPath;
        opts.mountId = mountId;
        opts.resume = true;
        opts.concurrency = options_.downloadConcurrency;
        opts.progressInterval = options_.progressInterval;
        opts.cancel = cancel;
        opts.onProgress = [&](const DownloadProgress& p) {
            if (p.phase != DownloadPhase::Downloading) return;
            ExtractionUpdate u;
            u.phase = ExtractionStage::Downloading;
            u.downloadPercent = percentOf(finishedBytes + p.downloadedBytes, grandTotal);
            u.currentFile = job.first;
            mounts_.setExtractionProgress(mountId, toMountProgress(u));
            if (onProgress) onProgress(u);
        };

        DownloadResult result;
        if (!downloader.download(job.second, opts, result, err)) return false;
        finishedBytes += result.bytesWritten;
        outPaths.push_back(outPath);
    }
    return true;
}

ExtractionOutcome ExtractionCoordinator::runExtraction(const std::string& mountId, uint64_t generation,
                                                       const ParsedManifest& manifest,
                                                       const ExtractionUpdateFn& onProgress,
                                                       const std::string& password, const CancellationToken& cancel) {
    ExtractionOutcome outcome;

    auto report = [&](const ExtractionUpdate& u) {
        mounts_.setExtractionProgress(mountId, toMountProgress(u));
        if (onProgress) onProgress(u);
    };

    auto fail = [&](const ErrorInfo& e) {
        outcome.err = e;
        ExtractionUpdate u;
        u.error = e.userMessage;
        if (isCancellation(e)) {
            u.phase = ExtractionStage::Cancelled;
            logInfo("Extraction cancelled for " + mountId, "COORD");
            if (isCurrentRun(mountId, generation)) {
                mounts_.updateStatus(mountId, MountStatus::RequiresExtraction);
                mounts_.setExtractionProgress(mountId, std::nullopt);
            }
        } else {
            u.phase = ExtractionStage::Error;
            logError("Extraction failed for " + mountId + ": " + describeError(e), "COORD");
            if (isCurrentRun(mountId, generation)) {
                mounts_.updateStatus(mountId, MountStatus::Error);
                mounts_.setExtractionProgress(mountId, toMountProgress(u));
            }
        }
        if (onProgress) onProgress(u);
        return outcome;
    };

    const std::string base = mountDir(mountId);
    const std::string downloadDir = (std::filesystem::path(base) / "download").string();
    const std::string extractDir = (std::filesystem::path(base) / "extracted").string();
    if (!ensureDirectory(downloadDir) || !ensureDirectory(extractDir) || !ensureDirectory(stateDir_)) {
        return fail(makeError(ErrorCode::FilesystemError, "Failed to create working directories.", base));
    }

    mounts_.updateStatus(mountId, MountStatus::Downloading);
    logInfo("Starting download phase for " + mountId + " (" + std::to_string(manifest.files.size()) + " files)",
            "COORD");

    std::vector<std::string> downloaded;
    ErrorInfo err;
    if (!downloadContent(mountId, manifest, downloadDir, onProgress, cancel, downloaded, err)) return fail(err);
    if (cancel.isCancelled()) return fail(makeError(ErrorCode::Cancelled, "Extraction was cancelled."));

    const std::string& primary = downloaded.front();
    logInfo("Download complete for " + mountId + ": " + primary, "COORD");

    ArchiveType type = ArchiveType::Unknown;
    if (!detectArchiveTypeOfFile(primary, type, err)) return fail(err);

    std::string finalPath;
    if (type == ArchiveType::Unknown && isMediaFile(primary)) {
        // Already playable: no extraction pass.
        finalPath = (std::filesystem::path(extractDir) / std::filesystem::path(primary).filename()).string();
        std::string moveErr;
        if (!moveFile(primary, finalPath, moveErr)) {
            return fail(makeError(ErrorCode::FilesystemError, "Failed to move downloaded file.", moveErr));
        }
    } else {
        mounts_.updateStatus(mountId, MountStatus::Extracting);
        logInfo("Starting extraction phase for " + mountId + ": " + primary, "COORD");

        ExtractOptions opts;
        opts.password = password;
        opts.cancel = cancel;
        opts.onProgress = [&](const ExtractionProgress& p) {
            if (p.phase != ExtractionPhase::Extracting) return;
            ExtractionUpdate u;
            u.phase = ExtractionStage::Extracting;
            u.downloadPercent = 100;
            u.extractionPercent = percentOf(p.extractedBytes, p.totalBytes);
            u.currentFile = p.currentFile;
            report(u);
        };

        ExtractResult result;
        if (!engine_.extract(downloaded, extractDir, opts, result, err)) return fail(err);

        const ExtractedFile* best = nullptr;
        for (const auto& f : result.files) {
            if (!isMediaFile(f.diskPath)) continue;
            if (!best || f.size > best->size) best = &f;
        }
        if (!best) return fail(makeError(ErrorCode::NoMediaFound, "No media file found in extracted archive."));
        finalPath = best->diskPath;
    }

    // Downloaded archives are no longer needed once output exists.
    removeDirRecursive(downloadDir);
    for (const auto& p : downloaded) states_.remove(p);

    cache_.setExpiration(mountId, finalPath);
    mounts_.updateStatus(mountId, MountStatus::Ready);
    mounts_.setExtractionProgress(mountId, std::nullopt);

    logInfo("Extraction complete for " + mountId + ": " + finalPath + " (" + std::to_string(fileSize(finalPath)) +
            " bytes)", "COORD");
    ExtractionUpdate done;
    done.phase = ExtractionStage::Complete;
    done.downloadPercent = 100;
    done.extractionPercent = 100;
    if (onProgress) onProgress(done);

    outcome.extractedFilePath = finalPath;
    return outcome;
}

} // namespace nzbstream
