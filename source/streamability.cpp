#include "nzbstream/streamability.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/media_types.hpp"
#include "nzbstream/raii.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/util.hpp"

#include <algorithm>
#include <exception>

namespace nzbstream {

ContentPlan classifyContent(const ParsedManifest& manifest) {
    ContentPlan plan;

    const ManifestFile* largestMedia = nullptr;
    const ManifestFile* largestPlain = nullptr;
    bool anyVolume = false;
    for (const auto& f : manifest.files) {
        if (f.isArchiveVolume) {
            anyVolume = true;
            continue;
        }
        if (!largestPlain || f.totalSize > largestPlain->totalSize) largestPlain = &f;
        if (isMediaFile(f.name) && (!largestMedia || f.totalSize > largestMedia->totalSize)) largestMedia = &f;
    }

    if (largestMedia) {
        plan.kind = ContentKind::Direct;
        plan.direct = *largestMedia;
        return plan;
    }
    if (!anyVolume) {
        plan.kind = ContentKind::Direct;
        if (largestPlain) plan.direct = *largestPlain;
        return plan;
    }

    // First volume decides which group is the release.
    const ManifestFile* first = nullptr;
    for (const auto& f : manifest.files) {
        if (!f.isArchiveVolume) continue;
        if (!first || f.volumeNumber.value_or(0) < first->volumeNumber.value_or(0)) first = &f;
    }
    auto groups = groupArchiveVolumes(manifest.files);
    const std::string key = util::toLower(archiveBaseName(first->name));
    auto it = groups.find(key);
    plan.kind = ContentKind::Archive;
    if (it != groups.end()) plan.volumes = it->second;
    return plan;
}

const char* streamArchiveTypeLabel(StreamArchiveType t) {
    switch (t) {
        case StreamArchiveType::None: return "none";
        case StreamArchiveType::Rar: return "rar";
        default: return "unknown";
    }
}

StreamabilityChecker::StreamabilityChecker(ArticleSource& source, size_t headerPeekBytes,
                                           Clock::duration archiveTtl)
    : source_(source), headerPeekBytes_(headerPeekBytes), archives_(archiveTtl) {}

StreamabilityInfo StreamabilityChecker::check(const std::string& mountId, const ParsedManifest& manifest) {
    StreamabilityInfo info;
    const ContentPlan plan = classifyContent(manifest);

    if (plan.kind == ContentKind::Direct) {
        info.canStream = true;
        info.archiveType = StreamArchiveType::None;
        logInfo("Mount " + mountId + " has plain files, streaming directly (" +
                std::to_string(manifest.files.size()) + " files)", "STREAM");
        return info;
    }

    info.archiveType = StreamArchiveType::Rar;
    ArchiveHandle archive;
    ErrorInfo err;
    if (!getOrAssemble(mountId, plan.volumes, archive, err)) {
        info.errorCode = err.code;
        info.reason = err.userMessage;
        switch (err.code) {
            case ErrorCode::RequiresPassword:
                info.requiresPassword = true;
                break;
            case ErrorCode::HeaderParseError:
            case ErrorCode::NoArchiveVolumes:
                // Unknown layout: extraction is the safe route.
                info.requiresExtraction = true;
                info.reason = "Archive headers could not be parsed; extraction required (" + err.userMessage + ")";
                break;
            default:
                break;
        }
        logWarn("Streamability check failed for " + mountId + ": " + describeError(err), "STREAM");
        return info;
    }

    const AssembledArchiveFile* inner = findLargestMediaFile(*archive);
    if (inner && inner->isEncrypted) {
        info.requiresPassword = true;
        info.requiresExtraction = !archive->isStreamable;
        info.errorCode = ErrorCode::RequiresPassword;
        info.reason = "Password required";
        logInfo("Archive for " + mountId + " requires a password", "STREAM");
        return info;
    }

    if (!archive->isStreamable) {
        const AssembledArchiveFile* compressed = nullptr;
        for (const auto& f : archive->files) {
            if (f.compressionMethod != 0) {
                compressed = &f;
                break;
            }
        }
        info.requiresExtraction = true;
        info.errorCode = ErrorCode::RequiresExtraction;
        if (compressed) {
            info.compressionMethod = compressed->compressionMethod;
            info.reason = std::string("Archive uses ") + compressionMethodName(compressed->compressionMethod) +
                          " compression (method " + std::to_string(compressed->compressionMethod) +
                          "); extraction required";
        } else {
            info.reason = "Archive is not streamable; extraction required";
        }
        logInfo("Archive for " + mountId + " requires extraction: " + info.reason, "STREAM");
        return info;
    }

    if (!inner) {
        info.errorCode = ErrorCode::NoMediaFound;
        info.reason = "No media file found inside the archive";
        logWarn("Archive for " + mountId + " contains no media file", "STREAM");
        return info;
    }

    info.canStream = true;
    info.compressionMethod = 0;
    logInfo("Archive for " + mountId + " is streamable (stored, " + std::to_string(archive->volumes.size()) +
            " volumes)", "STREAM");
    return info;
}

bool StreamabilityChecker::getOrAssemble(const std::string& mountId, const std::vector<ManifestFile>& volumes,
                                         ArchiveHandle& out, ErrorInfo& err) {
    if (auto cached = archives_.get(mountId)) {
        out = *cached;
        return true;
    }

    std::shared_future<Outcome> future;
    bool owner = false;
    std::promise<Outcome> promise;
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        auto it = inflight_.find(mountId);
        if (it != inflight_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            inflight_.emplace(mountId, future);
            owner = true;
        }
    }

    if (owner) {
        auto clearInflight = make_scope_guard([this, &mountId] {
            std::lock_guard<std::mutex> lock(inflightMutex_);
            inflight_.erase(mountId);
        });
        Outcome outcome;
        logInfo("Assembling archive for " + mountId + " (" + std::to_string(volumes.size()) + " volumes)", "RAR");
        try {
            auto archive = std::make_shared<AssembledArchive>();
            if (assembleArchive(volumes, source_, *archive, outcome.err, headerPeekBytes_)) {
                outcome.archive = archive;
                archives_.put(mountId, outcome.archive);
            }
        } catch (const std::exception& e) {
            outcome.archive.reset();
            outcome.err = makeError(ErrorCode::Internal, "Archive assembly failed.", e.what());
            logError("Assembly for " + mountId + " threw: " + e.what(), "RAR");
        }
        promise.set_value(outcome);
    }

    const Outcome& result = future.get();
    if (!result.archive) {
        err = result.err;
        return false;
    }
    out = result.archive;
    return true;
}

ArchiveHandle StreamabilityChecker::cachedArchive(const std::string& mountId) const {
    auto cached = archives_.get(mountId);
    return cached ? *cached : ArchiveHandle{};
}

void StreamabilityChecker::cacheArchive(const std::string& mountId, ArchiveHandle archive) {
    archives_.put(mountId, std::move(archive));
}

void StreamabilityChecker::removeCachedArchive(const std::string& mountId) {
    archives_.erase(mountId);
}

size_t StreamabilityChecker::sweepCache() {
    const size_t removed = archives_.sweep();
    if (removed > 0) logDebug("Dropped " + std::to_string(removed) + " cached archive(s)", "STREAM");
    return removed;
}

} // namespace nzbstream
