#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "nzbstream/article_source.hpp"
#include "nzbstream/errors.hpp"
#include "nzbstream/models.hpp"
#include "nzbstream/rar_assembler.hpp"
#include "nzbstream/ttl_cache.hpp"

namespace nzbstream {

enum class ContentKind { Direct, Archive };

// How a manifest's content is served:
// - Direct: plain files exist (media preferred); `direct` is the largest one.
// - Archive: only archive volumes matter; `volumes` is the group of the first
//   volume, ordered by volume number. Auxiliary files are ignored.
struct ContentPlan {
    ContentKind kind{ContentKind::Direct};
    std::optional<ManifestFile> direct;
    std::vector<ManifestFile> volumes;
};

ContentPlan classifyContent(const ParsedManifest& manifest);

enum class StreamArchiveType { None, Rar };

const char* streamArchiveTypeLabel(StreamArchiveType t);

struct StreamabilityInfo {
    bool canStream{false};
    bool requiresExtraction{false};
    bool requiresPassword{false};
    StreamArchiveType archiveType{StreamArchiveType::None};
    std::optional<int> compressionMethod;
    std::string reason;
    ErrorCode errorCode{ErrorCode::None};
};

using ArchiveHandle = std::shared_ptr<const AssembledArchive>;

// Decides direct streaming vs. extraction and keeps the assembled archive
// per mount so the streaming path does not re-read volume headers.
class StreamabilityChecker {
public:
    using Clock = std::chrono::steady_clock;

    StreamabilityChecker(ArticleSource& source, size_t headerPeekBytes = kDefaultHeaderPeekBytes,
                         Clock::duration archiveTtl = std::chrono::minutes(60));

    StreamabilityInfo check(const std::string& mountId, const ParsedManifest& manifest);

    // Cached archive, or assemble it. Concurrent callers for the same mount
    // share one assembly.
    bool getOrAssemble(const std::string& mountId, const std::vector<ManifestFile>& volumes,
                       ArchiveHandle& out, ErrorInfo& err);

    ArchiveHandle cachedArchive(const std::string& mountId) const;
    void cacheArchive(const std::string& mountId, ArchiveHandle archive);
    void removeCachedArchive(const std::string& mountId);
    size_t sweepCache();

private:
    struct Outcome {
        ArchiveHandle archive;
        ErrorInfo err;
    };

    ArticleSource& source_;
    size_t headerPeekBytes_;
    TtlCache<std::string, ArchiveHandle> archives_;

    std::mutex inflightMutex_;
    std::map<std::string, std::shared_future<Outcome>> inflight_;
};

} // namespace nzbstream
