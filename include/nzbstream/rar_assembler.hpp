#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "nzbstream/article_source.hpp"
#include "nzbstream/errors.hpp"
#include "nzbstream/models.hpp"
#include "nzbstream/rar_header.hpp"

namespace nzbstream {

constexpr size_t kDefaultHeaderPeekBytes = 64 * 1024;

struct Span {
    int volumeIndex{0};            // index into AssembledArchive::volumes
    uint64_t volumeByteOffset{0};  // byte offset inside that volume
    uint64_t logicalFileOffset{0}; // byte offset inside the assembled file
    uint64_t length{0};
};

struct VolumeInfo {
    int volumeNumber{0};
    std::string baseName;
    ArchiveVolumeHeader header;
    int manifestFileIndex{0};
};

struct AssembledArchiveFile {
    std::string name;
    uint64_t size{0};
    bool isEncrypted{false};
    int compressionMethod{0};
    std::vector<Span> spans; // ordered by logicalFileOffset
};

struct AssembledArchive {
    std::string baseName;
    std::vector<VolumeInfo> volumes;
    std::vector<AssembledArchiveFile> files;
    uint64_t totalSize{0};
    bool isEncrypted{false};
    bool isStreamable{false}; // every entry stored and none encrypted
};

struct VolumePosition {
    int volumeIndex{0};
    uint64_t volumeByteOffset{0};
};

// Leading bytes of a manifest file: whole segments until peekBytes is reached.
// Only a failure on the first segment is an error; later failures truncate.
bool fetchHeaderPrefix(const ManifestFile& file, ArticleSource& source, size_t peekBytes,
                       std::string& out, ErrorInfo& err);

// Merge per-volume headers of `volumes` (ordered by volume number) into one
// logical archive. No partial assembly: any volume failure fails the whole call.
bool assembleArchive(const std::vector<ManifestFile>& volumes, ArticleSource& source,
                     AssembledArchive& out, ErrorInfo& err,
                     size_t peekBytes = kDefaultHeaderPeekBytes);

// Same merge over already parsed headers.
bool assembleFromHeaders(std::vector<VolumeInfo> volumes, AssembledArchive& out, ErrorInfo& err);

// Spans intersecting the inclusive logical range [start, end], clipped to it.
std::vector<Span> findSpansForRange(const AssembledArchiveFile& file, uint64_t start, uint64_t end);

std::optional<VolumePosition> positionInVolume(const AssembledArchiveFile& file, uint64_t logicalOffset);

// Largest media-typed entry, or nullptr.
const AssembledArchiveFile* findLargestMediaFile(const AssembledArchive& archive);

} // namespace nzbstream
