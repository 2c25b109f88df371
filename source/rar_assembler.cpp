#include "nzbstream/rar_assembler.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/media_types.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/util.hpp"
#include <algorithm>
#include <unordered_map>

namespace nzbstream {

bool fetchHeaderPrefix(const ManifestFile& file, ArticleSource& source, size_t peekBytes,
                       std::string& out, ErrorInfo& err) {
    out.clear();
    if (file.segments.empty()) {
        err = makeError(ErrorCode::HeaderParseError, "Archive volume has no segments.", file.name);
        return false;
    }
    for (size_t i = 0; i < file.segments.size() && out.size() < peekBytes; ++i) {
        std::string data;
        ErrorInfo fetchErr;
        if (!source.getDecodedArticle(file.segments[i].messageId, data, fetchErr)) {
            if (i == 0) {
                err = fetchErr;
                if (err.userMessage.empty()) err = makeError(ErrorCode::TransportError, "Failed to fetch archive header.");
                err.detail = "header fetch for " + file.name + ": " + fetchErr.detail;
                return false;
            }
            logDebug("Header prefix for " + file.name + " truncated at segment " + std::to_string(i), "RAR");
            break;
        }
        out += data;
    }
    return true;
}

bool assembleFromHeaders(std::vector<VolumeInfo> volumes, AssembledArchive& out, ErrorInfo& err) {
    out = AssembledArchive{};
    if (volumes.empty()) {
        err = makeError(ErrorCode::NoArchiveVolumes, "No archive volumes to assemble.");
        return false;
    }
    out.baseName = volumes.front().baseName;

    std::unordered_map<std::string, size_t> byName;
    bool allStored = true;
    for (size_t v = 0; v < volumes.size(); ++v) {
        for (const auto& entry : volumes[v].header.entries) {
            if (entry.isDirectory) continue;
            auto it = byName.find(entry.name);
            if (it == byName.end()) {
                it = byName.emplace(entry.name, out.files.size()).first;
                AssembledArchiveFile f;
                f.name = entry.name;
                out.files.push_back(std::move(f));
            }
            AssembledArchiveFile& f = out.files[it->second];
            f.size = std::max(f.size, entry.uncompressedSize);
            if (entry.isEncrypted) f.isEncrypted = true;
            if (entry.compressionMethod != 0) {
                allStored = false;
                if (f.compressionMethod == 0) f.compressionMethod = entry.compressionMethod;
            }
            Span s;
            s.volumeIndex = static_cast<int>(v);
            s.volumeByteOffset = entry.dataOffset;
            s.logicalFileOffset = f.spans.empty() ? 0 : f.spans.back().logicalFileOffset + f.spans.back().length;
            s.length = entry.compressedSize;
            if (s.length > 0) f.spans.push_back(s);
        }
    }

    for (const auto& f : out.files) {
        out.totalSize += f.size;
        if (f.isEncrypted) out.isEncrypted = true;
        // Stored entries carry their bytes verbatim, so spans must tile [0, size).
        if (f.compressionMethod == 0 && !f.isEncrypted) {
            uint64_t covered = 0;
            for (const auto& s : f.spans) {
                if (s.logicalFileOffset != covered) {
                    err = makeError(ErrorCode::HeaderParseError, "Archive volumes are inconsistent.",
                                    "gap or overlap in spans of " + f.name);
                    return false;
                }
                covered += s.length;
            }
            if (covered != f.size) {
                err = makeError(ErrorCode::HeaderParseError, "Archive volumes are incomplete.",
                                "spans of " + f.name + " cover " + std::to_string(covered) + " of " +
                                    std::to_string(f.size) + " bytes");
                return false;
            }
        }
    }
    out.isStreamable = allStored && !out.isEncrypted && !out.files.empty();
    out.volumes = std::move(volumes);
    return true;
}

bool assembleArchive(const std::vector<ManifestFile>& volumes, ArticleSource& source,
                     AssembledArchive& out, ErrorInfo& err, size_t peekBytes) {
    if (volumes.empty()) {
        err = makeError(ErrorCode::NoArchiveVolumes, "No archive volumes to assemble.");
        return false;
    }
    const std::string baseName = archiveBaseName(volumes.front().name);

    std::vector<VolumeInfo> infos;
    infos.reserve(volumes.size());
    for (const auto& file : volumes) {
        std::string prefix;
        if (!fetchHeaderPrefix(file, source, peekBytes, prefix, err)) return false;

        VolumeInfo info;
        info.volumeNumber = file.volumeNumber.value_or(static_cast<int>(infos.size()) + 1);
        info.baseName = baseName;
        info.manifestFileIndex = file.index;
        if (!parseRarHeader(prefix, info.header, err)) {
            err.detail = file.name + ": " + err.detail;
            logWarn("Header parse failed for " + file.name + ": " + err.detail, "RAR");
            return false;
        }
        infos.push_back(std::move(info));
    }

    if (!assembleFromHeaders(std::move(infos), out, err)) {
        logWarn("Assembly failed for " + baseName + ": " + err.detail, "RAR");
        return false;
    }
    logInfo("Assembled " + baseName + ": " + std::to_string(out.volumes.size()) + " volume(s), " +
            std::to_string(out.files.size()) + " file(s), " + util::formatBytes(out.totalSize) +
            (out.isStreamable ? ", streamable" : ", requires extraction"), "RAR");
    return true;
}

std::vector<Span> findSpansForRange(const AssembledArchiveFile& file, uint64_t start, uint64_t end) {
    std::vector<Span> out;
    if (end < start) return out;
    for (const auto& s : file.spans) {
        if (s.length == 0) continue;
        const uint64_t spanStart = s.logicalFileOffset;
        const uint64_t spanEnd = s.logicalFileOffset + s.length - 1;
        if (spanEnd < start) continue;
        if (spanStart > end) break;
        const uint64_t clipStart = std::max(start, spanStart);
        const uint64_t clipEnd = std::min(end, spanEnd);
        Span c;
        c.volumeIndex = s.volumeIndex;
        c.volumeByteOffset = s.volumeByteOffset + (clipStart - spanStart);
        c.logicalFileOffset = clipStart;
        c.length = clipEnd - clipStart + 1;
        out.push_back(c);
    }
    return out;
}

std::optional<VolumePosition> positionInVolume(const AssembledArchiveFile& file, uint64_t logicalOffset) {
    for (const auto& s : file.spans) {
        if (logicalOffset >= s.logicalFileOffset && logicalOffset < s.logicalFileOffset + s.length) {
            return VolumePosition{s.volumeIndex, s.volumeByteOffset + (logicalOffset - s.logicalFileOffset)};
        }
    }
    return std::nullopt;
}

const AssembledArchiveFile* findLargestMediaFile(const AssembledArchive& archive) {
    const AssembledArchiveFile* best = nullptr;
    for (const auto& f : archive.files) {
        if (!isMediaFile(f.name)) continue;
        if (!best || f.size > best->size) best = &f;
    }
    return best;
}

} // namespace nzbstream
