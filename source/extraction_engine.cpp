#include "nzbstream/extraction_engine.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/media_types.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/util.hpp"

namespace nzbstream {

namespace {

constexpr size_t kDetectBytes = 16;

bool startsWith(const std::string& data, std::initializer_list<unsigned char> sig) {
    if (data.size() < sig.size()) return false;
    size_t i = 0;
    for (unsigned char b : sig) {
        if (static_cast<unsigned char>(data[i++]) != b) return false;
    }
    return true;
}

std::string mediaPattern() {
    std::string alt;
    for (const auto& ext : mediaExtensions()) {
        if (!alt.empty()) alt += "|";
        alt += ext;
    }
    return "\\.(" + alt + ")$";
}

} // namespace

const char* archiveTypeLabel(ArchiveType t) {
    switch (t) {
        case ArchiveType::Rar: return "rar";
        case ArchiveType::SevenZip: return "7z";
        case ArchiveType::Zip: return "zip";
        default: return "unknown";
    }
}

const char* extractionPhaseLabel(ExtractionPhase p) {
    switch (p) {
        case ExtractionPhase::Detecting: return "detecting";
        case ExtractionPhase::Extracting: return "extracting";
        case ExtractionPhase::Complete: return "complete";
        case ExtractionPhase::Error: return "error";
        case ExtractionPhase::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

ArchiveType detectArchiveType(const std::string& prefix) {
    if (detectRarVersion(prefix) != RarVersion::None) return ArchiveType::Rar;
    if (startsWith(prefix, {0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C})) return ArchiveType::SevenZip;
    // local file header, empty archive, spanned archive
    if (startsWith(prefix, {0x50, 0x4B, 0x03, 0x04}) || startsWith(prefix, {0x50, 0x4B, 0x05, 0x06}) ||
        startsWith(prefix, {0x50, 0x4B, 0x07, 0x08})) {
        return ArchiveType::Zip;
    }
    return ArchiveType::Unknown;
}

bool detectArchiveTypeOfFile(const std::string& path, ArchiveType& out, ErrorInfo& err) {
    std::string prefix, ferr;
    if (!readFilePrefix(path, kDetectBytes, prefix, ferr)) {
        err = makeError(ErrorCode::FilesystemError, "Could not read archive.", ferr);
        return false;
    }
    out = detectArchiveType(prefix);
    return true;
}

bool PathFilter::compile(const std::vector<std::string>& include, const std::vector<std::string>& exclude,
                         ErrorInfo& err) {
    include_.clear();
    exclude_.clear();
    try {
        for (const auto& p : include) include_.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
        for (const auto& p : exclude) exclude_.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        err = makeError(ErrorCode::Internal, "Invalid extraction filter pattern.", e.what());
        return false;
    }
    return true;
}

bool PathFilter::matches(const std::string& path) const {
    for (const auto& re : exclude_) {
        if (std::regex_search(path, re)) return false;
    }
    if (include_.empty()) return true;
    for (const auto& re : include_) {
        if (std::regex_search(path, re)) return true;
    }
    return false;
}

void ExtractionEngine::registerExtractor(std::unique_ptr<Extractor> extractor) {
    if (!extractor) return;
    const ArchiveType t = extractor->type();
    extractors_[t] = std::move(extractor);
}

bool ExtractionEngine::hasExtractor(ArchiveType type) const {
    return extractors_.count(type) > 0;
}

Extractor* ExtractionEngine::resolve(const std::vector<std::string>& volumes, ArchiveType& type, ErrorInfo& err) {
    if (volumes.empty()) {
        err = makeError(ErrorCode::NoArchiveVolumes, "No archive files to extract.");
        return nullptr;
    }
    if (!detectArchiveTypeOfFile(volumes.front(), type, err)) return nullptr;
    if (type == ArchiveType::Unknown) {
        err = makeError(ErrorCode::UnknownArchiveFormat, "Unknown archive format.",
                        "no known signature in " + volumes.front());
        return nullptr;
    }
    auto it = extractors_.find(type);
    if (it == extractors_.end()) {
        err = makeError(ErrorCode::ExtractionFailure,
                        std::string("No extractor available for ") + archiveTypeLabel(type) + " archives.");
        return nullptr;
    }
    return it->second.get();
}

bool ExtractionEngine::listEntries(const std::vector<std::string>& volumes, const std::string& password,
                                   std::vector<ArchiveEntry>& out, ErrorInfo& err) {
    ArchiveType type = ArchiveType::Unknown;
    Extractor* ex = resolve(volumes, type, err);
    if (!ex) return false;
    return ex->listEntries(volumes, password, out, err);
}

bool ExtractionEngine::listEntries(const std::string& path, const std::string& password,
                                   std::vector<ArchiveEntry>& out, ErrorInfo& err) {
    return listEntries(std::vector<std::string>{path}, password, out, err);
}

bool ExtractionEngine::extract(const std::vector<std::string>& volumes, const std::string& outputDir,
                               const ExtractOptions& opts, ExtractResult& out, ErrorInfo& err) {
    out = ExtractResult{};
    if (opts.onProgress) {
        ExtractionProgress p;
        p.phase = ExtractionPhase::Detecting;
        opts.onProgress(p);
    }

    ArchiveType type = ArchiveType::Unknown;
    Extractor* ex = resolve(volumes, type, err);
    if (!ex) {
        logError("Extraction not attempted: " + describeError(err), "EXTRACT");
        return false;
    }

    PathFilter filter;
    if (!filter.compile(opts.includePatterns, opts.excludePatterns, err)) return false;
    if (!ensureDirectory(outputDir)) {
        err = makeError(ErrorCode::FilesystemError, "Failed to create extraction directory.", outputDir);
        return false;
    }

    logInfo(std::string("Extracting ") + archiveTypeLabel(type) + " archive " + volumes.front() + " (" +
            std::to_string(volumes.size()) + " volume(s)) -> " + outputDir, "EXTRACT");
    if (!ex->extract(volumes, outputDir, opts, filter, out, err)) {
        if (isCancellation(err)) logInfo("Extraction cancelled: " + volumes.front(), "EXTRACT");
        else logError("Extraction failed: " + describeError(err), "EXTRACT");
        return false;
    }
    if (out.files.empty() && out.message.empty()) out.message = "No files matched";
    logInfo("Extracted " + std::to_string(out.files.size()) + " file(s) from " + volumes.front(), "EXTRACT");
    return true;
}

bool ExtractionEngine::extract(const std::string& path, const std::string& outputDir,
                               const ExtractOptions& opts, ExtractResult& out, ErrorInfo& err) {
    return extract(std::vector<std::string>{path}, outputDir, opts, out, err);
}

bool ExtractionEngine::findLargestMediaFile(const std::vector<std::string>& volumes, const std::string& password,
                                            ArchiveEntry& out, ErrorInfo& err) {
    std::vector<ArchiveEntry> entries;
    if (!listEntries(volumes, password, entries, err)) return false;
    const ArchiveEntry* best = nullptr;
    for (const auto& e : entries) {
        if (e.isDirectory || !isMediaFile(e.path)) continue;
        if (!best || e.size > best->size) best = &e;
    }
    if (!best) {
        err = makeError(ErrorCode::NoMediaFound, "No media file found in archive.", volumes.front());
        return false;
    }
    out = *best;
    return true;
}

bool ExtractionEngine::extractMediaFiles(const std::vector<std::string>& volumes, const std::string& outputDir,
                                         const ExtractOptions& opts, ExtractResult& out, ErrorInfo& err) {
    ExtractOptions mediaOpts = opts;
    mediaOpts.includePatterns = {mediaPattern()};
    return extract(volumes, outputDir, mediaOpts, out, err);
}

} // namespace nzbstream
