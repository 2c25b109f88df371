#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include "nzbstream/cancellation.hpp"
#include "nzbstream/errors.hpp"

namespace nzbstream {

enum class ArchiveType { Unknown, Rar, SevenZip, Zip };

const char* archiveTypeLabel(ArchiveType t);

// Magic-byte detection over the first bytes of an archive.
ArchiveType detectArchiveType(const std::string& prefix);
bool detectArchiveTypeOfFile(const std::string& path, ArchiveType& out, ErrorInfo& err);

struct ArchiveEntry {
    std::string path;
    uint64_t size{0};
    bool isEncrypted{false};
    bool isDirectory{false};
    int method{-1}; // -1 when the codec does not report it
};

struct ExtractedFile {
    std::string archivePath;
    std::string diskPath;
    uint64_t size{0};
};

enum class ExtractionPhase { Detecting, Extracting, Complete, Error, Cancelled };

const char* extractionPhaseLabel(ExtractionPhase p);

struct ExtractionProgress {
    ExtractionPhase phase{ExtractionPhase::Detecting};
    ArchiveType archiveType{ArchiveType::Unknown};
    uint64_t totalBytes{0};
    uint64_t extractedBytes{0};
    std::string currentFile;
    std::string error;
};

using ExtractionProgressFn = std::function<void(const ExtractionProgress&)>;

struct ExtractOptions {
    std::string password;
    // ECMAScript regexes matched case-insensitively against archive paths.
    // Empty include list means everything; exclude wins over include.
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    ExtractionProgressFn onProgress;
    CancellationToken cancel;
};

struct ExtractResult {
    std::vector<ExtractedFile> files;
    std::string message;
};

class PathFilter {
public:
    bool compile(const std::vector<std::string>& include, const std::vector<std::string>& exclude, ErrorInfo& err);
    bool matches(const std::string& path) const;

private:
    std::vector<std::regex> include_;
    std::vector<std::regex> exclude_;
};

// Format-specific codec behind a uniform list/extract contract.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual ArchiveType type() const = 0;
    // volumes: ordered paths of a (possibly multi-volume) archive.
    virtual bool listEntries(const std::vector<std::string>& volumes, const std::string& password,
                             std::vector<ArchiveEntry>& out, ErrorInfo& err) = 0;
    virtual bool extract(const std::vector<std::string>& volumes, const std::string& outputDir,
                         const ExtractOptions& opts, const PathFilter& filter,
                         ExtractResult& out, ErrorInfo& err) = 0;
};

class ExtractionEngine {
public:
    void registerExtractor(std::unique_ptr<Extractor> extractor);
    bool hasExtractor(ArchiveType type) const;

    bool listEntries(const std::vector<std::string>& volumes, const std::string& password,
                     std::vector<ArchiveEntry>& out, ErrorInfo& err);
    bool listEntries(const std::string& path, const std::string& password,
                     std::vector<ArchiveEntry>& out, ErrorInfo& err);
    // Partial output is left on disk when extraction fails.
    bool extract(const std::vector<std::string>& volumes, const std::string& outputDir,
                 const ExtractOptions& opts, ExtractResult& out, ErrorInfo& err);
    bool extract(const std::string& path, const std::string& outputDir,
                 const ExtractOptions& opts, ExtractResult& out, ErrorInfo& err);

    // Largest media-typed entry; NoMediaFound when there is none.
    bool findLargestMediaFile(const std::vector<std::string>& volumes, const std::string& password,
                              ArchiveEntry& out, ErrorInfo& err);
    // extract() restricted to media-typed entries (user include patterns are replaced).
    bool extractMediaFiles(const std::vector<std::string>& volumes, const std::string& outputDir,
                           const ExtractOptions& opts, ExtractResult& out, ErrorInfo& err);

private:
    Extractor* resolve(const std::vector<std::string>& volumes, ArchiveType& type, ErrorInfo& err);

    std::map<ArchiveType, std::unique_ptr<Extractor>> extractors_;
};

} // namespace nzbstream
