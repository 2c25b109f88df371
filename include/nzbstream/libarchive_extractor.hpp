#pragma once

#include "nzbstream/extraction_engine.hpp"

namespace nzbstream {

// Extractor backed by libarchive. One instance serves one archive type;
// multi-volume sets are opened as a single logical stream.
class LibArchiveExtractor : public Extractor {
public:
    explicit LibArchiveExtractor(ArchiveType type) : type_(type) {}

    ArchiveType type() const override { return type_; }
    bool listEntries(const std::vector<std::string>& volumes, const std::string& password,
                     std::vector<ArchiveEntry>& out, ErrorInfo& err) override;
    bool extract(const std::vector<std::string>& volumes, const std::string& outputDir,
                 const ExtractOptions& opts, const PathFilter& filter,
                 ExtractResult& out, ErrorInfo& err) override;

private:
    ArchiveType type_;
};

// Registers rar, 7z and zip extractors.
void registerLibArchiveExtractors(ExtractionEngine& engine);

} // namespace nzbstream
