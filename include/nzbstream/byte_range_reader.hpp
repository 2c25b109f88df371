#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "nzbstream/article_source.hpp"
#include "nzbstream/cancellation.hpp"
#include "nzbstream/errors.hpp"
#include "nzbstream/models.hpp"
#include "nzbstream/raii.hpp"
#include "nzbstream/rar_assembler.hpp"

namespace nzbstream {

// Receives bytes in order. Returning false stops the read without an error
// (the consumer went away).
using ByteSink = std::function<bool(const char* data, size_t len)>;

constexpr int kDefaultPrefetchSegments = 5;

// Random-access view of one logical file. read() delivers exactly the bytes of
// the inclusive range [start, end] to the sink.
class RangeReader {
public:
    virtual ~RangeReader() = default;

    virtual uint64_t size() const = 0;
    virtual bool read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
                      ErrorInfo& err) = 0;
};

// Manifest file read straight from its segments, fetching up to
// `prefetch` segments ahead of the one being delivered.
class SegmentRangeReader : public RangeReader {
public:
    SegmentRangeReader(ArticleSource& source, ManifestFile file, int prefetch = kDefaultPrefetchSegments);

    uint64_t size() const override { return file_.totalSize; }
    bool read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
              ErrorInfo& err) override;

private:
    ArticleSource& source_;
    ManifestFile file_;
    std::vector<uint64_t> offsets_; // declared start offset of each segment
    int prefetch_;
};

// Inner file of a stored archive, mapped onto the volumes through its spans.
// volumeFiles[i] is the manifest file of archive->volumes[i].
class ArchiveRangeReader : public RangeReader {
public:
    ArchiveRangeReader(ArticleSource& source, std::shared_ptr<const AssembledArchive> archive,
                       AssembledArchiveFile file, std::vector<ManifestFile> volumeFiles,
                       int prefetch = kDefaultPrefetchSegments);

    uint64_t size() const override { return file_.size; }
    bool read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
              ErrorInfo& err) override;

private:
    ArticleSource& source_;
    std::shared_ptr<const AssembledArchive> archive_;
    AssembledArchiveFile file_;
    std::vector<std::unique_ptr<SegmentRangeReader>> volumes_;
};

// Local file read with pread.
class LocalFileRangeReader : public RangeReader {
public:
    static std::unique_ptr<LocalFileRangeReader> open(const std::string& path, ErrorInfo& err);

    uint64_t size() const override { return size_; }
    bool read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
              ErrorInfo& err) override;

private:
    LocalFileRangeReader(std::string path, UniqueFd fd, uint64_t size)
        : path_(std::move(path)), fd_(std::move(fd)), size_(size) {}

    std::string path_;
    UniqueFd fd_;
    uint64_t size_{0};
};

} // namespace nzbstream
