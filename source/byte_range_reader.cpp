#include "nzbstream/byte_range_reader.hpp"
#include "nzbstream/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <future>
#include <sys/stat.h>
#include <unistd.h>

namespace nzbstream {

namespace {

constexpr size_t kLocalChunkBytes = 256 * 1024;

struct Fetched {
    std::string data;
    ErrorInfo err;
    bool ok{false};
};

} // namespace

SegmentRangeReader::SegmentRangeReader(ArticleSource& source, ManifestFile file, int prefetch)
    : source_(source), file_(std::move(file)), prefetch_(std::max(1, prefetch)) {
    uint64_t offset = 0;
    offsets_.reserve(file_.segments.size());
    for (const auto& s : file_.segments) {
        offsets_.push_back(offset);
        offset += s.byteSize;
    }
}

bool SegmentRangeReader::read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
                              ErrorInfo& err) {
    if (end < start || start >= file_.totalSize) {
        err = makeError(ErrorCode::RangeNotSatisfiable, "Requested range is outside the file.",
                        std::to_string(start) + "-" + std::to_string(end));
        return false;
    }
    end = std::min(end, file_.totalSize - 1);

    // First segment whose declared range contains start.
    auto it = std::upper_bound(offsets_.begin(), offsets_.end(), start);
    size_t first = static_cast<size_t>(std::distance(offsets_.begin(), it)) - 1;
    size_t last = first;
    while (last + 1 < offsets_.size() && offsets_[last + 1] <= end) ++last;

    std::deque<std::pair<size_t, std::future<Fetched>>> window;
    size_t nextToFetch = first;
    auto launch = [&] {
        while (nextToFetch <= last && window.size() < static_cast<size_t>(prefetch_)) {
            const std::string id = file_.segments[nextToFetch].messageId;
            window.emplace_back(nextToFetch, std::async(std::launch::async, [this, id] {
                Fetched f;
                f.ok = source_.getDecodedArticle(id, f.data, f.err);
                return f;
            }));
            ++nextToFetch;
        }
    };

    launch();
    while (!window.empty()) {
        if (cancel.isCancelled()) {
            err = makeError(ErrorCode::Cancelled, "Stream was cancelled.");
            return false;
        }
        const size_t idx = window.front().first;
        Fetched f = window.front().second.get();
        window.pop_front();
        if (!f.ok) {
            err = f.err;
            if (err.ok()) err = makeError(ErrorCode::TransportError, "Failed to fetch segment.");
            logWarn("Segment " + std::to_string(idx + 1) + " of " + file_.name + " failed: " + describeError(err),
                    "STREAM");
            return false;
        }
        launch();

        // Offsets come from the declared sizes; a body is cut to its declared
        // size and must cover the part of it the range needs.
        const uint64_t segStart = offsets_[idx];
        const uint64_t declared = file_.segments[idx].byteSize;
        const uint64_t from = start > segStart ? start - segStart : 0;
        const uint64_t until = std::min<uint64_t>(end + 1 - segStart, declared);
        if (f.data.size() != declared) {
            logDebug("Segment " + std::to_string(idx + 1) + " of " + file_.name + " decoded to " +
                         std::to_string(f.data.size()) + " bytes, declared " + std::to_string(declared),
                     "STREAM");
        }
        if (f.data.size() < until) {
            err = makeError(ErrorCode::TransportError, "Segment is shorter than declared.",
                            file_.segments[idx].messageId + ": got " + std::to_string(f.data.size()) +
                                " bytes, need " + std::to_string(until));
            logWarn("Segment " + std::to_string(idx + 1) + " of " + file_.name + " is truncated", "STREAM");
            return false;
        }
        if (from >= until) continue;
        if (!sink(f.data.data() + from, static_cast<size_t>(until - from))) return true;
    }
    return true;
}

ArchiveRangeReader::ArchiveRangeReader(ArticleSource& source, std::shared_ptr<const AssembledArchive> archive,
                                       AssembledArchiveFile file, std::vector<ManifestFile> volumeFiles, int prefetch)
    : source_(source), archive_(std::move(archive)), file_(std::move(file)) {
    for (auto& v : volumeFiles) volumes_.push_back(std::make_unique<SegmentRangeReader>(source_, std::move(v), prefetch));
}

bool ArchiveRangeReader::read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
                              ErrorInfo& err) {
    if (end < start || start >= file_.size) {
        err = makeError(ErrorCode::RangeNotSatisfiable, "Requested range is outside the file.",
                        std::to_string(start) + "-" + std::to_string(end));
        return false;
    }
    bool stopped = false;
    const ByteSink guarded = [&](const char* data, size_t len) {
        if (!sink(data, len)) {
            stopped = true;
            return false;
        }
        return true;
    };
    for (const auto& span : findSpansForRange(file_, start, std::min(end, file_.size - 1))) {
        if (span.volumeIndex < 0 || static_cast<size_t>(span.volumeIndex) >= volumes_.size()) {
            err = makeError(ErrorCode::Internal, "Archive span refers to a missing volume.",
                            std::to_string(span.volumeIndex));
            return false;
        }
        const uint64_t volStart = span.volumeByteOffset;
        const uint64_t volEnd = span.volumeByteOffset + span.length - 1;
        if (!volumes_[span.volumeIndex]->read(volStart, volEnd, guarded, cancel, err)) return false;
        if (stopped) return true;
    }
    return true;
}

std::unique_ptr<LocalFileRangeReader> LocalFileRangeReader::open(const std::string& path, ErrorInfo& err) {
    UniqueFd fd = UniqueFd::openReadOnly(path);
    if (!fd) {
        err = makeError(ErrorCode::FileNotFound, "Extracted file is not available.",
                        "open failed: " + path + ": " + std::strerror(errno));
        return nullptr;
    }
    struct stat st{};
    if (::fstat(fd.fd, &st) != 0) {
        err = makeError(ErrorCode::FilesystemError, "Could not stat extracted file.", path);
        return nullptr;
    }
    return std::unique_ptr<LocalFileRangeReader>(
        new LocalFileRangeReader(path, std::move(fd), static_cast<uint64_t>(st.st_size)));
}

bool LocalFileRangeReader::read(uint64_t start, uint64_t end, const ByteSink& sink, const CancellationToken& cancel,
                                ErrorInfo& err) {
    if (end < start || start >= size_) {
        err = makeError(ErrorCode::RangeNotSatisfiable, "Requested range is outside the file.",
                        std::to_string(start) + "-" + std::to_string(end));
        return false;
    }
    end = std::min(end, size_ - 1);
    std::string buf(kLocalChunkBytes, '\0');
    uint64_t pos = start;
    while (pos <= end) {
        if (cancel.isCancelled()) {
            err = makeError(ErrorCode::Cancelled, "Stream was cancelled.");
            return false;
        }
        const size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), end - pos + 1));
        const ssize_t n = ::pread(fd_.fd, &buf[0], want, static_cast<off_t>(pos));
        if (n < 0) {
            if (errno == EINTR) continue;
            err = makeError(ErrorCode::FilesystemError, "Failed to read extracted file.",
                            path_ + ": " + std::strerror(errno));
            return false;
        }
        if (n == 0) {
            err = makeError(ErrorCode::FilesystemError, "Extracted file ended early.", path_);
            return false;
        }
        if (!sink(buf.data(), static_cast<size_t>(n))) return true;
        pos += static_cast<uint64_t>(n);
    }
    return true;
}

} // namespace nzbstream
