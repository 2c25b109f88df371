#include "nzbstream/libarchive_extractor.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/raii.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>

namespace nzbstream {

namespace {

using Archive = struct archive;
using Entry = struct archive_entry;

struct ArchiveDeleter {
    void operator()(Archive* const a) const { archive_read_free(a); }
};

using ArchivePtr = std::unique_ptr<Archive, ArchiveDeleter>;

constexpr size_t kReadBlockSize = 1024 * 1024;

const char* archiveErrorString(Archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "Unspecified error";
}

bool isPassphraseError(const std::string& msg) {
    return msg.rfind("Incorrect passphrase", 0) == 0 || msg.rfind("Passphrase required", 0) == 0;
}

ErrorInfo codecError(Archive* a, const std::string& context, bool havePassword) {
    const std::string msg = archiveErrorString(a);
    if (isPassphraseError(msg)) {
        if (!havePassword) return makeError(ErrorCode::RequiresPassword, "Archive is password protected.", msg);
        return makeError(ErrorCode::ExtractionFailure, "Archive password is incorrect.", msg);
    }
    ErrorInfo e = classifyError(context + ": " + msg, ErrorCategory::Extraction);
    if (e.code == ErrorCode::Unknown) {
        e.code = ErrorCode::ExtractionFailure;
        e.category = ErrorCategory::Extraction;
    }
    return e;
}

bool enableFormat(Archive* a, ArchiveType type) {
    switch (type) {
        case ArchiveType::Rar:
            if (archive_read_support_format_rar(a) == ARCHIVE_FATAL) return false;
            return archive_read_support_format_rar5(a) != ARCHIVE_FATAL;
        case ArchiveType::SevenZip:
            return archive_read_support_format_7zip(a) != ARCHIVE_FATAL;
        case ArchiveType::Zip:
            return archive_read_support_format_zip_seekable(a) != ARCHIVE_FATAL;
        default:
            return false;
    }
}

ArchivePtr openArchive(ArchiveType type, const std::vector<std::string>& volumes, const std::string& password,
                       ErrorInfo& err) {
    ArchivePtr a(archive_read_new());
    if (!a) {
        err = makeError(ErrorCode::Internal, "Out of memory.", "archive_read_new");
        return nullptr;
    }
    if (!enableFormat(a.get(), type)) {
        err = makeError(ErrorCode::ExtractionFailure, "Archive format is not supported by this build.",
                        archiveErrorString(a.get()));
        return nullptr;
    }
    if (!password.empty() && archive_read_add_passphrase(a.get(), password.c_str()) != ARCHIVE_OK) {
        err = makeError(ErrorCode::Internal, "Could not set archive password.", archiveErrorString(a.get()));
        return nullptr;
    }

    std::vector<const char*> names;
    names.reserve(volumes.size() + 1);
    for (const auto& v : volumes) names.push_back(v.c_str());
    names.push_back(nullptr);

    if (archive_read_open_filenames(a.get(), names.data(), kReadBlockSize) != ARCHIVE_OK) {
        err = codecError(a.get(), "open " + volumes.front(), !password.empty());
        return nullptr;
    }
    return a;
}

ArchiveEntry toArchiveEntry(Entry* e) {
    ArchiveEntry out;
    const char* p = archive_entry_pathname(e);
    out.path = p ? p : "";
    out.size = archive_entry_size_is_set(e) ? static_cast<uint64_t>(archive_entry_size(e)) : 0;
    out.isEncrypted = archive_entry_is_encrypted(e) != 0;
    out.isDirectory = archive_entry_filetype(e) == AE_IFDIR;
    return out;
}

// Walks headers; calls fn for each entry. fn returns false to stop with err set.
template <typename Fn>
bool forEachEntry(Archive* a, bool havePassword, ErrorInfo& err, Fn&& fn) {
    while (true) {
        Entry* e = nullptr;
        const int r = archive_read_next_header(a, &e);
        if (r == ARCHIVE_EOF) return true;
        if (r == ARCHIVE_RETRY) continue;
        if (r == ARCHIVE_WARN) {
            logWarn(std::string("libarchive: ") + archiveErrorString(a), "EXTRACT");
        } else if (r != ARCHIVE_OK) {
            err = codecError(a, "read header", havePassword);
            return false;
        }
        if (!fn(e)) return false;
    }
}

struct CopyState {
    const ExtractOptions* opts{nullptr};
    ExtractionProgress progress;
    std::chrono::steady_clock::time_point lastEmit{};
};

void emitProgress(CopyState& st, bool force) {
    if (!st.opts || !st.opts->onProgress) return;
    auto now = std::chrono::steady_clock::now();
    if (!force && now - st.lastEmit < std::chrono::milliseconds(250)) return;
    st.lastEmit = now;
    st.opts->onProgress(st.progress);
}

bool copyEntryData(Archive* a, const std::string& diskPath, CopyState& st, bool havePassword,
                   uint64_t& written, ErrorInfo& err) {
    UniqueFile f = UniqueFile::open(diskPath, "wb");
    if (!f) {
        err = makeError(ErrorCode::FilesystemError, "Failed to open output file.",
                        "open failed: " + diskPath + ": " + std::strerror(errno));
        return false;
    }
    written = 0;
    while (true) {
        if (st.opts->cancel.isCancelled()) {
            err = makeError(ErrorCode::Cancelled, "Extraction was cancelled.");
            return false;
        }
        const void* buf = nullptr;
        size_t len = 0;
        la_int64_t offset = 0;
        switch (archive_read_data_block(a, &buf, &len, &offset)) {
            case ARCHIVE_RETRY:
                continue;
            case ARCHIVE_WARN:
                logWarn(std::string("libarchive: ") + archiveErrorString(a), "EXTRACT");
                break;
            case ARCHIVE_OK:
                break;
            case ARCHIVE_EOF:
                if (!f.close()) {
                    err = makeError(ErrorCode::FilesystemError, "Failed to finish output file.",
                                    "write failed: " + diskPath);
                    return false;
                }
                return true;
            default:
                err = codecError(a, "read data", havePassword);
                return false;
        }
        if (static_cast<uint64_t>(offset) != written) {
            // sparse hole: libarchive skipped zero bytes
            if (std::fseek(f.f, static_cast<long>(offset), SEEK_SET) != 0) {
                err = makeError(ErrorCode::FilesystemError, "Failed to seek output file.", diskPath);
                return false;
            }
            st.progress.extractedBytes += static_cast<uint64_t>(offset) - written;
            written = static_cast<uint64_t>(offset);
        }
        if (len > 0 && std::fwrite(buf, 1, len, f.f) != len) {
            err = makeError(ErrorCode::FilesystemError, "Failed to write output file.",
                            "write failed: " + diskPath + ": " + std::strerror(errno));
            return false;
        }
        written += len;
        st.progress.extractedBytes += len;
        emitProgress(st, false);
    }
}

} // namespace

bool LibArchiveExtractor::listEntries(const std::vector<std::string>& volumes, const std::string& password,
                                      std::vector<ArchiveEntry>& out, ErrorInfo& err) {
    out.clear();
    ArchivePtr a = openArchive(type_, volumes, password, err);
    if (!a) return false;
    return forEachEntry(a.get(), !password.empty(), err, [&](Entry* e) {
        out.push_back(toArchiveEntry(e));
        archive_read_data_skip(a.get());
        return true;
    });
}

bool LibArchiveExtractor::extract(const std::vector<std::string>& volumes, const std::string& outputDir,
                                  const ExtractOptions& opts, const PathFilter& filter,
                                  ExtractResult& out, ErrorInfo& err) {
    const bool havePassword = !opts.password.empty();

    // Sizes first so progress has a denominator.
    std::vector<ArchiveEntry> entries;
    if (!listEntries(volumes, opts.password, entries, err)) return false;

    CopyState st;
    st.opts = &opts;
    st.progress.phase = ExtractionPhase::Extracting;
    st.progress.archiveType = type_;
    for (const auto& e : entries) {
        if (e.isDirectory || !filter.matches(e.path)) continue;
        if (e.isEncrypted && !havePassword) {
            err = makeError(ErrorCode::RequiresPassword, "Archive is password protected.", e.path);
            return false;
        }
        st.progress.totalBytes += e.size;
    }

    ArchivePtr a = openArchive(type_, volumes, opts.password, err);
    if (!a) return false;

    const bool ok = forEachEntry(a.get(), havePassword, err, [&](Entry* e) {
        if (opts.cancel.isCancelled()) {
            err = makeError(ErrorCode::Cancelled, "Extraction was cancelled.");
            return false;
        }
        ArchiveEntry info = toArchiveEntry(e);
        if (info.isDirectory || !filter.matches(info.path)) {
            archive_read_data_skip(a.get());
            return true;
        }
        const std::string rel = sanitizeRelativePath(info.path);
        if (rel.empty()) {
            logWarn("Skipping unsafe archive path: " + info.path, "EXTRACT");
            archive_read_data_skip(a.get());
            return true;
        }

        std::filesystem::path disk = std::filesystem::path(outputDir) / rel;
        if (!ensureDirectory(disk.parent_path().string())) {
            err = makeError(ErrorCode::FilesystemError, "Failed to create extraction directory.",
                            disk.parent_path().string());
            return false;
        }

        st.progress.currentFile = info.path;
        emitProgress(st, true);

        uint64_t written = 0;
        if (!copyEntryData(a.get(), disk.string(), st, havePassword, written, err)) return false;
        out.files.push_back(ExtractedFile{info.path, disk.string(), written});
        logDebug("Extracted " + info.path + " (" + std::to_string(written) + " bytes)", "EXTRACT");
        return true;
    });

    if (!ok) {
        st.progress.phase = isCancellation(err) ? ExtractionPhase::Cancelled : ExtractionPhase::Error;
        st.progress.error = err.userMessage;
        emitProgress(st, true);
        return false;
    }

    st.progress.phase = ExtractionPhase::Complete;
    st.progress.currentFile.clear();
    emitProgress(st, true);
    return true;
}

void registerLibArchiveExtractors(ExtractionEngine& engine) {
    engine.registerExtractor(std::make_unique<LibArchiveExtractor>(ArchiveType::Rar));
    engine.registerExtractor(std::make_unique<LibArchiveExtractor>(ArchiveType::SevenZip));
    engine.registerExtractor(std::make_unique<LibArchiveExtractor>(ArchiveType::Zip));
}

} // namespace nzbstream
