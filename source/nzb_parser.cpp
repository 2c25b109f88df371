#include "nzbstream/nzb_parser.hpp"
#include "nzbstream/digest.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/media_types.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/raii.hpp"
#include "nzbstream/util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>
#include <set>
#include <expat.h>

namespace nzbstream {

namespace {

// Element name without any namespace prefix.
std::string localName(const XML_Char* name) {
    std::string n(name);
    auto colon = n.rfind(':');
    return colon == std::string::npos ? n : n.substr(colon + 1);
}

constexpr size_t kParseChunkBytes = 1024 * 1024;

// Segment numbers are 1-based; anything unparsable or out of range is 0 and
// the segment gets dropped.
int parseSegmentNumber(const char* v) {
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(v, &end, 10);
    if (errno == ERANGE || end == v || n <= 0 || n > std::numeric_limits<int>::max()) return 0;
    return static_cast<int>(n);
}

uint64_t parseByteSize(const char* v) {
    while (*v == ' ' || *v == '\t') ++v;
    if (*v == '-') return 0;
    errno = 0;
    char* end = nullptr;
    const unsigned long long n = std::strtoull(v, &end, 10);
    if (errno == ERANGE || end == v) return 0;
    return static_cast<uint64_t>(n);
}

const XML_Char* findAttr(const XML_Char** attrs, const char* key) {
    for (int i = 0; attrs && attrs[i]; i += 2) {
        if (localName(attrs[i]) == key) return attrs[i + 1];
    }
    return nullptr;
}

struct ParseState {
    std::vector<std::string> stack;
    bool sawRoot{false};
    bool inFile{false};
    ManifestFile current;
    Segment segment;
    std::string text;
    std::string metaType;
    std::vector<ManifestFile> files;
    std::map<std::string, std::string> meta;
    size_t droppedSegments{0};
};

void XMLCALL onStart(void* userData, const XML_Char* name, const XML_Char** attrs) {
    auto* st = static_cast<ParseState*>(userData);
    const std::string el = localName(name);
    if (st->stack.empty() && el == "nzb") st->sawRoot = true;
    st->stack.push_back(el);
    st->text.clear();

    if (!st->sawRoot) return;
    if (el == "file") {
        st->inFile = true;
        st->current = ManifestFile{};
        if (auto* v = findAttr(attrs, "poster")) st->current.poster = v;
        if (auto* v = findAttr(attrs, "date")) st->current.postDate = std::strtoll(v, nullptr, 10);
        if (auto* v = findAttr(attrs, "subject")) st->current.subject = v;
    } else if (el == "segment" && st->inFile) {
        st->segment = Segment{};
        if (auto* v = findAttr(attrs, "number")) st->segment.number = parseSegmentNumber(v);
        if (auto* v = findAttr(attrs, "bytes")) st->segment.byteSize = parseByteSize(v);
    } else if (el == "meta") {
        st->metaType.clear();
        if (auto* v = findAttr(attrs, "type")) st->metaType = v;
    }
}

void XMLCALL onEnd(void* userData, const XML_Char* name) {
    auto* st = static_cast<ParseState*>(userData);
    const std::string el = localName(name);
    std::string text = st->text;
    util::trim(text);
    st->text.clear();
    if (!st->stack.empty()) st->stack.pop_back();
    if (!st->sawRoot) return;

    if (el == "segment" && st->inFile) {
        st->segment.messageId = text;
        if (!st->segment.messageId.empty() && st->segment.number > 0) {
            st->current.segments.push_back(st->segment);
        } else {
            st->droppedSegments++;
        }
    } else if (el == "group" && st->inFile) {
        if (!text.empty()) st->current.groups.push_back(text);
    } else if (el == "meta" && !st->metaType.empty()) {
        st->meta[util::toLower(st->metaType)] = text;
    } else if (el == "file" && st->inFile) {
        st->inFile = false;
        st->files.push_back(std::move(st->current));
    }
}

void XMLCALL onText(void* userData, const XML_Char* s, int len) {
    auto* st = static_cast<ParseState*>(userData);
    st->text.append(s, static_cast<size_t>(len));
}

void finalizeFile(ManifestFile& f) {
    std::stable_sort(f.segments.begin(), f.segments.end(), [](const Segment& a, const Segment& b) {
        return a.number < b.number;
    });
    f.segments.erase(std::unique(f.segments.begin(), f.segments.end(),
                                 [](const Segment& a, const Segment& b) { return a.number == b.number; }),
                     f.segments.end());
    f.totalSize = 0;
    for (const auto& s : f.segments) f.totalSize += s.byteSize;
    f.name = extractFilename(f.subject);
    VolumeNameInfo vol = detectVolumeFromFilename(f.name);
    f.isArchiveVolume = vol.isArchiveVolume;
    if (vol.isArchiveVolume) f.volumeNumber = vol.volumeNumber;
    else f.volumeNumber.reset();
}

bool nameLess(const std::string& a, const std::string& b) {
    const std::string la = util::toLower(a);
    const std::string lb = util::toLower(b);
    if (la != lb) return la < lb;
    return a < b;
}

} // namespace

std::string extractFilename(const std::string& subject) {
    static const std::regex quoted("\"([^\"]+)\"");
    static const std::regex yenc("yEnc\\s*\\(\\d+/\\d+\\)\\s*(.+?)(?:\\s*\\[|$)", std::regex::icase);
    static const std::regex trailing("([^\\s/\\\\]+\\.[a-z0-9]{2,4})\\s*$", std::regex::icase);

    std::smatch m;
    if (std::regex_search(subject, m, quoted)) return m[1].str();
    if (std::regex_search(subject, m, yenc)) {
        std::string name = m[1].str();
        util::trim(name);
        if (!name.empty()) return name;
    }
    if (std::regex_search(subject, m, trailing)) return m[1].str();
    return subject.substr(0, 100);
}

ParsedManifest buildParsedManifest(const std::string& contentHash, std::vector<ManifestFile> files) {
    ParsedManifest out;
    out.contentHash = contentHash;

    std::stable_sort(files.begin(), files.end(), [](const ManifestFile& a, const ManifestFile& b) {
        return nameLess(a.name, b.name);
    });

    std::set<std::string> seenGroups;
    for (size_t i = 0; i < files.size(); ++i) {
        auto& f = files[i];
        f.index = static_cast<int>(i);
        out.totalSize += f.totalSize;
        for (const auto& g : f.groups) {
            if (seenGroups.insert(g).second) out.groups.push_back(g);
        }
        if (f.isArchiveVolume || isMediaFile(f.name)) out.mediaCandidateFiles.push_back(f);
    }

    std::stable_sort(out.mediaCandidateFiles.begin(), out.mediaCandidateFiles.end(),
                     [](const ManifestFile& a, const ManifestFile& b) {
                         if (a.isArchiveVolume != b.isArchiveVolume) return !a.isArchiveVolume;
                         if (a.isArchiveVolume) return a.volumeNumber.value_or(0) < b.volumeNumber.value_or(0);
                         return nameLess(a.name, b.name);
                     });
    out.files = std::move(files);
    return out;
}

bool parseManifest(const std::string& xml, ParsedManifest& out, ErrorInfo& err) {
    out = ParsedManifest{};
    ParseState st;

    XML_Parser parser = XML_ParserCreate(nullptr);
    if (!parser) {
        err = makeError(ErrorCode::Internal, "Could not allocate XML parser.");
        return false;
    }
    auto freeParser = make_scope_guard([&] { XML_ParserFree(parser); });
    XML_SetUserData(parser, &st);
    XML_SetElementHandler(parser, onStart, onEnd);
    XML_SetCharacterDataHandler(parser, onText);

    size_t offset = 0;
    do {
        const size_t len = std::min(kParseChunkBytes, xml.size() - offset);
        const bool last = offset + len == xml.size();
        if (XML_Parse(parser, xml.data() + offset, static_cast<int>(len), last ? XML_TRUE : XML_FALSE) ==
            XML_STATUS_ERROR) {
            std::string detail = std::string(XML_ErrorString(XML_GetErrorCode(parser))) +
                                 " at line " + std::to_string(XML_GetCurrentLineNumber(parser));
            err = makeError(ErrorCode::InvalidManifest, "Invalid NZB: malformed XML.", detail);
            return false;
        }
        offset += len;
    } while (offset < xml.size());
    if (!st.sawRoot) {
        err = makeError(ErrorCode::InvalidManifest, "Invalid NZB: No root <nzb> element found");
        return false;
    }
    if (st.files.empty()) {
        err = makeError(ErrorCode::InvalidManifest, "Invalid NZB: No <file> elements found");
        return false;
    }

    for (auto& f : st.files) finalizeFile(f);
    out = buildParsedManifest(sha256Hex(xml), std::move(st.files));
    out.meta = std::move(st.meta);

    if (st.droppedSegments > 0) {
        logWarn("Dropped " + std::to_string(st.droppedSegments) + " segment(s) without id or number", "NZB");
    }
    logDebug("Parsed NZB hash=" + out.contentHash.substr(0, 12) +
             " files=" + std::to_string(out.files.size()) +
             " media=" + std::to_string(out.mediaCandidateFiles.size()) +
             " size=" + util::formatBytes(out.totalSize) +
             " groups=" + std::to_string(out.groups.size()), "NZB");
    return true;
}

} // namespace nzbstream
