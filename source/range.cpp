#include "nzbstream/range.hpp"
#include "nzbstream/util.hpp"

#include <cctype>

namespace nzbstream {

namespace {

std::string trimmed(std::string s) {
    util::trim(s);
    return s;
}

bool parseUnsigned(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 19) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    out = v;
    return true;
}

RangeRequest full(uint64_t totalSize) {
    RangeRequest r;
    r.kind = RangeKind::Full;
    r.start = 0;
    r.end = totalSize > 0 ? totalSize - 1 : 0;
    r.length = totalSize;
    return r;
}

RangeRequest unsatisfiable() {
    RangeRequest r;
    r.kind = RangeKind::Unsatisfiable;
    return r;
}

} // namespace

RangeRequest parseRangeHeader(const std::string& header, uint64_t totalSize) {
    const std::string h = trimmed(header);
    const std::string prefix = "bytes=";
    if (h.size() <= prefix.size() || util::toLower(h.substr(0, prefix.size())) != prefix) return full(totalSize);

    const std::string ranges = trimmed(h.substr(prefix.size()));
    if (ranges.find(',') != std::string::npos) return full(totalSize);
    const size_t dash = ranges.find('-');
    if (dash == std::string::npos) return full(totalSize);

    const std::string a = trimmed(ranges.substr(0, dash));
    const std::string b = trimmed(ranges.substr(dash + 1));

    RangeRequest r;
    r.kind = RangeKind::Partial;
    if (a.empty()) {
        uint64_t n = 0;
        if (!parseUnsigned(b, n)) return full(totalSize);
        if (n == 0 || totalSize == 0) return unsatisfiable();
        if (n > totalSize) n = totalSize;
        r.start = totalSize - n;
        r.end = totalSize - 1;
    } else {
        uint64_t start = 0;
        if (!parseUnsigned(a, start)) return full(totalSize);
        uint64_t end = totalSize > 0 ? totalSize - 1 : 0;
        if (!b.empty()) {
            if (!parseUnsigned(b, end)) return full(totalSize);
            if (end < start) return full(totalSize);
        }
        if (start >= totalSize) return unsatisfiable();
        if (end >= totalSize) end = totalSize - 1;
        r.start = start;
        r.end = end;
    }
    r.length = r.end - r.start + 1;
    return r;
}

} // namespace nzbstream
