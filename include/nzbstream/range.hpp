#pragma once

#include <cstdint>
#include <string>

namespace nzbstream {

enum class RangeKind { Full, Partial, Unsatisfiable };

// Resolved byte range; start/end inclusive, meaningful when length > 0.
struct RangeRequest {
    RangeKind kind{RangeKind::Full};
    uint64_t start{0};
    uint64_t end{0};
    uint64_t length{0};
};

// "bytes=a-b", "bytes=a-" and "bytes=-n" against totalSize. A missing or
// malformed header (including multi-range) means the full content; end is
// clamped to the last byte; a start past the end is unsatisfiable.
RangeRequest parseRangeHeader(const std::string& header, uint64_t totalSize);

} // namespace nzbstream
