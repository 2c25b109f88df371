#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "nzbstream/errors.hpp"
#include "nzbstream/rar_detector.hpp"

namespace nzbstream {

struct RarEntryHeader {
    std::string name;
    uint64_t uncompressedSize{0};
    uint64_t compressedSize{0}; // data bytes stored in this volume
    uint64_t dataOffset{0};     // offset of the data area inside the volume
    bool isEncrypted{false};
    bool isDirectory{false};
    int compressionMethod{0};   // 0 = stored, 1..5 fastest..best
    bool splitBefore{false};
    bool splitAfter{false};
};

struct ArchiveVolumeHeader {
    RarVersion version{RarVersion::None};
    bool isMultiVolume{false};
    std::optional<int> volumeIndex; // RAR5 main header volume number (0-based after the first)
    bool sawEndOfArchive{false};
    std::vector<RarEntryHeader> entries;
};

// Parse the header blocks contained in a leading prefix of a RAR volume.
// Fails with HeaderParseError on a bad signature, a malformed block, or when
// no file entry could be enumerated; RequiresPassword when headers are encrypted.
bool parseRarHeader(const std::string& prefix, ArchiveVolumeHeader& out, ErrorInfo& err);

const char* compressionMethodName(int method);

} // namespace nzbstream
