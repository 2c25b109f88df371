#include "nzbstream/rar_header.hpp"
#include "nzbstream/logger.hpp"

namespace nzbstream {

namespace {

constexpr size_t kRar5SigLen = 8;
constexpr size_t kRar4SigLen = 7;
constexpr uint64_t kMaxHeaderSize = 2 * 1024 * 1024;

// RAR5 header types
constexpr uint64_t kRar5Main = 1;
constexpr uint64_t kRar5File = 2;
constexpr uint64_t kRar5Encryption = 4;
constexpr uint64_t kRar5End = 5;

// RAR5 common header flags
constexpr uint64_t kRar5HasExtra = 0x0001;
constexpr uint64_t kRar5HasData = 0x0002;
constexpr uint64_t kRar5SplitBefore = 0x0008;
constexpr uint64_t kRar5SplitAfter = 0x0010;

// RAR4 block types and flags
constexpr uint8_t kRar4Main = 0x73;
constexpr uint8_t kRar4File = 0x74;
constexpr uint8_t kRar4End = 0x7B;
constexpr uint16_t kRar4LongBlock = 0x8000;
constexpr uint16_t kRar4MainVolume = 0x0001;
constexpr uint16_t kRar4MainPassword = 0x0080;
constexpr uint16_t kRar4SplitBefore = 0x0001;
constexpr uint16_t kRar4SplitAfter = 0x0002;
constexpr uint16_t kRar4FilePassword = 0x0004;
constexpr uint16_t kRar4DirMask = 0x00E0;
constexpr uint16_t kRar4Large = 0x0100;
constexpr uint16_t kRar4Unicode = 0x0200;

class ByteReader {
public:
    ByteReader(const std::string& data, size_t pos, size_t limit) : data_(data), pos_(pos), limit_(limit) {}

    size_t pos() const { return pos_; }
    void seek(size_t p) { pos_ = p; }

    bool u8(uint8_t& v) {
        if (pos_ + 1 > limit_) return false;
        v = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }
    bool u16(uint16_t& v) {
        if (pos_ + 2 > limit_) return false;
        v = static_cast<uint16_t>(byte(0) | (byte(1) << 8));
        pos_ += 2;
        return true;
    }
    bool u32(uint32_t& v) {
        if (pos_ + 4 > limit_) return false;
        v = byte(0) | (byte(1) << 8) | (byte(2) << 16) | (byte(3) << 24);
        pos_ += 4;
        return true;
    }
    // RAR5 variable-length integer: 7 bits per byte, high bit continues.
    bool vint(uint64_t& v) {
        v = 0;
        for (int shift = 0; shift < 70; shift += 7) {
            uint8_t b = 0;
            if (!u8(b)) return false;
            v |= static_cast<uint64_t>(b & 0x7F) << shift;
            if ((b & 0x80) == 0) return true;
        }
        return false;
    }
    bool bytes(size_t n, std::string& out) {
        if (pos_ + n > limit_) return false;
        out.assign(data_, pos_, n);
        pos_ += n;
        return true;
    }
    bool skip(size_t n) {
        if (pos_ + n > limit_) return false;
        pos_ += n;
        return true;
    }

private:
    uint32_t byte(size_t i) const { return static_cast<uint8_t>(data_[pos_ + i]); }

    const std::string& data_;
    size_t pos_;
    size_t limit_;
};

ErrorInfo malformed(const std::string& detail) {
    return makeError(ErrorCode::HeaderParseError, "Could not parse RAR headers.", detail);
}

bool parseRar5File(ByteReader& r, uint64_t headerFlags, uint64_t extraSize, size_t headerEnd,
                   RarEntryHeader& entry, ErrorInfo& err) {
    uint64_t fileFlags = 0, unpacked = 0, attrs = 0, compInfo = 0, hostOs = 0, nameLen = 0;
    if (!r.vint(fileFlags) || !r.vint(unpacked) || !r.vint(attrs)) {
        err = malformed("truncated RAR5 file header fields");
        return false;
    }
    if ((fileFlags & 0x0002) && !r.skip(4)) { // mtime
        err = malformed("truncated RAR5 mtime");
        return false;
    }
    if ((fileFlags & 0x0004) && !r.skip(4)) { // data crc32
        err = malformed("truncated RAR5 crc");
        return false;
    }
    if (!r.vint(compInfo) || !r.vint(hostOs) || !r.vint(nameLen) || nameLen > 0xFFFF) {
        err = malformed("truncated RAR5 compression info");
        return false;
    }
    if (!r.bytes(static_cast<size_t>(nameLen), entry.name)) {
        err = malformed("truncated RAR5 file name");
        return false;
    }
    entry.uncompressedSize = unpacked;
    entry.isDirectory = (fileFlags & 0x0001) != 0;
    entry.compressionMethod = static_cast<int>((compInfo >> 7) & 0x7);
    entry.splitBefore = (headerFlags & kRar5SplitBefore) != 0;
    entry.splitAfter = (headerFlags & kRar5SplitAfter) != 0;

    if (extraSize > 0) {
        if (extraSize > headerEnd) {
            err = malformed("RAR5 extra area larger than header");
            return false;
        }
        r.seek(headerEnd - static_cast<size_t>(extraSize));
        while (r.pos() < headerEnd) {
            uint64_t recSize = 0;
            if (!r.vint(recSize) || recSize == 0 || recSize > headerEnd - r.pos()) break;
            const size_t recEnd = r.pos() + static_cast<size_t>(recSize);
            uint64_t recType = 0;
            if (!r.vint(recType)) break;
            if (recType == 0x01) entry.isEncrypted = true; // file encryption record
            r.seek(recEnd);
        }
    }
    return true;
}

bool parseRar5(const std::string& data, ArchiveVolumeHeader& out, ErrorInfo& err) {
    size_t pos = kRar5SigLen;
    while (pos < data.size()) {
        ByteReader r(data, pos, data.size());
        uint64_t headerSize = 0;
        if (!r.skip(4) || !r.vint(headerSize)) break; // prefix ends inside the block
        if (headerSize == 0 || headerSize > kMaxHeaderSize) {
            err = malformed("invalid RAR5 header size " + std::to_string(headerSize) + " at " + std::to_string(pos));
            return false;
        }
        const size_t headerEnd = r.pos() + static_cast<size_t>(headerSize);
        if (headerEnd > data.size()) break;

        ByteReader hr(data, r.pos(), headerEnd);
        uint64_t type = 0, flags = 0, extraSize = 0, dataSize = 0;
        if (!hr.vint(type) || !hr.vint(flags)) {
            err = malformed("truncated RAR5 block header");
            return false;
        }
        if ((flags & kRar5HasExtra) && !hr.vint(extraSize)) {
            err = malformed("truncated RAR5 extra size");
            return false;
        }
        if ((flags & kRar5HasData) && !hr.vint(dataSize)) {
            err = malformed("truncated RAR5 data size");
            return false;
        }

        if (type == kRar5Main) {
            uint64_t archiveFlags = 0;
            if (hr.vint(archiveFlags)) {
                out.isMultiVolume = (archiveFlags & 0x0001) != 0;
                uint64_t volNum = 0;
                if ((archiveFlags & 0x0002) && hr.vint(volNum)) out.volumeIndex = static_cast<int>(volNum);
            }
        } else if (type == kRar5File) {
            RarEntryHeader entry;
            if (!parseRar5File(hr, flags, extraSize, headerEnd, entry, err)) return false;
            entry.compressedSize = dataSize;
            entry.dataOffset = headerEnd;
            out.entries.push_back(std::move(entry));
        } else if (type == kRar5Encryption) {
            err = makeError(ErrorCode::RequiresPassword, "Archive headers are encrypted.",
                            "RAR5 archive encryption header present");
            return false;
        } else if (type == kRar5End) {
            out.sawEndOfArchive = true;
            break;
        }
        // Data running past the prefix ends the walk.
        if (dataSize >= data.size() - headerEnd) break;
        pos = headerEnd + static_cast<size_t>(dataSize);
    }
    return true;
}

bool parseRar4(const std::string& data, ArchiveVolumeHeader& out, ErrorInfo& err) {
    size_t pos = kRar4SigLen; // the signature is the marker block
    while (pos + 7 <= data.size()) {
        ByteReader r(data, pos, data.size());
        uint16_t crc = 0, flags = 0, headSize = 0;
        uint8_t type = 0;
        r.u16(crc);
        r.u8(type);
        r.u16(flags);
        r.u16(headSize);
        if (headSize < 7) {
            err = malformed("invalid RAR4 block size " + std::to_string(headSize) + " at " + std::to_string(pos));
            return false;
        }
        if (pos + headSize > data.size()) break;

        uint64_t addSize = 0;
        if (type == kRar4Main) {
            out.isMultiVolume = (flags & kRar4MainVolume) != 0;
            if (flags & kRar4MainPassword) {
                err = makeError(ErrorCode::RequiresPassword, "Archive headers are encrypted.",
                                "RAR4 main header password flag");
                return false;
            }
        } else if (type == kRar4File) {
            ByteReader fr(data, pos + 7, pos + headSize);
            uint32_t packLow = 0, unpLow = 0, fileCrc = 0, ftime = 0, attrs = 0;
            uint8_t hostOs = 0, unpVer = 0, method = 0;
            uint16_t nameSize = 0;
            if (!fr.u32(packLow) || !fr.u32(unpLow) || !fr.u8(hostOs) || !fr.u32(fileCrc) || !fr.u32(ftime) ||
                !fr.u8(unpVer) || !fr.u8(method) || !fr.u16(nameSize) || !fr.u32(attrs)) {
                err = malformed("truncated RAR4 file header");
                return false;
            }
            uint64_t pack = packLow;
            uint64_t unp = unpLow;
            if (flags & kRar4Large) {
                uint32_t highPack = 0, highUnp = 0;
                if (!fr.u32(highPack) || !fr.u32(highUnp)) {
                    err = malformed("truncated RAR4 large-file sizes");
                    return false;
                }
                pack |= static_cast<uint64_t>(highPack) << 32;
                unp |= static_cast<uint64_t>(highUnp) << 32;
            }
            RarEntryHeader entry;
            if (!fr.bytes(nameSize, entry.name)) {
                err = malformed("truncated RAR4 file name");
                return false;
            }
            if (flags & kRar4Unicode) {
                auto nul = entry.name.find('\0');
                if (nul != std::string::npos) entry.name.resize(nul);
            }
            entry.uncompressedSize = unp;
            entry.compressedSize = pack;
            entry.dataOffset = pos + headSize;
            entry.isEncrypted = (flags & kRar4FilePassword) != 0;
            entry.isDirectory = (flags & kRar4DirMask) == kRar4DirMask;
            entry.compressionMethod = method >= 0x30 ? method - 0x30 : method;
            entry.splitBefore = (flags & kRar4SplitBefore) != 0;
            entry.splitAfter = (flags & kRar4SplitAfter) != 0;
            out.entries.push_back(std::move(entry));
            addSize = pack;
        } else if (type == kRar4End) {
            out.sawEndOfArchive = true;
            break;
        } else if (flags & kRar4LongBlock) {
            uint32_t add = 0;
            if (!r.u32(add)) break;
            addSize = add;
        }
        const size_t blockEnd = pos + headSize;
        if (addSize >= data.size() - blockEnd) break;
        pos = blockEnd + static_cast<size_t>(addSize);
    }
    return true;
}

} // namespace

const char* compressionMethodName(int method) {
    switch (method) {
        case 0: return "store";
        case 1: return "fastest";
        case 2: return "fast";
        case 3: return "normal";
        case 4: return "good";
        case 5: return "best";
        default: return "unknown";
    }
}

bool parseRarHeader(const std::string& prefix, ArchiveVolumeHeader& out, ErrorInfo& err) {
    out = ArchiveVolumeHeader{};
    out.version = detectRarVersion(prefix);
    if (out.version == RarVersion::None) {
        err = makeError(ErrorCode::HeaderParseError, "Not a RAR archive.", "RAR signature not found");
        return false;
    }

    bool ok = out.version == RarVersion::Rar5 ? parseRar5(prefix, out, err) : parseRar4(prefix, out, err);
    if (!ok) return false;

    if (out.entries.empty()) {
        err = makeError(ErrorCode::HeaderParseError, "Could not read archive entries from header data.",
                        std::string(rarVersionLabel(out.version)) + " prefix of " + std::to_string(prefix.size()) +
                            " bytes holds no complete file header");
        return false;
    }
    logDebug(std::string(rarVersionLabel(out.version)) + " header: " + std::to_string(out.entries.size()) +
             " entr" + (out.entries.size() == 1 ? "y" : "ies") + (out.isMultiVolume ? " (multi-volume)" : ""), "RAR");
    return true;
}

} // namespace nzbstream
