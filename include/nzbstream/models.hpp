#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nzbstream {

struct Segment {
    std::string messageId;
    int number{0};       // 1-based position within the file
    uint64_t byteSize{0}; // declared decoded size
};

struct ManifestFile {
    int index{0};
    std::string name;
    std::string poster;
    int64_t postDate{0}; // unix seconds
    std::string subject;
    std::vector<std::string> groups;
    std::vector<Segment> segments; // sorted by number, no duplicates
    uint64_t totalSize{0};
    bool isArchiveVolume{false};
    std::optional<int> volumeNumber;
};

struct ParsedManifest {
    std::string contentHash; // sha256 hex of the raw manifest
    std::vector<ManifestFile> files; // sorted by name, index == position
    // Plain media files first, then archive volumes by volume number.
    std::vector<ManifestFile> mediaCandidateFiles;
    uint64_t totalSize{0};
    std::vector<std::string> groups; // deduplicated, first-seen order
    std::map<std::string, std::string> meta; // <head><meta type=..>, e.g. "password"
};

} // namespace nzbstream
