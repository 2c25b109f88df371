#include "nzbstream/media_types.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/util.hpp"
#include <algorithm>
#include <unordered_map>

namespace nzbstream {

namespace {

const std::unordered_map<std::string, std::string>& mimeTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"mkv", "video/x-matroska"},
        {"mp4", "video/mp4"},
        {"avi", "video/x-msvideo"},
        {"mov", "video/quicktime"},
        {"wmv", "video/x-ms-wmv"},
        {"flv", "video/x-flv"},
        {"webm", "video/webm"},
        {"m4v", "video/x-m4v"},
        {"mpg", "video/mpeg"},
        {"mpeg", "video/mpeg"},
        {"ts", "video/mp2t"},
        {"m2ts", "video/mp2t"},
        {"vob", "video/dvd"},
        {"mp3", "audio/mpeg"},
        {"flac", "audio/flac"},
        {"aac", "audio/aac"},
        {"ogg", "audio/ogg"},
        {"wav", "audio/wav"},
        {"m4a", "audio/mp4"},
        {"wma", "audio/x-ms-wma"},
    };
    return table;
}

} // namespace

const std::vector<std::string>& mediaExtensions() {
    static const std::vector<std::string> exts = {
        "mkv", "mp4", "avi", "mov", "wmv", "flv", "webm", "m4v", "mpg", "mpeg",
        "ts", "m2ts", "vob", "mp3", "flac", "aac", "ogg", "wav", "m4a", "wma",
    };
    return exts;
}

bool isMediaFile(const std::string& name) {
    const std::string ext = util::extensionOf(name);
    if (ext.empty()) return false;
    const auto& exts = mediaExtensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool isArchiveFile(const std::string& name) {
    const std::string ext = util::extensionOf(name);
    if (ext == "7z" || ext == "zip") return true;
    return detectVolumeFromFilename(name).isArchiveVolume;
}

std::string contentTypeFor(const std::string& name) {
    const auto& table = mimeTable();
    auto it = table.find(util::extensionOf(name));
    if (it == table.end()) return "application/octet-stream";
    return it->second;
}

} // namespace nzbstream
