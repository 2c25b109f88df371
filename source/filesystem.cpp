#include "nzbstream/filesystem.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/raii.hpp"
#include <cstdio>
#include <filesystem>
#include <vector>
#include <sys/statvfs.h>

namespace nzbstream {

bool ensureDirectory(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    bool ok = std::filesystem::create_directories(p, ec) || std::filesystem::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool fileExists(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    return std::filesystem::exists(p, ec);
}

uint64_t fileSize(const std::string& path) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(sz);
}

uint64_t directorySize(const std::string& path) {
    std::error_code ec;
    uint64_t total = 0;
    if (!std::filesystem::is_directory(path, ec)) return 0;
    for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            auto sz = it->file_size(fec);
            if (!fec) total += static_cast<uint64_t>(sz);
        }
    }
    return total;
}

uint64_t getFreeSpace(const std::string& path) {
    struct statvfs s{};
    if (statvfs(path.c_str(), &s) != 0) return 0;
    return static_cast<uint64_t>(s.f_bavail) * static_cast<uint64_t>(s.f_frsize);
}

bool removeDirRecursive(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return true;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        logWarn("Failed to remove dir " + path + " err=" + ec.message(), "FS");
        return false;
    }
    logDebug("Removed dir " + path, "FS");
    return true;
}

bool moveFile(const std::string& from, const std::string& to, std::string& err) {
    std::error_code ec;
    std::filesystem::path dst(to);
    if (!dst.parent_path().empty()) std::filesystem::create_directories(dst.parent_path(), ec);
    ec.clear();
    std::filesystem::rename(from, to, ec);
    if (!ec) return true;

    // Cross-device rename: copy then remove.
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        err = "Failed to move " + from + " to " + to + ": " + ec.message();
        return false;
    }
    std::filesystem::remove(from, ec);
    if (ec) logWarn("Copied but could not remove " + from + ": " + ec.message(), "FS");
    return true;
}

bool readFilePrefix(const std::string& path, size_t maxBytes, std::string& out, std::string& err) {
    out.clear();
    UniqueFile f(std::fopen(path.c_str(), "rb"));
    if (!f) {
        err = "open failed: " + path;
        return false;
    }
    out.resize(maxBytes);
    size_t n = std::fread(&out[0], 1, maxBytes, f.f);
    if (n < maxBytes && std::ferror(f.f)) {
        err = "read failed: " + path;
        out.clear();
        return false;
    }
    out.resize(n);
    return true;
}

std::string sanitizeRelativePath(const std::string& archivePath) {
    std::string normalized = archivePath;
    for (auto& c : normalized) {
        if (c == '\\') c = '/';
    }
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t slash = normalized.find('/', start);
        if (slash == std::string::npos) slash = normalized.size();
        std::string part = normalized.substr(start, slash - start);
        start = slash + 1;
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        if (parts.empty() && part.size() == 2 && part[1] == ':') continue; // drive letter
        parts.push_back(part);
    }
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.push_back('/');
        out += parts[i];
    }
    return out;
}

} // namespace nzbstream
