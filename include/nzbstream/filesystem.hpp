#pragma once

#include <cstdint>
#include <string>

namespace nzbstream {

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
// Check if a file exists.
bool fileExists(const std::string& path);
// Size of a regular file, 0 when missing.
uint64_t fileSize(const std::string& path);
// Sum of regular file sizes below a directory.
uint64_t directorySize(const std::string& path);
// Best-effort free-space query for a path (bytes).
uint64_t getFreeSpace(const std::string& path);
// Best-effort recursive delete; returns false only when the path survives.
bool removeDirRecursive(const std::string& path);
// Rename, falling back to copy + remove across filesystems.
bool moveFile(const std::string& from, const std::string& to, std::string& err);
// Read up to maxBytes from the start of a file.
bool readFilePrefix(const std::string& path, size_t maxBytes, std::string& out, std::string& err);
// Archive member path made relative and stripped of "..", drive and root components.
// Empty when nothing safe remains.
std::string sanitizeRelativePath(const std::string& archivePath);

} // namespace nzbstream
