#pragma once

#include <string>
#include <vector>

namespace nzbstream {

// Playable media extensions, lowercase without the dot.
const std::vector<std::string>& mediaExtensions();

bool isMediaFile(const std::string& name);
// rar / rNN / partN.rar / NNN / 7z / zip
bool isArchiveFile(const std::string& name);
// MIME type by extension; application/octet-stream when unknown.
std::string contentTypeFor(const std::string& name);

} // namespace nzbstream
