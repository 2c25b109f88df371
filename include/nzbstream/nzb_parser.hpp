#pragma once

#include <string>
#include <vector>
#include "nzbstream/errors.hpp"
#include "nzbstream/models.hpp"

namespace nzbstream {

// Parse raw NZB XML. Fails with InvalidManifest when the document is not
// well-formed, has no <nzb> root, or has no <file> elements.
bool parseManifest(const std::string& xml, ParsedManifest& out, ErrorInfo& err);

// Recover a filename from a subject line: quoted name, then "yEnc (n/m) name",
// then a trailing name.ext token, else the first 100 characters.
std::string extractFilename(const std::string& subject);

// Sort files by name, re-index them and derive totals, groups and media candidates.
// Used by parseManifest and to rebuild a manifest from a stored file list.
ParsedManifest buildParsedManifest(const std::string& contentHash, std::vector<ManifestFile> files);

} // namespace nzbstream
