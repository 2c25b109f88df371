#pragma once

#include <map>
#include <string>
#include <vector>
#include "nzbstream/models.hpp"

namespace nzbstream {

enum class VolumeNaming { None, PartRar, Rar, RNumber, Numbered };

struct VolumeNameInfo {
    bool isArchiveVolume{false};
    int volumeNumber{0};
    VolumeNaming naming{VolumeNaming::None};
    std::string baseName;
};

enum class RarVersion { None, Rar4, Rar5 };

// name.partNN.rar -> NN, name.rar -> 1, name.rNN -> NN+2, name.NNN -> NNN.
VolumeNameInfo detectVolumeFromFilename(const std::string& name);
// Strips .partN.rar / .rar / .rNN / .NNN; other names are returned unchanged.
std::string archiveBaseName(const std::string& name);
RarVersion detectRarVersion(const std::string& prefix);
const char* rarVersionLabel(RarVersion v);

// Archive volumes grouped by base name, each group ordered by volume number.
std::map<std::string, std::vector<ManifestFile>> groupArchiveVolumes(const std::vector<ManifestFile>& files);
void sortByVolumeNumber(std::vector<ManifestFile>& volumes);

} // namespace nzbstream
