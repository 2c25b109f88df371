#include "nzbstream/rar_detector.hpp"
#include "nzbstream/util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace nzbstream {

namespace {

const unsigned char kRar5Sig[] = {0x52, 0x61, 0x72, 0x21, 0x1A, 0x07, 0x01, 0x00};
const unsigned char kRar4Sig[] = {0x52, 0x61, 0x72, 0x21, 0x1A, 0x07, 0x00};

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool hasPrefix(const std::string& data, const unsigned char* sig, size_t len) {
    if (data.size() < len) return false;
    for (size_t i = 0; i < len; ++i) {
        if (static_cast<unsigned char>(data[i]) != sig[i]) return false;
    }
    return true;
}

} // namespace

VolumeNameInfo detectVolumeFromFilename(const std::string& name) {
    VolumeNameInfo info;
    const std::string lower = util::toLower(name);
    const auto dot = lower.rfind('.');
    if (dot == std::string::npos || dot + 1 >= lower.size()) return info;
    const std::string ext = lower.substr(dot + 1);

    if (ext == "rar") {
        // name.partNN.rar
        const std::string stem = lower.substr(0, dot);
        const auto partPos = stem.rfind(".part");
        if (partPos != std::string::npos) {
            const std::string digits = stem.substr(partPos + 5);
            if (allDigits(digits)) {
                info.isArchiveVolume = true;
                info.naming = VolumeNaming::PartRar;
                info.volumeNumber = std::atoi(digits.c_str());
                info.baseName = name.substr(0, partPos);
                return info;
            }
        }
        info.isArchiveVolume = true;
        info.naming = VolumeNaming::Rar;
        info.volumeNumber = 1;
        info.baseName = name.substr(0, dot);
        return info;
    }

    if (ext.size() == 3 && ext[0] == 'r' && allDigits(ext.substr(1))) {
        info.isArchiveVolume = true;
        info.naming = VolumeNaming::RNumber;
        info.volumeNumber = std::atoi(ext.c_str() + 1) + 2;
        info.baseName = name.substr(0, dot);
        return info;
    }

    if (ext.size() == 3 && allDigits(ext)) {
        info.isArchiveVolume = true;
        info.naming = VolumeNaming::Numbered;
        info.volumeNumber = std::atoi(ext.c_str());
        info.baseName = name.substr(0, dot);
        return info;
    }

    return info;
}

std::string archiveBaseName(const std::string& name) {
    VolumeNameInfo info = detectVolumeFromFilename(name);
    return info.isArchiveVolume ? info.baseName : name;
}

RarVersion detectRarVersion(const std::string& prefix) {
    if (hasPrefix(prefix, kRar5Sig, sizeof(kRar5Sig))) return RarVersion::Rar5;
    if (hasPrefix(prefix, kRar4Sig, sizeof(kRar4Sig))) return RarVersion::Rar4;
    return RarVersion::None;
}

const char* rarVersionLabel(RarVersion v) {
    switch (v) {
        case RarVersion::Rar4: return "RAR4";
        case RarVersion::Rar5: return "RAR5";
        default: return "none";
    }
}

void sortByVolumeNumber(std::vector<ManifestFile>& volumes) {
    std::stable_sort(volumes.begin(), volumes.end(), [](const ManifestFile& a, const ManifestFile& b) {
        return a.volumeNumber.value_or(0) < b.volumeNumber.value_or(0);
    });
}

std::map<std::string, std::vector<ManifestFile>> groupArchiveVolumes(const std::vector<ManifestFile>& files) {
    std::map<std::string, std::vector<ManifestFile>> groups;
    for (const auto& f : files) {
        if (!f.isArchiveVolume) continue;
        groups[util::toLower(archiveBaseName(f.name))].push_back(f);
    }
    for (auto& kv : groups) sortByVolumeNumber(kv.second);
    return groups;
}

} // namespace nzbstream
