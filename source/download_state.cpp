#include "nzbstream/download_state.hpp"
#include "nzbstream/digest.hpp"
#include "nzbstream/logger.hpp"
#include "mini/json.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace nzbstream {

std::string downloadStateToJson(const DownloadState& s) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"mount_id\":\"" << mini::escape(s.mountId) << "\",";
    oss << "\"output_path\":\"" << mini::escape(s.outputPath) << "\",";
    oss << "\"completed_segments\":[";
    bool first = true;
    for (int idx : s.completedSegments) {
        if (!first) oss << ",";
        oss << idx;
        first = false;
    }
    oss << "],";
    oss << "\"bytes_written\":" << static_cast<unsigned long long>(s.bytesWritten) << ",";
    oss << "\"last_updated\":" << static_cast<long long>(s.lastUpdated) << ",";
    oss << "\"is_complete\":" << (s.isComplete ? "true" : "false");
    oss << "}";
    return oss.str();
}

bool downloadStateFromJson(const std::string& json, DownloadState& out, std::string& err) {
    out = DownloadState{};
    mini::Object obj;
    if (!mini::parse(json, obj)) {
        err = "Invalid download state JSON";
        return false;
    }
    mini::getString(obj, "mount_id", out.mountId);
    mini::getString(obj, "output_path", out.outputPath);
    mini::getInt(obj, "bytes_written", out.bytesWritten);
    mini::getInt(obj, "last_updated", out.lastUpdated);
    mini::getBool(obj, "is_complete", out.isComplete);

    auto it = obj.find("completed_segments");
    if (it != obj.end() && it->second.type == mini::Value::Type::Array) {
        for (const auto& v : it->second.array) {
            if (v.type == mini::Value::Type::Number && v.number >= 0) {
                out.completedSegments.insert(static_cast<int>(v.number));
            }
        }
    }
    if (out.outputPath.empty()) {
        err = "Download state missing output_path";
        return false;
    }
    return true;
}

int contiguousCompletedPrefix(const DownloadState& s) {
    int k = 0;
    while (s.completedSegments.count(k)) ++k;
    return k;
}

DownloadStateStore::DownloadStateStore(std::string stateDir) : stateDir_(std::move(stateDir)) {}

std::string DownloadStateStore::pathFor(const std::string& outputPath) const {
    std::string key = sha256Hex(outputPath).substr(0, 32);
    return (std::filesystem::path(stateDir_) / (key + ".state.json")).string();
}

bool DownloadStateStore::load(const std::string& outputPath, DownloadState& out) const {
    const std::string path = pathFor(outputPath);
    std::ifstream in(path, std::ios::binary);
    if (!in) return false; // no record yet
    std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (json.empty()) return false;

    DownloadState parsed;
    std::string perr;
    if (!downloadStateFromJson(json, parsed, perr)) {
        logWarn("Ignoring unreadable download state " + path + ": " + perr, "DL");
        return false;
    }
    if (parsed.outputPath != outputPath) {
        logWarn("Download state " + path + " belongs to " + parsed.outputPath + "; ignoring", "DL");
        return false;
    }
    out = std::move(parsed);
    return true;
}

bool DownloadStateStore::save(const DownloadState& state, std::string& err) const {
    std::error_code ec;
    std::filesystem::create_directories(stateDir_, ec);
    if (ec) {
        err = "Failed to create state dir: " + stateDir_ + " err=" + ec.message();
        return false;
    }
    const std::string path = pathFor(state.outputPath);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            err = "Failed to open download state for write: " + tmp;
            return false;
        }
        out << downloadStateToJson(state);
        if (!out.good()) {
            err = "Failed writing download state: " + tmp;
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        err = "Failed to commit download state " + path + ": " + ec.message();
        return false;
    }
    return true;
}

void DownloadStateStore::remove(const std::string& outputPath) const {
    std::error_code ec;
    std::filesystem::remove(pathFor(outputPath), ec);
}

} // namespace nzbstream
