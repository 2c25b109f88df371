#include "nzbstream/logger.hpp"
#include "nzbstream/util.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace nzbstream {

static constexpr size_t kMaxLogBytes = 512 * 1024; // rotate past this size
static std::atomic<LogLevel> gMinLevel{LogLevel::Info};
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;
static bool gLogReady = false;

bool initLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
    gLogPath = path;
    if (path.empty()) return true;

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    // Start a fresh log file on launch
    gLogFile.open(path, std::ios::trunc);
    if (!gLogFile) return false;
    gLogFile << "nzbstream log start\n";
    gLogFile.flush();
    gLogBytes = static_cast<size_t>(gLogFile.tellp());
    gLogReady = true;
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
}

void setLogLevel(LogLevel level) { gMinLevel = level; }

LogLevel logLevel() { return gMinLevel; }

void setLogLevelFromString(const std::string& level) {
    std::string l = util::toLower(level);
    if (l == "debug") gMinLevel = LogLevel::Debug;
    else if (l == "warn") gMinLevel = LogLevel::Warn;
    else if (l == "error") gMinLevel = LogLevel::Error;
    else gMinLevel = LogLevel::Info;
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < gMinLevel.load()) return;
    std::string line = "[" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::cout << line << std::endl;
    if (!gLogReady) return;

    auto rotate = []() {
        if (gLogFile.is_open()) gLogFile.close();
        std::error_code ec;
        std::filesystem::path p(gLogPath);
        std::filesystem::path rotated = p;
        rotated += ".1";
        std::filesystem::remove(rotated, ec);
        ec.clear();
        std::filesystem::rename(p, rotated, ec); // best-effort
        gLogFile.open(gLogPath, std::ios::trunc);
        gLogBytes = 0;
        if (gLogFile) {
            gLogFile << "nzbstream log start (rotated)\n";
            gLogFile.flush();
            gLogBytes = static_cast<size_t>(gLogFile.tellp());
        }
    };

    size_t writeBytes = line.size() + 1; // newline
    if (gLogBytes + writeBytes > kMaxLogBytes) {
        rotate();
    }
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logLine(const std::string& msg) { logInternal(LogLevel::Info, "APP", msg); }
void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace nzbstream
