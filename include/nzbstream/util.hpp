#pragma once

#include <string>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace nzbstream::util {

inline std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline void trim(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n')) i++;
    s = s.substr(i);
}

// Lowercased extension without the dot; empty when the name has none.
inline std::string extensionOf(const std::string& name) {
    auto slash = name.find_last_of("/\\");
    auto dot = name.rfind('.');
    if (dot == std::string::npos) return {};
    if (slash != std::string::npos && dot < slash) return {};
    if (dot + 1 >= name.size()) return {};
    return toLower(name.substr(dot + 1));
}

inline std::string ellipsize(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

inline std::string formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    std::ostringstream oss;
    if (u == 0) oss << bytes << " B";
    else oss << std::fixed << std::setprecision(1) << v << " " << units[u];
    return oss.str();
}

inline std::string hexEncode(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace nzbstream::util
