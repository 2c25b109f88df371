#pragma once

#include "nzbstream/article_source.hpp"
#include "nzbstream/models.hpp"
#include "nzbstream/rar_detector.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// In-memory article source. Bodies are keyed by message id; ids can be made
// to fail or to answer slowly, and every fetch is recorded.
class FakeArticleSource : public nzbstream::ArticleSource {
public:
    void put(const std::string& id, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        bodies_[id] = std::move(body);
    }

    void failOn(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(id);
    }

    void clearFailures() {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.clear();
    }

    void setDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultDelay_ = delay;
    }

    void setDelay(const std::string& id, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[id] = delay;
    }

    void setStatus(nzbstream::SourceStatus s) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = s;
    }

    size_t fetchCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_.size();
    }

    size_t fetchCount(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(log_.begin(), log_.end(), id));
    }

    std::vector<std::string> fetched() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

    void resetCounters() {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.clear();
    }

    bool getDecodedArticle(const std::string& messageId, std::string& out, nzbstream::ErrorInfo& err) override {
        std::chrono::milliseconds delay{0};
        bool fail = false;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            log_.push_back(messageId);
            auto d = delays_.find(messageId);
            delay = d != delays_.end() ? d->second : defaultDelay_;
            fail = failing_.count(messageId) > 0;
            auto it = bodies_.find(messageId);
            if (it != bodies_.end()) {
                found = true;
                out = it->second;
            }
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail || !found) {
            err = nzbstream::makeError(nzbstream::ErrorCode::TransportError, "Article not found.",
                                       "article not found: " + messageId);
            return false;
        }
        return true;
    }

    nzbstream::SourceStatus status() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    std::vector<nzbstream::ProviderStats> getStats() const override {
        nzbstream::ProviderStats s;
        s.name = "fake";
        s.maxConnections = 4;
        std::lock_guard<std::mutex> lock(mutex_);
        s.articlesFetched = log_.size();
        return {s};
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> bodies_;
    std::set<std::string> failing_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::chrono::milliseconds defaultDelay_{0};
    nzbstream::SourceStatus status_{nzbstream::SourceStatus::Ready};
    std::vector<std::string> log_;
};

// Deterministic, non-repeating-looking payload.
inline std::string patternBytes(size_t n, unsigned seed = 7) {
    std::string out(n, '\0');
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<char>((i * 31 + seed + i / 251) % 251);
    return out;
}

inline std::string segmentId(const std::string& fileName, int number) {
    return fileName + "-" + std::to_string(number) + "@test";
}

// Splits data into segments of segmentSize, registers the bodies with src and
// returns the manifest file describing them.
inline nzbstream::ManifestFile addFile(FakeArticleSource& src, const std::string& name, const std::string& data,
                                       size_t segmentSize) {
    nzbstream::ManifestFile f;
    f.name = name;
    f.subject = "\"" + name + "\" yEnc";
    f.groups = {"alt.binaries.test"};
    int number = 1;
    for (size_t pos = 0; pos < data.size(); pos += segmentSize, ++number) {
        const std::string chunk = data.substr(pos, segmentSize);
        nzbstream::Segment s;
        s.messageId = segmentId(name, number);
        s.number = number;
        s.byteSize = chunk.size();
        src.put(s.messageId, chunk);
        f.segments.push_back(s);
        f.totalSize += chunk.size();
    }
    const nzbstream::VolumeNameInfo vol = nzbstream::detectVolumeFromFilename(name);
    f.isArchiveVolume = vol.isArchiveVolume;
    if (vol.isArchiveVolume) f.volumeNumber = vol.volumeNumber;
    return f;
}

// Manifest over `files`, sorted by name with index == position.
inline nzbstream::ParsedManifest manifestOf(std::vector<nzbstream::ManifestFile> files) {
    std::sort(files.begin(), files.end(),
              [](const nzbstream::ManifestFile& a, const nzbstream::ManifestFile& b) { return a.name < b.name; });
    nzbstream::ParsedManifest m;
    m.contentHash = "test";
    for (size_t i = 0; i < files.size(); ++i) {
        files[i].index = static_cast<int>(i);
        m.totalSize += files[i].totalSize;
    }
    m.files = std::move(files);
    m.groups = {"alt.binaries.test"};
    return m;
}
