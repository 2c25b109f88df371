#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "nzbstream/errors.hpp"

namespace nzbstream {

enum class SourceStatus { Pending, Ready, Error };

inline const char* sourceStatusLabel(SourceStatus s) {
    switch (s) {
        case SourceStatus::Pending: return "pending";
        case SourceStatus::Ready: return "ready";
        case SourceStatus::Error: return "error";
        default: return "unknown";
    }
}

struct ProviderStats {
    std::string name;
    int activeConnections{0};
    int idleConnections{0};
    int maxConnections{0};
    uint64_t articlesFetched{0};
    uint64_t failures{0};
};

// Article-fetch primitive backed by an already connected provider pool.
// Implementations must be safe to call from multiple threads.
class ArticleSource {
public:
    virtual ~ArticleSource() = default;

    // Decoded article body for a message id; TransportError on not-found or connection loss.
    virtual bool getDecodedArticle(const std::string& messageId, std::string& out, ErrorInfo& err) = 0;
    virtual SourceStatus status() const = 0;
    virtual std::vector<ProviderStats> getStats() const = 0;
};

// Reads pre-decoded article bodies from a directory; file name is the message
// id with '/' replaced by '_' and surrounding angle brackets removed.
class SpoolArticleSource : public ArticleSource {
public:
    explicit SpoolArticleSource(std::string directory);

    bool getDecodedArticle(const std::string& messageId, std::string& out, ErrorInfo& err) override;
    SourceStatus status() const override;
    std::vector<ProviderStats> getStats() const override;

    static std::string spoolFileName(const std::string& messageId);

private:
    std::string directory_;
    std::atomic<uint64_t> fetched_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace nzbstream
