#include "nzbstream/article_source.hpp"
#include "nzbstream/logger.hpp"
#include <filesystem>
#include <fstream>

namespace nzbstream {

SpoolArticleSource::SpoolArticleSource(std::string directory) : directory_(std::move(directory)) {}

std::string SpoolArticleSource::spoolFileName(const std::string& messageId) {
    std::string id = messageId;
    if (id.size() >= 2 && id.front() == '<' && id.back() == '>') id = id.substr(1, id.size() - 2);
    for (auto& c : id) {
        if (c == '/' || c == '\\') c = '_';
    }
    return id;
}

bool SpoolArticleSource::getDecodedArticle(const std::string& messageId, std::string& out, ErrorInfo& err) {
    const std::filesystem::path p = std::filesystem::path(directory_) / spoolFileName(messageId);
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        failures_++;
        err = makeError(ErrorCode::TransportError, "Article not found.", "article not found: " + messageId);
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        failures_++;
        err = makeError(ErrorCode::TransportError, "Failed to read article.", "read failed: " + p.string());
        return false;
    }
    fetched_++;
    return true;
}

SourceStatus SpoolArticleSource::status() const {
    std::error_code ec;
    return std::filesystem::is_directory(directory_, ec) ? SourceStatus::Ready : SourceStatus::Error;
}

std::vector<ProviderStats> SpoolArticleSource::getStats() const {
    ProviderStats s;
    s.name = "spool:" + directory_;
    s.maxConnections = 1;
    s.articlesFetched = fetched_.load();
    s.failures = failures_.load();
    return {s};
}

} // namespace nzbstream
