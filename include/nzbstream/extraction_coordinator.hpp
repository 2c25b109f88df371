#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "nzbstream/article_source.hpp"
#include "nzbstream/cancellation.hpp"
#include "nzbstream/download_state.hpp"
#include "nzbstream/errors.hpp"
#include "nzbstream/extraction_cache.hpp"
#include "nzbstream/extraction_engine.hpp"
#include "nzbstream/models.hpp"
#include "nzbstream/mount_store.hpp"

namespace nzbstream {

enum class ExtractionStage { Downloading, Extracting, Complete, Error, Cancelled };

const char* extractionStageLabel(ExtractionStage s);

struct ExtractionUpdate {
    ExtractionStage phase{ExtractionStage::Downloading};
    int downloadPercent{0};
    int extractionPercent{0};
    std::string currentFile;
    std::string error;
};

using ExtractionUpdateFn = std::function<void(const ExtractionUpdate&)>;

struct ExtractionOutcome {
    std::string extractedFilePath;
    ErrorInfo err;

    bool ok() const { return err.ok(); }
};

struct CoordinatorOptions {
    std::string baseDir;  // <baseDir>/<mountId>/{download,extracted}
    std::string stateDir; // empty = <baseDir>/.state
    int downloadConcurrency{10};
    std::chrono::milliseconds progressInterval{500};
};

// Download -> detect -> extract -> register, one run per mount at a time.
class ExtractionCoordinator {
public:
    ExtractionCoordinator(MountStore& mounts, ArticleSource& source, ExtractionEngine& engine,
                          ExtractionCacheManager& cache, CoordinatorOptions options);
    ~ExtractionCoordinator();

    ExtractionCoordinator(const ExtractionCoordinator&) = delete;
    ExtractionCoordinator& operator=(const ExtractionCoordinator&) = delete;

    // A second call for a mount already in flight returns the same future;
    // its onProgress is not attached. A run started right after a cancel
    // waits for the cancelled worker to stop touching the mount's files.
    std::shared_future<ExtractionOutcome> startExtraction(const std::string& mountId, const ParsedManifest& manifest,
                                                          ExtractionUpdateFn onProgress = {},
                                                          const std::string& password = {});
    bool cancelExtraction(const std::string& mountId);
    bool isExtractionInProgress(const std::string& mountId) const;

    // Largest media file under the mount's extracted directory, or empty.
    std::string getExtractedFilePath(const std::string& mountId) const;
    // Removes the mount's working directory and resets it to requires_extraction.
    bool cleanupExtractedFiles(const std::string& mountId);

    // Cancels every run and joins the workers.
    void shutdown();

    std::string mountDir(const std::string& mountId) const;
    const std::string& stateDir() const { return stateDir_; }

private:
    struct Active {
        uint64_t generation{0};
        std::shared_future<ExtractionOutcome> future;
        CancellationToken cancel;
    };

    // Cancelled run whose worker has not returned yet.
    struct Draining {
        uint64_t generation{0};
        std::shared_future<ExtractionOutcome> future;
    };

    ExtractionOutcome runExtraction(const std::string& mountId, uint64_t generation, const ParsedManifest& manifest,
                                    const ExtractionUpdateFn& onProgress, const std::string& password,
                                    const CancellationToken& cancel);
    bool downloadContent(const std::string& mountId, const ParsedManifest& manifest, const std::string& downloadDir,
                         const ExtractionUpdateFn& onProgress, const CancellationToken& cancel,
                         std::vector<std::string>& outPaths, ErrorInfo& err);
    void finishRun(const std::string& mountId, uint64_t generation);
    void reapFinishedWorkers();
    bool isCurrentRun(const std::string& mountId, uint64_t generation) const;

    MountStore& mounts_;
    ArticleSource& source_;
    ExtractionEngine& engine_;
    ExtractionCacheManager& cache_;
    CoordinatorOptions options_;
    std::string stateDir_;
    DownloadStateStore states_;

    mutable std::mutex mutex_;
    uint64_t nextGeneration_{1};
    std::map<std::string, Active> active_;
    std::map<std::string, Draining> draining_;
    std::map<uint64_t, std::thread> workers_;
    std::vector<uint64_t> finished_;
};

} // namespace nzbstream
