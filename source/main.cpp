#include "nzbstream/article_source.hpp"
#include "nzbstream/config.hpp"
#include "nzbstream/download_state.hpp"
#include "nzbstream/extraction_cache.hpp"
#include "nzbstream/extraction_coordinator.hpp"
#include "nzbstream/extraction_engine.hpp"
#include "nzbstream/filesystem.hpp"
#include "nzbstream/libarchive_extractor.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/mount_store.hpp"
#include "nzbstream/nzb_parser.hpp"
#include "nzbstream/raii.hpp"
#include "nzbstream/rar_detector.hpp"
#include "nzbstream/scheduler.hpp"
#include "nzbstream/segment_downloader.hpp"
#include "nzbstream/stream_service.hpp"
#include "nzbstream/streamability.hpp"
#include "nzbstream/util.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace nzbstream;

namespace {

struct CliArgs {
    std::string envPath;
    std::string jsonPath;
    std::string command;
    std::vector<std::string> positional;
    std::string password;
};

void printUsage() {
    std::cerr << "usage: nzbstream [--env FILE] [--config FILE] <command> ...\n"
                 "  inspect  <nzb>                              list files, volumes and media candidates\n"
                 "  check    <nzb>                              report whether content can be streamed\n"
                 "  download <nzb> <outDir>                     download the content files (resumable)\n"
                 "  extract  <nzb> [--password PW]              download and extract the main media file\n"
                 "  stream   <nzb> <fileIndex> <range> <out>    write a byte range (e.g. bytes=0-999) to a file\n";
}

bool parseArgs(int argc, char** argv, CliArgs& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--env") {
            if (!next(out.envPath)) return false;
        } else if (a == "--config") {
            if (!next(out.jsonPath)) return false;
        } else if (a == "--password") {
            if (!next(out.password)) return false;
        } else if (out.command.empty()) {
            out.command = a;
        } else {
            out.positional.push_back(a);
        }
    }
    if (out.envPath.empty() && out.jsonPath.empty()) out.envPath = ".env";
    return !out.command.empty();
}

bool readWholeFile(const std::string& path, std::string& out, std::string& err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        err = "Cannot open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

bool loadManifest(const std::string& path, ParsedManifest& out) {
    std::string xml, ferr;
    if (!readWholeFile(path, xml, ferr)) {
        std::cerr << ferr << "\n";
        return false;
    }
    ErrorInfo err;
    if (!parseManifest(xml, out, err)) {
        std::cerr << describeError(err) << "\n";
        return false;
    }
    return true;
}

Mount mountFor(const ParsedManifest& manifest) {
    Mount m;
    m.id = "cli-" + manifest.contentHash.substr(0, 12);
    m.manifestHash = manifest.contentHash;
    m.status = MountStatus::Ready;
    m.mediaFiles = manifest.files;
    m.totalSize = manifest.totalSize;
    return m;
}

int cmdInspect(const ParsedManifest& manifest) {
    std::cout << "hash  " << manifest.contentHash << "\n"
              << "files " << manifest.files.size() << " (" << util::formatBytes(manifest.totalSize) << ")\n";
    for (const auto& f : manifest.files) {
        std::cout << "  [" << f.index << "] " << f.name << "  " << util::formatBytes(f.totalSize) << ", "
                  << f.segments.size() << " segments";
        if (f.isArchiveVolume) std::cout << ", volume " << f.volumeNumber.value_or(0);
        std::cout << "\n";
    }
    for (const auto& kv : groupArchiveVolumes(manifest.files)) {
        std::cout << "archive " << kv.first << ": " << kv.second.size() << " volume(s)\n";
    }
    std::cout << "media candidates:\n";
    for (const auto& f : manifest.mediaCandidateFiles) std::cout << "  " << f.name << "\n";
    for (const auto& kv : manifest.meta) std::cout << "meta " << kv.first << "\n";
    return 0;
}

int cmdCheck(const ParsedManifest& manifest, ArticleSource& source, const Config& cfg) {
    StreamabilityChecker checker(source, static_cast<size_t>(cfg.headerPeekBytes),
                                 std::chrono::minutes(cfg.archiveCacheTtlMinutes));
    const StreamabilityInfo info = checker.check(mountFor(manifest).id, manifest);
    std::cout << "canStream          " << (info.canStream ? "yes" : "no") << "\n"
              << "requiresExtraction " << (info.requiresExtraction ? "yes" : "no") << "\n"
              << "requiresPassword   " << (info.requiresPassword ? "yes" : "no") << "\n"
              << "archiveType        " << streamArchiveTypeLabel(info.archiveType) << "\n";
    if (info.compressionMethod) std::cout << "compressionMethod  " << *info.compressionMethod << "\n";
    if (!info.reason.empty()) std::cout << "reason             " << info.reason << "\n";
    if (info.errorCode != ErrorCode::None) std::cout << "error              " << errorCodeLabel(info.errorCode) << "\n";
    return info.errorCode == ErrorCode::None || info.errorCode == ErrorCode::RequiresExtraction ? 0 : 1;
}

int cmdDownload(const ParsedManifest& manifest, const std::string& outDir, ArticleSource& source, const Config& cfg) {
    const ContentPlan plan = classifyContent(manifest);
    std::vector<ManifestFile> files;
    if (plan.kind == ContentKind::Direct && plan.direct) files.push_back(*plan.direct);
    else files = plan.volumes;
    if (files.empty()) {
        std::cerr << "Nothing to download.\n";
        return 1;
    }
    if (!ensureDirectory(outDir)) return 1;

    DownloadStateStore states(resolveStateDir(cfg));
    SegmentDownloader downloader(source, states);
    for (const auto& f : files) {
        DownloadOptions opts;
        opts.outputPath = (std::filesystem::path(outDir) / std::filesystem::path(sanitizeRelativePath(f.name)).filename()).string();
        opts.concurrency = cfg.downloadConcurrency;
        opts.progressInterval = std::chrono::milliseconds(cfg.progressIntervalMs);
        opts.onProgress = [&](const DownloadProgress& p) {
            std::fprintf(stderr, "\r%s %zu/%zu segments %s", f.name.c_str(), p.segmentsCompleted, p.totalSegments,
                         util::formatBytes(static_cast<uint64_t>(p.speedBps)).c_str());
        };
        DownloadResult result;
        ErrorInfo err;
        if (!downloader.download({f}, opts, result, err)) {
            std::cerr << "\n" << describeError(err) << "\n";
            return 1;
        }
        downloader.cleanupState(result.outputPath);
        std::cerr << "\n";
        std::cout << result.outputPath << " " << result.bytesWritten << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parseArgs(argc, argv, args)) {
        printUsage();
        return 2;
    }

    Config cfg;
    std::string cfgError;
    if (!loadConfig(args.envPath, args.jsonPath, cfg, cfgError)) {
        std::cerr << "Config error: " << cfgError << "\n";
        return 1;
    }
    setLogLevelFromString(cfg.logLevel);
    if (!initLogFile(cfg.logPath)) std::cerr << "Could not open log file " << cfg.logPath << "\n";
    auto closeLog = make_scope_guard([] { closeLogFile(); });
    logInfo("nzbstream " + args.command, "APP");

    if (args.positional.empty()) {
        printUsage();
        return 2;
    }
    ParsedManifest manifest;
    if (!loadManifest(args.positional[0], manifest)) return 1;
    if (args.command == "inspect") return cmdInspect(manifest);

    if (cfg.spoolDir.empty()) {
        std::cerr << "spool_dir is not configured.\n";
        return 1;
    }
    SpoolArticleSource source(cfg.spoolDir);

    if (args.command == "check") return cmdCheck(manifest, source, cfg);
    if (args.command == "download") {
        if (args.positional.size() < 2) {
            printUsage();
            return 2;
        }
        return cmdDownload(manifest, args.positional[1], source, cfg);
    }
    if (args.command != "extract" && args.command != "stream") {
        printUsage();
        return 2;
    }

    // Full pipeline wiring.
    MemoryMountStore mounts;
    const Mount mount = mountFor(manifest);
    mounts.putMount(mount);

    TaskScheduler scheduler;
    scheduler.start();

    CacheSettings cacheSettings;
    cacheSettings.retentionHours = cfg.retentionHours;
    cacheSettings.maxCacheSizeGB = cfg.maxCacheSizeGB;
    cacheSettings.sweepIntervalMinutes = cfg.cacheSweepIntervalMinutes;
    cacheSettings.initialSweepDelaySeconds = cfg.cacheInitialSweepDelaySeconds;
    ExtractionCacheManager cache(mounts, scheduler, cfg.extractionDir, cacheSettings);

    ExtractionEngine engine;
    registerLibArchiveExtractors(engine);

    CoordinatorOptions coordOpts;
    coordOpts.baseDir = cfg.extractionDir;
    coordOpts.stateDir = resolveStateDir(cfg);
    coordOpts.downloadConcurrency = cfg.downloadConcurrency;
    coordOpts.progressInterval = std::chrono::milliseconds(cfg.progressIntervalMs);
    ExtractionCoordinator coordinator(mounts, source, engine, cache, coordOpts);

    StreamabilityChecker checker(source, static_cast<size_t>(cfg.headerPeekBytes),
                                 std::chrono::minutes(cfg.archiveCacheTtlMinutes));
    StreamServiceOptions streamOpts;
    streamOpts.prefetchSegments = cfg.prefetchSegments;
    streamOpts.cleanupDelay = std::chrono::seconds(cfg.streamCleanupDelaySeconds);
    streamOpts.manifestTtl = std::chrono::minutes(cfg.manifestCacheTtlMinutes);
    streamOpts.maintenanceInterval = std::chrono::minutes(cfg.cacheMaintenanceIntervalMinutes);
    StreamService service(mounts, source, checker, coordinator, cache, scheduler, streamOpts);

    ParsedManifest cached;
    ErrorInfo cacheErr;
    std::string xml, ferr;
    if (readWholeFile(args.positional[0], xml, ferr)) service.cacheManifest(xml, cached, cacheErr);

    ErrorInfo err;

    int rc = 0;
    if (args.command == "extract") {
        auto future = service.startExtraction(mount.id, [](const ExtractionUpdate& u) {
            std::fprintf(stderr, "\r%-11s download %3d%% extract %3d%% %s", extractionStageLabel(u.phase),
                         u.downloadPercent, u.extractionPercent, util::ellipsize(u.currentFile, 40).c_str());
        }, args.password);
        const ExtractionOutcome outcome = future.get();
        std::cerr << "\n";
        if (outcome.ok()) {
            std::cout << outcome.extractedFilePath << "\n";
        } else {
            std::cerr << describeError(outcome.err) << "\n";
            rc = 1;
        }
    } else {
        if (args.positional.size() < 4) {
            printUsage();
            rc = 2;
        } else {
            const int fileIndex = std::atoi(args.positional[1].c_str());
            StreamResult result;
            if (!service.createStream(mount.id, fileIndex, args.positional[2], result, err)) {
                std::cerr << describeError(err) << "\n";
                rc = 1;
            } else {
                UniqueFile out = UniqueFile::open(args.positional[3], "wb");
                if (!out) {
                    std::cerr << "Cannot open " << args.positional[3] << "\n";
                    rc = 1;
                } else {
                    CancellationToken cancel;
                    const bool ok = result.stream->pump([&](const char* data, size_t len) {
                        return std::fwrite(data, 1, len, out.f) == len;
                    }, cancel, err);
                    if (!ok || !out.close()) {
                        std::cerr << (err.ok() ? "Write failed." : describeError(err)) << "\n";
                        rc = 1;
                    } else {
                        std::cout << result.fileName << " " << result.contentType << " " << result.startByte << "-"
                                  << result.endByte << "/" << result.totalSize << "\n";
                    }
                }
                result.stream.reset();
            }
        }
    }

    service.stop();
    coordinator.shutdown();
    cache.stop();
    scheduler.stop();
    return rc;
}
