#include "catch.hpp"
#include "nzbstream/stream_service.hpp"

#include "fake_article_source.hpp"
#include "rar_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

namespace {

namespace fs = std::filesystem;

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

struct ServiceFixture {
    fs::path base;
    nzbstream::TaskScheduler scheduler;
    FakeArticleSource src;
    nzbstream::MemoryMountStore mounts;
    nzbstream::ExtractionEngine engine;
    nzbstream::StreamabilityChecker checker;
    nzbstream::ExtractionCacheManager cache;
    nzbstream::ExtractionCoordinator coordinator;
    nzbstream::StreamService service;

    explicit ServiceFixture(const std::string& name)
        : base(fs::current_path() / name),
          checker(src),
          cache(mounts, scheduler, base.string()),
          coordinator(mounts, src, engine, cache, coordinatorOptions(base)),
          service(mounts, src, checker, coordinator, cache, scheduler, serviceOptions()) {
        fs::remove_all(base);
        scheduler.start();
        service.start();
    }
    ~ServiceFixture() {
        service.stop();
        scheduler.stop();
        coordinator.shutdown();
        fs::remove_all(base);
    }

    static nzbstream::CoordinatorOptions coordinatorOptions(const fs::path& base) {
        nzbstream::CoordinatorOptions o;
        o.baseDir = base.string();
        return o;
    }

    static nzbstream::StreamServiceOptions serviceOptions() {
        nzbstream::StreamServiceOptions o;
        o.prefetchSegments = 2;
        o.cleanupDelay = std::chrono::milliseconds(40);
        return o;
    }

    void addMount(const std::string& id, nzbstream::MountStatus status, const nzbstream::ParsedManifest& manifest) {
        nzbstream::Mount m;
        m.id = id;
        m.manifestHash = "hash-" + id;
        m.status = status;
        m.mediaFiles = manifest.files;
        m.totalSize = manifest.totalSize;
        mounts.putMount(m);
    }

    // Extracted output on disk plus the matching mount bookkeeping.
    std::string addExtractedMount(const std::string& id, const std::string& content) {
        const fs::path dir = base / id / "extracted";
        fs::create_directories(dir);
        const fs::path file = dir / "movie.mkv";
        std::ofstream(file, std::ios::binary) << content;
        nzbstream::Mount m;
        m.id = id;
        m.status = nzbstream::MountStatus::Ready;
        mounts.putMount(m);
        cache.setExpiration(id, file.string());
        return file.string();
    }
};

std::string drain(nzbstream::StreamResult& r) {
    std::string out;
    nzbstream::ErrorInfo err;
    const bool ok = r.stream->pump([&](const char* d, size_t n) {
        out.append(d, n);
        return true;
    }, nzbstream::CancellationToken{}, err);
    REQUIRE(ok);
    return out;
}

} // namespace

TEST_CASE("stored two-volume archive streams the inner file") {
    ServiceFixture fx("tmp_service_archive");
    const std::string content = patternBytes(6000);
    rarfix::Entry first;
    first.name = "episode.mkv";
    first.unpackedSize = content.size();
    first.data = content.substr(0, 4000);
    first.splitAfter = true;
    rarfix::Entry second = first;
    second.data = content.substr(4000);
    second.splitAfter = false;
    second.splitBefore = true;

    const std::string vol1 = rarfix::rar5Volume({first}, true, 0, true);
    const std::string vol2 = rarfix::rar5Volume({second}, true, 1);
    auto manifest = manifestOf({addFile(fx.src, "episode.part1.rar", vol1, 1400),
                                addFile(fx.src, "episode.part2.rar", vol2, 1400),
                                addFile(fx.src, "episode.nfo", "notes", 1400)});
    REQUIRE(manifest.files[1].segments.size() == 3);
    REQUIRE(manifest.files[2].segments.size() == 2);
    fx.addMount("m1", nzbstream::MountStatus::Ready, manifest);

    nzbstream::StreamabilityInfo info;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.service.checkStreamability("m1", info, err));
    REQUIRE(info.canStream);

    fx.src.resetCounters();
    nzbstream::StreamResult r;
    REQUIRE(fx.service.createStream("m1", 0, "bytes=0-999", r, err));
    REQUIRE(r.isPartial);
    REQUIRE(r.contentLength == 1000);
    REQUIRE(r.totalSize == 6000);
    REQUIRE(r.fileName == "episode.mkv");
    REQUIRE(r.contentType == "video/x-matroska");
    REQUIRE(fx.service.activeStreamCount("m1") == 1);

    REQUIRE(drain(r) == content.substr(0, 1000));
    REQUIRE(fx.src.fetchCount() > 0);
    for (const auto& id : fx.src.fetched()) REQUIRE(id.find("episode.part1.rar") == 0);

    nzbstream::StreamResult full;
    REQUIRE(fx.service.createStream("m1", 0, "", full, err));
    REQUIRE_FALSE(full.isPartial);
    REQUIRE(drain(full) == content);
    REQUIRE(fx.service.activeStreamCount("m1") == 2);

    r.stream.reset();
    full.stream.reset();
    REQUIRE(fx.service.activeStreamCount("m1") == 0);
}

TEST_CASE("plain files stream by manifest index") {
    ServiceFixture fx("tmp_service_direct");
    const std::string movie = patternBytes(3000, 3);
    auto manifest = manifestOf({addFile(fx.src, "movie.mkv", movie, 1000), addFile(fx.src, "movie.nfo", "nfo", 1000)});
    fx.addMount("m1", nzbstream::MountStatus::Ready, manifest);

    nzbstream::StreamResult r;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.service.createStream("m1", 0, "bytes=-500", r, err));
    REQUIRE(r.fileName == "movie.mkv");
    REQUIRE(r.startByte == 2500);
    REQUIRE(r.endByte == 2999);
    REQUIRE(drain(r) == movie.substr(2500));

    err = {};
    REQUIRE_FALSE(fx.service.createStream("m1", 7, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::FileNotFound);

    err = {};
    REQUIRE_FALSE(fx.service.createStream("m1", 0, "bytes=5000-6000", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::RangeNotSatisfiable);

    err = {};
    REQUIRE_FALSE(fx.service.createStream("nobody", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::MountNotFound);
}

TEST_CASE("mount status gates streaming") {
    ServiceFixture fx("tmp_service_status");
    auto manifest = manifestOf({addFile(fx.src, "movie.mkv", patternBytes(1000), 1000)});
    nzbstream::StreamResult r;
    nzbstream::ErrorInfo err;

    fx.addMount("needs", nzbstream::MountStatus::RequiresExtraction, manifest);
    REQUIRE_FALSE(fx.service.createStream("needs", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::RequiresExtraction);

    fx.addMount("busy", nzbstream::MountStatus::Extracting, manifest);
    err = {};
    REQUIRE_FALSE(fx.service.createStream("busy", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::MountNotReady);
    REQUIRE(err.userMessage == "Extraction in progress: extracting");

    fx.addMount("broken", nzbstream::MountStatus::Error, manifest);
    err = {};
    REQUIRE_FALSE(fx.service.createStream("broken", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::MountNotReady);
    REQUIRE_FALSE(err.retryable);
}

TEST_CASE("mount without a recoverable manifest must be recreated") {
    ServiceFixture fx("tmp_service_no_manifest");
    nzbstream::Mount m;
    m.id = "m1";
    m.manifestHash = "gone";
    m.status = nzbstream::MountStatus::Ready;
    fx.mounts.putMount(m);

    nzbstream::StreamResult r;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(fx.service.createStream("m1", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::InvalidManifest);
    REQUIRE(err.userMessage == "NZB content not available - mount needs to be recreated.");
}

TEST_CASE("cached manifest serves a mount without stored files") {
    ServiceFixture fx("tmp_service_cached_manifest");
    const std::string movie = patternBytes(1500, 9);
    fx.src.put("mv-1@test", movie.substr(0, 1000));
    fx.src.put("mv-2@test", movie.substr(1000));
    const std::string xml = R"NZB(<?xml version="1.0" encoding="utf-8"?>
<nzb xmlns="http://www.newzbin.com/DTD/2003/nzb">
  <file poster="p@example.com" date="1700000000" subject="&quot;movie.mkv&quot; yEnc (1/2)">
    <groups><group>alt.binaries.test</group></groups>
    <segments>
      <segment bytes="1000" number="1">mv-1@test</segment>
      <segment bytes="500" number="2">mv-2@test</segment>
    </segments>
  </file>
</nzb>
)NZB";

    nzbstream::ParsedManifest parsed;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.service.cacheManifest(xml, parsed, err));

    nzbstream::Mount m;
    m.id = "m1";
    m.manifestHash = parsed.contentHash;
    m.status = nzbstream::MountStatus::Ready;
    fx.mounts.putMount(m);

    nzbstream::StreamResult r;
    REQUIRE(fx.service.createStream("m1", 0, "bytes=1000-", r, err));
    REQUIRE(r.contentLength == 500);
    REQUIRE(drain(r) == movie.substr(1000));
}

TEST_CASE("extracted output wins over the mount status and refreshes expiry") {
    ServiceFixture fx("tmp_service_extracted");
    const std::string content = patternBytes(4096, 5);
    fx.addExtractedMount("m1", content);
    fx.mounts.updateStatus("m1", nzbstream::MountStatus::RequiresExtraction);

    nzbstream::StreamResult r;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.service.createStream("m1", 0, "bytes=100-199", r, err));
    REQUIRE(drain(r) == content.substr(100, 100));
    REQUIRE(r.fileName == "movie.mkv");

    nzbstream::Mount m;
    fx.mounts.getMount("m1", m);
    REQUIRE(m.accessCount == 1);
    REQUIRE(m.lastAccessedAt.has_value());
}

TEST_CASE("partial output is not served while extraction runs or after a cancel") {
    ServiceFixture fx("tmp_service_partial");
    auto manifest = manifestOf({addFile(fx.src, "episode.mkv", patternBytes(1000), 1000)});
    const fs::path dir = fx.base / "m1" / "extracted";
    fs::create_directories(dir);
    std::ofstream(dir / "episode.mkv", std::ios::binary) << patternBytes(300);

    fx.addMount("m1", nzbstream::MountStatus::Extracting, manifest);
    nzbstream::StreamResult r;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(fx.service.createStream("m1", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::MountNotReady);
    REQUIRE(err.retryable);
    REQUIRE(fx.service.activeStreamCount("m1") == 0);

    // Leftovers of an unregistered run do not count as extracted output.
    fx.mounts.updateStatus("m1", nzbstream::MountStatus::RequiresExtraction);
    err = {};
    REQUIRE_FALSE(fx.service.createStream("m1", 0, "", r, err));
    REQUIRE(err.code == nzbstream::ErrorCode::RequiresExtraction);
}

TEST_CASE("extracted output is removed after the last stream ends") {
    ServiceFixture fx("tmp_service_deferred");
    const std::string file = fx.addExtractedMount("m1", patternBytes(2048));

    {
        nzbstream::StreamResult a, b;
        nzbstream::ErrorInfo err;
        REQUIRE(fx.service.createStream("m1", 0, "", a, err));
        REQUIRE(fx.service.createStream("m1", 0, "bytes=0-9", b, err));
        a.stream.reset();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE(fs::exists(file));
    }

    REQUIRE(waitFor([&] { return !fs::exists(file); }));
    nzbstream::Mount m;
    REQUIRE(waitFor([&] {
        fx.mounts.getMount("m1", m);
        return m.status == nzbstream::MountStatus::RequiresExtraction;
    }));
    REQUIRE(m.extractedFilePath.empty());
}

TEST_CASE("a new stream cancels the pending cleanup") {
    ServiceFixture fx("tmp_service_reopen");
    const std::string file = fx.addExtractedMount("m1", patternBytes(2048));
    nzbstream::ErrorInfo err;

    {
        nzbstream::StreamResult first;
        REQUIRE(fx.service.createStream("m1", 0, "", first, err));
    }
    nzbstream::StreamResult second;
    REQUIRE(fx.service.createStream("m1", 0, "", second, err));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    REQUIRE(fs::exists(file));
    REQUIRE(fx.service.activeStreamCount("m1") == 1);

    second.stream.reset();
    REQUIRE(waitFor([&] { return !fs::exists(file); }));
}

TEST_CASE("service status reflects the source and active streams") {
    ServiceFixture fx("tmp_service_health");
    auto manifest = manifestOf({addFile(fx.src, "movie.mkv", patternBytes(1000), 1000)});
    fx.addMount("m1", nzbstream::MountStatus::Ready, manifest);

    nzbstream::StreamResult r;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.service.createStream("m1", 0, "", r, err));

    nzbstream::StreamServiceStatus st = fx.service.getStatus();
    REQUIRE(st.ready);
    REQUIRE(st.providers.size() == 1);
    REQUIRE(st.activeStreams.at("m1") == 1);

    fx.src.setStatus(nzbstream::SourceStatus::Pending);
    REQUIRE_FALSE(fx.service.isReady());
    REQUIRE_FALSE(fx.service.getStatus().ready);
}
