#include "catch.hpp"
#include "nzbstream/segment_downloader.hpp"

#include "fake_article_source.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

namespace fs = std::filesystem;

std::string readAll(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

struct DownloadFixture {
    fs::path dir;
    FakeArticleSource src;
    nzbstream::DownloadStateStore states;
    nzbstream::SegmentDownloader downloader;

    explicit DownloadFixture(const std::string& name)
        : dir(fs::current_path() / name), states((dir / ".state").string()), downloader(src, states) {
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    ~DownloadFixture() { fs::remove_all(dir); }

    nzbstream::DownloadOptions options(const std::string& file, int concurrency) const {
        nzbstream::DownloadOptions o;
        o.outputPath = (dir / file).string();
        o.mountId = "m1";
        o.concurrency = concurrency;
        o.progressInterval = std::chrono::milliseconds(0);
        return o;
    }
};

} // namespace

TEST_CASE("segment tasks carry global indices and declared offsets") {
    FakeArticleSource src;
    std::vector<nzbstream::ManifestFile> files = {
        addFile(src, "a.001", patternBytes(250), 100),
        addFile(src, "a.002", patternBytes(120), 100),
    };
    auto tasks = nzbstream::buildSegmentTasks(files);
    REQUIRE(tasks.size() == 5);
    REQUIRE(tasks[0].offset == 0);
    REQUIRE(tasks[2].offset == 200);
    REQUIRE(tasks[2].segment.byteSize == 50);
    REQUIRE(tasks[3].index == 3);
    REQUIRE(tasks[3].fileIndex == 1);
    REQUIRE(tasks[3].offset == 250);
    REQUIRE(tasks[4].offset == 350);
}

TEST_CASE("bytes are written in segment order when fetches finish out of order") {
    DownloadFixture fx("tmp_dl_ordering");
    const std::string content = patternBytes(20 * 1000);
    nzbstream::ManifestFile f = addFile(fx.src, "episode.mkv", content, 1000);
    // Early segments answer last.
    fx.src.setDelay(segmentId("episode.mkv", 1), std::chrono::milliseconds(80));
    fx.src.setDelay(segmentId("episode.mkv", 2), std::chrono::milliseconds(40));

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.downloader.download({f}, fx.options("episode.mkv", 4), result, err));
    REQUIRE(result.bytesWritten == content.size());
    REQUIRE(result.segmentsFetched == 20);
    REQUIRE(readAll(fx.dir / "episode.mkv") == content);
}

TEST_CASE("multiple manifest files concatenate in list order") {
    DownloadFixture fx("tmp_dl_concat");
    const std::string a = patternBytes(2500, 1);
    const std::string b = patternBytes(1700, 2);
    std::vector<nzbstream::ManifestFile> files = {addFile(fx.src, "movie.mkv.001", a, 600),
                                                  addFile(fx.src, "movie.mkv.002", b, 600)};

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.downloader.download(files, fx.options("movie.mkv", 3), result, err));
    REQUIRE(readAll(fx.dir / "movie.mkv") == a + b);
}

TEST_CASE("failed download resumes from the contiguous prefix") {
    DownloadFixture fx("tmp_dl_resume");
    const std::string content = patternBytes(10 * 500);
    nzbstream::ManifestFile f = addFile(fx.src, "vol.part1.rar", content, 500);
    fx.src.failOn(segmentId("vol.part1.rar", 5));

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    auto opts = fx.options("vol.part1.rar", 1);
    REQUIRE_FALSE(fx.downloader.download({f}, opts, result, err));
    REQUIRE(err.code == nzbstream::ErrorCode::TransportError);
    REQUIRE(err.retryable);
    REQUIRE(err.detail.find("segment 5") != std::string::npos);

    nzbstream::DownloadState state;
    REQUIRE(fx.states.load(opts.outputPath, state));
    REQUIRE(nzbstream::contiguousCompletedPrefix(state) == 4);
    REQUIRE(state.bytesWritten == 2000);
    REQUIRE_FALSE(state.isComplete);

    fx.src.clearFailures();
    fx.src.resetCounters();
    err = {};
    REQUIRE(fx.downloader.download({f}, opts, result, err));
    REQUIRE(result.resumed);
    REQUIRE(result.segmentsFetched == 6);
    REQUIRE(fx.src.fetchCount(segmentId("vol.part1.rar", 1)) == 0);
    REQUIRE(readAll(opts.outputPath) == content);

    // Complete record: nothing left to fetch.
    fx.src.resetCounters();
    REQUIRE(fx.downloader.download({f}, opts, result, err));
    REQUIRE(result.alreadyComplete);
    REQUIRE(fx.src.fetchCount() == 0);

    fx.downloader.cleanupState(opts.outputPath);
    REQUIRE_FALSE(fx.states.load(opts.outputPath, state));
}

TEST_CASE("resume disabled starts over") {
    DownloadFixture fx("tmp_dl_noresume");
    const std::string content = patternBytes(3000);
    nzbstream::ManifestFile f = addFile(fx.src, "a.mkv", content, 1000);

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    auto opts = fx.options("a.mkv", 2);
    REQUIRE(fx.downloader.download({f}, opts, result, err));

    fx.src.resetCounters();
    opts.resume = false;
    REQUIRE(fx.downloader.download({f}, opts, result, err));
    REQUIRE_FALSE(result.alreadyComplete);
    REQUIRE(fx.src.fetchCount() == 3);
    REQUIRE(readAll(opts.outputPath) == content);
}

TEST_CASE("cancelled download reports Cancelled") {
    DownloadFixture fx("tmp_dl_cancel");
    nzbstream::ManifestFile f = addFile(fx.src, "a.mkv", patternBytes(5000), 500);

    auto opts = fx.options("a.mkv", 2);
    opts.cancel.cancel();
    std::vector<nzbstream::DownloadPhase> phases;
    opts.onProgress = [&](const nzbstream::DownloadProgress& p) { phases.push_back(p.phase); };

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(fx.downloader.download({f}, opts, result, err));
    REQUIRE(nzbstream::isCancellation(err));
    REQUIRE_FALSE(phases.empty());
    REQUIRE(phases.back() == nzbstream::DownloadPhase::Cancelled);
}

TEST_CASE("progress ends with a complete report") {
    DownloadFixture fx("tmp_dl_progress");
    const std::string content = patternBytes(4000);
    nzbstream::ManifestFile f = addFile(fx.src, "a.mkv", content, 1000);

    std::vector<nzbstream::DownloadProgress> reports;
    auto opts = fx.options("a.mkv", 2);
    opts.onProgress = [&](const nzbstream::DownloadProgress& p) { reports.push_back(p); };

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    REQUIRE(fx.downloader.download({f}, opts, result, err));
    REQUIRE_FALSE(reports.empty());
    const auto& last = reports.back();
    REQUIRE(last.phase == nzbstream::DownloadPhase::Complete);
    REQUIRE(last.totalBytes == content.size());
    REQUIRE(last.downloadedBytes == content.size());
    REQUIRE(last.totalSegments == 4);
    for (size_t i = 1; i < reports.size(); ++i) {
        REQUIRE(reports[i].downloadedBytes >= reports[i - 1].downloadedBytes);
    }
}

TEST_CASE("files without segments are rejected") {
    DownloadFixture fx("tmp_dl_empty");
    nzbstream::ManifestFile empty;
    empty.name = "empty.mkv";

    nzbstream::DownloadResult result;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(fx.downloader.download({empty}, fx.options("empty.mkv", 2), result, err));
    REQUIRE(err.code == nzbstream::ErrorCode::InvalidManifest);
}
