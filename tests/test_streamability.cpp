#include "catch.hpp"
#include "nzbstream/streamability.hpp"

#include "fake_article_source.hpp"
#include "rar_fixtures.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

rarfix::Entry entry(const std::string& name, const std::string& data, int method = 0, bool encrypted = false) {
    rarfix::Entry e;
    e.name = name;
    e.unpackedSize = data.size();
    e.data = data;
    e.method = method;
    e.encrypted = encrypted;
    return e;
}

nzbstream::ParsedManifest singleVolume(FakeArticleSource& src, const rarfix::Entry& e) {
    return manifestOf({addFile(src, "release.rar", rarfix::rar5Volume({e}), 1000),
                       addFile(src, "release.nfo", "release notes", 1000)});
}

// Throws from the next fetch once armed.
class ThrowingArticleSource : public FakeArticleSource {
public:
    void armThrow() { throwNext_ = true; }

    bool getDecodedArticle(const std::string& messageId, std::string& out, nzbstream::ErrorInfo& err) override {
        if (throwNext_.exchange(false)) throw std::runtime_error("decoder blew up");
        return FakeArticleSource::getDecodedArticle(messageId, out, err);
    }

private:
    std::atomic<bool> throwNext_{false};
};

} // namespace

TEST_CASE("content classification") {
    FakeArticleSource src;

    SECTION("plain media beats archives") {
        auto m = manifestOf({addFile(src, "movie.mkv", patternBytes(3000), 1000),
                             addFile(src, "movie.part1.rar", patternBytes(5000), 1000),
                             addFile(src, "sample.mkv", patternBytes(500), 1000)});
        auto plan = nzbstream::classifyContent(m);
        REQUIRE(plan.kind == nzbstream::ContentKind::Direct);
        REQUIRE(plan.direct);
        REQUIRE(plan.direct->name == "movie.mkv");
    }

    SECTION("archives without plain media use the first volume's group") {
        auto m = manifestOf({addFile(src, "extras.part3.rar", patternBytes(100), 1000),
                             addFile(src, "show.part2.rar", patternBytes(100), 1000),
                             addFile(src, "show.part1.rar", patternBytes(100), 1000),
                             addFile(src, "show.nfo", "nfo", 1000)});
        auto plan = nzbstream::classifyContent(m);
        REQUIRE(plan.kind == nzbstream::ContentKind::Archive);
        REQUIRE(plan.volumes.size() == 2);
        REQUIRE(plan.volumes[0].name == "show.part1.rar");
        REQUIRE(plan.volumes[1].name == "show.part2.rar");
    }

    SECTION("no media and no archives streams the largest file") {
        auto m = manifestOf({addFile(src, "a.bin", patternBytes(300), 1000), addFile(src, "b.bin", patternBytes(900), 1000)});
        auto plan = nzbstream::classifyContent(m);
        REQUIRE(plan.kind == nzbstream::ContentKind::Direct);
        REQUIRE(plan.direct->name == "b.bin");
    }
}

TEST_CASE("plain files stream directly without fetching anything") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto m = manifestOf({addFile(src, "movie.mkv", patternBytes(3000), 1000)});
    src.resetCounters();

    auto info = checker.check("m1", m);
    REQUIRE(info.canStream);
    REQUIRE_FALSE(info.requiresExtraction);
    REQUIRE(info.archiveType == nzbstream::StreamArchiveType::None);
    REQUIRE(src.fetchCount() == 0);
}

TEST_CASE("stored archive is streamable and cached") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto m = singleVolume(src, entry("episode.mkv", patternBytes(2500)));
    src.resetCounters();

    auto info = checker.check("m1", m);
    REQUIRE(info.canStream);
    REQUIRE(info.archiveType == nzbstream::StreamArchiveType::Rar);
    REQUIRE(info.compressionMethod == 0);
    REQUIRE(info.errorCode == nzbstream::ErrorCode::None);
    REQUIRE(src.fetchCount() > 0);

    auto archive = checker.cachedArchive("m1");
    REQUIRE(archive);
    REQUIRE(archive->files.size() == 1);
    REQUIRE(archive->files[0].name == "episode.mkv");

    src.resetCounters();
    REQUIRE(checker.check("m1", m).canStream);
    REQUIRE(src.fetchCount() == 0);

    checker.removeCachedArchive("m1");
    REQUIRE_FALSE(checker.cachedArchive("m1"));
}

TEST_CASE("compressed archive requires extraction") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto info = checker.check("m1", singleVolume(src, entry("episode.mkv", patternBytes(800), 3)));
    REQUIRE_FALSE(info.canStream);
    REQUIRE(info.requiresExtraction);
    REQUIRE(info.compressionMethod == 3);
    REQUIRE(info.errorCode == nzbstream::ErrorCode::RequiresExtraction);
    REQUIRE(info.reason == "Archive uses normal compression (method 3); extraction required");
}

TEST_CASE("encrypted entries and headers require a password") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);

    auto info = checker.check("m1", singleVolume(src, entry("episode.mkv", patternBytes(800), 0, true)));
    REQUIRE_FALSE(info.canStream);
    REQUIRE(info.requiresPassword);
    REQUIRE(info.errorCode == nzbstream::ErrorCode::RequiresPassword);

    FakeArticleSource src2;
    nzbstream::StreamabilityChecker checker2(src2);
    const std::string locked = rarfix::rar5Signature() + rarfix::rar5EncryptionBlock() + patternBytes(200);
    auto m = manifestOf({addFile(src2, "locked.rar", locked, 1000)});
    info = checker2.check("m2", m);
    REQUIRE(info.requiresPassword);
    REQUIRE_FALSE(info.canStream);
    REQUIRE_FALSE(checker2.cachedArchive("m2"));
}

TEST_CASE("unparseable volume falls back to extraction") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto m = manifestOf({addFile(src, "broken.rar", "this is not a rar archive at all", 1000)});
    auto info = checker.check("m1", m);
    REQUIRE_FALSE(info.canStream);
    REQUIRE(info.requiresExtraction);
    REQUIRE(info.errorCode == nzbstream::ErrorCode::HeaderParseError);
}

TEST_CASE("unreachable first segment is reported as a transport failure") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto m = singleVolume(src, entry("episode.mkv", patternBytes(800)));
    src.failOn(segmentId("release.rar", 1));
    auto info = checker.check("m1", m);
    REQUIRE_FALSE(info.canStream);
    REQUIRE_FALSE(info.requiresExtraction);
    REQUIRE(info.errorCode == nzbstream::ErrorCode::TransportError);
}

TEST_CASE("concurrent checks of one mount share a single assembly") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto m = singleVolume(src, entry("episode.mkv", patternBytes(2500)));
    src.setDelay(segmentId("release.rar", 1), std::chrono::milliseconds(100));
    src.resetCounters();

    nzbstream::StreamabilityInfo a, b;
    std::thread t1([&] { a = checker.check("m1", m); });
    std::thread t2([&] { b = checker.check("m1", m); });
    t1.join();
    t2.join();

    REQUIRE(a.canStream);
    REQUIRE(b.canStream);
    REQUIRE(src.fetchCount(segmentId("release.rar", 1)) == 1);
}

TEST_CASE("an assembly that throws fails its callers and can be retried") {
    ThrowingArticleSource src;
    nzbstream::StreamabilityChecker checker(src);
    auto m = singleVolume(src, entry("episode.mkv", patternBytes(2500)));
    const auto plan = nzbstream::classifyContent(m);
    REQUIRE(plan.kind == nzbstream::ContentKind::Archive);

    src.armThrow();
    nzbstream::ArchiveHandle archive;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(checker.getOrAssemble("m1", plan.volumes, archive, err));
    REQUIRE(err.code == nzbstream::ErrorCode::Internal);
    REQUIRE_FALSE(archive);

    err = {};
    REQUIRE(checker.getOrAssemble("m1", plan.volumes, archive, err));
    REQUIRE(archive);
    REQUIRE(archive->files[0].name == "episode.mkv");
}

TEST_CASE("expired archives are swept") {
    FakeArticleSource src;
    nzbstream::StreamabilityChecker checker(src, nzbstream::kDefaultHeaderPeekBytes, std::chrono::milliseconds(20));
    REQUIRE(checker.check("m1", singleVolume(src, entry("episode.mkv", patternBytes(900)))).canStream);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    REQUIRE_FALSE(checker.cachedArchive("m1"));
    REQUIRE(checker.sweepCache() == 1);
}
