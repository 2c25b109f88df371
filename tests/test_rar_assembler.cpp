#include "catch.hpp"
#include "nzbstream/rar_assembler.hpp"

#include "fake_article_source.hpp"
#include "rar_fixtures.hpp"

namespace {

nzbstream::VolumeInfo parsedVolume(const std::string& bytes, int number) {
    nzbstream::VolumeInfo v;
    v.volumeNumber = number;
    v.baseName = "episode";
    v.manifestFileIndex = number - 1;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::parseRarHeader(bytes, v.header, err));
    return v;
}

// episode.mkv split 4000 + 2000 over two stored volumes.
struct TwoVolumeSet {
    std::string content = patternBytes(6000);
    rarfix::Entry first;
    rarfix::Entry second;
    std::string vol1;
    std::string vol2;

    TwoVolumeSet() {
        first.name = second.name = "episode.mkv";
        first.unpackedSize = second.unpackedSize = content.size();
        first.data = content.substr(0, 4000);
        first.splitAfter = true;
        second.data = content.substr(4000);
        second.splitBefore = true;
        vol1 = rarfix::rar5Volume({first}, true, 0, true);
        vol2 = rarfix::rar5Volume({second}, true, 1, false);
    }
};

} // namespace

TEST_CASE("stored multi-volume entry becomes contiguous spans") {
    TwoVolumeSet set;
    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::assembleFromHeaders({parsedVolume(set.vol1, 1), parsedVolume(set.vol2, 2)}, a, err));

    REQUIRE(a.baseName == "episode");
    REQUIRE(a.isStreamable);
    REQUIRE_FALSE(a.isEncrypted);
    REQUIRE(a.volumes.size() == 2);
    REQUIRE(a.files.size() == 1);
    REQUIRE(a.totalSize == 6000);

    const auto& f = a.files[0];
    REQUIRE(f.size == 6000);
    REQUIRE(f.spans.size() == 2);
    REQUIRE(f.spans[0].volumeIndex == 0);
    REQUIRE(f.spans[0].logicalFileOffset == 0);
    REQUIRE(f.spans[0].length == 4000);
    REQUIRE(f.spans[0].volumeByteOffset == rarfix::rar5DataOffset(set.first, true, 0));
    REQUIRE(f.spans[1].volumeIndex == 1);
    REQUIRE(f.spans[1].logicalFileOffset == 4000);
    REQUIRE(f.spans[1].length == 2000);

    // Span bytes reproduce the content.
    std::string rebuilt = set.vol1.substr(f.spans[0].volumeByteOffset, f.spans[0].length) +
                          set.vol2.substr(f.spans[1].volumeByteOffset, f.spans[1].length);
    REQUIRE(rebuilt == set.content);
}

TEST_CASE("findSpansForRange clips to the request") {
    TwoVolumeSet set;
    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::assembleFromHeaders({parsedVolume(set.vol1, 1), parsedVolume(set.vol2, 2)}, a, err));
    const auto& f = a.files[0];

    auto spans = nzbstream::findSpansForRange(f, 0, 999);
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].volumeIndex == 0);
    REQUIRE(spans[0].length == 1000);

    spans = nzbstream::findSpansForRange(f, 3990, 4009);
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[0].length == 10);
    REQUIRE(spans[0].volumeByteOffset == f.spans[0].volumeByteOffset + 3990);
    REQUIRE(spans[1].volumeIndex == 1);
    REQUIRE(spans[1].logicalFileOffset == 4000);
    REQUIRE(spans[1].volumeByteOffset == f.spans[1].volumeByteOffset);
    REQUIRE(spans[1].length == 10);

    REQUIRE(nzbstream::findSpansForRange(f, 10, 5).empty());

    auto pos = nzbstream::positionInVolume(f, 4500);
    REQUIRE(pos.has_value());
    REQUIRE(pos->volumeIndex == 1);
    REQUIRE(pos->volumeByteOffset == f.spans[1].volumeByteOffset + 500);
    REQUIRE_FALSE(nzbstream::positionInVolume(f, 6000).has_value());
}

TEST_CASE("missing volume data makes a stored set inconsistent") {
    TwoVolumeSet set;
    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(nzbstream::assembleFromHeaders({parsedVolume(set.vol1, 1)}, a, err));
    REQUIRE(err.code == nzbstream::ErrorCode::HeaderParseError);
}

TEST_CASE("compressed or encrypted entries are not streamable") {
    rarfix::Entry packed;
    packed.name = "episode.mkv";
    packed.unpackedSize = 9000;
    packed.data = std::string(3000, 'p');
    packed.method = 3;

    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::assembleFromHeaders({parsedVolume(rarfix::rar5Volume({packed}), 1)}, a, err));
    REQUIRE_FALSE(a.isStreamable);
    REQUIRE(a.files[0].compressionMethod == 3);

    rarfix::Entry locked;
    locked.name = "episode.mkv";
    locked.unpackedSize = 100;
    locked.data = std::string(112, 'e');
    locked.encrypted = true;
    REQUIRE(nzbstream::assembleFromHeaders({parsedVolume(rarfix::rar5Volume({locked}), 1)}, a, err));
    REQUIRE(a.isEncrypted);
    REQUIRE_FALSE(a.isStreamable);
}

TEST_CASE("largest media entry ignores other files") {
    rarfix::Entry nfo;
    nfo.name = "release.nfo";
    nfo.unpackedSize = 5000;
    nfo.data = std::string(5000, 'n');
    rarfix::Entry sample;
    sample.name = "Sample/sample.mkv";
    sample.unpackedSize = 100;
    sample.data = std::string(100, 's');
    rarfix::Entry main;
    main.name = "episode.mkv";
    main.unpackedSize = 2000;
    main.data = std::string(2000, 'm');

    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::assembleFromHeaders({parsedVolume(rarfix::rar5Volume({nfo, sample, main}), 1)}, a, err));
    const auto* best = nzbstream::findLargestMediaFile(a);
    REQUIRE(best != nullptr);
    REQUIRE(best->name == "episode.mkv");
}

TEST_CASE("assembleArchive reads only the header prefix of each volume") {
    TwoVolumeSet set;
    FakeArticleSource src;
    std::vector<nzbstream::ManifestFile> volumes = {
        addFile(src, "episode.part1.rar", set.vol1, 1500),
        addFile(src, "episode.part2.rar", set.vol2, 1500),
    };
    volumes[0].index = 0;
    volumes[1].index = 1;

    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::assembleArchive(volumes, src, a, err, 200));
    REQUIRE(a.isStreamable);
    REQUIRE(a.baseName == "episode");
    REQUIRE(a.volumes[0].volumeNumber == 1);
    REQUIRE(a.volumes[1].volumeNumber == 2);
    REQUIRE(a.volumes[1].manifestFileIndex == 1);
    REQUIRE(a.files[0].size == 6000);

    // One segment per volume covers 200 bytes of header.
    REQUIRE(src.fetchCount() == 2);
    REQUIRE(src.fetchCount(segmentId("episode.part1.rar", 1)) == 1);
    REQUIRE(src.fetchCount(segmentId("episode.part2.rar", 1)) == 1);
}

TEST_CASE("assembleArchive fails as a whole when one volume fails") {
    TwoVolumeSet set;
    FakeArticleSource src;
    std::vector<nzbstream::ManifestFile> volumes = {
        addFile(src, "episode.part1.rar", set.vol1, 1500),
        addFile(src, "episode.part2.rar", set.vol2, 1500),
    };
    src.failOn(segmentId("episode.part2.rar", 1));

    nzbstream::AssembledArchive a;
    nzbstream::ErrorInfo err;
    REQUIRE_FALSE(nzbstream::assembleArchive(volumes, src, a, err, 200));
    REQUIRE(err.code == nzbstream::ErrorCode::TransportError);
    REQUIRE(a.files.empty());

    err = {};
    REQUIRE_FALSE(nzbstream::assembleArchive({}, src, a, err));
    REQUIRE(err.code == nzbstream::ErrorCode::NoArchiveVolumes);
}

TEST_CASE("header prefix tolerates failures after the first segment") {
    FakeArticleSource src;
    nzbstream::ManifestFile f = addFile(src, "x.part1.rar", patternBytes(3000), 1000);
    src.failOn(segmentId("x.part1.rar", 2));

    std::string prefix;
    nzbstream::ErrorInfo err;
    REQUIRE(nzbstream::fetchHeaderPrefix(f, src, 4096, prefix, err));
    REQUIRE(prefix.size() == 1000);

    src.failOn(segmentId("x.part1.rar", 1));
    REQUIRE_FALSE(nzbstream::fetchHeaderPrefix(f, src, 4096, prefix, err));
    REQUIRE(err.code == nzbstream::ErrorCode::TransportError);
}
