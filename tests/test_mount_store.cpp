#include "catch.hpp"
#include "nzbstream/mount_store.hpp"

TEST_CASE("memory mount store tracks status and extraction bookkeeping") {
    nzbstream::MemoryMountStore store;
    nzbstream::Mount m;
    m.id = "m1";
    m.manifestHash = "abc";
    m.status = nzbstream::MountStatus::RequiresExtraction;
    store.putMount(m);

    nzbstream::Mount got;
    REQUIRE(store.getMount("m1", got));
    REQUIRE(got.manifestHash == "abc");
    REQUIRE_FALSE(store.getMount("missing", got));
    REQUIRE_FALSE(store.updateStatus("missing", nzbstream::MountStatus::Ready));

    REQUIRE(store.updateStatus("m1", nzbstream::MountStatus::Downloading));
    nzbstream::MountProgress p;
    p.phase = "downloading";
    p.downloadPercent = 40;
    REQUIRE(store.setExtractionProgress("m1", p));
    store.getMount("m1", got);
    REQUIRE(got.status == nzbstream::MountStatus::Downloading);
    REQUIRE(got.extractionProgress.has_value());
    REQUIRE(got.extractionProgress->downloadPercent == 40);

    const auto expiry = nzbstream::WallClock::now() + std::chrono::hours(1);
    REQUIRE(store.setExtractedFile("m1", "/x/m1/extracted/e.mkv", expiry));
    REQUIRE(store.refreshExpiry("m1", expiry + std::chrono::hours(1)));
    store.getMount("m1", got);
    REQUIRE(got.extractedFilePath == "/x/m1/extracted/e.mkv");
    REQUIRE(got.expiresAt == expiry + std::chrono::hours(1));
    REQUIRE(got.accessCount == 1);
    REQUIRE(got.lastAccessedAt.has_value());

    REQUIRE(store.clearExtractedFile("m1", nzbstream::MountStatus::RequiresExtraction));
    store.getMount("m1", got);
    REQUIRE(got.extractedFilePath.empty());
    REQUIRE_FALSE(got.expiresAt.has_value());
    REQUIRE_FALSE(got.extractionProgress.has_value());
    REQUIRE(got.status == nzbstream::MountStatus::RequiresExtraction);

    REQUIRE(store.listMounts().size() == 1);
    REQUIRE(store.removeMount("m1"));
    REQUIRE(store.listMounts().empty());
}

TEST_CASE("mount status labels") {
    REQUIRE(std::string(nzbstream::mountStatusLabel(nzbstream::MountStatus::RequiresExtraction)) ==
            "requires_extraction");
    REQUIRE(std::string(nzbstream::mountStatusLabel(nzbstream::MountStatus::Ready)) == "ready");
    REQUIRE(std::string(nzbstream::mountStatusLabel(nzbstream::MountStatus::Extracting)) == "extracting");
}
