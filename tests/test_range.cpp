#include "catch.hpp"
#include "nzbstream/range.hpp"

using nzbstream::RangeKind;
using nzbstream::parseRangeHeader;

TEST_CASE("closed range inside the file") {
    auto r = parseRangeHeader("bytes=0-999", 5000);
    REQUIRE(r.kind == RangeKind::Partial);
    REQUIRE(r.start == 0);
    REQUIRE(r.end == 999);
    REQUIRE(r.length == 1000);
}

TEST_CASE("open-ended range runs to the last byte") {
    auto r = parseRangeHeader("bytes=4000-", 5000);
    REQUIRE(r.kind == RangeKind::Partial);
    REQUIRE(r.start == 4000);
    REQUIRE(r.end == 4999);
    REQUIRE(r.length == 1000);
}

TEST_CASE("suffix range selects the tail") {
    auto r = parseRangeHeader("bytes=-500", 5000);
    REQUIRE(r.kind == RangeKind::Partial);
    REQUIRE(r.start == 4500);
    REQUIRE(r.end == 4999);

    r = parseRangeHeader("bytes=-9000", 5000);
    REQUIRE(r.start == 0);
    REQUIRE(r.length == 5000);

    REQUIRE(parseRangeHeader("bytes=-0", 5000).kind == RangeKind::Unsatisfiable);
}

TEST_CASE("end past the file is clamped") {
    auto r = parseRangeHeader("bytes=100-999999", 5000);
    REQUIRE(r.kind == RangeKind::Partial);
    REQUIRE(r.end == 4999);
    REQUIRE(r.length == 4900);
}

TEST_CASE("start past the file is unsatisfiable") {
    REQUIRE(parseRangeHeader("bytes=5000-", 5000).kind == RangeKind::Unsatisfiable);
    REQUIRE(parseRangeHeader("bytes=6000-7000", 5000).kind == RangeKind::Unsatisfiable);
    REQUIRE(parseRangeHeader("bytes=0-", 0).kind == RangeKind::Unsatisfiable);
}

TEST_CASE("missing or malformed headers mean the full content") {
    for (const char* h : {"", "bytes=", "items=0-10", "bytes=abc-def", "bytes=10-5", "bytes=0-10,20-30",
                          "bytes=5"}) {
        auto r = parseRangeHeader(h, 5000);
        INFO(h);
        REQUIRE(r.kind == RangeKind::Full);
        REQUIRE(r.start == 0);
        REQUIRE(r.end == 4999);
        REQUIRE(r.length == 5000);
    }
}

TEST_CASE("unit and whitespace are tolerated") {
    auto r = parseRangeHeader("  Bytes= 10 - 19 ", 100);
    REQUIRE(r.kind == RangeKind::Partial);
    REQUIRE(r.start == 10);
    REQUIRE(r.end == 19);
}
