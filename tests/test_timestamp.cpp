#include <doctest/doctest.h>

#include <string>

#include "wiredoc/build_error.h"
#include "wiredoc/build_timestamp.h"

using namespace WireDoc;

TEST_CASE("Timestamp: parsing fixed build times") {
    SUBCASE("minutes only") {
        BuildTimestamp ts = BuildTimestamp::parse("2025-10-06 15:56");
        CHECK(ts.year() == 2025);
        CHECK(ts.month() == 10);
        CHECK(ts.day() == 6);
        CHECK(ts.hour() == 15);
        CHECK(ts.minute() == 56);
        CHECK(ts.second() == 0);
    }
    SUBCASE("seconds and T separator") {
        BuildTimestamp ts = BuildTimestamp::parse(" 2024-02-29T07:05:09 ");
        CHECK(ts.iso() == "2024-02-29 07:05:09");
    }
}

TEST_CASE("Timestamp: output forms") {
    BuildTimestamp ts = BuildTimestamp::parse("2025-10-06 15:56");
    CHECK(ts.display() == "6 October 2025 at 15:56");
    CHECK(ts.pdfDate() == "D:20251006155600");
    CHECK(ts.iso() == "2025-10-06 15:56:00");

    CHECK(BuildTimestamp::parse("2026-01-31 00:00").display() == "31 January 2026 at 00:00");
}

TEST_CASE("Timestamp: invalid input is a configuration error") {
    const char* bad[] = {
        "", "2025-10-06", "2025/10/06 15:56", "2025-13-01 10:00", "2025-02-29 10:00",
        "2025-04-31 10:00", "2025-10-06 24:00", "2025-10-06 12:60", "2025-10-06 12:00:61",
        "now"
    };
    for (const char* text : bad) {
        CAPTURE(text);
        try {
            BuildTimestamp::parse(text);
            FAIL("expected a BuildError");
        } catch (const BuildError& e) {
            REQUIRE(e.issues().size() == 1);
            CHECK(e.issues()[0].code == ErrorCode::INVALID_CONFIG);
        }
    }
}

TEST_CASE("Timestamp: now is a valid calendar time") {
    BuildTimestamp ts = BuildTimestamp::now();
    CHECK(ts.year() >= 2020);
    CHECK(ts.month() >= 1);
    CHECK(ts.month() <= 12);
    CHECK(BuildTimestamp::parse(ts.iso()).iso() == ts.iso());
}
