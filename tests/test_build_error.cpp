#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "wiredoc/build_error.h"

using namespace WireDoc;

TEST_CASE("Errors: codes map to kinds and exit codes") {
    CHECK(kind_of(ErrorCode::MISSING_CROP_REGION) == ErrorKind::CONFIGURATION);
    CHECK(kind_of(ErrorCode::PAGE_NOT_IN_SOURCE) == ErrorKind::CONFIGURATION);
    CHECK(kind_of(ErrorCode::REGION_OUT_OF_BOUNDS) == ErrorKind::GEOMETRY);
    CHECK(kind_of(ErrorCode::UNSUPPORTED_SOURCE_FORMAT) == ErrorKind::SOURCE_DOCUMENT);
    CHECK(kind_of(ErrorCode::MISSING_ZONE_DATA) == ErrorKind::ASSEMBLY);
    CHECK(kind_of(ErrorCode::WRITE_FAILED) == ErrorKind::OUTPUT);
    CHECK(kind_of(ErrorCode::CANCELLED) == ErrorKind::CANCELLED);

    CHECK(exit_code_for(ErrorKind::CONFIGURATION) == EC_CONFIGURATION_ERROR);
    CHECK(exit_code_for(ErrorKind::GEOMETRY) == EC_GEOMETRY_ERROR);
    CHECK(exit_code_for(ErrorKind::OUTPUT) == EC_WRITE_ERROR);
    CHECK(exit_code_for(ErrorKind::CANCELLED) == EC_CANCELLED);
}

TEST_CASE("Errors: an issue names everything it knows") {
    BuildIssue i = issue(ErrorCode::REGION_OUT_OF_BOUNDS)
        .in_room("Kitchen").in_tab("E1").in_track("lighting").at_page(3)
        .with_region(10, 20, 900, 40).at_path("crops.csv").at_row(7)
        .because("region exceeds page");

    CHECK(i.describe() ==
          "GeometryError [RegionOutOfBounds] room 'Kitchen' tab 'E1' track 'lighting' page 3 "
          "region (10, 20, 900, 40) in crops.csv row 7: region exceeds page");
}

TEST_CASE("Errors: sparse issues stay short") {
    BuildIssue zone = issue(ErrorCode::MISSING_ZONE_DATA).in_room("Hall").in_zone("Z9");
    CHECK(zone.describe() == "AssemblyError [MissingZoneData] room 'Hall' zone 'Z9'");

    BuildIssue row_only = issue(ErrorCode::INVALID_ROW).at_row(4).because("empty Tab");
    CHECK(row_only.describe() == "ConfigurationError [InvalidRow] row 4: empty Tab");
}

TEST_CASE("Errors: a BuildError carries every issue in order") {
    std::vector<BuildIssue> issues;
    issues.push_back(issue(ErrorCode::UNKNOWN_TAB).in_room("R1").in_tab("T9"));
    issues.push_back(issue(ErrorCode::INVALID_REGION).in_room("R2").in_tab("T1"));

    try {
        throw_if_any(issues);
        FAIL("expected a BuildError");
    } catch (const BuildError& e) {
        REQUIRE(e.issues().size() == 2);
        CHECK(e.kind() == ErrorKind::CONFIGURATION);
        CHECK(e.issues()[1].code == ErrorCode::INVALID_REGION);

        std::string what = e.what();
        CHECK(what.find("2 problems found:") == 0);
        CHECK(what.find("tab 'T9'") != std::string::npos);
        CHECK(what.find("room 'R2'") != std::string::npos);
    }

    CHECK_NOTHROW(throw_if_any({}));
}

TEST_CASE("Errors: single issue message is the description") {
    BuildError e(issue(ErrorCode::WRITE_FAILED).at_path("/nowhere/out.pdf").because("directory does not exist"));
    CHECK(std::string(e.what()) == "OutputError [WriteFailed] in /nowhere/out.pdf: directory does not exist");
    CHECK(e.kind() == ErrorKind::OUTPUT);
}
