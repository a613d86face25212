#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "test_support.h"
#include "wiredoc/pack_assembler.h"

using namespace WireDoc;
using namespace WireDocTest;

namespace {

// Two tabs A and B, each a two-page plan PDF, and rooms given by the test
struct PackFixture {
    TempDir dir;
    MapSourceResolver resolver;
    FakeZoneData zones;
    std::vector<RoomSpec> rooms;
    TabTable tabs;
    CropTable crops;
    BuildOptions options;

    PackFixture() {
        options.title = "House";
        options.timestamp = "2025-10-06 15:56";
        options.workers = 2;
    }

    void source(const std::string& tab, const std::vector<std::string>& markers) {
        std::string path = dir.file(tab + ".pdf");
        write_test_pdf(path, marked_pages(markers));
        resolver.paths[tab] = path;
    }

    void room(const std::string& name, const std::string& zone) {
        RoomSpec r;
        r.name = name;
        r.zones.push_back(zone);
        rooms.push_back(r);
        zones.zones.insert(zone);
    }

    void standard() {
        source("A", {"A1", "A2"});
        source("B", {"B1", "B2"});
        tabs = parse_tab_table("Tab\nA\nB\n", "tabs.csv");
        room("R1", "Z1");
        crops = parse_crop_table(
            "Room,Tab,X0,Y0,X1,Y1\n"
            "R1,A,0,0,300,400\n"
            "R1,B,10,10,210,110\n", "crops.csv");
    }

    std::unique_ptr<DocumentationPack> build() {
        return build_pack(rooms, crops, tabs, resolver, zones, options);
    }
};

BuildError build_error(PackFixture& f) {
    try {
        f.build();
    } catch (const BuildError& e) {
        return e;
    }
    FAIL("expected a BuildError");
    return BuildError(std::vector<BuildIssue>{});
}

std::vector<std::string> serialized_markers(DocumentationPack& pack, std::string& bytes) {
    bytes = pack.serialize();
    std::shared_ptr<QPDF> pdf = open_memory(bytes);
    return first_text_per_page(*pdf);
}

} // namespace

TEST_CASE("Pack: data pages then tracks riffled") {
    PackFixture f;
    f.standard();

    std::unique_ptr<DocumentationPack> pack = f.build();
    CHECK(pack->stage() == BuildStage::ASSEMBLED);
    CHECK(pack->pageCount() == 5);

    REQUIRE(pack->blocks().size() == 1);
    const PageBlock& block = pack->blocks()[0];
    CHECK(block.room == "R1");
    CHECK(block.data_pages == 1);
    REQUIRE(block.plan_pages.size() == 4);
    CHECK(block.plan_pages[0].tab == "A");
    CHECK(block.plan_pages[1].tab == "B");
    CHECK(block.plan_pages[1].source_page == 1);
    CHECK(block.plan_pages[2].source_page == 2);
    CHECK(block.plan_pages[1].width == doctest::Approx(200.0));

    std::string bytes;
    CHECK(serialized_markers(*pack, bytes) == std::vector<std::string>{"DATA R1", "A1", "B1", "A2", "B2"});
    CHECK(pack->stage() == BuildStage::SERIALIZED);

    std::shared_ptr<QPDF> pdf = open_memory(bytes);
    std::vector<QPDFPageObjectHelper> pages = all_pages(*pdf);
    QPDFObjectHandle::Rectangle a1 = media_box(pages[1]);
    CHECK(a1.urx == doctest::Approx(300.0));
    CHECK(a1.ury == doctest::Approx(400.0));
    QPDFObjectHandle::Rectangle b1 = media_box(pages[2]);
    CHECK(b1.urx == doctest::Approx(200.0));
    CHECK(b1.ury == doctest::Approx(100.0));
}

TEST_CASE("Pack: a short track drops out of the riffle") {
    PackFixture f;
    f.source("A", {"L1", "L2", "L3", "P1"});
    f.tabs = parse_tab_table("Tab,Track,Pages\nA,lighting,1-3\nA,power,4\n", "tabs.csv");
    f.room("R1", "Z1");
    f.crops = parse_crop_table("Room,Tab,X0,Y0,X1,Y1\nR1,A,0,0,300,400\n", "crops.csv");

    std::unique_ptr<DocumentationPack> pack = f.build();
    std::string bytes;
    CHECK(serialized_markers(*pack, bytes) == std::vector<std::string>{"DATA R1", "L1", "P1", "L2", "L3"});
    CHECK(pack->blocks()[0].plan_pages[1].track == "power");
}

TEST_CASE("Pack: blocks follow room order, not completion order") {
    PackFixture f;
    f.standard();
    f.rooms.clear();
    f.room("R2", "Z2");
    f.room("R1", "Z1");
    f.crops = parse_crop_table(
        "Room,Tab,X0,Y0,X1,Y1\n"
        "R1,A,0,0,300,400\n"
        "R1,B,0,0,300,400\n"
        "R2,A,0,0,100,100\n"
        "R2,B,0,0,100,100\n", "crops.csv");
    f.zones.delay_ms["R2"] = 300;

    std::unique_ptr<DocumentationPack> pack = f.build();
    CHECK(f.zones.finish_order["R1"] < f.zones.finish_order["R2"]);

    REQUIRE(pack->blocks().size() == 2);
    CHECK(pack->blocks()[0].room == "R2");
    CHECK(pack->blocks()[1].room == "R1");

    std::string bytes;
    std::vector<std::string> markers = serialized_markers(*pack, bytes);
    REQUIRE(markers.size() == 10);
    CHECK(markers[0] == "DATA R2");
    CHECK(markers[5] == "DATA R1");
}

TEST_CASE("Pack: identical inputs give identical bytes") {
    std::string first;
    std::string second;
    {
        PackFixture f;
        f.standard();
        f.options.workers = 1;
        first = f.build()->serialize();
    }
    {
        PackFixture f;
        f.standard();
        f.options.workers = 4;
        second = f.build()->serialize();
    }
    CHECK(first.size() == second.size());
    CHECK(first == second);
}

TEST_CASE("Pack: document properties use the build timestamp") {
    PackFixture f;
    f.standard();
    std::unique_ptr<DocumentationPack> pack = f.build();
    CHECK(pack->timestamp().iso() == "2025-10-06 15:56:00");

    std::string bytes = pack->serialize();
    std::shared_ptr<QPDF> pdf = open_memory(bytes);
    QPDFObjectHandle info = pdf->getTrailer().getKey("/Info");
    REQUIRE(info.isDictionary());
    CHECK(info.getKey("/Title").getUTF8Value() == "House");
    CHECK(info.getKey("/Producer").getUTF8Value() == "wiredoc");
    CHECK(info.getKey("/CreationDate").getUTF8Value() == "D:20251006155600");
    CHECK(info.getKey("/ModDate").getUTF8Value() == "D:20251006155600");
}

TEST_CASE("Pack: geometry errors stop the build before any file is touched") {
    PackFixture f;
    f.standard();
    f.crops = parse_crop_table(
        "Room,Tab,X0,Y0,X1,Y1\n"
        "R1,A,300,0,100,400\n"
        "R1,B,0,0,100,100\n", "crops.csv");

    BuildError e = build_error(f);
    CHECK(e.kind() == ErrorKind::GEOMETRY);
    REQUIRE(e.issues().size() == 1);
    CHECK(e.issues()[0].code == ErrorCode::INVALID_REGION);
    CHECK(e.issues()[0].room == "R1");
    CHECK(e.issues()[0].tab == "A");
    CHECK(f.resolver.calls == 0);
}

TEST_CASE("Pack: a missing crop names the room and tab") {
    PackFixture f;
    f.standard();
    f.room("R2", "Z2");
    f.crops = parse_crop_table(
        "Room,Tab,X0,Y0,X1,Y1\n"
        "R1,A,0,0,100,100\n"
        "R2,A,0,0,100,100\n"
        "R2,B,0,0,100,100\n", "crops.csv");

    BuildError e = build_error(f);
    REQUIRE(e.issues().size() == 1);
    CHECK(e.issues()[0].code == ErrorCode::MISSING_CROP_REGION);
    CHECK(e.issues()[0].room == "R1");
    CHECK(e.issues()[0].tab == "B");
    CHECK(exit_code_for(e.kind()) == EC_CONFIGURATION_ERROR);
}

TEST_CASE("Pack: crop table consistency") {
    PackFixture f;
    f.standard();

    SUBCASE("unknown tab, unknown track and duplicates are all reported") {
        f.crops = parse_crop_table(
            "Room,Tab,Track,X0,Y0,X1,Y1\n"
            "R1,A,,0,0,100,100\n"
            "R1,B,,0,0,100,100\n"
            "R1,C,,0,0,100,100\n"
            "R1,A,power,0,0,100,100\n"
            "R1,B,,0,0,50,50\n", "crops.csv");

        BuildError e = build_error(f);
        REQUIRE(e.issues().size() == 3);
        CHECK(e.issues()[0].code == ErrorCode::UNKNOWN_TAB);
        CHECK(e.issues()[1].code == ErrorCode::UNKNOWN_TRACK);
        CHECK(e.issues()[2].code == ErrorCode::DUPLICATE_ENTRY);
        CHECK(e.issues()[2].row == 6);
    }
    SUBCASE("rows for rooms that are not configured are ignored") {
        f.crops = parse_crop_table(
            "Room,Tab,X0,Y0,X1,Y1\n"
            "R1,A,0,0,100,100\n"
            "R1,B,0,0,100,100\n"
            "Attic,A,0,0,100,100\n", "crops.csv");
        CHECK(f.build()->blocks().size() == 1);
    }
}

TEST_CASE("Pack: zones without data are fatal") {
    PackFixture f;
    f.standard();
    f.rooms[0].zones.push_back("Z9");

    BuildError e = build_error(f);
    CHECK(e.kind() == ErrorKind::ASSEMBLY);
    REQUIRE(e.issues().size() == 1);
    CHECK(e.issues()[0].code == ErrorCode::MISSING_ZONE_DATA);
    CHECK(e.issues()[0].zone == "Z9");
    CHECK(f.resolver.calls == 0);
}

TEST_CASE("Pack: sources are checked before any room is built") {
    PackFixture f;
    f.standard();

    SUBCASE("page outside the source") {
        f.tabs = parse_tab_table("Tab,Pages\nA,1-3\nB,\n", "tabs.csv");
        BuildError e = build_error(f);
        REQUIRE(e.issues().size() == 1);
        CHECK(e.issues()[0].code == ErrorCode::PAGE_NOT_IN_SOURCE);
        CHECK(e.issues()[0].page == 3);
        CHECK(e.issues()[0].detail == "page 3 not in source (2 page(s))");
    }
    SUBCASE("a long range past the end is reported once") {
        f.tabs = parse_tab_table("Tab,Pages\nA,1-100000\nB,\n", "tabs.csv");
        BuildError e = build_error(f);
        REQUIRE(e.issues().size() == 1);
        CHECK(e.issues()[0].code == ErrorCode::PAGE_NOT_IN_SOURCE);
        CHECK(e.issues()[0].tab == "A");
        CHECK(e.issues()[0].page == 3);
        CHECK(e.issues()[0].detail == "pages 3-100000 not in source (2 page(s))");
    }
    SUBCASE("a range wholly past the end") {
        f.tabs = parse_tab_table("Tab,Pages\nA,\"1,5-2147483647\"\nB,\n", "tabs.csv");
        BuildError e = build_error(f);
        REQUIRE(e.issues().size() == 1);
        CHECK(e.issues()[0].page == 5);
        CHECK(e.issues()[0].detail == "pages 5-2147483647 not in source (2 page(s))");
    }
    SUBCASE("region outside the page") {
        f.crops = parse_crop_table(
            "Room,Tab,X0,Y0,X1,Y1\n"
            "R1,A,0,0,700,100\n"
            "R1,B,0,0,100,100\n", "crops.csv");
        BuildError e = build_error(f);
        REQUIRE(e.issues().size() == 2);
        CHECK(e.kind() == ErrorKind::GEOMETRY);
        CHECK(e.issues()[0].code == ErrorCode::REGION_OUT_OF_BOUNDS);
        CHECK(e.issues()[0].page == 1);
        CHECK(e.issues()[1].page == 2);
    }
    SUBCASE("unresolved tab") {
        f.resolver.paths.erase("B");
        BuildError e = build_error(f);
        CHECK(has_issue(e, ErrorCode::UNRESOLVED_SOURCE));
        CHECK(f.zones.finished == 0);
    }
    SUBCASE("invalid timestamp") {
        f.options.timestamp = "yesterday";
        BuildError e = build_error(f);
        CHECK(e.issues()[0].code == ErrorCode::INVALID_CONFIG);
    }
}

TEST_CASE("Pack: a room without data pages fails the build") {
    PackFixture f;
    f.standard();
    f.zones.empty_rooms.insert("R1");

    BuildError e = build_error(f);
    CHECK(e.issues()[0].code == ErrorCode::MISSING_ROOM_DATA);
    CHECK(e.issues()[0].room == "R1");
}

TEST_CASE("Pack: crop and riffle stages are recorded only when every room is done") {
    PackFixture f;
    f.standard();
    f.room("R2", "Z2");
    f.crops = parse_crop_table(
        "Room,Tab,X0,Y0,X1,Y1\n"
        "R1,A,0,0,300,400\n"
        "R1,B,10,10,210,110\n"
        "R2,A,0,0,300,400\n"
        "R2,B,10,10,210,110\n", "crops.csv");

    SUBCASE("all rooms succeed") {
        PackAssembler assembler(f.rooms, f.crops, f.tabs, f.resolver, f.zones, f.options);
        std::unique_ptr<DocumentationPack> pack = assembler.build();
        CHECK(assembler.stage() == BuildStage::ASSEMBLED);
        CHECK(pack->blocks().size() == 2);
    }
    SUBCASE("one room fails") {
        f.zones.empty_rooms.insert("R2");
        PackAssembler assembler(f.rooms, f.crops, f.tabs, f.resolver, f.zones, f.options);
        CHECK_THROWS_AS(assembler.build(), BuildError);
        CHECK(assembler.stage() == BuildStage::LOADED);
    }
}

TEST_CASE("Pack: check runs validation only") {
    PackFixture f;
    f.standard();
    f.tabs = parse_tab_table("Tab,Track,Pages\nA,plan,2\nB,plan,all\n", "tabs.csv");

    PackAssembler assembler(f.rooms, f.crops, f.tabs, f.resolver, f.zones, f.options);
    std::vector<RoomPlan> plans = assembler.check();

    REQUIRE(plans.size() == 1);
    REQUIRE(plans[0].tracks.size() == 2);
    CHECK(plans[0].tracks[0].pages == std::vector<int>{2});
    CHECK(plans[0].tracks[1].pages == std::vector<int>{1, 2});
    CHECK(plans[0].tracks[1].source_path == f.dir.file("B.pdf"));
    CHECK(f.zones.finished == 0);
    CHECK(assembler.stage() == BuildStage::LOADED);
}

TEST_CASE("Pack: writing") {
    PackFixture f;
    f.standard();
    std::unique_ptr<DocumentationPack> pack = f.build();

    SUBCASE("output replaces nothing until complete") {
        std::string out = f.dir.file("pack.pdf");
        pack->write(out);
        CHECK(std::filesystem::exists(out));
        CHECK_FALSE(std::filesystem::exists(out + ".tmp"));
        CHECK(pack->stage() == BuildStage::SERIALIZED);

        QPDF written;
        written.processFile(out.c_str());
        CHECK(all_pages(written).size() == 5);
    }
    SUBCASE("missing directory") {
        std::string out = f.dir.file("missing/pack.pdf");
        try {
            pack->write(out);
            FAIL("expected a BuildError");
        } catch (const BuildError& e) {
            CHECK(e.issues()[0].code == ErrorCode::WRITE_FAILED);
        }
        CHECK_FALSE(std::filesystem::exists(out));
    }
    SUBCASE("cancelled") {
        std::atomic<bool> cancel{true};
        std::string out = f.dir.file("pack.pdf");
        try {
            pack->write(out, &cancel);
            FAIL("expected a BuildError");
        } catch (const BuildError& e) {
            CHECK(e.kind() == ErrorKind::CANCELLED);
        }
        CHECK_FALSE(std::filesystem::exists(out));
        CHECK_FALSE(std::filesystem::exists(out + ".tmp"));
    }
}

TEST_CASE("Pack: cancellation before room work") {
    PackFixture f;
    f.standard();
    std::atomic<bool> cancel{true};
    f.options.cancel = &cancel;

    BuildError e = build_error(f);
    CHECK(e.kind() == ErrorKind::CANCELLED);
    CHECK(exit_code_for(e.kind()) == EC_CANCELLED);
    CHECK(f.zones.finished == 0);
}

TEST_CASE("Pack: retained intermediates") {
    PackFixture f;
    f.standard();
    f.options.retain_directory = f.dir.file("work");

    f.build();

    CHECK(std::filesystem::exists(f.dir.file("work/data_R1.pdf")));
    CHECK(std::filesystem::exists(f.dir.file("work/plans_R1.pdf")));

    std::ifstream list(f.dir.file("work/plans_R1.csv"));
    REQUIRE(list.is_open());
    std::stringstream content;
    content << list.rdbuf();
    CHECK(content.str() ==
          "Position,Tab,Track,Page,Width,Height\n"
          "1,A,plan,1,300.00,400.00\n"
          "2,B,plan,1,200.00,100.00\n"
          "3,A,plan,2,300.00,400.00\n"
          "4,B,plan,2,200.00,100.00\n");

    QPDF plans;
    plans.processFile(f.dir.file("work/plans_R1.pdf").c_str());
    CHECK(first_text_per_page(plans) == std::vector<std::string>{"A1", "B1", "A2", "B2"});
}
