#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "wiredoc/text_util.h"

using namespace WireDoc;

TEST_CASE("Names: whitespace and typographic quotes are folded") {
    CHECK(normalise_name("  Master   Bedroom \n") == "Master Bedroom");
    CHECK(normalise_name("Kid\xE2\x80\x99s room") == "Kid's room");
    CHECK(normalise_name("\xE2\x80\x9CLoft\xE2\x80\x9D") == "\"Loft\"");
    CHECK(normalise_name("") == "");
}

TEST_CASE("Numbers: strict parsing") {
    double d = 0.0;
    CHECK(parse_double(" 12.5 ", d));
    CHECK(d == doctest::Approx(12.5));
    CHECK(parse_double("-3", d));
    CHECK(d == doctest::Approx(-3.0));
    CHECK_FALSE(parse_double("12pt", d));
    CHECK_FALSE(parse_double("", d));
    CHECK_FALSE(parse_double("nan", d));

    int i = 0;
    CHECK(parse_int("42", i));
    CHECK(i == 42);
    CHECK_FALSE(parse_int("4.2", i));
    CHECK_FALSE(parse_int("x", i));
}

TEST_CASE("Page specs") {
    PageSpec spec;
    std::string error;

    SUBCASE("all and empty select every page") {
        CHECK(parse_page_spec("all", spec, error));
        CHECK(spec.all);
        CHECK(parse_page_spec("  ", spec, error));
        CHECK(spec.all);
        CHECK(parse_page_spec("ALL", spec, error));
        CHECK(spec.all);
    }
    SUBCASE("ranges and single pages keep their order") {
        REQUIRE(parse_page_spec("1-3, 7,9-10", spec, error));
        CHECK_FALSE(spec.all);
        REQUIRE(spec.ranges.size() == 3);
        CHECK(spec.ranges[0].first == 1);
        CHECK(spec.ranges[0].last == 3);
        CHECK(spec.ranges[1].first == 7);
        CHECK(spec.ranges[1].last == 7);
        CHECK(spec.ranges[2].first == 9);
        CHECK(spec.ranges[2].last == 10);
    }
    SUBCASE("huge ranges are stored as written") {
        REQUIRE(parse_page_spec("1-2147483647", spec, error));
        REQUIRE(spec.ranges.size() == 1);
        CHECK(spec.ranges[0].first == 1);
        CHECK(spec.ranges[0].last == 2147483647);
    }
    SUBCASE("invalid specs are rejected") {
        CHECK_FALSE(parse_page_spec("0", spec, error));
        CHECK_FALSE(parse_page_spec("5-2", spec, error));
        CHECK_FALSE(parse_page_spec("1,,2", spec, error));
        CHECK_FALSE(parse_page_spec("a-b", spec, error));
        CHECK_FALSE(error.empty());
    }
}

TEST_CASE("CSV: quoting, blank lines and line numbers") {
    std::vector<CsvRecord> records;
    std::string error;

    const std::string text =
        "\xEF\xBB\xBFRoom,Tab\n"
        "\n"
        "\"Kitchen, east\",\"Ground \"\"A\"\"\"\n"
        "\"Multi\nline\",T2\r\n"
        "Last,T3";

    REQUIRE(parse_csv_text(text, records, error));
    REQUIRE(records.size() == 4);
    CHECK(records[0].fields == std::vector<std::string>{"Room", "Tab"});
    CHECK(records[0].line == 1);
    CHECK(records[1].fields == std::vector<std::string>{"Kitchen, east", "Ground \"A\""});
    CHECK(records[1].line == 3);
    CHECK(records[2].fields == std::vector<std::string>{"Multi\nline", "T2"});
    CHECK(records[2].line == 4);
    CHECK(records[3].fields == std::vector<std::string>{"Last", "T3"});
    CHECK(records[3].line == 6);
}

TEST_CASE("CSV: malformed quoting is reported") {
    std::vector<CsvRecord> records;
    std::string error;
    CHECK_FALSE(parse_csv_text("a,\"unterminated\n", records, error));
    CHECK(error.find("unterminated") != std::string::npos);
}

TEST_CASE("CSV: header lookup and escaping") {
    std::vector<std::string> header = {"Room", " tab ", "X0"};
    CHECK(column_index(header, "room") == 0);
    CHECK(column_index(header, "TAB") == 1);
    CHECK(column_index(header, "Y0") == -1);

    CHECK(csv_escape("plain") == "plain");
    CHECK(csv_escape("a,b") == "\"a,b\"");
    CHECK(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
}
