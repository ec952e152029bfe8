#include <doctest/doctest.h>
#include <nestar/index_list.hpp>

using namespace nestar;

TEST_CASE("parse_index_list maps blocks to locators and prefixes") {
    auto r = parse_index_list(
        "NestarIndex-Version: 1.0\n"
        "\n"
        "_NESTAR_CURRENT_ARCHIVE_\n"
        "com/example/app/\n"
        "\n"
        "lib/util.pkg\n"
        "util/\n"
        "util/io/\n"
        "\n");
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    REQUIRE(r.mappings.size() == 3);

    CHECK(r.mappings[0].locator == "");
    CHECK(r.mappings[0].prefix == "com/example/app/");
    CHECK(r.mappings[1].locator == "lib/util.pkg/");
    CHECK(r.mappings[1].prefix == "util/");
    CHECK(r.mappings[2].locator == "lib/util.pkg/");
    CHECK(r.mappings[2].prefix == "util/io/");
}

TEST_CASE("parse_index_list keeps document order for shared prefixes") {
    auto r = parse_index_list(
        "NestarIndex-Version: 1.0\n"
        "\n"
        "lib/a.pkg\n"
        "util/\n"
        "\n"
        "lib/b.pkg\n"
        "util/\n");
    REQUIRE(r.ok);
    REQUIRE(r.mappings.size() == 2);
    CHECK(r.mappings[0].locator == "lib/a.pkg/");
    CHECK(r.mappings[1].locator == "lib/b.pkg/");
}

TEST_CASE("parse_index_list strips a leading slash from prefixes") {
    auto r = parse_index_list("NestarIndex-Version: 1.0\n\nlib/a.pkg\n/util/\n");
    REQUIRE(r.ok);
    REQUIRE(r.mappings.size() == 1);
    CHECK(r.mappings[0].prefix == "util/");
}

TEST_CASE("parse_index_list accepts CRLF line endings") {
    auto r = parse_index_list("NestarIndex-Version: 1.0\r\n\r\nlib/a.pkg\r\nutil/\r\n");
    REQUIRE(r.ok);
    REQUIRE(r.mappings.size() == 1);
    CHECK(r.mappings[0].locator == "lib/a.pkg/");
    CHECK(r.mappings[0].prefix == "util/");
}

TEST_CASE("parse_index_list ignores everything after an empty block") {
    auto r = parse_index_list(
        "NestarIndex-Version: 1.0\n"
        "\n"
        "lib/a.pkg\n"
        "util/\n"
        "\n"
        "\n"
        "lib/b.pkg\n"
        "other/\n");
    REQUIRE(r.ok);
    REQUIRE(r.mappings.size() == 1);
    CHECK(r.mappings[0].locator == "lib/a.pkg/");
}

TEST_CASE("parse_index_list yields no mappings for an unknown version") {
    auto r = parse_index_list("NestarIndex-Version: 2.0\n\nlib/a.pkg\nutil/\n");
    REQUIRE(r.ok);
    CHECK(r.mappings.empty());
    CHECK(r.warnings.size() == 1);
}

TEST_CASE("parse_index_list rejects an empty document") {
    auto r = parse_index_list("");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("parse_index_list allows a locator without prefixes") {
    auto r = parse_index_list("NestarIndex-Version: 1.0\n\nlib/a.pkg\n\nlib/b.pkg\nutil/\n");
    REQUIRE(r.ok);
    REQUIRE(r.mappings.size() == 1);
    CHECK(r.mappings[0].locator == "lib/b.pkg/");
}
