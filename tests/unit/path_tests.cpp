#include <doctest/doctest.h>
#include <nestar/types.hpp>
#include <nestar/platform.hpp>

#include "zip_fixture.hpp"

using namespace nestar;

// ============================================================================
// Logical Path Tests
// ============================================================================

TEST_CASE("normalize_logical_path strips leading slash") {
    CHECK(normalize_logical_path("/util/Helper.bin") == "util/Helper.bin");
    CHECK(normalize_logical_path("//util/Helper.bin") == "util/Helper.bin");
    CHECK(normalize_logical_path("util/Helper.bin") == "util/Helper.bin");
}

TEST_CASE("normalize_logical_path converts backslashes") {
    CHECK(normalize_logical_path("util\\io\\Reader.bin") == "util/io/Reader.bin");
}

TEST_CASE("namespace_prefix keeps everything up to the last slash") {
    CHECK(namespace_prefix("util/Helper.bin") == "util/");
    CHECK(namespace_prefix("util/io/Reader.bin") == "util/io/");
}

TEST_CASE("namespace_prefix is empty for top-level paths") {
    CHECK(namespace_prefix("Helper.bin") == "");
    CHECK(namespace_prefix("/Helper.bin") == "");
    CHECK(namespace_prefix("") == "");
}

TEST_CASE("namespace_key trims slashes on both ends") {
    CHECK(namespace_key("util/") == "util");
    CHECK(namespace_key("/util/io/") == "util/io");
    CHECK(namespace_key("util") == "util");
    CHECK(namespace_key("/") == "");
}

TEST_CASE("has_suffix is case-insensitive") {
    std::vector<std::string> suffixes = {".zip", ".jar", ".pkg"};
    CHECK(has_suffix("lib/a.pkg", suffixes));
    CHECK(has_suffix("lib/A.JAR", suffixes));
    CHECK_FALSE(has_suffix("lib/a.pkg.txt", suffixes));
    CHECK_FALSE(has_suffix("zip", suffixes));
}

TEST_CASE("parse_layout_kind accepts known names") {
    CHECK(parse_layout_kind("flat") == LayoutKind::Flat);
    CHECK(parse_layout_kind("INLINE") == LayoutKind::Inline);
    CHECK_FALSE(parse_layout_kind("nested").has_value());
}

// ============================================================================
// Platform Tests
// ============================================================================

TEST_CASE("create_unique_file never hands out the same name twice") {
    testing::TempDir dir;
    Bytes content = testing::to_bytes("payload");

    auto a = create_unique_file(dir.path(), "libfoo", ".so", content);
    auto b = create_unique_file(dir.path(), "libfoo", ".so", content);
    REQUIRE(a.isOk());
    REQUIRE(b.isOk());
    CHECK(a.value() != b.value());

    CHECK(get_filename(a.value()).rfind("libfoo", 0) == 0);
    CHECK(get_filename(a.value()).size() > std::string("libfoo.so").size());
    CHECK(a.value().substr(a.value().size() - 3) == ".so");

    auto read = read_file_bytes(a.value());
    REQUIRE(read.isOk());
    CHECK(read.value() == content);
}

TEST_CASE("create_unique_file fails in a missing directory") {
    testing::TempDir dir;
    auto r = create_unique_file(dir.file("missing"), "x", ".so", Bytes{1, 2, 3});
    CHECK(r.isErr());
}

TEST_CASE("read_file_bytes reports missing files") {
    testing::TempDir dir;
    auto r = read_file_bytes(dir.file("nope.bin"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("join_path and get_parent_directory agree") {
    std::string joined = join_path("/opt/app", "lib/a.pkg");
    CHECK(get_filename(joined) == "a.pkg");
    CHECK(get_filename(get_parent_directory(joined)) == "lib");
}
