#include <doctest/doctest.h>
#include <nestar/archive.hpp>

#include "zip_fixture.hpp"

#include <string>
#include <vector>

using namespace nestar;
using nestar::testing::ZipBuilder;
using nestar::testing::as_string;
using nestar::testing::to_bytes;

namespace {

std::unique_ptr<ArchiveReader> open_or_fail(Bytes data,
                                            ArchiveOpenMode mode = ArchiveOpenMode::RandomAccess) {
    auto r = ArchiveReader::open_memory(std::move(data), "test.zip", mode);
    REQUIRE_MESSAGE(r.isOk(), r.error().toString());
    return r.takeValue();
}

} // namespace

// ============================================================================
// Central Directory
// ============================================================================

TEST_CASE("ArchiveReader lists entries in physical order") {
    auto data = ZipBuilder()
        .add_directory("util/")
        .add_file("util/b.bin", "bbb")
        .add_file("util/a.bin", "aa")
        .build();
    auto reader = open_or_fail(data);

    REQUIRE(reader->entry_count() == 3);
    CHECK(reader->entries()[0].name == "util/");
    CHECK(reader->entries()[0].is_directory);
    CHECK(reader->entries()[0].size == 0);
    CHECK(reader->entries()[1].name == "util/b.bin");
    CHECK(reader->entries()[1].size == 3);
    CHECK(reader->entries()[2].name == "util/a.bin");
}

TEST_CASE("ArchiveReader for_each stops when the callback returns false") {
    auto data = ZipBuilder().add_file("a", "1").add_file("b", "2").add_file("c", "3").build();
    auto reader = open_or_fail(data);

    std::vector<std::string> seen;
    reader->for_each([&](const ArchiveEntry& e) {
        seen.push_back(e.name);
        return seen.size() < 2;
    });
    CHECK(seen == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ArchiveReader accepts an empty archive") {
    auto reader = open_or_fail(ZipBuilder().build());
    CHECK(reader->entry_count() == 0);
    CHECK(reader->find("anything") == nullptr);
}

TEST_CASE("ArchiveReader find needs random access") {
    auto data = ZipBuilder().add_file("a.txt", "x").build();

    auto random = open_or_fail(data, ArchiveOpenMode::RandomAccess);
    CHECK(random->is_random_access());
    CHECK(random->find("a.txt") != nullptr);

    auto sequential = open_or_fail(data, ArchiveOpenMode::Sequential);
    CHECK_FALSE(sequential->is_random_access());
    CHECK(sequential->find("a.txt") == nullptr);
    CHECK(sequential->entry_count() == 1);
}

TEST_CASE("ArchiveReader find returns the first physical duplicate") {
    auto data = ZipBuilder().add_file("dup.txt", "first").add_file("dup.txt", "second").build();
    auto reader = open_or_fail(data);

    const ArchiveEntry* entry = reader->find("dup.txt");
    REQUIRE(entry != nullptr);
    auto bytes = reader->read(*entry);
    REQUIRE(bytes.isOk());
    CHECK(as_string(bytes.value()) == "first");
}

// ============================================================================
// Entry Payloads
// ============================================================================

TEST_CASE("ArchiveReader reads stored entries") {
    auto reader = open_or_fail(ZipBuilder().add_file("hello.txt", "hello world").build());
    auto bytes = reader->read("hello.txt");
    REQUIRE(bytes.isOk());
    CHECK(as_string(bytes.value()) == "hello world");
}

TEST_CASE("ArchiveReader inflates deflated entries") {
    std::string text;
    for (int i = 0; i < 200; ++i) text += "repetitive line " + std::to_string(i % 7) + "\n";

    auto reader = open_or_fail(ZipBuilder().add_file("big.txt", text, true).build());
    const ArchiveEntry* entry = reader->find("big.txt");
    REQUIRE(entry != nullptr);
    CHECK(entry->method == ZIP_METHOD_DEFLATED);
    CHECK(entry->compressed_size < entry->size);

    auto bytes = reader->read(*entry);
    REQUIRE(bytes.isOk());
    CHECK(as_string(bytes.value()) == text);
}

TEST_CASE("ArchiveReader reads empty entries of both methods") {
    auto reader = open_or_fail(ZipBuilder()
        .add_file("empty-stored", "")
        .add_file("empty-deflated", "", true)
        .build());

    auto a = reader->read("empty-stored");
    auto b = reader->read("empty-deflated");
    REQUIRE(a.isOk());
    REQUIRE(b.isOk());
    CHECK(a.value().empty());
    CHECK(b.value().empty());
}

TEST_CASE("ArchiveReader read of a directory yields no bytes") {
    auto reader = open_or_fail(ZipBuilder().add_directory("util").build());
    auto bytes = reader->read("util/");
    REQUIRE(bytes.isOk());
    CHECK(bytes.value().empty());
}

TEST_CASE("ArchiveReader read by name reports missing entries") {
    auto reader = open_or_fail(ZipBuilder().add_file("a", "1").build());
    auto bytes = reader->read("b");
    REQUIRE(bytes.isErr());
    CHECK(bytes.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("ArchiveReader opens nested archives from entry bytes") {
    auto inner = ZipBuilder().add_file("util/Helper.bin", "v1").build();
    auto outer = ZipBuilder().add_file("lib/a.pkg", inner).build();

    auto reader = open_or_fail(outer);
    auto inner_bytes = reader->read("lib/a.pkg");
    REQUIRE(inner_bytes.isOk());

    std::string origin = nested_locator(reader->locator(), "lib/a.pkg");
    CHECK(origin == "test.zip!/lib/a.pkg");

    auto nested = ArchiveReader::open_memory(inner_bytes.takeValue(), origin,
                                             ArchiveOpenMode::RandomAccess);
    REQUIRE(nested.isOk());
    CHECK(nested.value()->locator() == origin);
    auto helper = nested.value()->read("util/Helper.bin");
    REQUIRE(helper.isOk());
    CHECK(as_string(helper.value()) == "v1");
}

// ============================================================================
// Structural Errors
// ============================================================================

TEST_CASE("ArchiveReader rejects data without an end record") {
    auto r = ArchiveReader::open_memory(to_bytes("this is not a zip archive at all"), "junk.zip");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CORRUPT_ARCHIVE);
    CHECK(r.error().message().find("junk.zip") != std::string::npos);
}

TEST_CASE("ArchiveReader rejects tiny inputs") {
    auto r = ArchiveReader::open_memory(Bytes{0x50, 0x4b}, "tiny.zip");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CORRUPT_ARCHIVE);
}

TEST_CASE("ArchiveReader rejects a truncated archive") {
    auto data = ZipBuilder().add_file("a.txt", "content").build();
    data.resize(data.size() - 10);
    auto r = ArchiveReader::open_memory(std::move(data), "cut.zip");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CORRUPT_ARCHIVE);
}

TEST_CASE("ArchiveReader rejects a corrupted central directory signature") {
    auto data = ZipBuilder().add_file("a.txt", "content").build();
    // Central directory starts right after the single local record
    size_t cd = 30 + std::string("a.txt").size() + std::string("content").size();
    data[cd] = 0x00;
    auto r = ArchiveReader::open_memory(std::move(data), "bad.zip");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CORRUPT_ARCHIVE);
}

TEST_CASE("ArchiveReader detects CRC mismatches") {
    auto data = ZipBuilder().add_file("a.txt", "content").build();
    // Flip one byte of the stored payload
    data[30 + std::string("a.txt").size()] ^= 0xFF;

    auto reader = open_or_fail(std::move(data));
    auto bytes = reader->read("a.txt");
    REQUIRE(bytes.isErr());
    CHECK(bytes.error().code() == ErrorCode::CORRUPT_ARCHIVE);
    CHECK(bytes.error().message().find("CRC") != std::string::npos);
}

TEST_CASE("ArchiveReader detects a damaged local header") {
    auto data = ZipBuilder().add_file("a.txt", "content").build();
    data[0] = 0x00;

    auto reader = open_or_fail(std::move(data));
    auto bytes = reader->read("a.txt");
    REQUIRE(bytes.isErr());
    CHECK(bytes.error().code() == ErrorCode::CORRUPT_ARCHIVE);
}

TEST_CASE("ArchiveReader reports unsupported compression methods") {
    auto data = ZipBuilder().add_file("a.txt", "content").build();
    // Patch the method field in the central record to 12 (bzip2)
    size_t cd = 30 + std::string("a.txt").size() + std::string("content").size();
    data[cd + 10] = 12;

    auto reader = open_or_fail(std::move(data));
    auto bytes = reader->read("a.txt");
    REQUIRE(bytes.isErr());
    CHECK(bytes.error().code() == ErrorCode::UNSUPPORTED_COMPRESSION);
}

TEST_CASE("ArchiveReader rejects multi-volume archives") {
    auto data = ZipBuilder().add_file("a.txt", "x").build();
    // EOCD "number of this disk"
    data[data.size() - 22 + 4] = 1;
    auto r = ArchiveReader::open_memory(std::move(data), "split.zip");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CORRUPT_ARCHIVE);
}

// ============================================================================
// File-backed Archives
// ============================================================================

TEST_CASE("ArchiveReader open_file reads from disk") {
    testing::TempDir dir;
    std::string path = dir.file("disk.zip");
    ZipBuilder().add_file("x/y.txt", "on disk", true).write(path);

    auto r = ArchiveReader::open_file(path, ArchiveOpenMode::RandomAccess);
    REQUIRE(r.isOk());
    CHECK(r.value()->locator() == path);
    auto bytes = r.value()->read("x/y.txt");
    REQUIRE(bytes.isOk());
    CHECK(as_string(bytes.value()) == "on disk");
}

TEST_CASE("ArchiveReader open_file reports missing files") {
    testing::TempDir dir;
    auto r = ArchiveReader::open_file(dir.file("missing.zip"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
}
