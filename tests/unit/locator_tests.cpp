#include <doctest/doctest.h>
#include <nestar/archive.hpp>
#include <nestar/locator.hpp>

#include "zip_fixture.hpp"

#include <iterator>

using namespace nestar;
using nestar::testing::ZipBuilder;
using nestar::testing::as_string;
using nestar::testing::to_bytes;

namespace {

std::string slurp(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Locator opens in-memory buffers") {
    auto data = std::make_shared<const Bytes>(to_bytes("in memory"));
    auto locator = Locator::memory("app.zip!/lib/a.pkg", "util/Helper.bin", data);

    CHECK(locator.kind() == Locator::Kind::Memory);
    CHECK(locator.to_string() == "memory:app.zip!/lib/a.pkg!/util/Helper.bin");

    auto stream = locator.open();
    REQUIRE(stream.isOk());
    CHECK(slurp(*stream.value()) == "in memory");
}

TEST_CASE("Locator opens archive members lazily") {
    auto built = ZipBuilder().add_file("lib/a.pkg/util/Helper.bin", "member bytes", true).build();
    auto reader = ArchiveReader::open_memory(built, "app.zip", ArchiveOpenMode::RandomAccess);
    REQUIRE(reader.isOk());
    std::shared_ptr<const ArchiveReader> archive(reader.takeValue());

    auto locator = Locator::archive_member(archive, "lib/a.pkg/util/Helper.bin");
    CHECK(locator.kind() == Locator::Kind::Archive);
    CHECK(locator.to_string() == "archive:app.zip!/lib/a.pkg/util/Helper.bin");

    auto bytes = locator.read_all();
    REQUIRE(bytes.isOk());
    CHECK(as_string(bytes.value()) == "member bytes");
}

TEST_CASE("Locator opens files on disk") {
    testing::TempDir dir;
    std::string path = dir.file("plain.txt");
    {
        std::ofstream out(path, std::ios::binary);
        out << "from disk";
    }

    auto locator = Locator::file(path);
    CHECK(locator.kind() == Locator::Kind::File);
    CHECK(locator.to_string() == "file:" + path);

    auto stream = locator.open();
    REQUIRE(stream.isOk());
    CHECK(slurp(*stream.value()) == "from disk");
}

TEST_CASE("Locator reports missing files") {
    testing::TempDir dir;
    auto r = Locator::file(dir.file("gone.txt")).open();
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("Locator namespace placeholders cannot be opened") {
    auto locator = Locator::namespace_marker("util");
    CHECK(locator.kind() == Locator::Kind::Namespace);
    CHECK(locator.to_string() == "namespace:util/");

    auto r = locator.open();
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::NOT_A_FILE);
    CHECK(locator.read_all().isErr());
}

TEST_CASE("Locator streams are independent") {
    auto data = std::make_shared<const Bytes>(to_bytes("abcdef"));
    auto locator = Locator::memory("o", "p", data);

    auto a = locator.open();
    auto b = locator.open();
    REQUIRE(a.isOk());
    REQUIRE(b.isOk());

    char buf[3] = {};
    a.value()->read(buf, 3);
    CHECK(std::string(buf, 3) == "abc");
    CHECK(slurp(*b.value()) == "abcdef");
    CHECK(slurp(*a.value()) == "def");
}
