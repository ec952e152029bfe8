#include <doctest/doctest.h>
#include <nestar/eager_strategy.hpp>
#include <nestar/lazy_strategy.hpp>
#include <nestar/resolver.hpp>

#include "zip_fixture.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace nestar;
using nestar::testing::ZipBuilder;
using nestar::testing::as_string;

namespace {

// Two inner archives a.pkg and b.pkg both declaring util/, in that order
Bytes flat_scenario() {
    auto a = ZipBuilder()
        .add_directory("util/")
        .add_file("util/Helper.bin", Bytes{0x01, 0x02})
        .add_file("config.properties", "top=level")
        .build();
    auto b = ZipBuilder().add_directory("util/").add_file("util/Helper.bin", Bytes{0x03}).build();
    return ZipBuilder()
        .add_manifest("Nestar-Layout: flat\n")
        .add_file("a.pkg", a)
        .add_file("b.pkg", b)
        .build();
}

Bytes inline_scenario() {
    return ZipBuilder()
        .add_manifest("Nestar-Layout: inline\n")
        .add_file("META-INF/INDEX.LIST",
                  "NestarIndex-Version: 1.0\n\na.pkg\nutil/\nconfig.properties\n\nb.pkg\nutil/\n")
        .add_directory("a.pkg/util/")
        .add_file("a.pkg/util/Helper.bin", Bytes{0x01, 0x02})
        .add_file("a.pkg/config.properties", "top=level")
        .add_directory("b.pkg/util/")
        .add_file("b.pkg/util/Helper.bin", Bytes{0x03})
        .build();
}

struct Built {
    PackageRegistrar registrar;
    std::shared_ptr<const ResourceSource> strategy;
    const EagerStrategy* eager = nullptr;
};

std::unique_ptr<Built> build_eager(const Bytes& data) {
    auto built = std::make_unique<Built>();
    auto reader = ArchiveReader::open_memory(data, "app.zip");
    REQUIRE(reader.isOk());
    auto created = EagerStrategy::create(*reader.value(), Manifest{}, built->registrar);
    REQUIRE(created.isOk());
    std::shared_ptr<const EagerStrategy> eager(created.takeValue());
    built->eager = eager.get();
    built->strategy = eager;
    return built;
}

std::unique_ptr<Built> build_lazy(const Bytes& data) {
    auto built = std::make_unique<Built>();
    auto reader = ArchiveReader::open_memory(data, "app.zip", ArchiveOpenMode::RandomAccess);
    REQUIRE(reader.isOk());
    std::shared_ptr<const ArchiveReader> outer(reader.takeValue());
    auto created = LazyStrategy::create(outer, Manifest{}, built->registrar);
    REQUIRE(created.isOk());
    built->strategy = std::shared_ptr<const LazyStrategy>(created.takeValue());
    return built;
}

void write_text(const std::string& path, const std::string& text) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

} // namespace

// ============================================================================
// Concrete Scenarios
// ============================================================================

TEST_CASE("util/Helper.bin resolves to the first archive's bytes under both strategies") {
    SUBCASE("lazy") {
        auto built = build_lazy(inline_scenario());
        Resolver resolver(built->strategy);
        auto bytes = resolver.resolve("util/Helper.bin");
        REQUIRE(bytes.has_value());
        CHECK(*bytes == Bytes{0x01, 0x02});
    }

    SUBCASE("eager") {
        auto built = build_eager(flat_scenario());
        Resolver resolver(built->strategy);
        auto bytes = resolver.resolve("util/Helper.bin");
        REQUIRE(bytes.has_value());
        CHECK(*bytes == Bytes{0x01, 0x02});

        REQUIRE(built->eager->conflicts().size() == 1);
        CHECK(built->eager->conflicts()[0].first_origin == "app.zip!/a.pkg");
        CHECK(built->eager->conflicts()[0].duplicate_origin == "app.zip!/b.pkg");
    }
}

TEST_CASE("a top-level resource resolves the same under both strategies") {
    for (bool lazy : {false, true}) {
        auto built = lazy ? build_lazy(inline_scenario()) : build_eager(flat_scenario());
        Resolver resolver(built->strategy);

        auto bytes = resolver.resolve("config.properties");
        REQUIRE(bytes.has_value());
        CHECK(as_string(*bytes) == "top=level");
        CHECK(resolver.exists("/config.properties"));
        CHECK(resolver.list_all("config.properties").size() == 1);
    }
}

TEST_CASE("a missing path resolves to absent without a fallback") {
    auto built = build_eager(flat_scenario());
    Resolver resolver(built->strategy);

    CHECK_FALSE(resolver.resolve("missing/Thing.bin").has_value());
    CHECK_FALSE(resolver.find("missing/Thing.bin").has_value());
    CHECK_FALSE(resolver.exists("missing/Thing.bin"));
    CHECK(resolver.list_all("missing/Thing.bin").empty());

    auto stream = resolver.open("missing/Thing.bin");
    REQUIRE(stream.isErr());
    CHECK(stream.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("exists is true for a resolvable path or a known namespace") {
    for (bool lazy : {false, true}) {
        auto built = lazy ? build_lazy(inline_scenario()) : build_eager(flat_scenario());
        Resolver resolver(built->strategy);

        CHECK(resolver.exists("util/Helper.bin"));
        CHECK(resolver.exists("util/"));
        CHECK(resolver.exists("util"));
        CHECK_FALSE(resolver.exists("other/"));
    }
}

// ============================================================================
// Chain
// ============================================================================

TEST_CASE("Resolver consults fallbacks only on a miss") {
    testing::TempDir dir;
    write_text(dir.file("util/Helper.bin"), "from disk");
    write_text(dir.file("extra/Only.bin"), "only on disk");

    auto built = build_eager(flat_scenario());
    Resolver resolver(built->strategy);
    resolver.add_fallback(std::make_shared<DirectorySource>(dir.path()));

    CHECK(*resolver.resolve("util/Helper.bin") == Bytes{0x01, 0x02});
    CHECK(as_string(*resolver.resolve("extra/Only.bin")) == "only on disk");

    auto locator = resolver.find("extra/Only.bin");
    REQUIRE(locator.has_value());
    CHECK(locator->kind() == Locator::Kind::File);
}

TEST_CASE("Resolver list_all concatenates matches in chain order") {
    testing::TempDir dir;
    write_text(dir.file("util/Helper.bin"), "from disk");

    auto built = build_lazy(inline_scenario());
    Resolver resolver(built->strategy);
    resolver.add_fallback(std::make_shared<DirectorySource>(dir.path()));

    auto all = resolver.list_all("util/Helper.bin");
    REQUIRE(all.size() == 3);
    CHECK(all[0].to_string() == "archive:app.zip!/a.pkg/util/Helper.bin");
    CHECK(all[1].to_string() == "archive:app.zip!/b.pkg/util/Helper.bin");
    CHECK(all[2].kind() == Locator::Kind::File);
}

TEST_CASE("Resolver list_all includes a namespace placeholder") {
    auto built = build_eager(flat_scenario());
    Resolver resolver(built->strategy);

    auto all = resolver.list_all("util/");
    REQUIRE(all.size() == 1);
    CHECK(all[0].to_string() == "namespace:util/");
    CHECK(all[0].open().error().code() == ErrorCode::NOT_A_FILE);
}

TEST_CASE("Resolvers can be chained behind each other") {
    auto first = build_eager(flat_scenario());
    auto second = build_eager(ZipBuilder().add_file("other/Thing.bin", "thing").build());

    auto inner = std::make_shared<Resolver>(second->strategy);
    Resolver outer(first->strategy);
    outer.add_fallback(inner);

    CHECK(as_string(*outer.resolve("other/Thing.bin")) == "thing");
    CHECK(outer.chain().size() == 2);
    CHECK(outer.describe().find(" -> ") != std::string::npos);
}

TEST_CASE("Resolver open streams the winning bytes") {
    auto built = build_lazy(inline_scenario());
    Resolver resolver(built->strategy);

    auto stream = resolver.open("/util/Helper.bin");
    REQUIRE(stream.isOk());
    std::string content((std::istreambuf_iterator<char>(*stream.value())),
                        std::istreambuf_iterator<char>());
    CHECK(content == std::string("\x01\x02", 2));
}

// ============================================================================
// DirectorySource
// ============================================================================

TEST_CASE("DirectorySource resolves files and reports directories as namespaces") {
    testing::TempDir dir;
    write_text(dir.file("pkg/File.bin"), "file");

    DirectorySource source(dir.path());
    CHECK(as_string(*source.resolve("/pkg/File.bin")) == "file");
    CHECK(source.exists("pkg/"));
    CHECK_FALSE(source.resolve("pkg/").has_value());
    CHECK_FALSE(source.exists("pkg/Missing.bin"));

    auto all = source.list_all("pkg");
    REQUIRE(all.size() == 1);
    CHECK(all[0].kind() == Locator::Kind::Namespace);
}

TEST_CASE("DirectorySource stays inside its root") {
    testing::TempDir dir;
    write_text(dir.file("secret.txt"), "outside");
    write_text(dir.file("sub/inside.txt"), "inside");

    DirectorySource source(dir.file("sub"));
    CHECK(as_string(*source.resolve("inside.txt")) == "inside");

    for (const char* path : {"../secret.txt", "/../secret.txt", "a/../../secret.txt", "..\\secret.txt", ".."}) {
        CAPTURE(path);
        CHECK_FALSE(source.resolve(path).has_value());
        CHECK_FALSE(source.find(path).has_value());
        CHECK_FALSE(source.exists(path));
        CHECK(source.list_all(path).empty());
    }
}

TEST_CASE("DirectorySource does not treat the root as a match") {
    testing::TempDir dir;
    write_text(dir.file("pkg/File.bin"), "file");

    DirectorySource source(dir.path());
    CHECK_FALSE(source.exists(""));
    CHECK_FALSE(source.exists("/"));
    CHECK(source.list_all("").empty());

    auto built = build_eager(flat_scenario());
    Resolver resolver(built->strategy);
    resolver.add_fallback(std::make_shared<DirectorySource>(dir.path()));
    CHECK_FALSE(resolver.exists(""));
    CHECK(resolver.exists("pkg"));
}
