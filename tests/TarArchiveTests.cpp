// Unit tests for utils/TarArchive.cpp - in-memory tar and tar.gz reader

#include <catch2/catch.hpp>
#include "core/Errors.hpp"
#include "utils/TarArchive.hpp"
#include "utils/ZipArchive.hpp"
#include "support/TarWriter.hpp"
#include "support/TestHelpers.hpp"
#include "support/ZipWriter.hpp"

TEST_CASE("TarArchive - Reads plain and gzipped archives", "[tar][unit]") {
    std::string book(3000, 'b');
    TarWriter writer;
    writer.add_directory("pack").add("pack/Book.epub", book).add("pack/empty.txt", "");

    SECTION("Plain tar") {
        std::string bytes = writer.build();
        REQUIRE(TarArchive::has_signature(bytes));
        TarArchive tar(bytes);

        REQUIRE(tar.entries().size() == 3);
        REQUIRE(tar.entries()[0].is_directory());
        REQUIRE(tar.entries()[1].name == "pack/Book.epub");
        REQUIRE(tar.entries()[1].is_file());
        REQUIRE(tar.read(tar.entries()[1]) == book);
        REQUIRE(tar.read(tar.entries()[2]).empty());
    }

    SECTION("Gzipped tar") {
        std::string bytes = writer.build_gzip();
        REQUIRE(TarArchive::has_signature(bytes));
        TarArchive tar(bytes);
        REQUIRE(tar.entries().size() == 3);
        REQUIRE(tar.read(tar.entries()[1]) == book);
    }
}

TEST_CASE("TarArchive - Long names and links", "[tar][unit]") {
    std::string long_name = std::string(60, 'd') + "/" + std::string(60, 'e') + "/Book.pdf";
    TarArchive tar(TarWriter().add(long_name, "pdf").add_symlink("link.epub", "/etc/passwd").build());

    REQUIRE(tar.entries().size() == 2);
    REQUIRE(tar.entries()[0].name == long_name);
    REQUIRE(tar.read(tar.entries()[0]) == "pdf");
    REQUIRE(tar.entries()[1].type == '2');
    REQUIRE_FALSE(tar.entries()[1].is_file());
    REQUIRE_FALSE(tar.entries()[1].is_directory());
}

TEST_CASE("TarArchive - Signature detection", "[tar][unit]") {
    TempDir dir;
    TarWriter().add("a.txt", "alpha").write((dir / "a.tar.gz").string(), true);
    TarWriter().add("a.txt", "alpha").write((dir / "a.tar").string());
    ZipWriter().add("a.txt", "alpha").write((dir / "a.zip").string());
    write_text(dir / "plain.txt", std::string(600, 'p'));

    REQUIRE(TarArchive::file_has_signature((dir / "a.tar.gz").string()));
    REQUIRE(TarArchive::file_has_signature((dir / "a.tar").string()));
    REQUIRE_FALSE(TarArchive::file_has_signature((dir / "a.zip").string()));
    REQUIRE_FALSE(TarArchive::file_has_signature((dir / "plain.txt").string()));
    REQUIRE_FALSE(TarArchive::file_has_signature((dir / "absent.tar").string()));

    TarArchive tar = TarArchive::open((dir / "a.tar.gz").string());
    REQUIRE(tar.read(tar.entries().at(0)) == "alpha");
}

TEST_CASE("TarArchive - Rejects damaged input", "[tar][unit]") {
    SECTION("Bad header checksum") {
        std::string bytes = TarWriter().add("a.txt", "alpha").build();
        bytes[0] = 'z';
        REQUIRE_THROWS_AS(TarArchive(bytes), TarFormatError);
    }

    SECTION("Data cut short") {
        std::string bytes = TarWriter().add("a.txt", std::string(2000, 'a')).build();
        REQUIRE_THROWS_AS(TarArchive(bytes.substr(0, 1024)), TarFormatError);
    }

    SECTION("Zip bytes are not a tar header") {
        std::string zip = ZipWriter().add("a.txt", "alpha").build();
        REQUIRE_THROWS_AS(TarArchive(zip + std::string(600, '\0')), TarFormatError);
    }

    SECTION("Truncated gzip stream") {
        std::string gz = TarWriter().add("a.txt", "alpha").build_gzip();
        REQUIRE_THROWS_AS(TarArchive(gz.substr(0, gz.size() / 2)), TarFormatError);
    }

    SECTION("Expansion past the limit") {
        std::string bytes = TarWriter().add("zeros.bin", std::string(1 << 20, '\0')).build_gzip();
        REQUIRE_THROWS_WITH(TarArchive(bytes, 64 * 1024), "Compressed archive expands beyond 65536 bytes");
    }

    SECTION("TarFormatError is an ArchiveFormatError") {
        REQUIRE_THROWS_AS(TarArchive(std::string(700, 'x')), ArchiveFormatError);
        REQUIRE_THROWS_AS(TarArchive(std::string(700, 'x')), ProtocolError);
    }
}
