#include <catch2/catch.hpp>

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Zipper.hpp"
#include "libpandaprint/ZipperArchive.hpp"

using namespace PandaPrint;

TEST_CASE("In-memory zip archives", "[Zipper]") {
    Zipper zipper;
    zipper.add_entry("Metadata/", nullptr, 0);
    zipper.add_entry("Metadata/plate_1.gcode", std::string(100000, 'G'));
    zipper.add_entry("empty.txt", "");
    REQUIRE(zipper.entries_count() == 3);

    const std::string data = zipper.finalize();

    SECTION("No entry can be added once finalized") {
        REQUIRE_THROWS_AS(zipper.add_entry("late.txt", "x"), LogicError);
        REQUIRE_THROWS_AS(zipper.finalize(), LogicError);
    }

    SECTION("Entries read back in order with their content") {
        ZipperArchive zip(data);
        REQUIRE(zip.entries().size() == 3);
        REQUIRE(zip.entries()[0].is_directory);
        REQUIRE(zip.entries()[1].name == "Metadata/plate_1.gcode");
        REQUIRE(zip.entries()[1].uncompressed_size == 100000);
        REQUIRE(zip.read("Metadata/plate_1.gcode") == std::string(100000, 'G'));
        REQUIRE(zip.read("empty.txt").empty());
    }

    SECTION("Missing entries are reported") {
        ZipperArchive zip(data);
        REQUIRE_THROWS_AS(zip.read("nope"), MalformedArchiveError);
    }
}
