#include "application_ini.hpp"
#include "test_dir.hpp"
#include <catch2/catch.hpp>

TEST_CASE("companion ini is named after the stamp", "[application_ini]") {
    REQUIRE(application_ini_name("20130101000000") == "application_20130101000000.ini");
}

TEST_CASE("reads BuildID and Version from the App section", "[application_ini]") {
    TestDir dir;
    dir.write_ini("20130101000000", "20130101000000", "1.0");

    auto info = read_application_ini((dir.path() / "application_20130101000000.ini").string());
    REQUIRE(info.build_id == "20130101000000");
    REQUIRE(info.version == "1.0");
}

TEST_CASE("keys in other sections are not picked up", "[application_ini]") {
    TestDir dir;
    auto path = dir.write("application.ini", "[Gecko]\nBuildID=1\nVersion=2\n");
    REQUIRE_THROWS_AS(read_application_ini(path.string()), MetadataError);
}

TEST_CASE("missing or incomplete ini files are rejected", "[application_ini]") {
    TestDir dir;

    SECTION("missing file") {
        REQUIRE_THROWS_AS(read_application_ini((dir.path() / "application_x.ini").string()), MetadataError);
    }
    SECTION("missing Version") {
        auto path = dir.write("application.ini", "[App]\nBuildID=20130101000000\n");
        REQUIRE_THROWS_WITH(read_application_ini(path.string()), Catch::Contains("App.Version"));
    }
    SECTION("missing BuildID") {
        auto path = dir.write("application.ini", "[App]\nVersion=1.0\n");
        REQUIRE_THROWS_WITH(read_application_ini(path.string()), Catch::Contains("App.BuildID"));
    }
    SECTION("unparsable") {
        auto path = dir.write("application.ini", "[App\nVersion 1.0\n");
        REQUIRE_THROWS_AS(read_application_ini(path.string()), MetadataError);
    }
}

TEST_CASE("option names match regardless of case", "[application_ini]") {
    TestDir dir;
    auto path = dir.write("application.ini", "[App]\nbuildid=20130101000000\nVERSION=1.0\n");

    auto info = read_application_ini(path.string());
    REQUIRE(info.build_id == "20130101000000");
    REQUIRE(info.version == "1.0");
}
