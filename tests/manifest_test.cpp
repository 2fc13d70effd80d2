#include "manifest.hpp"
#include "test_dir.hpp"
#include <catch2/catch.hpp>
#include <memory>

namespace {

const char* kExpected =
    "<?xml version=\"1.0\"?>\n"
    "<updates>\n"
    "  <update type=\"minor\" appVersion=\"1.0\" version=\"1.0\" extensionVersion=\"1.0\" buildID=\"20130101000000\""
    " licenseURL=\"http://www.mozilla.com/test/sample-eula.html\" detailsURL=\"http://www.mozilla.com/test/sample-details.html\">\n"
    "    <patch type=\"complete\" URL=\"http://update.boot2gecko.org/nightly/b2g_update_20130101000000.mar\""
    " hashFunction=\"SHA512\" hashValue=\"deadbeef\" size=\"100\"/>\n"
    "  </update>\n"
    "</updates>";

struct ManifestFixture {
    TestDir dir;
    std::unique_ptr<UpdateFile> update;

    ManifestFixture() {
        dir.write_update("b2g_update_20130101000000.mar", 100);
        dir.write_ini("20130101000000", "20130101000000", "1.0");
        update = std::make_unique<UpdateFile>(dir.str(), "b2g_update_20130101000000.mar",
                                              naming_for_channel("nightly"),
                                              [](const std::string&) { return std::string("deadbeef"); });
    }
};

} // namespace

TEST_CASE_METHOD(ManifestFixture, "manifest matches the update.xml layout byte for byte", "[manifest]") {
    REQUIRE(render_manifest(*update, "nightly") == kExpected);
}

TEST_CASE_METHOD(ManifestFixture, "manifest rendering is deterministic", "[manifest]") {
    ManifestQuery query{std::string("abc")};
    auto first = render_manifest(*update, "nightly", query);
    REQUIRE(render_manifest(*update, "nightly", query) == first);
}

TEST_CASE_METHOD(ManifestFixture, "dogfood id is appended to the download URL", "[manifest]") {
    auto xml = render_manifest(*update, "nightly", ManifestQuery{std::string("abc")});
    REQUIRE_THAT(xml, Catch::Contains(
        "URL=\"http://update.boot2gecko.org/nightly/b2g_update_20130101000000.mar?dogfooding_prerelease_id=abc\""));
}

TEST_CASE_METHOD(ManifestFixture, "attribute values are XML escaped", "[manifest]") {
    auto xml = render_manifest(*update, "nightly", ManifestQuery{std::string("a&b\"<c>")});
    REQUIRE_THAT(xml, Catch::Contains("?dogfooding_prerelease_id=a&amp;b&quot;&lt;c&gt;\""));
}

TEST_CASE_METHOD(ManifestFixture, "publish path is used verbatim", "[manifest]") {
    auto xml = render_manifest(*update, "stable/b2g");
    REQUIRE_THAT(xml, Catch::Contains("http://update.boot2gecko.org/stable/b2g/b2g_update_20130101000000.mar\""));
}

TEST_CASE("manifest needs the companion ini", "[manifest]") {
    TestDir dir;
    dir.write_update("b2g_update_1.mar", 10);
    UpdateFile update(dir.str(), "b2g_update_1.mar", naming_for_channel("nightly"));
    REQUIRE_THROWS_AS(render_manifest(update, "nightly"), MetadataError);
}

TEST_CASE("xml_escape leaves plain text alone", "[manifest]") {
    REQUIRE(xml_escape("20130101000000") == "20130101000000");
    REQUIRE(xml_escape("1.0-prerelease") == "1.0-prerelease");
    REQUIRE(xml_escape("<&>\"") == "&lt;&amp;&gt;&quot;");
}
