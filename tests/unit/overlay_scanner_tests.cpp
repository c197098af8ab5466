#include <doctest/doctest.h>
#include <ocfg/overlay_scanner.hpp>

#include <limits>

#include "test_fs.hpp"

using namespace ocfg;
using ocfg::test::TempDir;

// ============================================================================
// Manifest parsing
// ============================================================================

TEST_CASE("parse_overlay_manifest reads all fields") {
    auto result = parse_overlay_manifest(R"({
        "package": "com.example.overlay",
        "target_package": "android",
        "target_name": "Theme",
        "static": true,
        "priority": 5
    })", "/vendor/overlay/a.overlay.json");

    REQUIRE(result.ok);
    CHECK(result.overlay.package_name == "com.example.overlay");
    CHECK(result.overlay.target_package == "android");
    CHECK(result.overlay.target_name == "Theme");
    CHECK(result.overlay.is_static);
    CHECK(result.overlay.priority == 5);
    CHECK(result.overlay.path == "/vendor/overlay/a.overlay.json");
}

TEST_CASE("parse_overlay_manifest applies defaults") {
    auto result = parse_overlay_manifest(R"({"package": "  com.a  ", "target_package": "android"})");
    REQUIRE(result.ok);
    CHECK(result.overlay.package_name == "com.a");
    CHECK(result.overlay.target_name.empty());
    CHECK_FALSE(result.overlay.is_static);
    CHECK(result.overlay.priority == 0);
}

TEST_CASE("parse_overlay_manifest requires package and target") {
    CHECK_FALSE(parse_overlay_manifest(R"({"target_package": "android"})").ok);
    CHECK_FALSE(parse_overlay_manifest(R"({"package": "   ", "target_package": "android"})").ok);
    CHECK_FALSE(parse_overlay_manifest(R"({"package": "com.a"})").ok);
}

TEST_CASE("parse_overlay_manifest rejects wrong types") {
    CHECK_FALSE(parse_overlay_manifest(R"({"package": "com.a", "target_package": "android", "static": "yes"})").ok);
    CHECK_FALSE(parse_overlay_manifest(R"({"package": "com.a", "target_package": "android", "priority": 1.5})").ok);
    CHECK_FALSE(parse_overlay_manifest(R"({"package": "com.a", "target_package": "android", "target_name": 3})").ok);
}

TEST_CASE("parse_overlay_manifest rejects priorities outside int range") {
    auto too_large = parse_overlay_manifest(
        R"({"package": "com.a", "target_package": "android", "priority": 4294967297})");
    CHECK_FALSE(too_large.ok);
    CHECK(too_large.error == "priority out of range");

    CHECK_FALSE(parse_overlay_manifest(
        R"({"package": "com.a", "target_package": "android", "priority": -2147483649})").ok);

    auto boundary = parse_overlay_manifest(
        R"({"package": "com.a", "target_package": "android", "priority": -2147483648})");
    REQUIRE(boundary.ok);
    CHECK(boundary.overlay.priority == std::numeric_limits<int>::min());
}

TEST_CASE("parse_overlay_manifest rejects invalid JSON") {
    auto result = parse_overlay_manifest("{ not json");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("parse error") != std::string::npos);

    CHECK_FALSE(parse_overlay_manifest("[]").ok);
}

// ============================================================================
// Directory scanning
// ============================================================================

TEST_CASE("DirectoryOverlayScanner finds manifests recursively in name order") {
    TempDir tmp;
    tmp.write_overlay("vendor", "com.b");
    tmp.write_overlay("vendor", "com.a", false, 0, "nested/deeper");
    tmp.write("vendor/overlay/readme.txt", "not a manifest");

    DirectoryOverlayScanner scanner;
    WarningCollector diagnostics;
    auto overlays = scanner.scan(tmp.file("vendor/overlay"), diagnostics);

    REQUIRE(overlays.size() == 2);
    CHECK(overlays[0].package_name == "com.b");
    CHECK(overlays[1].package_name == "com.a");
    CHECK(overlays[1].path == tmp.file("vendor/overlay/nested/deeper/com.a.overlay.json"));
    CHECK(diagnostics.get_warnings().empty());
}

TEST_CASE("DirectoryOverlayScanner returns nothing for a missing directory") {
    TempDir tmp;
    DirectoryOverlayScanner scanner;
    WarningCollector diagnostics;
    CHECK(scanner.scan(tmp.file("odm/overlay"), diagnostics).empty());
    CHECK(diagnostics.get_warnings().empty());
}

TEST_CASE("DirectoryOverlayScanner reports invalid manifests and keeps going") {
    TempDir tmp;
    tmp.write("system/overlay/broken.overlay.json", "{ nope");
    tmp.write_overlay("system", "com.good");

    DirectoryOverlayScanner scanner;
    WarningCollector diagnostics;
    auto overlays = scanner.scan(tmp.file("system/overlay"), diagnostics);

    REQUIRE(overlays.size() == 1);
    CHECK(overlays[0].package_name == "com.good");
    CHECK(diagnostics.count(Warning::overlay_manifest_invalid) == 1);
}

TEST_CASE("DirectoryOverlayScanner keeps the first manifest of a duplicated package") {
    TempDir tmp;
    tmp.write("product/overlay/a.overlay.json",
              R"({"package": "com.dup", "target_package": "android", "priority": 1})");
    tmp.write("product/overlay/b.overlay.json",
              R"({"package": "com.dup", "target_package": "android", "priority": 2})");

    DirectoryOverlayScanner scanner;
    WarningCollector diagnostics;
    auto overlays = scanner.scan(tmp.file("product/overlay"), diagnostics);

    REQUIRE(overlays.size() == 1);
    CHECK(overlays[0].priority == 1);
    REQUIRE(diagnostics.get_warnings().size() == 1);
    CHECK(diagnostics.get_warnings()[0].key == "overlay_duplicate");
    CHECK(diagnostics.get_warnings()[0].fields.at("skipped_path") ==
          tmp.file("product/overlay/b.overlay.json"));
}

TEST_CASE("DirectoryOverlayScanner honours the depth limit") {
    TempDir tmp;
    tmp.write_overlay("oem", "com.top");
    tmp.write_overlay("oem", "com.deep", false, 0, "one/two");

    WarningCollector diagnostics;

    DirectoryOverlayScanner shallow(2);
    auto limited = shallow.scan(tmp.file("oem/overlay"), diagnostics);
    REQUIRE(limited.size() == 1);
    CHECK(limited[0].package_name == "com.top");

    DirectoryOverlayScanner deep(3);
    CHECK(deep.scan(tmp.file("oem/overlay"), diagnostics).size() == 2);
}

TEST_CASE("make_directory_scanner_factory creates independent scanners") {
    auto factory = make_directory_scanner_factory(4);
    auto first = factory();
    auto second = factory();
    REQUIRE(first);
    REQUIRE(second);
    CHECK(first.get() != second.get());
}
