#include <catch2/catch.hpp>
#include "errors.hpp"
#include "version.hpp"

using namespace relcheck;

TEST_CASE("Version classification", "[version]") {
    SECTION("Plain dotted numbers are releases") {
        CHECK(Version("1").kind() == VersionKind::Release);
        CHECK(Version("1.2.3").kind() == VersionKind::Release);
        CHECK(Version("10.0.0.42").kind() == VersionKind::Release);
    }

    SECTION("Suffixes are matched case-insensitively") {
        CHECK(Version("1.0-snapshot").kind() == VersionKind::Snapshot);
        CHECK(Version("1.0-SNAPSHOT").kind() == VersionKind::Snapshot);
        CHECK(Version("2.0Snapshot").kind() == VersionKind::Snapshot);
        CHECK(Version("1.0.0-dev").kind() == VersionKind::Dev);
        CHECK(Version("1.0.0-DEV").kind() == VersionKind::Dev);
        CHECK(Version("3dev").kind() == VersionKind::Dev);
    }

    SECTION("Forced pre-release is dev unless the suffix says snapshot") {
        CHECK(Version("1.2.3", true).kind() == VersionKind::Dev);
        CHECK(Version("1.0.0-rc", true).kind() == VersionKind::Dev);
        CHECK(Version("2.0-beta.1", true).kind() == VersionKind::Dev);
        CHECK(Version("1.0-snapshot", true).kind() == VersionKind::Snapshot);
    }

    SECTION("parseKind follows the same table") {
        CHECK(parseKind("1.0-snapshot") == VersionKind::Snapshot);
        CHECK(parseKind("1.0-dev") == VersionKind::Dev);
        CHECK(parseKind("1.0", true) == VersionKind::Dev);
        CHECK(parseKind("1.0") == VersionKind::Release);
    }
}

TEST_CASE("Version accessors", "[version]") {
    Version version("1.4.0-SNAPSHOT");
    CHECK(version.raw() == "1.4.0-SNAPSHOT");
    CHECK(version.numeric() == "1.4.0");

    CHECK(Version("2.1dev").numeric() == "2.1");
    CHECK(Version("1.0.0-rc", true).numeric() == "1.0.0");
    CHECK(Version("7.7").numeric() == "7.7");

    CHECK(suffix(VersionKind::Release).empty());
    CHECK(suffix(VersionKind::Snapshot) == "snapshot");
    CHECK(suffix(VersionKind::Dev) == "dev");
    CHECK(toString(VersionKind::Release) == "release");
}

TEST_CASE("Malformed versions are rejected", "[version]") {
    CHECK_THROWS_AS(Version(""), VersionFormatError);
    CHECK_THROWS_AS(Version("abc"), VersionFormatError);
    CHECK_THROWS_AS(Version("1.a"), VersionFormatError);
    CHECK_THROWS_AS(Version("1..2"), VersionFormatError);
    CHECK_THROWS_AS(Version("1.2."), VersionFormatError);
    CHECK_THROWS_AS(Version(".1.2"), VersionFormatError);
    CHECK_THROWS_AS(Version("-1.2"), VersionFormatError);
    CHECK_THROWS_AS(Version("1.2-"), VersionFormatError);
    CHECK_THROWS_AS(Version("v1.2"), VersionFormatError);
    CHECK_THROWS_AS(Version("1.2 "), VersionFormatError);

    SECTION("Unknown labels need the pre-release flag") {
        CHECK_THROWS_AS(Version("1.0.0-rc"), VersionFormatError);
        CHECK_THROWS_AS(Version("1.0.0-", true), VersionFormatError);
        CHECK_THROWS_AS(Version("1.0.0-r c", true), VersionFormatError);
    }

    SECTION("Format errors are update errors") {
        CHECK_THROWS_AS(Version("x"), UpdateError);
    }
}

TEST_CASE("Version ordering", "[version]") {
    CHECK(Version("1.2").compare(Version("1.2.0")) == 0);
    CHECK(Version("1.10").compare(Version("1.9")) == 1);
    CHECK(Version("1.9").compare(Version("1.10")) == -1);
    CHECK(Version("1.0.0-dev").compare(Version("1.0.1")) == -1);
    CHECK(Version("2").compare(Version("1.99.99")) == 1);
    CHECK(Version("1.0.0.1").compare(Version("1")) == 1);
    CHECK(Version("01.002").compare(Version("1.2")) == 0);

    SECTION("Components wider than any integer type still compare") {
        CHECK(Version("1.99999999999999999999999").compare(Version("1.99999999999999999999998")) == 1);
        CHECK(Version("123456789012345678901234567890").compare(Version("9")) == 1);
    }

    SECTION("Operators agree with compare") {
        CHECK(Version("1.2.3") < Version("1.3"));
        CHECK(Version("1.3") > Version("1.2.3"));
        CHECK(Version("1.3") >= Version("1.3.0"));
        CHECK(Version("1.3") <= Version("1.3.0"));
        CHECK(Version("1.3") != Version("1.4"));
    }
}

TEST_CASE("Version equality ignores the suffix", "[version]") {
    CHECK(Version("1.0-snapshot") == Version("1.0"));
    CHECK(Version("1.0.0-dev") == Version("1.0-snapshot"));
    CHECK(Version("1.0.0-rc", true) == Version("1.0"));
    CHECK_FALSE(Version("1.0.1") == Version("1.0"));
}
