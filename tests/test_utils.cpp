#include <catch2/catch.hpp>
#include "utils.hpp"

using namespace relcheck;

TEST_CASE("String helpers", "[utils]") {
    SECTION("splitString drops nothing but a trailing empty token") {
        CHECK(utils::splitString("1.2.3", '.') == std::vector<std::string>{"1", "2", "3"});
        CHECK(utils::splitString("a//b", '/') == std::vector<std::string>{"a", "", "b"});
        CHECK(utils::splitString("", '.').empty());
    }

    SECTION("stripVersionPrefix removes one leading v") {
        CHECK(utils::stripVersionPrefix("v1.0") == "1.0");
        CHECK(utils::stripVersionPrefix("vv1.0") == "v1.0");
        CHECK(utils::stripVersionPrefix("V1.0") == "V1.0");
        CHECK(utils::stripVersionPrefix("1.0") == "1.0");
        CHECK(utils::stripVersionPrefix("").empty());
    }

    SECTION("lastPathSegment") {
        CHECK(utils::lastPathSegment("https://github.com/o/r/releases/tag/v1.2") == "v1.2");
        CHECK(utils::lastPathSegment("release/v3.1") == "v3.1");
        CHECK(utils::lastPathSegment("v3.1") == "v3.1");
        CHECK(utils::lastPathSegment("/a/b/") == "b");
        CHECK(utils::lastPathSegment("").empty());
    }

    SECTION("replaceAll replaces every occurrence") {
        CHECK(utils::replaceAll("@a and @a", "@a", "x") == "x and x");
        CHECK(utils::replaceAll("aaa", "a", "aa") == "aaaaaa");
        CHECK(utils::replaceAll("text", "", "x") == "text");
    }

    SECTION("toLower and endsWith") {
        CHECK(utils::toLower("1.0-SnapShot") == "1.0-snapshot");
        CHECK(utils::endsWith("1.0-dev", "dev"));
        CHECK_FALSE(utils::endsWith("dev", "1.0-dev"));
    }
}
