#include <catch2/catch_test_macros.hpp>
#include "upgrade/Version.hpp"

using namespace upgrade;

TEST_CASE("Version parses release tags", "[version]")
{
    SECTION("Plain and prefixed tags")
    {
        Version v;
        REQUIRE(Version::tryParse("1.2.3", v));
        REQUIRE(v == Version(1, 2, 3));
        REQUIRE(Version::tryParse("v1.2.3", v));
        REQUIRE(v == Version(1, 2, 3));
        REQUIRE(Version::tryParse("V2.0", v));
        REQUIRE(v == Version(2, 0, 0));
    }

    SECTION("Build revision is kept")
    {
        Version v;
        REQUIRE(Version::tryParse("1.0.9.47", v));
        REQUIRE(v.revision() == 47);
        REQUIRE(v.toString() == "1.0.9.47");
    }

    SECTION("Garbage is rejected and leaves the output untouched")
    {
        Version v(3, 1, 4);
        REQUIRE_FALSE(Version::tryParse("Unknown", v));
        REQUIRE_FALSE(Version::tryParse("", v));
        REQUIRE_FALSE(Version::tryParse("1.2.3-beta", v));
        REQUIRE(v == Version(3, 1, 4));
    }

    SECTION("Malformed numbers")
    {
        REQUIRE_FALSE(Version::parse("-1.0").has_value());
        REQUIRE_FALSE(Version::parse("1..2").has_value());
        REQUIRE_FALSE(Version::parse("1.2.").has_value());
        REQUIRE_FALSE(Version::parse("1.2.3.4.5").has_value());
        REQUIRE_FALSE(Version::parse("99999999999.0").has_value());
        REQUIRE_FALSE(Version::parse("v").has_value());
        REQUIRE_FALSE(Version::parse(" 1.2.3").has_value());
    }

    SECTION("Constructor falls back to 0.0.0")
    {
        REQUIRE(Version("not a version") == Version());
        REQUIRE(Version("not a version").toString() == "0.0.0");
    }
}

TEST_CASE("Version ordering", "[version]")
{
    REQUIRE(Version("1.0.10") > Version("1.0.9"));
    REQUIRE(Version("2.0.0") > Version("1.99.99"));
    REQUIRE(Version("1.0.9.1") > Version("1.0.9"));
    REQUIRE(Version("v1.0") == Version("1.0.0"));
    REQUIRE(Version("2.0") == Version("2.0.0.0"));
    REQUIRE(Version("0.9.0") < Version("0.10.0"));
}

TEST_CASE("normalizeTag strips only the leading v", "[version]")
{
    REQUIRE(Version::normalizeTag("v2.0.0") == "2.0.0");
    REQUIRE(Version::normalizeTag("2.0.0") == "2.0.0");
    REQUIRE(Version::normalizeTag("v02.0") == "02.0");
    REQUIRE(Version::normalizeTag("") == "");
}
