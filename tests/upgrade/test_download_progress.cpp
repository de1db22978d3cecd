#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "upgrade/UpgradeTypes.hpp"

using namespace upgrade;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

TEST_CASE("DownloadProgress percentage", "[download][progress]")
{
    SECTION("Unknown total reports zero")
    {
        auto p = DownloadProgress::compute(5000, 0, 1000ms);
        REQUIRE(p.percentComplete() == 0);
        REQUIRE(p.toString() == "Starting download...");
    }

    SECTION("Percentage is floored")
    {
        REQUIRE(DownloadProgress::compute(399, 1000, 1000ms).percentComplete() == 39);
        REQUIRE(DownloadProgress::compute(400, 1000, 1000ms).percentComplete() == 40);
    }

    SECTION("Overshoot clamps to 100")
    {
        REQUIRE(DownloadProgress::compute(1200, 1000, 1000ms).percentComplete() == 100);
    }
}

TEST_CASE("DownloadProgress speed and ETA", "[download][progress]")
{
    SECTION("Average speed since transfer start")
    {
        auto p = DownloadProgress::compute(2 * 1024 * 1024, 4 * 1024 * 1024, 2000ms);
        REQUIRE_THAT(p.speedBytesPerSecond, WithinAbs(1024.0 * 1024.0, 0.5));
        REQUIRE_THAT(p.speedMBps(), WithinAbs(1.0, 0.0001));
        REQUIRE(p.eta == 2000ms);
    }

    SECTION("No elapsed time means no speed and no ETA")
    {
        auto p = DownloadProgress::compute(100, 1000, 0ms);
        REQUIRE(p.speedBytesPerSecond == 0.0);
        REQUIRE(p.eta == 0ms);
    }

    SECTION("Finished transfer has no ETA")
    {
        auto p = DownloadProgress::compute(1000, 1000, 500ms);
        REQUIRE(p.eta == 0ms);
        REQUIRE(p.percentComplete() == 100);
    }
}

TEST_CASE("DownloadProgress formatting", "[download][progress]")
{
    REQUIRE(DownloadProgress::formatBytes(0) == "0 B");
    REQUIRE(DownloadProgress::formatBytes(512) == "512 B");
    REQUIRE(DownloadProgress::formatBytes(1024) == "1 KB");
    REQUIRE(DownloadProgress::formatBytes(1536) == "1.5 KB");
    REQUIRE(DownloadProgress::formatBytes(5 * 1024 * 1024) == "5 MB");

    auto p = DownloadProgress::compute(400 * 1024, 1000 * 1024, 1000ms);
    REQUIRE(p.toString() == "40% - 400 KB / 1000 KB (0.39 MB/s, ETA: 2s)");
}
