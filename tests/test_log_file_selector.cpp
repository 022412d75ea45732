#include <catch2/catch.hpp>

#include "input/LogFileSelector.hpp"
#include "TestHelpers.hpp"

using namespace LogAnalyzer;
using Testing::TempDir;

TEST_CASE("log file name matching")
{
    SECTION("plain and gzip names carry a date")
    {
        auto plain = Input::parseLogFileName("nginx-access-ui.log-20170630");
        REQUIRE(plain.has_value());
        CHECK(plain->year == 2017);
        CHECK(plain->month == 6);
        CHECK(plain->day == 30);

        auto gz = Input::parseLogFileName("nginx-access-ui.log-20170629.gz");
        REQUIRE(gz.has_value());
        CHECK(gz->day == 29);
    }

    SECTION("other names are ignored")
    {
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-20170630.bz2").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-2017063").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-201706301").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-api.log-20170630").has_value());
        CHECK_FALSE(Input::parseLogFileName("xnginx-access-ui.log-20170630").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-20170630.gz.tmp").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-").has_value());
    }

    SECTION("impossible calendar dates are ignored")
    {
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-20171301").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-20170631").has_value());
        CHECK_FALSE(Input::parseLogFileName("nginx-access-ui.log-20170229").has_value());
        CHECK(Input::parseLogFileName("nginx-access-ui.log-20160229").has_value());
    }
}

TEST_CASE("latest log file selection")
{
    TempDir dir;
    Testing::CapturingLogger log;

    SECTION("the newest date wins regardless of compression")
    {
        Testing::writeFile(dir / "nginx-access-ui.log-20170628", "");
        Testing::writeFile(dir / "nginx-access-ui.log-20170630", "");
        Testing::writeFile(dir / "nginx-access-ui.log-20170629.gz", "");
        Testing::writeFile(dir / "nginx-access-ui.log-20170701.bz2", "");
        Testing::writeFile(dir / "nginx-access-api.log-20170801", "");

        auto latest = Input::findLatestLogFile(dir.path(), log.logger());
        REQUIRE(latest.has_value());
        CHECK(latest->name() == "nginx-access-ui.log-20170630");
        CHECK(latest->date().toString() == "2017.06.30");
        CHECK(latest->path().string() == (dir / "nginx-access-ui.log-20170630").string());
        CHECK_FALSE(latest->isCompressed());
    }

    SECTION("a compressed file can be the newest")
    {
        Testing::writeFile(dir / "nginx-access-ui.log-20170628", "");
        Testing::writeFile(dir / "nginx-access-ui.log-20180101.gz", "");

        auto latest = Input::findLatestLogFile(dir.path(), log.logger());
        REQUIRE(latest.has_value());
        CHECK(latest->isCompressed());
        CHECK(latest->date().toString() == "2018.01.01");
    }

    SECTION("same date twice picks the plain file")
    {
        Testing::writeFile(dir / "nginx-access-ui.log-20170630.gz", "");
        Testing::writeFile(dir / "nginx-access-ui.log-20170630", "");

        auto latest = Input::findLatestLogFile(dir.path(), log.logger());
        REQUIRE(latest.has_value());
        CHECK(latest->name() == "nginx-access-ui.log-20170630");
    }

    SECTION("no matching file")
    {
        Testing::writeFile(dir / "README", "");
        Testing::writeFile(dir / "nginx-access-ui.log-20171340", "");
        CHECK_FALSE(Input::findLatestLogFile(dir.path(), log.logger()).has_value());
    }

    SECTION("empty directory")
    {
        CHECK_FALSE(Input::findLatestLogFile(dir.path(), log.logger()).has_value());
    }

    SECTION("missing directory")
    {
        CHECK_FALSE(Input::findLatestLogFile(dir / "absent", log.logger()).has_value());
    }

    SECTION("a regular file is not a directory")
    {
        Testing::writeFile(dir / "plain", "");
        CHECK_FALSE(Input::findLatestLogFile(dir / "plain", log.logger()).has_value());
    }
}
