#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/UrlStatsAggregator.hpp"
#include "core/Errors.hpp"
#include "input/LogFileParser.hpp"
#include "TestHelpers.hpp"

using namespace LogAnalyzer;

namespace
{
    core::LogRecord record(const std::string& url, double requestTime)
    {
        return core::LogRecord({}, url, requestTime);
    }
} // namespace

TEST_CASE("median")
{
    CHECK(Analysis::median({1, 5, 7, 10, 2, 5, 7}) == Approx(5));
    CHECK(Analysis::median({1, 2}) == Approx(1.5));
    CHECK(Analysis::median({1, 2, 3, 4}) == Approx(2.5));
    CHECK(Analysis::median({4, 1, 3, 2}) == Approx(2.5));
    CHECK(Analysis::median({0.7}) == Approx(0.7));
    CHECK_THROWS_AS(Analysis::median({}), std::invalid_argument);
}

TEST_CASE("per-url statistics")
{
    Analysis::UrlStatsAggregator aggregator;
    aggregator.addRecord(record("/a", 1.0));
    aggregator.addRecord(record("/b", 4.0));
    aggregator.addRecord(record("/a", 3.0));
    aggregator.addRecord(record("/a", 2.0));

    CHECK(aggregator.requestsCount() == 4);
    CHECK(aggregator.requestsTimeSum() == Approx(10.0));
    CHECK(aggregator.urlCount() == 2);

    const auto stats = aggregator.finalize();
    REQUIRE(stats.size() == 2);

    SECTION("urls come out in first-seen order")
    {
        CHECK(stats[0].url == "/a");
        CHECK(stats[1].url == "/b");
    }

    SECTION("values of a url with several requests")
    {
        const auto& a = stats[0];
        CHECK(a.count == 3);
        CHECK(a.countPerc == Approx(75.0));
        CHECK(a.timeSum == Approx(6.0));
        CHECK(a.timePerc == Approx(60.0));
        CHECK(a.timeAvg == Approx(2.0));
        CHECK(a.timeMax == Approx(3.0));
        CHECK(a.timeMed == Approx(2.0));
    }

    SECTION("values of a url with a single request")
    {
        const auto& b = stats[1];
        CHECK(b.count == 1);
        CHECK(b.countPerc == Approx(25.0));
        CHECK(b.timeSum == Approx(4.0));
        CHECK(b.timePerc == Approx(40.0));
        CHECK(b.timeAvg == Approx(4.0));
        CHECK(b.timeMax == Approx(4.0));
        CHECK(b.timeMed == Approx(4.0));
    }

    SECTION("finalize resets the aggregator")
    {
        CHECK(aggregator.requestsCount() == 0);
        CHECK(aggregator.urlCount() == 0);
        CHECK_THROWS_AS(aggregator.finalize(), core::EmptyLogError);
    }
}

TEST_CASE("aggregate totals are consistent")
{
    Analysis::UrlStatsAggregator aggregator;
    const std::vector<std::string> urls{"/x", "/y", "/z", "/x", "/x", "/y", "/w"};
    double expectedSum = 0;
    for (std::size_t i = 0; i < urls.size(); ++i)
    {
        const double t = 0.1 * static_cast<double>(i + 1);
        expectedSum += t;
        aggregator.addRecord(record(urls[i], t));
    }

    const auto stats = aggregator.finalize();
    REQUIRE(stats.size() == 4);

    std::uint64_t count = 0;
    double countPerc = 0;
    double timePerc = 0;
    double timeSum = 0;
    for (const auto& s : stats)
    {
        count += s.count;
        countPerc += s.countPerc;
        timePerc += s.timePerc;
        timeSum += s.timeSum;
        CHECK(s.timeMax >= s.timeMed);
        CHECK(s.timeAvg <= s.timeMax);
    }

    CHECK(count == urls.size());
    CHECK(countPerc == Approx(100.0));
    CHECK(timePerc == Approx(100.0));
    CHECK(timeSum == Approx(expectedSum));
}

TEST_CASE("zero request times")
{
    Analysis::UrlStatsAggregator aggregator;
    aggregator.addRecord(record("/a", 0.0));
    aggregator.addRecord(record("/b", 0.0));

    const auto stats = aggregator.finalize();
    REQUIRE(stats.size() == 2);
    for (const auto& s : stats)
    {
        CHECK(s.timePerc == 0.0);
        CHECK(s.countPerc == Approx(50.0));
        CHECK(std::isfinite(s.timeAvg));
    }
}

TEST_CASE("empty input")
{
    Analysis::UrlStatsAggregator aggregator;
    CHECK_THROWS_AS(aggregator.finalize(), core::EmptyLogError);
}

TEST_CASE("aggregate a record stream")
{
    Testing::TempDir dir;
    Testing::CapturingLogger log;
    const auto path = dir / "nginx-access-ui.log-20170630";

    SECTION("every parsed line is counted once")
    {
        Testing::writeLines(path, {Testing::kGoodLine, Testing::makeLine("/b", "1"),
                                   Testing::kGoodLine, Testing::kBadLine});

        Input::LogFileParser records(path.string(), Input::LogParser(), std::nullopt, log.logger());
        const auto stats = Analysis::aggregate(records);
        REQUIRE(stats.size() == 2);
        CHECK(stats[0].url == "/api/1/campaigns/?id=617832");
        CHECK(stats[0].count == 2);
        CHECK(stats[0].timeSum == Approx(0.292));
        CHECK(stats[1].count == 1);
    }

    SECTION("a file without valid lines has nothing to aggregate")
    {
        Testing::writeLines(path, {Testing::kBadLine});

        Input::LogFileParser records(path.string(), Input::LogParser(), std::nullopt, log.logger());
        CHECK_THROWS_AS(Analysis::aggregate(records), core::EmptyLogError);
    }

    SECTION("an over-budget file fails before any statistic is produced")
    {
        Testing::writeLines(path, {Testing::kGoodLine, Testing::kBadLine});

        Input::LogFileParser records(path.string(), Input::LogParser(), 0.05, log.logger());
        CHECK_THROWS_AS(Analysis::aggregate(records), core::ErrorsBudgetExceeded);
    }
}
