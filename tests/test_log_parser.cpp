#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>

#include "core/FieldSpec.hpp"
#include "input/LogParser.hpp"
#include "TestHelpers.hpp"

using namespace LogAnalyzer;
using Testing::kBadLine;
using Testing::kGoodLine;

TEST_CASE("parse a well-formed access log line")
{
    Input::LogParser parser;

    auto record = parser.parseLine(kGoodLine);
    REQUIRE(record.has_value());

    CHECK(record->url() == "/api/1/campaigns/?id=617832");
    CHECK(record->requestTime() == Approx(0.146));

    SECTION("raw values keep their delimiters")
    {
        CHECK(record->field("remote_addr") == "1.200.76.128");
        CHECK(record->field("remote_user") == "f032b48fb33e1e692");
        CHECK(record->field("http_x_real_ip") == "-");
        CHECK(record->field("time_local") == "[29/Jun/2017:03:50:32 +0300]");
        CHECK(record->field("request") == "\"GET /api/1/campaigns/?id=617832 HTTP/1.1\"");
        CHECK(record->field("status") == "200");
        CHECK(record->field("body_bytes_sent") == "637");
        CHECK(record->field("http_referer") == "\"-\"");
        CHECK(record->field("http_user_agent") == "\"-\"");
        CHECK(record->field("http_x_forwarded_for") == "\"-\"");
        CHECK(record->field("http_X_REQUEST_ID") == "\"1498697432-4102637017-4709-9928915\"");
        CHECK(record->field("http_X_RB_USER") == "\"-\"");
        CHECK(record->field("request_time") == "0.146");
        CHECK(record->field("url") == "/api/1/campaigns/?id=617832");
    }

    SECTION("every template field plus url is present")
    {
        CHECK(record->fields().size() == 14);
        CHECK_FALSE(record->field("no_such_field").has_value());
    }
}

TEST_CASE("malformed lines are rejected as a whole")
{
    Input::LogParser parser;

    SECTION("unterminated bracketed field")
    {
        CHECK_FALSE(parser.parseLine(kBadLine).has_value());

        auto detailed = parser.parseLineDetailed(kBadLine);
        CHECK(detailed.malformed);
        CHECK_FALSE(detailed.entry.has_value());
        CHECK(detailed.error.find("time_local") != std::string::npos);
    }

    SECTION("line runs out before the template")
    {
        const std::string truncated = kGoodLine.substr(0, kGoodLine.find(" 200 "));
        CHECK_FALSE(parser.parseLine(truncated).has_value());
    }

    SECTION("empty line")
    {
        CHECK_FALSE(parser.parseLine("").has_value());
    }

    SECTION("leading whitespace does not match the first field")
    {
        CHECK_FALSE(parser.parseLine(" " + kGoodLine).has_value());
    }

    SECTION("request without a path")
    {
        const std::string line = Testing::makeLine("", "0.1");
        // "GET  HTTP/1.1" still has two tokens; use a bare method instead.
        std::string bare = line;
        bare.replace(bare.find("\"GET  HTTP/1.1\""), 15, "\"GET\"");
        CHECK_FALSE(parser.parseLine(bare).has_value());
    }

    SECTION("request_time is not a number")
    {
        CHECK_FALSE(parser.parseLine(Testing::makeLine("/x", "fast")).has_value());
        CHECK_FALSE(parser.parseLine(Testing::makeLine("/x", "0.1s")).has_value());
    }

    SECTION("empty quoted field")
    {
        std::string line = Testing::makeLine("/x", "0.1");
        line.replace(line.find("\"-\""), 3, "\"\"");
        CHECK_FALSE(parser.parseLine(line).has_value());
    }

    SECTION("missing separator between fields")
    {
        std::string line = Testing::makeLine("/x", "0.1");
        line.replace(line.find("] \"GET"), 2, "]");
        CHECK_FALSE(parser.parseLine(line).has_value());
    }
}

TEST_CASE("parser edge cases")
{
    Input::LogParser parser;

    SECTION("text after the last field is ignored")
    {
        auto record = parser.parseLine(Testing::makeLine("/a", "1.5") + " trailing junk");
        REQUIRE(record.has_value());
        CHECK(record->requestTime() == Approx(1.5));
    }

    SECTION("several spaces between fields form one separator")
    {
        std::string line = Testing::makeLine("/a", "2");
        line.replace(line.find(" 200 "), 5, "   200\t ");
        auto record = parser.parseLine(line);
        REQUIRE(record.has_value());
        CHECK(record->field("status") == "200");
    }

    SECTION("exponent notation in request_time")
    {
        auto record = parser.parseLine(Testing::makeLine("/a", "1e-3"));
        REQUIRE(record.has_value());
        CHECK(record->requestTime() == Approx(0.001));
    }

    SECTION("infinite request_time is a number")
    {
        auto record = parser.parseLine(Testing::makeLine("/a", "inf"));
        REQUIRE(record.has_value());
        CHECK(std::isinf(record->requestTime()));
    }

    SECTION("url is the second token of the request as matched")
    {
        std::string line = Testing::makeLine("/short", "0.2");
        line.replace(line.find("\"GET /short HTTP/1.1\""), 21, "\"GET /short\"");
        auto record = parser.parseLine(line);
        REQUIRE(record.has_value());
        CHECK(record->url() == "/short\"");
    }

    SECTION("leading blank inside the quotes shifts the url")
    {
        std::string line = Testing::makeLine("/x", "0.2");
        line.replace(line.find("\"GET /x"), 7, "\" GET /x");
        auto record = parser.parseLine(line);
        REQUIRE(record.has_value());
        CHECK(record->url() == "GET");
    }
}

TEST_CASE("custom log format")
{
    auto spec = core::FieldSpec::compile("ip \"request\" request_time");
    Input::LogParser parser(spec);

    auto record = parser.parseLine("10.0.0.1 \"POST /login HTTP/2.0\" 0.250");
    REQUIRE(record.has_value());
    CHECK(record->url() == "/login");
    CHECK(record->requestTime() == Approx(0.25));
    CHECK(record->field("ip") == "10.0.0.1");

    SECTION("a format without the statistics fields is refused")
    {
        CHECK_THROWS_AS(Input::LogParser(core::FieldSpec::compile("ip \"request\"")),
                                        std::invalid_argument);
        CHECK_THROWS_AS(Input::LogParser(core::FieldSpec::compile("ip request_time")),
                                        std::invalid_argument);
    }
}
