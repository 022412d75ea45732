// Core data model for the per-URL timing statistics of one analysis run.
// Produced by the aggregator, ranked by the report selector and rendered
// by the JSON/HTML reporters.

#ifndef CORE_URL_STAT_HPP
#define CORE_URL_STAT_HPP

#include <cstdint>
#include <string>

namespace LogAnalyzer
{
namespace core
{

/**
 * @brief Finalized statistics for one request path.
 *
 * Percentages are in the 0..100 range. Times are seconds, as logged by
 * nginx in $request_time.
 */
struct UrlStat
{
    std::string   url;
    std::uint64_t count{0};      ///< Requests for this URL.
    double        countPerc{0};  ///< Share of all requests.
    double        timeSum{0};    ///< Total request time.
    double        timePerc{0};   ///< Share of the total request time of the log.
    double        timeAvg{0};
    double        timeMax{0};
    double        timeMed{0};
};

} // namespace core
} // namespace LogAnalyzer

#endif // CORE_URL_STAT_HPP
