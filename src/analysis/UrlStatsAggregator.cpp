#include "analysis/UrlStatsAggregator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "core/Errors.hpp"
#include "input/LogFileParser.hpp"

namespace LogAnalyzer
{
    namespace Analysis
    {
        double median(std::vector<double> values)
        {
            if (values.empty())
            {
                throw std::invalid_argument("median of an empty list");
            }

            std::sort(values.begin(), values.end());

            const std::size_t mid = values.size() / 2;
            if (values.size() % 2 != 0)
            {
                return values[mid];
            }
            return (values[mid - 1] + values[mid]) / 2.0;
        }

        void UrlStatsAggregator::addRecord(const core::LogRecord &record)
        {
            ++m_requestsCount;
            m_requestsTimeSum += record.requestTime();

            auto [it, inserted] = m_index.try_emplace(record.url(), m_urls.size());
            if (inserted)
            {
                m_urls.push_back(Accumulator{record.url(), {}});
            }
            m_urls[it->second].times.push_back(record.requestTime());
        }

        std::vector<core::UrlStat> UrlStatsAggregator::finalize()
        {
            if (m_requestsCount == 0)
            {
                throw core::EmptyLogError();
            }

            const double totalCount = static_cast<double>(m_requestsCount);

            std::vector<core::UrlStat> result;
            result.reserve(m_urls.size());

            for (auto &acc : m_urls)
            {
                core::UrlStat stat;
                stat.url       = std::move(acc.url);
                stat.count     = acc.times.size();
                stat.countPerc = 100.0 * static_cast<double>(stat.count) / totalCount;
                stat.timeSum   = std::accumulate(acc.times.begin(), acc.times.end(), 0.0);
                // All-zero request times: no share to distribute.
                stat.timePerc  = m_requestsTimeSum != 0.0
                                     ? 100.0 * stat.timeSum / m_requestsTimeSum
                                     : 0.0;
                stat.timeAvg   = stat.timeSum / static_cast<double>(stat.count);
                stat.timeMax   = *std::max_element(acc.times.begin(), acc.times.end());
                stat.timeMed   = median(std::move(acc.times));

                result.push_back(std::move(stat));
            }

            reset();
            return result;
        }

        void UrlStatsAggregator::reset()
        {
            m_index.clear();
            m_urls.clear();
            m_requestsCount   = 0;
            m_requestsTimeSum = 0.0;
        }

        std::vector<core::UrlStat> aggregate(Input::LogFileParser &records)
        {
            UrlStatsAggregator aggregator;
            while (auto record = records.next())
            {
                aggregator.addRecord(*record);
            }
            return aggregator.finalize();
        }

    } // namespace Analysis
} // namespace LogAnalyzer
