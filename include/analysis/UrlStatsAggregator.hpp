#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/LogRecord.hpp"
#include "core/UrlStat.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        class LogFileParser;
    }

    namespace Analysis
    {
        /**
         * Median of a list of values.
         *
         * Odd length: middle element of the sorted values. Even length:
         * mean of the two middle elements.
         *
         * @throws std::invalid_argument for an empty list.
         */
        double median(std::vector<double> values);

        /**
         * UrlStatsAggregator
         *
         * Accumulates request times per URL while records stream in, then
         * turns them into UrlStat summaries. The per-request times are kept
         * until finalize() because the median needs all of them.
         */
        class UrlStatsAggregator
        {
        public:
            UrlStatsAggregator() = default;

            UrlStatsAggregator(const UrlStatsAggregator &)            = delete;
            UrlStatsAggregator &operator=(const UrlStatsAggregator &) = delete;

            void addRecord(const core::LogRecord &record);

            /**
             * Compute the statistics of every URL seen, in first-seen order,
             * and reset the aggregator.
             *
             * @throws core::EmptyLogError if no record was added.
             */
            std::vector<core::UrlStat> finalize();

            std::uint64_t requestsCount() const noexcept { return m_requestsCount; }
            double requestsTimeSum() const noexcept { return m_requestsTimeSum; }
            std::size_t urlCount() const noexcept { return m_urls.size(); }

            void reset();

        private:
            struct Accumulator
            {
                std::string         url;
                std::vector<double> times;
            };

            std::unordered_map<std::string, std::size_t> m_index;   // url -> position in m_urls
            std::vector<Accumulator>                     m_urls;

            std::uint64_t m_requestsCount   = 0;
            double        m_requestsTimeSum = 0.0;
        };

        /**
         * Drain a record stream into per-URL statistics.
         *
         * @throws core::ErrorsBudgetExceeded from the stream, core::EmptyLogError
         *         when the stream yields no record.
         */
        std::vector<core::UrlStat> aggregate(Input::LogFileParser &records);

    } // namespace Analysis
} // namespace LogAnalyzer
