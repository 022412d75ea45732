#pragma once

#include <ostream>
#include <vector>
#include <string>
#include "core/UrlStat.hpp"

namespace LogAnalyzer
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Serializes ranked URL statistics as a JSON array of objects:
         *
         *   [{"url": "/api/v2/banner/25019354", "count": 2, "count_perc": 0.01,
         *     "time_sum": 1.3, "time_perc": 0.02, "time_avg": 0.65,
         *     "time_max": 0.8, "time_med": 0.65}, ...]
         *
         * The array is what the HTML report template embeds as $table_json.
         *
         * Design notes:
         *  - No external JSON dependency; strings are escaped per RFC 8259.
         *  - Non-finite numbers (a request_time of "inf") are written as null.
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // One object per line
            };

            /// Default: compact output
            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            JsonReporter(const JsonReporter&) = default;
            JsonReporter& operator=(const JsonReporter&) = default;

            /// Write the array to an output stream.
            void writeJson(std::ostream& output, const std::vector<core::UrlStat>& stats) const;

            /// Get the array as a string.
            std::string toJson(const std::vector<core::UrlStat>& stats) const;

            /// Single statistic as a JSON object.
            std::string statToJson(const core::UrlStat& stat) const;

            void setPrettyPrint(PrettyPrint mode) noexcept;

        private:
            static std::string formatNumber(double value);

        private:
            PrettyPrint m_prettyPrint;
        };

    } // namespace Report
} // namespace LogAnalyzer
